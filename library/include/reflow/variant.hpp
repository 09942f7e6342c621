#ifndef reflow_variant_hpp
#define reflow_variant_hpp

#include <ostream>
#include <variant>

namespace reflow {

/// @brief Variant type.
/// @note Use this alias instead of <code>std::variant</code> directly to
/// support output streaming within the same namespace as the reflow object
/// to be streamed.
using std::variant;

template<class... Ts>
auto operator<<(std::ostream& os, const variant<Ts...>& sv) -> std::ostream&
{
    std::visit([&os](const auto& v) { os << v; }, sv);
    return os;
}

}

#endif /* reflow_variant_hpp */
