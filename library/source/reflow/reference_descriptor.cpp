#include <type_traits> // for std::underlying_type_t

#include "reflow/reference_descriptor.hpp"

namespace reflow {

auto operator<<(std::ostream& os, reference_descriptor value) -> std::ostream&
{
    using underlying_type = std::underlying_type_t<reference_descriptor>;
    os << "fd:" << static_cast<underlying_type>(value);
    return os;
}

}
