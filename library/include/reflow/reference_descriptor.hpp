#ifndef reflow_reference_descriptor_hpp
#define reflow_reference_descriptor_hpp

#include <ostream>

namespace reflow {

/// @brief Non-owning file descriptor strong type.
enum class reference_descriptor: int;

auto operator<<(std::ostream& os, reference_descriptor value) -> std::ostream&;

namespace descriptors {
constexpr auto invalid_id = reference_descriptor{-1};
constexpr auto stdin_id = reference_descriptor{0};
constexpr auto stdout_id = reference_descriptor{1};
constexpr auto stderr_id = reference_descriptor{2};
}

}

#endif /* reflow_reference_descriptor_hpp */
