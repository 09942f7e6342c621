#ifndef reflow_os_error_code_hpp
#define reflow_os_error_code_hpp

#include <ostream>
#include <string>

namespace reflow {

/// @brief Operating system error code.
/// @note Wraps an <code>errno</code> value. Zero means no error.
enum class os_error_code: int;

auto operator<<(std::ostream& os, os_error_code err)
    -> std::ostream&;

auto to_string(os_error_code err) -> std::string;

/// @brief Gets the calling thread's current <code>errno</code> value.
auto last_os_error() noexcept -> os_error_code;

}

#endif /* reflow_os_error_code_hpp */
