#include <cerrno> // for errno
#include <sstream>
#include <system_error>

#include "reflow/os_error_code.hpp"
#include "reflow/utility.hpp"

namespace reflow {

auto operator<<(std::ostream& os, os_error_code err)
    -> std::ostream&
{
    return write(os, std::error_code{int(err), std::system_category()});
}

auto to_string(os_error_code err) -> std::string
{
    std::ostringstream os;
    os << err;
    return os.str();
}

auto last_os_error() noexcept -> os_error_code
{
    return os_error_code{errno};
}

}
