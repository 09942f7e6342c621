#include <sys/wait.h>

#include "reflow/wait_status.hpp"

namespace reflow {

auto operator<<(std::ostream& os, const wait_unknown_status&) -> std::ostream&
{
    os << "unknown-status";
    return os;
}

auto operator<<(std::ostream& os, const wait_exit_status& value) -> std::ostream&
{
    os << "exit-status=" << value.value;
    return os;
}

auto operator<<(std::ostream& os, const wait_signaled_status& value) -> std::ostream&
{
    os << "signal=" << value.signal;
    os << ", core-dumped=" << std::boolalpha << value.core_dumped;
    return os;
}

auto to_wait_status(int status) noexcept -> wait_status
{
    if (WIFEXITED(status)) {
        return wait_exit_status{WEXITSTATUS(status)};
    }
    if (WIFSIGNALED(status)) {
        return wait_signaled_status{WTERMSIG(status), WCOREDUMP(status) != 0};
    }
    return wait_unknown_status{};
}

}
