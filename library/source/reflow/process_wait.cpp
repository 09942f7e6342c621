#include <sys/wait.h>

#include <cerrno> // for errno, EINTR

#include "reflow/process_wait.hpp"

namespace reflow {

auto reap(reference_process_id id) noexcept -> reap_result
{
    auto status = 0;
    for (;;) {
        if (::waitpid(pid_t(id), &status, 0) != -1) {
            return to_wait_status(status);
        }
        if (errno != EINTR) {
            return os_error_code{errno};
        }
    }
}

auto await_termination(reference_process_id id) noexcept -> os_error_code
{
    auto info = siginfo_t{};
    for (;;) {
        if (::waitid(P_PID, id_t(id), &info, WEXITED|WNOWAIT) != -1) {
            return os_error_code{};
        }
        if (errno != EINTR) {
            return os_error_code{errno};
        }
    }
}

}
