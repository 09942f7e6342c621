#include <cerrno> // for errno
#include <csignal>
#include <string> // for std::to_string

#include "reflow/signal.hpp"

namespace reflow {

auto operator<<(std::ostream& os, signal s) -> std::ostream&
{
    switch (int(s)) {
    case SIGINT:
        os << "sigint";
        break;
    case SIGTERM:
        os << "sigterm";
        break;
    case SIGKILL:
        os << "sigkill";
        break;
    case SIGPIPE:
        os << "sigpipe";
        break;
    case SIGCHLD:
        os << "sigchild";
        break;
    default:
        os << "signal-#" << std::to_string(int(s));
        break;
    }
    return os;
}

auto send_signal_to_group(signal sig, reference_process_id pgrp) noexcept
    -> os_error_code
{
    // A group of 0 or 1 (or less) would address far more than one child.
    if (int(pgrp) <= 1) {
        return os_error_code{EINVAL};
    }
    if (::kill(-int(pgrp), int(sig)) == -1) {
        return os_error_code{errno};
    }
    return os_error_code{};
}

}

namespace reflow::signals {

auto interrupt() noexcept -> signal
{
    return signal{SIGINT};
}

auto terminate() noexcept -> signal
{
    return signal{SIGTERM};
}

auto kill() noexcept -> signal
{
    return signal{SIGKILL};
}

auto pipe() noexcept -> signal
{
    return signal{SIGPIPE};
}

}
