#ifndef reflow_signal_hpp
#define reflow_signal_hpp

#include <ostream>

#include "reflow/os_error_code.hpp"
#include "reflow/reference_process_id.hpp"

namespace reflow {

enum class signal: int;

auto operator<<(std::ostream& os, signal s) -> std::ostream&;

namespace signals {
auto interrupt() noexcept -> signal;
auto terminate() noexcept -> signal;
auto kill() noexcept -> signal;
auto pipe() noexcept -> signal;
}

/// @brief Sends the given signal to every process in the identified group.
auto send_signal_to_group(signal sig, reference_process_id pgrp) noexcept
    -> os_error_code;

}

#endif /* reflow_signal_hpp */
