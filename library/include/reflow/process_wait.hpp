#ifndef reflow_process_wait_hpp
#define reflow_process_wait_hpp

#include "reflow/os_error_code.hpp"
#include "reflow/reference_process_id.hpp"
#include "reflow/variant.hpp" // for <variant>, reflow::variant, + ostream support
#include "reflow/wait_status.hpp"

namespace reflow {

using reap_result = variant<wait_status, os_error_code>;

/// @brief Blocks until the identified child has terminated, then reaps it.
/// @note Retries if interrupted by a signal.
/// @return Terminal status of the child, or the error from
///   <code>waitpid</code> (e.g. <code>ECHILD</code> if it's not a child of
///   the calling process or was already reaped).
auto reap(reference_process_id id) noexcept -> reap_result;

/// @brief Blocks until the identified child has terminated, but leaves it
///   unreaped.
/// @note The process ID stays reserved until the child is reaped, so it's
///   safe to signal its process group up to then.
auto await_termination(reference_process_id id) noexcept -> os_error_code;

}

#endif /* reflow_process_wait_hpp */
