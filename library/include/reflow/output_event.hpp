#ifndef reflow_output_event_hpp
#define reflow_output_event_hpp

#include <cstddef> // for std::size_t
#include <functional> // for std::function
#include <ostream>
#include <string>
#include <string_view>

#include "reflow/variant.hpp" // for <variant>, reflow::variant, plus ostream support
#include "reflow/wait_status.hpp"

namespace reflow {

/// @brief A new run is starting. Output of any earlier run is stale.
struct reset_event {
    std::string command;
};

auto operator<<(std::ostream& os, const reset_event& value)
    -> std::ostream&;

/// @brief Next chunk of the active run's combined output.
/// @note The data is only valid during the sink call.
struct chunk_event {
    std::string_view data;

    /// @brief Bytes of output of the run so far, including this chunk.
    std::size_t total_bytes{};

    /// @brief Newlines in the output of the run so far.
    std::size_t total_lines{};
};

auto operator<<(std::ostream& os, const chunk_event& value)
    -> std::ostream&;

/// @brief Annotation of a failure, shown instead of command output.
struct error_event {
    std::string message;
};

auto operator<<(std::ostream& os, const error_event& value)
    -> std::ostream&;

/// @brief The run's output is fully drained.
/// @note The status is informational. Non-zero exits aren't failures.
struct finished_event {
    wait_status status;
    std::size_t total_bytes{};
};

auto operator<<(std::ostream& os, const finished_event& value)
    -> std::ostream&;

using output_event = variant<
    reset_event,
    chunk_event,
    error_event,
    finished_event
>;

/// @brief Consumer of output events.
/// @note Called from the foreground for resets and failures to start,
///   and from a run's reader task otherwise. Never called concurrently.
using output_sink = std::function<void(const output_event&)>;

}

#endif /* reflow_output_event_hpp */
