#ifndef reflow_run_coordinator_hpp
#define reflow_run_coordinator_hpp

#include <cstddef> // for std::size_t
#include <memory> // for std::unique_ptr
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "reflow/capture_tee.hpp"
#include "reflow/control_event.hpp"
#include "reflow/history_log.hpp"
#include "reflow/output_event.hpp"
#include "reflow/run_phase.hpp"
#include "reflow/supervisor.hpp"

namespace reflow {

/// @brief Options for <code>run_coordinator</code>.
struct coordinator_options
{
    static constexpr auto default_command = "cat";
    static constexpr auto default_chunk_size = std::size_t{4096u};

    spawn_options spawn;

    /// @brief Command run when the submitted text is empty.
    /// @note Defaults to a byte-identity pass-through.
    std::string fallback_command{default_command};

    /// @brief Size of the chunks read from a run's output pipe.
    std::size_t chunk_size{default_chunk_size};
};

/// @brief Run coordinator.
/// @note Owns at most one active run at a time. Every new run is only
///   started after the previous one has been cancelled and fully torn
///   down, so runs never race each other for the tee's live tail and the
///   sink never sees output of two runs interleaved.
/// @note Control functions are meant to be called from a single
///   foreground thread. Output streams to the sink from a background task.
struct run_coordinator
{
    struct run_state;

    run_coordinator(capture_tee& tee, output_sink sink,
                    coordinator_options opts, std::ostream& diags);

    run_coordinator(const run_coordinator& other) = delete;
    auto operator=(const run_coordinator& other) -> run_coordinator& = delete;

    /// @brief Cancels any active run and waits for its teardown.
    ~run_coordinator();

    /// @brief Handles the given control event.
    /// @return History entry navigated to for navigation events.
    auto handle(const control_event& event) -> std::optional<std::string>;

    /// @brief Starts a run of the given command without recording it.
    /// @note Used for the initial launch.
    auto start(const std::string& text) -> run_phase;

    /// @brief Records the given command in the history and restarts with it.
    auto submit(const std::string& text) -> run_phase;

    /// @brief Cancels the active run, if any, and waits for its teardown.
    auto quit() -> void;

    /// @brief Blocks until the active run stops streaming.
    auto wait() -> run_phase;

    [[nodiscard]] auto phase() const -> run_phase;

    /// @brief Accumulated output of the latest run.
    [[nodiscard]] auto output() const -> std::string;

    [[nodiscard]] auto byte_count() const -> std::size_t;

    [[nodiscard]] auto line_count() const -> std::size_t;

    /// @brief Command of the latest run.
    [[nodiscard]] auto command() const -> const std::string&
    {
        return last_command;
    }

    [[nodiscard]] auto history() const noexcept -> const history_log&
    {
        return log;
    }

    /// @brief Writes the accumulated output of the latest run, a delimiter
    ///   line, then the latest command prefixed by the program name.
    auto write_transcript(std::ostream& os, std::string_view program) const
        -> void;

private:
    auto effective_command(const std::string& text) const -> std::string;
    auto stop_active() -> void;
    auto stream(run_state& state) -> void;

    capture_tee& tee;
    output_sink sink;
    coordinator_options options;
    std::ostream& diags;
    history_log log;
    std::string last_command;
    std::unique_ptr<run_state> active;
};

}

#endif /* reflow_run_coordinator_hpp */
