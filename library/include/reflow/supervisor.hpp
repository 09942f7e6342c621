#ifndef reflow_supervisor_hpp
#define reflow_supervisor_hpp

#include <cstddef> // for std::size_t
#include <filesystem>
#include <memory> // for std::unique_ptr
#include <ostream>
#include <span>
#include <stop_token>
#include <string>
#include <type_traits> // for std::is_default_constructible_v

#include "reflow/child_process.hpp"
#include "reflow/environment_map.hpp"
#include "reflow/read_result.hpp"
#include "reflow/reference_descriptor.hpp"
#include "reflow/replay_source.hpp"
#include "reflow/shell.hpp"
#include "reflow/signal.hpp"
#include "reflow/wait_status.hpp"

namespace reflow {

/// @brief Options for <code>spawn</code>.
/// @see spawn.
struct spawn_options
{
    static constexpr auto default_chunk_size = std::size_t{4096u};

    /// @brief Interpreter to run commands with.
    /// @note Left empty to resolve one from <code>environment</code> at each
    ///   spawn.
    std::filesystem::path shell;

    /// @brief Environment of the spawned process, passed as is.
    environment_map environment;

    /// @brief Signal sent to the process group on cancellation.
    signal cancel_signal{signals::kill()};

    /// @brief Size of the chunks fed to the process's standard input.
    std::size_t chunk_size{default_chunk_size};
};

/// @brief Handle to one run of a command under supervision.
/// @note Owns the child process, the task feeding its standard input from
///   a <code>replay_source</code>, the task waiting for it to exit, and the
///   read end of its combined standard output and standard error.
/// @note Destroying a handle cancels the run and waits for its teardown.
/// @note This type is movable but not copyable.
struct run_handle
{
    struct impl;

    run_handle() noexcept;
    explicit run_handle(std::unique_ptr<impl> p) noexcept;
    run_handle(run_handle&& other) noexcept;
    run_handle(const run_handle& other) = delete;
    ~run_handle();

    auto operator=(run_handle&& other) noexcept -> run_handle&;
    auto operator=(const run_handle& other) -> run_handle& = delete;

    explicit operator bool() const noexcept { return pimpl != nullptr; }

    [[nodiscard]] auto id() const noexcept -> reference_process_id;

    /// @brief Read end of the combined output pipe.
    /// @note Reads reach end of input only once the child has fully exited
    ///   and the write end was closed by the waiting task.
    [[nodiscard]] auto output() const noexcept -> reference_descriptor;

    /// @brief Reads the next chunk of the combined output.
    /// @return <code>cancelled_read_result</code> once the run is cancelled,
    ///   even while processes outside the child's group still hold the
    ///   output pipe open.
    auto read(const std::span<char>& buffer) -> read_result;

    /// @brief Terminates the child's process group and stops feeding input.
    /// @note Doesn't block. Releases a child blocked reading its input from
    ///   the live tail as well as one blocked writing its output.
    auto cancel() noexcept -> void;

    /// @brief Blocks until the child has fully exited, its output pipe is
    ///   closed, and the input feeding task has released its replay source.
    auto wait() -> wait_status;

    /// @brief Terminal status of the child if known yet.
    [[nodiscard]] auto status() const noexcept -> wait_status;

private:
    std::unique_ptr<impl> pimpl;
};

static_assert(std::is_default_constructible_v<run_handle>);
static_assert(std::is_move_constructible_v<run_handle>);
static_assert(!std::is_copy_constructible_v<run_handle>);

/// @brief Spawns the given command line under the configured shell.
/// @param[in] command Command line, passed as <code>shell -c command</code>.
/// @param[in] input Source of the child's standard input.
/// @param[in] cancel Token whose stop request cancels the run.
/// @param[in] opts Options.
/// @param[out] diags Diagnostic information.
/// @throws shell_not_found if no shell is configured or resolvable.
/// @throws spawn_error if the shell couldn't be started.
auto spawn(const std::string& command,
           replay_source input,
           std::stop_token cancel,
           const spawn_options& opts,
           std::ostream& diags) -> run_handle;

}

#endif /* reflow_supervisor_hpp */
