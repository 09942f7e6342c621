#ifndef reflow_child_process_hpp
#define reflow_child_process_hpp

#include <experimental/propagate_const>
#include <filesystem>
#include <memory> // for std::unique_ptr
#include <ostream>
#include <string>
#include <system_error> // for std::system_error
#include <type_traits> // for std::is_default_constructible_v
#include <vector>

#include "reflow/environment_map.hpp"
#include "reflow/os_error_code.hpp"
#include "reflow/reference_descriptor.hpp"
#include "reflow/reference_process_id.hpp"
#include "reflow/signal.hpp"
#include "reflow/wait_status.hpp"

namespace reflow {

/// @brief Failure to start a process.
/// @note The code is the <code>errno</code> value of whichever step failed,
///   including <code>execve</code> failing within the forked child.
struct spawn_error: std::system_error
{
    using std::system_error::system_error;
};

/// @brief Owning handle to a forked child process.
/// @note The child leads its own process group, so signals meant for it
///   can reach everything it started.
/// @note Provides RAII-styled ownership: destroying a handle to a child
///   that's still running kills its group and reaps it.
/// @note This type is movable but not copyable.
struct child_process
{
    struct impl;

    static constexpr auto default_process_id = invalid_process_id;

    child_process() noexcept;
    explicit child_process(reference_process_id id);
    child_process(child_process&& other) noexcept;
    child_process(const child_process& other) = delete;
    ~child_process();

    auto operator=(child_process&& other) noexcept -> child_process&;
    auto operator=(const child_process& other) -> child_process& = delete;

    explicit operator bool() const noexcept;

    [[nodiscard]] auto id() const noexcept -> reference_process_id;

    /// @brief Sends the given signal to the child's process group.
    /// @note Does nothing and returns <code>ESRCH</code> once the child has
    ///   been reaped, so a recycled process ID is never signaled.
    auto signal_group(signal sig) noexcept -> os_error_code;

    /// @brief Blocks until the child terminates, without reaping it.
    auto await_termination() const noexcept -> os_error_code;

    /// @brief Blocks until the child terminates, then reaps it.
    /// @note Safe to call again or from more than one thread.
    /// @return Terminal status of the child, or
    ///   <code>wait_unknown_status</code> if this has no child.
    auto wait() noexcept -> wait_status;

    /// @brief Status of the child.
    /// @note This is an observer function.
    /// @return <code>wait_unknown_status{}</code> if the child hasn't been
    ///   reaped yet (possibly because this has no child).
    [[nodiscard]] auto status() const noexcept -> wait_status;

private:
    std::experimental::propagate_const<std::unique_ptr<impl>> pimpl;
};

static_assert(std::is_default_constructible_v<child_process>);
static_assert(std::is_move_constructible_v<child_process>);
static_assert(std::is_move_assignable_v<child_process>);
static_assert(!std::is_copy_constructible_v<child_process>);
static_assert(!std::is_copy_assignable_v<child_process>);

/// @brief Forks a child that executes the given file.
/// @param[in] file Path of the executable file.
/// @param[in] arguments Argument vector, including the program name.
/// @param[in] env Environment of the new process.
/// @param[in] input Descriptor duplicated to the child's standard input.
/// @param[in] output Descriptor duplicated to the child's standard output
///   and standard error.
/// @param[out] diags Diagnostic information.
/// @throws spawn_error if forking or executing the file fails.
auto fork_exec(const std::filesystem::path& file,
               std::vector<std::string> arguments,
               const environment_map& env,
               reference_descriptor input,
               reference_descriptor output,
               std::ostream& diags) -> child_process;

}

#endif /* reflow_child_process_hpp */
