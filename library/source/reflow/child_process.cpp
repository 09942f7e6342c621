#include <fcntl.h> // for fcntl, FD_CLOEXEC
#include <pthread.h>
#include <unistd.h> // for fork, execve, setpgid, dup2, _exit

#include <array>
#include <cerrno> // for errno
#include <csignal>
#include <cstring> // for std::memcpy
#include <iomanip> // for std::quoted
#include <mutex>
#include <utility> // for std::exchange

#include "reflow/child_process.hpp"
#include "reflow/pipe.hpp"
#include "reflow/read_result.hpp"
#include "reflow/utility.hpp"
#include "reflow/process_wait.hpp"

namespace reflow {

struct child_process::impl
{
    explicit impl(reference_process_id id) noexcept: pid{id} {}

    mutable std::mutex mutex;
    const reference_process_id pid;
    wait_status last_status{wait_unknown_status{}};
};

namespace {

constexpr auto exec_failure_code = 127;

/// @brief Exit the forked child.
/// @note We have to be careful how we actually exit. As a C++ library,
///   we need to make sure our normal destructors actually don't get
///   called from this context! Otherwise, things like calling
///   std::future::get can block awaiting a thread that it thinks is
///   running when ::fork() actually doesn't copy threads.
[[noreturn]]
auto exit_child(int exit_code) -> void
{
    ::_exit(exit_code); // NOLINT(concurrency-mt-unsafe)
}

/// @brief Reports the calling child's errno over the status pipe, then exits.
/// @note Only async-signal-safe calls are allowed here.
[[noreturn]]
auto fail_child(reference_descriptor status) -> void
{
    const auto err = errno;
    auto bytes = std::array<char, sizeof(err)>{};
    std::memcpy(data(bytes), &err, sizeof(err));
    (void) ::write(int(status), data(bytes), size(bytes)); // nothing left to tell on failure
    exit_child(exec_failure_code);
}

/// @note Only async-signal-safe calls are allowed here.
auto redirect(reference_descriptor from, reference_descriptor to) -> bool
{
    if (from == to) {
        return ::fcntl(int(to), F_SETFD, 0) != -1;
    }
    return ::dup2(int(from), int(to)) != -1;
}

/// @note Only async-signal-safe calls are allowed here.
auto reset_signal_dispositions() -> bool
{
    struct sigaction sa{};
    sa.sa_handler = SIG_DFL; // NOLINT(cppcoreguidelines-pro-type-union-access)
    sigemptyset(&sa.sa_mask);
    for (const auto sig: {SIGINT, SIGTERM, SIGPIPE, SIGCHLD}) {
        if (::sigaction(sig, &sa, nullptr) == -1) {
            return false;
        }
    }
    return true;
}

[[noreturn]]
auto exec_child(const std::filesystem::path& file,
                char * const *argv,
                char * const *envp,
                reference_descriptor input,
                reference_descriptor output,
                reference_descriptor status) -> void
{
    // Have to be careful here!
    // From https://man7.org/linux/man-pages/man2/fork.2.html:
    //   "in a multithreaded program, the child can safely call only
    //   async-signal-safe functions (see signal-safety(7)) until such
    //   time as it calls execve(2)."
    if (!reset_signal_dispositions()) {
        fail_child(status);
    }
    if (::setpgid(0, 0) == -1) {
        fail_child(status);
    }
    if (!redirect(input, descriptors::stdin_id) ||
        !redirect(output, descriptors::stdout_id) ||
        !redirect(output, descriptors::stderr_id)) {
        fail_child(status);
    }
    auto no_signals = sigset_t{};
    sigemptyset(&no_signals);
    pthread_sigmask(SIG_SETMASK, &no_signals, nullptr);
    ::execve(file.c_str(), argv, envp);
    fail_child(status);
}

auto read_child_error(reference_descriptor status) -> os_error_code
{
    auto bytes = std::array<char, sizeof(int)>{};
    auto have = std::size_t{};
    while (have < size(bytes)) {
        const auto result = read(status, std::span<char>{bytes}.subspan(have));
        if (const auto p = std::get_if<data_read_result>(&result)) {
            have += p->size;
            continue;
        }
        break;
    }
    if (have < size(bytes)) {
        return os_error_code{};
    }
    auto err = 0;
    std::memcpy(&err, data(bytes), sizeof(err));
    return os_error_code{err};
}

}

child_process::child_process() noexcept = default;

child_process::child_process(reference_process_id id):
    pimpl{(id <= no_process_id)? nullptr: std::make_unique<impl>(id)}
{
    // Intentionally empty.
}

child_process::child_process(child_process&& other) noexcept = default;

child_process::~child_process()
{
    if (pimpl && !is_terminal(status())) {
        signal_group(signals::kill());
        wait();
    }
}

auto child_process::operator=(child_process&& other) noexcept
    -> child_process&
{
    if (&other != this) {
        if (pimpl && !is_terminal(status())) {
            signal_group(signals::kill());
            wait();
        }
        pimpl = std::move(other.pimpl);
    }
    return *this;
}

child_process::operator bool() const noexcept
{
    return pimpl.get() != nullptr;
}

auto child_process::id() const noexcept -> reference_process_id
{
    return pimpl? pimpl->pid: default_process_id;
}

auto child_process::signal_group(signal sig) noexcept -> os_error_code
{
    if (!pimpl) {
        return os_error_code{ESRCH};
    }
    const std::lock_guard lock{pimpl->mutex};
    if (is_terminal(pimpl->last_status)) {
        return os_error_code{ESRCH};
    }
    // The child leads its own group, so the group ID is its process ID.
    return send_signal_to_group(sig, pimpl->pid);
}

auto child_process::await_termination() const noexcept -> os_error_code
{
    if (!pimpl) {
        return os_error_code{ECHILD};
    }
    {
        const std::lock_guard lock{pimpl->mutex};
        if (is_terminal(pimpl->last_status)) {
            return os_error_code{};
        }
    }
    return ::reflow::await_termination(pimpl->pid);
}

auto child_process::wait() noexcept -> wait_status
{
    if (!pimpl) {
        return wait_unknown_status{};
    }
    const auto err = await_termination();
    const std::lock_guard lock{pimpl->mutex};
    if (is_terminal(pimpl->last_status)) {
        return pimpl->last_status;
    }
    if (err != os_error_code{}) {
        return pimpl->last_status;
    }
    const auto result = reap(pimpl->pid);
    if (const auto p = std::get_if<wait_status>(&result)) {
        pimpl->last_status = *p;
    }
    return pimpl->last_status;
}

auto child_process::status() const noexcept -> wait_status
{
    if (!pimpl) {
        return wait_unknown_status{};
    }
    const std::lock_guard lock{pimpl->mutex};
    return pimpl->last_status;
}

auto fork_exec(const std::filesystem::path& file,
               std::vector<std::string> arguments,
               const environment_map& env,
               reference_descriptor input,
               reference_descriptor output,
               std::ostream& diags) -> child_process
{
    // Everything the child needs is prepared before forking since making
    // it involves calls that aren't async-signal-safe.
    auto env_buffers = make_arg_bufs(env);
    const auto argv = make_argv(arguments);
    const auto envp = make_argv(env_buffers);
    auto status_pipe = pipe{};

    // Keep signals from being handled in the child before its dispositions
    // are reset.
    auto all_signals = sigset_t{};
    auto old_set = sigset_t{};
    sigfillset(&all_signals);
    pthread_sigmask(SIG_SETMASK, &all_signals, &old_set);
    const auto pid = ::fork();
    if (pid == 0) {
        exec_child(file, argv.data(), envp.data(), input, output,
                   status_pipe.end(pipe::io::write));
    }
    const auto fork_err = errno;
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    if (pid == -1) {
        throw spawn_error{fork_err, std::system_category(), "fork"};
    }
    auto child = child_process{reference_process_id{pid}};
    // Also set from this side so the group exists before anyone signals it.
    if ((::setpgid(pid, pid) == -1) && (errno != EACCES)) {
        write_diags(diags, "setpgid(", child.id(), ") failed: ",
                    os_error_code(errno));
    }
    if (const auto err = status_pipe.close(pipe::io::write);
        err != os_error_code{}) {
        write_diags(diags, "closing status pipe failed: ", err);
    }
    if (const auto err = read_child_error(status_pipe.end(pipe::io::read));
        err != os_error_code{}) {
        const auto status = child.wait();
        write_diags(diags, "execve of ", file, " by ", child.id(),
                    " failed: ", err, ", ", status);
        throw spawn_error{int(err), std::system_category(),
            "cannot execute " + file.string()};
    }
    write_diags(diags, "started ", child.id(), " running ",
                std::quoted(join(arguments)));
    return child;
}

}
