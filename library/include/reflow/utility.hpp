#ifndef reflow_utility_hpp
#define reflow_utility_hpp

#include <mutex>
#include <ostream>
#include <sstream> // for std::ostringstream
#include <span>
#include <string>
#include <system_error> // for std::error_code
#include <vector>

#include "reflow/signal.hpp"

namespace reflow {

namespace detail {
template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}

/// @brief Makes a vector that's compatible for use with <code>execve</code>'s
///   <code>argv</code> parameter.
/// @note This is NOT an "async-signal-safe" function. So, it's not suitable
/// for forked child to call.
/// @see https://man7.org/linux/man-pages/man7/signal-safety.7.html
auto make_argv(const std::span<std::string>& args)
    -> std::vector<char*>;

auto write(std::ostream& os, const std::error_code& ec)
    -> std::ostream&;

auto diags_mutex() noexcept -> std::mutex&;

/// @brief Writes one line of diagnostics made up of the given arguments.
/// @note Safe to call from concurrently running tasks sharing the same
///   stream. Lines are never interleaved with each other.
template <class... Args>
auto write_diags(std::ostream& diags, const Args&... args) -> void
{
    std::ostringstream line;
    (line << ... << args);
    line << '\n';
    const std::lock_guard lock{diags_mutex()};
    diags << line.str();
    diags.flush();
}

/// @brief Installs a handler that records delivery of the given signal.
/// @note The handler is installed without <code>SA_RESTART</code> so that
///   blocking calls in the receiving thread fail with <code>EINTR</code>.
/// @see take_signal.
auto set_signal_handler(signal sig) -> void;

/// @brief Whether the given signal was delivered since last taken.
/// @note Async-signal-safe.
auto take_signal(signal sig) noexcept -> bool;

/// @brief Blocks, in the calling thread, the signals that only the
///   foreground thread is meant to see.
/// @note Called at the start of every background task. Blocking
///   <code>SIGPIPE</code> turns writes to a closed pipe into
///   <code>EPIPE</code> errors.
auto mask_background_signals() noexcept -> void;

/// @brief Joins the given strings with a single space between each.
auto join(const std::span<const std::string>& strings) -> std::string;

}

#endif /* reflow_utility_hpp */
