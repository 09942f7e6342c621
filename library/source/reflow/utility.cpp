#include <pthread.h> // for pthread_sigmask

#include <atomic>
#include <cerrno> // for errno
#include <csignal>
#include <cstdint> // for std::uint64_t

#include "reflow/utility.hpp"

namespace reflow {

namespace {

/// @brief Signals delivered but not taken yet, one bit per signal number.
auto received_signals() noexcept -> std::atomic<std::uint64_t>&
{
    static_assert(std::atomic<std::uint64_t>::is_always_lock_free);
    static auto value = std::atomic<std::uint64_t>{};
    return value;
}

constexpr auto to_signal_bit(int sig) noexcept -> std::uint64_t
{
    return ((sig > 0) && (sig < 64))? (std::uint64_t{1u} << (sig - 1)): 0u;
}

auto sigaction_cb(int sig, siginfo_t * /*info*/, void * /*ucontext*/) -> void
{
    received_signals().fetch_or(to_signal_bit(sig));
}

}

auto take_signal(signal sig) noexcept -> bool
{
    const auto bit = to_signal_bit(int(sig));
    return (received_signals().fetch_and(~bit) & bit) != 0u;
}

auto make_argv(const std::span<std::string>& args)
    -> std::vector<char*>
{
    auto result = std::vector<char*>{};
    for (auto&& arg: args) {
        result.push_back(arg.data());
    }
    result.push_back(nullptr); // last element must always be nullptr!
    return result;
}

auto write(std::ostream& os, const std::error_code& ec)
    -> std::ostream&
{
    os << ec << " (" << ec.message() << ")";
    return os;
}

auto diags_mutex() noexcept -> std::mutex&
{
    static std::mutex mutex;
    return mutex;
}

auto set_signal_handler(signal sig) -> void
{
    struct sigaction sa{};
    sa.sa_sigaction = sigaction_cb;
    sa.sa_flags = SA_SIGINFO;
    sigfillset(&sa.sa_mask);
    const auto psig = int(sig);
    if (::sigaction(psig, &sa, nullptr) == -1) {
        throw std::system_error{errno, std::system_category()};
    }
    auto new_set = sigset_t{};
    sigemptyset(&new_set);
    sigaddset(&new_set, psig);
    pthread_sigmask(SIG_UNBLOCK, &new_set, nullptr);
}

auto mask_background_signals() noexcept -> void
{
    auto new_set = sigset_t{};
    sigemptyset(&new_set);
    sigaddset(&new_set, int(signals::interrupt()));
    sigaddset(&new_set, int(signals::terminate()));
    sigaddset(&new_set, int(signals::pipe()));
    pthread_sigmask(SIG_BLOCK, &new_set, nullptr);
}

auto join(const std::span<const std::string>& strings) -> std::string
{
    auto result = std::string{};
    auto prefix = "";
    for (auto&& string: strings) {
        result += prefix;
        result += string;
        prefix = " ";
    }
    return result;
}

}
