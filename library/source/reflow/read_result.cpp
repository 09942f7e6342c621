#include <poll.h>
#include <unistd.h> // for ::read, ::write

#include <algorithm> // for std::min
#include <array>
#include <cerrno> // for errno
#include <climits> // for PIPE_BUF

#include "reflow/read_result.hpp"

namespace reflow {

namespace {

enum class readiness { ready, woken, failed };

/// @brief Waits until <code>d</code> is ready for the given events or
///   <code>wakeup</code> has something to read, whichever comes first.
auto await_ready(reference_descriptor d, short events,
                 reference_descriptor wakeup, os_error_code& err) noexcept
    -> readiness
{
    auto fds = std::array<::pollfd, 2u>{
        ::pollfd{int(wakeup), POLLIN, 0},
        ::pollfd{int(d), events, 0},
    };
    while (::poll(data(fds), size(fds), -1) == -1) {
        if (errno != EINTR) {
            err = os_error_code{errno};
            return readiness::failed;
        }
    }
    return (fds[0].revents == 0)? readiness::ready: readiness::woken;
}

}

auto operator<<(std::ostream& os, const data_read_result& arg)
    -> std::ostream&
{
    os << "read " << arg.size << "b";
    return os;
}

auto operator<<(std::ostream& os, const eof_read_result&)
    -> std::ostream&
{
    os << "end of input";
    return os;
}

auto operator<<(std::ostream& os, const error_read_result& arg)
    -> std::ostream&
{
    os << "read failed: " << arg.data;
    return os;
}

auto operator<<(std::ostream& os, const cancelled_read_result&)
    -> std::ostream&
{
    os << "read cancelled";
    return os;
}

auto read(reference_descriptor d, const std::span<char>& buffer) noexcept
    -> read_result
{
    for (;;) {
        const auto nread = ::read(int(d), data(buffer), size(buffer));
        if (nread > 0) {
            return data_read_result{static_cast<std::size_t>(nread)};
        }
        if (nread == 0) {
            return eof_read_result{};
        }
        if (errno != EINTR) {
            return error_read_result{os_error_code{errno}};
        }
    }
}

auto write_all(reference_descriptor d,
               const std::span<const char>& buffer) noexcept
    -> os_error_code
{
    auto remaining = buffer;
    while (!empty(remaining)) {
        const auto nwritten = ::write(int(d), data(remaining), size(remaining));
        if (nwritten == -1) {
            if (errno == EINTR) {
                continue;
            }
            return os_error_code{errno};
        }
        remaining = remaining.subspan(static_cast<std::size_t>(nwritten));
    }
    return os_error_code{};
}

auto read(reference_descriptor d, const std::span<char>& buffer,
          reference_descriptor wakeup) noexcept -> read_result
{
    auto err = os_error_code{};
    switch (await_ready(d, POLLIN, wakeup, err)) {
    case readiness::woken:
        return cancelled_read_result{};
    case readiness::failed:
        return error_read_result{err};
    case readiness::ready:
        break;
    }
    return read(d, buffer);
}

auto write_all(reference_descriptor d,
               const std::span<const char>& buffer,
               reference_descriptor wakeup) noexcept
    -> os_error_code
{
    auto remaining = buffer;
    while (!empty(remaining)) {
        auto err = os_error_code{};
        switch (await_ready(d, POLLOUT, wakeup, err)) {
        case readiness::woken:
            return os_error_code{ECANCELED};
        case readiness::failed:
            return err;
        case readiness::ready:
            break;
        }
        const auto count = std::min(size(remaining), std::size_t{PIPE_BUF});
        const auto nwritten = ::write(int(d), data(remaining), count);
        if (nwritten == -1) {
            if (errno == EINTR) {
                continue;
            }
            return os_error_code{errno};
        }
        remaining = remaining.subspan(static_cast<std::size_t>(nwritten));
    }
    return os_error_code{};
}

}
