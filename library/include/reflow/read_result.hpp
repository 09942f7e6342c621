#ifndef reflow_read_result_hpp
#define reflow_read_result_hpp

#include <concepts> // for std::regular
#include <cstddef> // for std::size_t
#include <ostream>
#include <span>

#include "reflow/os_error_code.hpp"
#include "reflow/reference_descriptor.hpp"
#include "reflow/variant.hpp" // for <variant>, reflow::variant, plus ostream support

namespace reflow {

/// @brief One or more bytes were read.
struct data_read_result {
    std::size_t size{};
    constexpr auto operator<=>(const data_read_result&) const noexcept =
        default;
};

auto operator<<(std::ostream& os, const data_read_result& arg)
    -> std::ostream&;

/// @brief Source reached its end. No more bytes will ever come.
struct eof_read_result {
    constexpr auto operator<=>(const eof_read_result&) const noexcept =
        default;
};

auto operator<<(std::ostream& os, const eof_read_result&)
    -> std::ostream&;

/// @brief Source failed. No more bytes will ever come.
struct error_read_result {
    os_error_code data;
    constexpr auto operator<=>(const error_read_result&) const noexcept =
        default;
};

auto operator<<(std::ostream& os, const error_read_result& arg)
    -> std::ostream&;

/// @brief Reader gave up because a stop was requested.
struct cancelled_read_result {
    constexpr auto operator<=>(const cancelled_read_result&) const noexcept =
        default;
};

auto operator<<(std::ostream& os, const cancelled_read_result&)
    -> std::ostream&;

using read_result = variant<
    data_read_result,
    eof_read_result,
    error_read_result,
    cancelled_read_result
>;

static_assert(std::regular<read_result>);

/// @brief Whether the given result ends its source for good.
constexpr auto is_terminal(const read_result& result) noexcept -> bool
{
    return std::holds_alternative<eof_read_result>(result)
        || std::holds_alternative<error_read_result>(result);
}

/// @brief Reads up to <code>size(buffer)</code> bytes from the descriptor.
/// @note Retries on <code>EINTR</code>. Never returns
///   <code>cancelled_read_result</code>.
auto read(reference_descriptor d, const std::span<char>& buffer) noexcept
    -> read_result;

/// @brief Reads up to <code>size(buffer)</code> bytes from the descriptor
///   unless the wakeup descriptor becomes readable first.
/// @return <code>cancelled_read_result</code> once <code>wakeup</code> is
///   readable, even if <code>d</code> is too.
auto read(reference_descriptor d, const std::span<char>& buffer,
          reference_descriptor wakeup) noexcept -> read_result;

/// @brief Writes all of the given bytes to the descriptor.
/// @return Zero error code on success, else the error that stopped the
///   write (e.g. <code>EPIPE</code> once the reading side is gone).
auto write_all(reference_descriptor d,
               const std::span<const char>& buffer) noexcept
    -> os_error_code;

/// @brief Writes all of the given bytes to the descriptor unless the
///   wakeup descriptor becomes readable first.
/// @note Writes at most <code>PIPE_BUF</code> bytes at a time so that a
///   pipe polled as writable never blocks the call.
/// @return <code>ECANCELED</code> if woken up before all was written.
auto write_all(reference_descriptor d,
               const std::span<const char>& buffer,
               reference_descriptor wakeup) noexcept
    -> os_error_code;

}

#endif /* reflow_read_result_hpp */
