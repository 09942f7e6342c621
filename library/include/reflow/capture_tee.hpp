#ifndef reflow_capture_tee_hpp
#define reflow_capture_tee_hpp

#include <condition_variable>
#include <cstddef> // for std::size_t
#include <future>
#include <mutex>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept> // for std::logic_error
#include <stop_token>
#include <string>
#include <type_traits> // for std::is_move_constructible_v

#include "reflow/pipe.hpp"
#include "reflow/read_result.hpp"
#include "reflow/reference_descriptor.hpp"

namespace reflow {

struct capture_tee;

/// @brief Thrown on an attempt to open a second live tail of the same tee.
struct tail_busy: std::logic_error
{
    using std::logic_error::logic_error;
};

/// @brief Live continuation of a <code>capture_tee</code>.
/// @note Yields the bytes the tee captures from its position onward, in
///   the order captured, blocking while none are available yet.
/// @note At most one live tail per tee exists at a time. This type is
///   movable but not copyable, and must not outlive its tee.
struct live_tail
{
    live_tail() noexcept = default;
    live_tail(live_tail&& other) noexcept;
    live_tail(const live_tail& other) = delete;
    ~live_tail();

    auto operator=(live_tail&& other) noexcept -> live_tail&;
    auto operator=(const live_tail& other) -> live_tail& = delete;

    explicit operator bool() const noexcept { return tee != nullptr; }

    /// @brief Offset within the capture of the next byte this yields.
    [[nodiscard]] auto position() const noexcept -> std::size_t
    {
        return offset;
    }

    /// @brief Reads captured bytes, blocking until there are some, the tee
    ///   reaches a terminal state, or a stop is requested.
    /// @return The tee's terminal result once everything captured has been
    ///   read. <code>cancelled_read_result</code> if stopped first.
    auto read(const std::span<char>& buffer, std::stop_token stop = {})
        -> read_result;

    /// @brief Gives the tail back to its tee.
    auto close() noexcept -> void;

private:
    friend struct capture_tee;
    live_tail(capture_tee& owner, std::size_t from) noexcept;

    capture_tee* tee{};
    std::size_t offset{};
};

static_assert(std::is_default_constructible_v<live_tail>);
static_assert(std::is_move_constructible_v<live_tail>);
static_assert(!std::is_copy_constructible_v<live_tail>);

/// @brief Capture tee.
/// @note Wraps a raw input descriptor that can only be read forward and
///   once. Every byte read through it is appended to an in-memory capture
///   that only ever grows.
/// @note Exactly one task is meant to pull from the raw source through
///   <code>read_raw</code> (typically via <code>capture</code>). Any number
///   of threads may call the observer functions concurrently with it.
struct capture_tee
{
    static constexpr auto default_chunk_size = std::size_t{4096u};

    /// @throws std::system_error if the wake-up pipe can't be made.
    explicit capture_tee(reference_descriptor source);

    capture_tee(const capture_tee& other) = delete;
    auto operator=(const capture_tee& other) -> capture_tee& = delete;

    ~capture_tee();

    /// @brief Reads from the raw source into the given buffer and appends
    ///   what was read to the capture.
    /// @return Result from the raw source, passed through unchanged, or
    ///   <code>cancelled_read_result</code> after <code>interrupt</code>.
    /// @note End of input and read failures are also recorded as this
    ///   tee's terminal state.
    auto read_raw(const std::span<char>& buffer) -> read_result;

    /// @brief Consistent copy of everything captured so far.
    [[nodiscard]] auto snapshot() const -> std::string;

    /// @brief Consistent copy of the first bytes captured.
    /// @param[in] length Number of bytes wanted. Clamped to what's been
    ///   captured.
    [[nodiscard]] auto snapshot(std::size_t length) const -> std::string;

    /// @brief Number of bytes captured so far.
    [[nodiscard]] auto size() const -> std::size_t;

    /// @brief Terminal state of the raw source, if reached yet.
    /// @return <code>eof_read_result</code> or <code>error_read_result</code>
    ///   once reached.
    [[nodiscard]] auto terminal_state() const -> std::optional<read_result>;

    /// @brief Opens the live tail starting at the current capture size.
    /// @throws tail_busy if a live tail of this tee is already open.
    [[nodiscard]] auto open_tail() -> live_tail;

    /// @brief Whether a live tail of this tee is currently open.
    [[nodiscard]] auto is_tail_open() const -> bool;

    /// @brief Wakes up and stops any current or future <code>read_raw</code>.
    /// @return Error from waking up a blocked <code>read_raw</code>, if any.
    auto interrupt() noexcept -> os_error_code;

    /// @brief Pulls from the raw source until it ends, fails, or this is
    ///   interrupted.
    auto capture(std::ostream& diags,
                 std::size_t chunk_size = default_chunk_size) -> read_result;

private:
    friend struct live_tail;

    reference_descriptor source;
    pipe wakeup;

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::string buffer;
    std::optional<read_result> terminal;
    bool tail_open{};
    bool interrupted{};
};

/// @brief Runs <code>capture_tee::capture</code> as a background task.
auto start_capture(capture_tee& tee, std::ostream& diags)
    -> std::future<read_result>;

}

#endif /* reflow_capture_tee_hpp */
