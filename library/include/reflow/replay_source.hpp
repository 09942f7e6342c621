#ifndef reflow_replay_source_hpp
#define reflow_replay_source_hpp

#include <cstddef> // for std::size_t
#include <span>
#include <stop_token>
#include <string>
#include <type_traits> // for std::is_move_constructible_v

#include "reflow/capture_tee.hpp"
#include "reflow/read_result.hpp"

namespace reflow {

/// @brief Replay source.
/// @note Yields a snapshot of already captured bytes and then continues
///   with the live tail of the capture, which starts exactly where the
///   snapshot ends. One of these is made per run.
/// @note This type is movable but not copyable.
struct replay_source
{
    replay_source() noexcept = default;
    replay_source(std::string snapshot, live_tail tail) noexcept;

    replay_source(replay_source&& other) noexcept = default;
    auto operator=(replay_source&& other) noexcept -> replay_source& = default;

    replay_source(const replay_source& other) = delete;
    auto operator=(const replay_source& other) -> replay_source& = delete;

    /// @brief Reads the next bytes.
    /// @note Drains the snapshot first, then blocks on the live tail.
    /// @return Terminal result of the raw source once everything has been
    ///   read; <code>eof_read_result</code> if this has no live tail.
    auto read(const std::span<char>& buffer, std::stop_token stop = {})
        -> read_result;

    /// @brief Number of bytes of the snapshot not yet read.
    [[nodiscard]] auto pending() const noexcept -> std::size_t
    {
        return size(snapshot) - offset;
    }

    /// @brief Releases the live tail, if still held.
    auto close() noexcept -> void;

private:
    std::string snapshot;
    std::size_t offset{};
    live_tail tail;
};

static_assert(std::is_default_constructible_v<replay_source>);
static_assert(std::is_move_constructible_v<replay_source>);
static_assert(!std::is_copy_constructible_v<replay_source>);

/// @brief Makes a replay source of everything the given tee has captured
///   so far plus its live tail.
/// @throws tail_busy if another replay source of the tee holds the tail.
auto make_replay_source(capture_tee& tee) -> replay_source;

}

#endif /* reflow_replay_source_hpp */
