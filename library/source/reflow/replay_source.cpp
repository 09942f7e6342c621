#include <algorithm> // for std::min, std::copy_n
#include <utility> // for std::move

#include "reflow/replay_source.hpp"

namespace reflow {

replay_source::replay_source(std::string snapshot_, live_tail tail_) noexcept:
    snapshot{std::move(snapshot_)}, tail{std::move(tail_)}
{
    // Intentionally empty.
}

auto replay_source::read(const std::span<char>& buffer, std::stop_token stop)
    -> read_result
{
    if (offset < size(snapshot)) {
        const auto count = std::min(size(buffer), size(snapshot) - offset);
        std::copy_n(data(snapshot) + offset, count, data(buffer));
        offset += count;
        return data_read_result{count};
    }
    if (!tail) {
        return eof_read_result{};
    }
    return tail.read(buffer, std::move(stop));
}

auto replay_source::close() noexcept -> void
{
    tail.close();
}

auto make_replay_source(capture_tee& tee) -> replay_source
{
    // The tail's position freezes the snapshot length, so no byte is both
    // in the snapshot and yielded by the tail.
    auto tail = tee.open_tail();
    auto snapshot = tee.snapshot(tail.position());
    return replay_source{std::move(snapshot), std::move(tail)};
}

}
