#include <algorithm> // for std::min, std::copy_n
#include <array>
#include <utility> // for std::exchange
#include <vector>

#include "reflow/capture_tee.hpp"
#include "reflow/utility.hpp"

namespace reflow {

namespace {

constexpr auto wakeup_byte = '\0';

}

live_tail::live_tail(capture_tee& owner, std::size_t from) noexcept:
    tee{&owner}, offset{from}
{
    // Intentionally empty.
}

live_tail::live_tail(live_tail&& other) noexcept:
    tee{std::exchange(other.tee, nullptr)},
    offset{std::exchange(other.offset, 0u)}
{
    // Intentionally empty.
}

live_tail::~live_tail()
{
    close();
}

auto live_tail::operator=(live_tail&& other) noexcept -> live_tail&
{
    if (&other != this) {
        close();
        tee = std::exchange(other.tee, nullptr);
        offset = std::exchange(other.offset, 0u);
    }
    return *this;
}

auto live_tail::close() noexcept -> void
{
    if (const auto p = std::exchange(tee, nullptr)) {
        const std::lock_guard lock{p->mutex};
        p->tail_open = false;
    }
}

auto live_tail::read(const std::span<char>& buffer, std::stop_token stop)
    -> read_result
{
    if (!tee) {
        return eof_read_result{};
    }
    auto& owner = *tee;
    std::unique_lock lock{owner.mutex};
    const auto ready = owner.cv.wait(lock, stop, [&owner,this]{
        return (size(owner.buffer) > offset) || owner.terminal.has_value();
    });
    if (!ready) {
        return cancelled_read_result{};
    }
    if (size(owner.buffer) > offset) {
        const auto count = std::min(size(buffer), size(owner.buffer) - offset);
        std::copy_n(data(owner.buffer) + offset, count, data(buffer));
        offset += count;
        return data_read_result{count};
    }
    return *owner.terminal;
}

capture_tee::capture_tee(reference_descriptor source_): source{source_}
{
    // Intentionally empty.
}

capture_tee::~capture_tee() = default;

auto capture_tee::read_raw(const std::span<char>& chunk) -> read_result
{
    {
        const std::lock_guard lock{mutex};
        if (terminal) {
            return *terminal;
        }
        if (interrupted) {
            return cancelled_read_result{};
        }
    }
    const auto result = read(source, chunk, wakeup.end(pipe::io::read));
    if (std::holds_alternative<cancelled_read_result>(result)) {
        return result;
    }
    {
        const std::lock_guard lock{mutex};
        if (const auto p = std::get_if<data_read_result>(&result)) {
            buffer.append(data(chunk), p->size);
        }
        else if (is_terminal(result)) {
            terminal = result;
        }
    }
    cv.notify_all();
    return result;
}

auto capture_tee::snapshot() const -> std::string
{
    const std::lock_guard lock{mutex};
    return buffer;
}

auto capture_tee::snapshot(std::size_t length) const -> std::string
{
    const std::lock_guard lock{mutex};
    return buffer.substr(0u, length);
}

auto capture_tee::size() const -> std::size_t
{
    const std::lock_guard lock{mutex};
    return buffer.size();
}

auto capture_tee::terminal_state() const -> std::optional<read_result>
{
    const std::lock_guard lock{mutex};
    return terminal;
}

auto capture_tee::open_tail() -> live_tail
{
    const std::lock_guard lock{mutex};
    if (tail_open) {
        throw tail_busy{"live tail already open"};
    }
    tail_open = true;
    return live_tail{*this, buffer.size()};
}

auto capture_tee::is_tail_open() const -> bool
{
    const std::lock_guard lock{mutex};
    return tail_open;
}

auto capture_tee::interrupt() noexcept -> os_error_code
{
    {
        const std::lock_guard lock{mutex};
        if (std::exchange(interrupted, true)) {
            return os_error_code{};
        }
    }
    // Nothing ever reads from the wakeup pipe, so one byte keeps it
    // readable for good.
    const auto byte = std::array<char, 1u>{wakeup_byte};
    return write_all(wakeup.end(pipe::io::write), byte);
}

auto capture_tee::capture(std::ostream& diags, std::size_t chunk_size)
    -> read_result
{
    auto chunk = std::vector<char>(chunk_size);
    auto total = std::size_t{};
    for (;;) {
        const auto result = read_raw(chunk);
        if (const auto p = std::get_if<data_read_result>(&result)) {
            total += p->size;
            continue;
        }
        write_diags(diags, "capture of ", source, " stopped after ",
                    total, "b: ", result);
        return result;
    }
}

auto start_capture(capture_tee& tee, std::ostream& diags)
    -> std::future<read_result>
{
    return std::async(std::launch::async, [&tee,&diags](){
        mask_background_signals();
        return tee.capture(diags);
    });
}

}
