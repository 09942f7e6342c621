#include <fcntl.h> // for ::open

#include <array>
#include <cerrno> // for EISDIR
#include <chrono>
#include <future>
#include <sstream> // for std::ostringstream
#include <stop_token>
#include <string>
#include <string_view>
#include <thread> // for std::this_thread

#include <gtest/gtest.h>

#include "reflow/capture_tee.hpp"
#include "reflow/owning_descriptor.hpp"
#include "reflow/pipe.hpp"
#include "reflow/replay_source.hpp"

using namespace reflow;
using namespace std::chrono_literals;

namespace {

auto write_text(reference_descriptor d, std::string_view text) -> os_error_code
{
    return write_all(d, std::span<const char>{data(text), size(text)});
}

/// @brief Reads everything from the source using small reads.
auto drain(replay_source& source, read_result& last) -> std::string
{
    auto result = std::string{};
    auto buffer = std::array<char, 3u>{};
    for (;;) {
        last = source.read(buffer);
        if (const auto p = std::get_if<data_read_result>(&last)) {
            result.append(data(buffer), p->size);
            continue;
        }
        return result;
    }
}

auto make_lines(std::size_t count) -> std::string
{
    auto result = std::string{};
    for (auto i = std::size_t{}; i < count; ++i) {
        result += "line " + std::to_string(i) + "\n";
    }
    return result;
}

}

TEST(replay_source, default_construction)
{
    auto source = replay_source{};
    EXPECT_EQ(source.pending(), 0u);
    auto buffer = std::array<char, 8u>{};
    EXPECT_EQ(source.read(buffer), read_result{eof_read_result{}});
}

TEST(replay_source, snapshot_then_live)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    auto chunk = std::array<char, 64u>{};
    ASSERT_EQ(write_text(input.end(reflow::pipe::io::write), "abc"), os_error_code{});
    ASSERT_EQ(tee.read_raw(chunk), read_result{data_read_result{3u}});

    auto source = make_replay_source(tee);
    EXPECT_EQ(source.pending(), 3u);
    EXPECT_TRUE(tee.is_tail_open());

    ASSERT_EQ(write_text(input.end(reflow::pipe::io::write), "def"), os_error_code{});
    ASSERT_EQ(tee.read_raw(chunk), read_result{data_read_result{3u}});
    ASSERT_EQ(input.close(reflow::pipe::io::write), os_error_code{});
    ASSERT_EQ(tee.read_raw(chunk), read_result{eof_read_result{}});

    auto last = read_result{};
    EXPECT_EQ(drain(source, last), "abcdef");
    EXPECT_EQ(last, read_result{eof_read_result{}});
    source.close();
    EXPECT_FALSE(tee.is_tail_open());
}

TEST(replay_source, no_gap_or_repeat_while_capturing)
{
    const auto expected = make_lines(2000u);
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    std::ostringstream diags;
    auto capturing = start_capture(tee, diags);
    auto writing = std::async(std::launch::async, [&](){
        auto sent = std::string_view{expected};
        while (!sent.empty()) {
            const auto piece = sent.substr(0u, 7u);
            if (write_text(input.end(reflow::pipe::io::write), piece) != os_error_code{}) {
                break;
            }
            sent.remove_prefix(size(piece));
        }
        return input.close(reflow::pipe::io::write);
    });
    while (tee.size() < size(expected) / 2u) {
        std::this_thread::sleep_for(1ms);
    }
    auto source = make_replay_source(tee);
    auto last = read_result{};
    EXPECT_EQ(drain(source, last), expected);
    EXPECT_EQ(last, read_result{eof_read_result{}});
    EXPECT_EQ(writing.get(), os_error_code{});
    EXPECT_EQ(capturing.get(), read_result{eof_read_result{}});
}

TEST(replay_source, input_ended_beforehand)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    std::ostringstream diags;
    auto capturing = start_capture(tee, diags);
    ASSERT_EQ(write_text(input.end(reflow::pipe::io::write), "3\n1\n2\n"),
              os_error_code{});
    ASSERT_EQ(input.close(reflow::pipe::io::write), os_error_code{});
    ASSERT_EQ(capturing.get(), read_result{eof_read_result{}});

    auto source = make_replay_source(tee);
    EXPECT_EQ(source.pending(), 6u);
    auto last = read_result{};
    EXPECT_EQ(drain(source, last), "3\n1\n2\n");
    EXPECT_EQ(last, read_result{eof_read_result{}});
    EXPECT_EQ(drain(source, last), "");
    EXPECT_EQ(last, read_result{eof_read_result{}});
}

TEST(replay_source, input_failed)
{
    const auto directory = owning_descriptor{::open("/", O_RDONLY|O_CLOEXEC)};
    ASSERT_TRUE(directory);
    auto tee = capture_tee{directory};
    const auto failed = read_result{error_read_result{os_error_code{EISDIR}}};

    // Already waiting on the live tail when the input fails.
    auto before = make_replay_source(tee);
    std::ostringstream diags;
    auto capturing = start_capture(tee, diags);
    auto last = read_result{};
    EXPECT_EQ(drain(before, last), "");
    EXPECT_EQ(last, failed);
    ASSERT_EQ(capturing.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(capturing.get(), failed);
    before.close();

    auto after = make_replay_source(tee);
    EXPECT_EQ(drain(after, last), "");
    EXPECT_EQ(last, failed);
}

TEST(replay_source, read_is_cancellable)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    auto chunk = std::array<char, 64u>{};
    ASSERT_EQ(write_text(input.end(reflow::pipe::io::write), "ab"), os_error_code{});
    ASSERT_EQ(tee.read_raw(chunk), read_result{data_read_result{2u}});

    auto source = make_replay_source(tee);
    auto stop = std::stop_source{};
    auto buffer = std::array<char, 64u>{};
    EXPECT_EQ(source.read(buffer, stop.get_token()),
              read_result{data_read_result{2u}});
    auto reading = std::async(std::launch::async, [&](){
        return source.read(buffer, stop.get_token());
    });
    EXPECT_EQ(reading.wait_for(50ms), std::future_status::timeout);
    stop.request_stop();
    ASSERT_EQ(reading.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(reading.get(), read_result{cancelled_read_result{}});
}

TEST(replay_source, second_source_needs_first_closed)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    auto first = make_replay_source(tee);
    EXPECT_THROW(static_cast<void>(make_replay_source(tee)), tail_busy);
    first.close();
    EXPECT_NO_THROW(static_cast<void>(make_replay_source(tee)));
}
