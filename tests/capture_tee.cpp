#include <fcntl.h> // for ::open

#include <array>
#include <cerrno> // for EISDIR
#include <chrono>
#include <future>
#include <sstream> // for std::ostringstream
#include <stop_token>
#include <string_view>

#include <gtest/gtest.h>

#include "reflow/capture_tee.hpp"
#include "reflow/owning_descriptor.hpp"
#include "reflow/pipe.hpp"

using namespace reflow;
using namespace std::chrono_literals;

namespace {

auto write_text(reference_descriptor d, std::string_view text) -> os_error_code
{
    return write_all(d, std::span<const char>{data(text), size(text)});
}

}

TEST(capture_tee, construction)
{
    auto source = reflow::pipe{};
    const auto tee = capture_tee{source.end(reflow::pipe::io::read)};
    EXPECT_EQ(tee.size(), 0u);
    EXPECT_EQ(tee.snapshot(), "");
    EXPECT_FALSE(tee.terminal_state());
    EXPECT_FALSE(tee.is_tail_open());
}

TEST(capture_tee, snapshots_only_grow)
{
    auto source = reflow::pipe{};
    auto tee = capture_tee{source.end(reflow::pipe::io::read)};
    auto chunk = std::array<char, 64u>{};

    ASSERT_EQ(write_text(source.end(reflow::pipe::io::write), "abc"), os_error_code{});
    EXPECT_EQ(tee.read_raw(chunk), read_result{data_read_result{3u}});
    const auto first = tee.snapshot();
    EXPECT_EQ(first, "abc");

    ASSERT_EQ(write_text(source.end(reflow::pipe::io::write), "de"), os_error_code{});
    EXPECT_EQ(tee.read_raw(chunk), read_result{data_read_result{2u}});
    const auto second = tee.snapshot();
    EXPECT_TRUE(second.starts_with(first));
    EXPECT_EQ(second, "abcde");
    EXPECT_EQ(tee.size(), 5u);
    EXPECT_EQ(tee.snapshot(2u), "ab");
    EXPECT_EQ(tee.snapshot(100u), "abcde");
}

TEST(capture_tee, end_of_input_is_terminal)
{
    auto source = reflow::pipe{};
    auto tee = capture_tee{source.end(reflow::pipe::io::read)};
    auto chunk = std::array<char, 64u>{};
    ASSERT_EQ(write_text(source.end(reflow::pipe::io::write), "x"), os_error_code{});
    ASSERT_EQ(source.close(reflow::pipe::io::write), os_error_code{});
    EXPECT_EQ(tee.read_raw(chunk), read_result{data_read_result{1u}});
    EXPECT_FALSE(tee.terminal_state());
    EXPECT_EQ(tee.read_raw(chunk), read_result{eof_read_result{}});
    EXPECT_EQ(tee.terminal_state(), read_result{eof_read_result{}});
    EXPECT_EQ(tee.read_raw(chunk), read_result{eof_read_result{}});
    EXPECT_EQ(tee.snapshot(), "x");
}

TEST(capture_tee, one_live_tail_at_a_time)
{
    auto source = reflow::pipe{};
    auto tee = capture_tee{source.end(reflow::pipe::io::read)};
    auto tail = tee.open_tail();
    EXPECT_TRUE(tail);
    EXPECT_TRUE(tee.is_tail_open());
    EXPECT_THROW(static_cast<void>(tee.open_tail()), tail_busy);
    tail.close();
    EXPECT_FALSE(tail);
    EXPECT_FALSE(tee.is_tail_open());
    {
        const auto other = tee.open_tail();
        EXPECT_TRUE(tee.is_tail_open());
    }
    EXPECT_FALSE(tee.is_tail_open());
}

TEST(capture_tee, live_tail_yields_what_follows)
{
    auto source = reflow::pipe{};
    auto tee = capture_tee{source.end(reflow::pipe::io::read)};
    auto chunk = std::array<char, 64u>{};
    ASSERT_EQ(write_text(source.end(reflow::pipe::io::write), "ab"), os_error_code{});
    ASSERT_EQ(tee.read_raw(chunk), read_result{data_read_result{2u}});

    auto tail = tee.open_tail();
    EXPECT_EQ(tail.position(), 2u);
    ASSERT_EQ(write_text(source.end(reflow::pipe::io::write), "cd"), os_error_code{});
    ASSERT_EQ(tee.read_raw(chunk), read_result{data_read_result{2u}});

    auto buffer = std::array<char, 64u>{};
    EXPECT_EQ(tail.read(buffer), read_result{data_read_result{2u}});
    EXPECT_EQ(std::string_view(data(buffer), 2u), "cd");
    EXPECT_EQ(tail.position(), 4u);

    ASSERT_EQ(source.close(reflow::pipe::io::write), os_error_code{});
    ASSERT_EQ(tee.read_raw(chunk), read_result{eof_read_result{}});
    EXPECT_EQ(tail.read(buffer), read_result{eof_read_result{}});
}

TEST(capture_tee, live_tail_read_stops)
{
    auto source = reflow::pipe{};
    auto tee = capture_tee{source.end(reflow::pipe::io::read)};
    auto tail = tee.open_tail();
    auto stop = std::stop_source{};
    auto buffer = std::array<char, 64u>{};
    auto reading = std::async(std::launch::async, [&](){
        return tail.read(buffer, stop.get_token());
    });
    EXPECT_EQ(reading.wait_for(50ms), std::future_status::timeout);
    stop.request_stop();
    ASSERT_EQ(reading.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(reading.get(), read_result{cancelled_read_result{}});
}

TEST(capture_tee, capture_until_end_of_input)
{
    auto source = reflow::pipe{};
    auto tee = capture_tee{source.end(reflow::pipe::io::read)};
    std::ostringstream diags;
    auto capturing = start_capture(tee, diags);
    ASSERT_EQ(write_text(source.end(reflow::pipe::io::write), "hello\n"),
              os_error_code{});
    ASSERT_EQ(source.close(reflow::pipe::io::write), os_error_code{});
    ASSERT_EQ(capturing.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(capturing.get(), read_result{eof_read_result{}});
    EXPECT_EQ(tee.snapshot(), "hello\n");
    EXPECT_FALSE(diags.str().empty());
}

TEST(capture_tee, read_error_is_terminal)
{
    const auto directory = owning_descriptor{::open("/", O_RDONLY|O_CLOEXEC)};
    ASSERT_TRUE(directory);
    auto tee = capture_tee{directory};
    std::ostringstream diags;
    const auto failed = read_result{error_read_result{os_error_code{EISDIR}}};
    EXPECT_EQ(tee.capture(diags), failed);
    EXPECT_EQ(tee.terminal_state(), failed);
    auto chunk = std::array<char, 8u>{};
    EXPECT_EQ(tee.read_raw(chunk), failed);
    EXPECT_EQ(tee.snapshot(), "");
}

TEST(capture_tee, interrupt)
{
    auto source = reflow::pipe{};
    auto tee = capture_tee{source.end(reflow::pipe::io::read)};
    std::ostringstream diags;
    auto capturing = start_capture(tee, diags);
    EXPECT_EQ(capturing.wait_for(50ms), std::future_status::timeout);
    EXPECT_EQ(tee.interrupt(), os_error_code{});
    EXPECT_EQ(tee.interrupt(), os_error_code{});
    ASSERT_EQ(capturing.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(capturing.get(), read_result{cancelled_read_result{}});
    EXPECT_FALSE(tee.terminal_state());
    auto chunk = std::array<char, 8u>{};
    EXPECT_EQ(tee.read_raw(chunk), read_result{cancelled_read_result{}});
}
