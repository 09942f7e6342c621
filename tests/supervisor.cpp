#include <array>
#include <chrono>
#include <csignal> // for SIGKILL
#include <future>
#include <sstream> // for std::ostringstream
#include <stop_token>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "reflow/capture_tee.hpp"
#include "reflow/pipe.hpp"
#include "reflow/supervisor.hpp"

using namespace reflow;
using namespace std::chrono_literals;

namespace {

constexpr auto no_such_path = "/fee/fii/foo/fum";

auto write_text(reference_descriptor d, std::string_view text) -> os_error_code
{
    return write_all(d, std::span<const char>{data(text), size(text)});
}

auto read_all(reference_descriptor d) -> std::string
{
    auto result = std::string{};
    auto buffer = std::array<char, 256u>{};
    for (;;) {
        const auto last = read(d, buffer);
        if (const auto p = std::get_if<data_read_result>(&last)) {
            result.append(data(buffer), p->size);
            continue;
        }
        return result;
    }
}

auto sh_options() -> spawn_options
{
    auto opts = spawn_options{};
    opts.shell = "/bin/sh";
    opts.environment = get_environ();
    return opts;
}

/// @brief Input whose capture is fully read, through the given end.
auto capture_all(capture_tee& tee) -> read_result
{
    auto chunk = std::array<char, 64u>{};
    for (;;) {
        const auto result = tee.read_raw(chunk);
        if (!std::holds_alternative<data_read_result>(result)) {
            return result;
        }
    }
}

}

TEST(supervisor, default_run_handle)
{
    auto handle = run_handle{};
    EXPECT_FALSE(handle);
    EXPECT_EQ(handle.id(), invalid_process_id);
    EXPECT_EQ(handle.output(), descriptors::invalid_id);
    EXPECT_EQ(handle.wait(), wait_status{wait_unknown_status{}});
    EXPECT_NO_THROW(handle.cancel());
}

TEST(supervisor, cat_passes_input_through)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    ASSERT_EQ(write_text(input.end(reflow::pipe::io::write), "hello\nworld\n"),
              os_error_code{});
    ASSERT_EQ(input.close(reflow::pipe::io::write), os_error_code{});
    ASSERT_EQ(capture_all(tee), read_result{eof_read_result{}});

    std::ostringstream diags;
    auto cancel = std::stop_source{};
    auto handle = spawn("cat", make_replay_source(tee), cancel.get_token(),
                        sh_options(), diags);
    EXPECT_TRUE(handle);
    EXPECT_NE(handle.id(), invalid_process_id);
    EXPECT_EQ(read_all(handle.output()), "hello\nworld\n");
    EXPECT_EQ(handle.wait(), wait_status{wait_exit_status{0}});
    EXPECT_EQ(handle.status(), wait_status{wait_exit_status{0}});
    EXPECT_FALSE(tee.is_tail_open());
    EXPECT_FALSE(diags.str().empty());
}

TEST(supervisor, output_combines_stdout_and_stderr)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    std::ostringstream diags;
    auto handle = spawn("echo out; echo err 1>&2", make_replay_source(tee),
                        std::stop_token{}, sh_options(), diags);
    EXPECT_EQ(read_all(handle.output()), "out\nerr\n");
    EXPECT_EQ(handle.wait(), wait_status{wait_exit_status{0}});
}

TEST(supervisor, exit_without_reading_input)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    std::ostringstream diags;
    auto handle = spawn("exit 3", make_replay_source(tee), std::stop_token{},
                        sh_options(), diags);
    EXPECT_EQ(read_all(handle.output()), "");
    auto waiting = std::async(std::launch::async, [&handle](){
        return handle.wait();
    });
    ASSERT_EQ(waiting.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(waiting.get(), wait_status{wait_exit_status{3}});
    EXPECT_FALSE(tee.is_tail_open());
}

TEST(supervisor, spawn_error)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    std::ostringstream diags;
    auto opts = sh_options();
    opts.shell = no_such_path;
    EXPECT_THROW(spawn("cat", make_replay_source(tee), std::stop_token{},
                       opts, diags), spawn_error);
    EXPECT_FALSE(tee.is_tail_open());
}

TEST(supervisor, shell_not_found)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    std::ostringstream diags;
    auto opts = spawn_options{};
    opts.environment = environment_map{{"PATH", no_such_path}};
    EXPECT_THROW(spawn("cat", make_replay_source(tee), std::stop_token{},
                       opts, diags), shell_not_found);
    EXPECT_FALSE(tee.is_tail_open());
}

TEST(supervisor, cancel_while_blocked_on_live_tail)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    auto chunk = std::array<char, 64u>{};
    ASSERT_EQ(write_text(input.end(reflow::pipe::io::write), "a\n"), os_error_code{});
    ASSERT_EQ(tee.read_raw(chunk), read_result{data_read_result{2u}});

    std::ostringstream diags;
    auto cancel = std::stop_source{};
    auto handle = spawn("cat", make_replay_source(tee), cancel.get_token(),
                        sh_options(), diags);
    auto buffer = std::array<char, 64u>{};
    ASSERT_EQ(read(handle.output(), buffer), read_result{data_read_result{2u}});
    EXPECT_EQ(std::string_view(data(buffer), 2u), "a\n");

    // The writer of the input is still there but paused.
    cancel.request_stop();
    auto waiting = std::async(std::launch::async, [&handle](){
        return handle.wait();
    });
    ASSERT_EQ(waiting.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(waiting.get(), wait_status{wait_signaled_status{SIGKILL}});
    EXPECT_EQ(read_all(handle.output()), "");
    EXPECT_FALSE(tee.is_tail_open());
}

TEST(supervisor, cancel_runaway_output)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    std::ostringstream diags;
    auto handle = spawn("yes", make_replay_source(tee), std::stop_token{},
                        sh_options(), diags);
    auto buffer = std::array<char, 64u>{};
    ASSERT_TRUE(std::holds_alternative<data_read_result>(
        read(handle.output(), buffer)));
    handle.cancel();
    auto waiting = std::async(std::launch::async, [&handle](){
        return handle.wait();
    });
    ASSERT_EQ(waiting.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(waiting.get(), wait_status{wait_signaled_status{SIGKILL}});
}

TEST(supervisor, destruction_cancels)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    std::ostringstream diags;
    const auto start = std::chrono::steady_clock::now();
    {
        auto handle = spawn("sleep 30", make_replay_source(tee),
                            std::stop_token{}, sh_options(), diags);
        EXPECT_TRUE(handle);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
    EXPECT_FALSE(tee.is_tail_open());
}

TEST(supervisor, cancel_with_output_held_outside_group)
{
    auto input = reflow::pipe{};
    auto tee = capture_tee{input.end(reflow::pipe::io::read)};
    std::ostringstream diags;
    auto handle = spawn("setsid sleep 5 & echo hi", make_replay_source(tee),
                        std::stop_token{}, sh_options(), diags);
    auto text = std::string{};
    auto buffer = std::array<char, 64u>{};
    while (text.size() < 3u) {
        const auto result = handle.read(buffer);
        const auto p = std::get_if<data_read_result>(&result);
        ASSERT_NE(p, nullptr) << result;
        text.append(data(buffer), p->size);
    }
    EXPECT_EQ(text, "hi\n");

    // The detached sleep keeps the output open past the shell's exit.
    const auto start = std::chrono::steady_clock::now();
    handle.cancel();
    auto reading = std::async(std::launch::async, [&handle, &buffer](){
        return handle.read(buffer);
    });
    ASSERT_EQ(reading.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(reading.get(), read_result{cancelled_read_result{}});
    EXPECT_TRUE(is_terminal(handle.wait()));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
}
