#include <algorithm> // for std::count
#include <exception> // for std::exception
#include <future>
#include <mutex>
#include <stop_token>
#include <system_error> // for std::system_error
#include <utility> // for std::move
#include <vector>

#include "reflow/read_result.hpp"
#include "reflow/replay_source.hpp"
#include "reflow/run_coordinator.hpp"
#include "reflow/utility.hpp"

namespace reflow {

struct run_coordinator::run_state
{
    std::stop_source stop;
    run_handle handle;
    std::future<void> reader;

    mutable std::mutex mutex;
    run_phase phase{run_phase::starting};
    std::string output;
    std::size_t bytes{};
    std::size_t lines{};
};

run_coordinator::run_coordinator(capture_tee& tee_, output_sink sink_,
                                 coordinator_options opts,
                                 std::ostream& diags_):
    tee{tee_},
    sink{std::move(sink_)},
    options{std::move(opts)},
    diags{diags_}
{
    // Intentionally empty.
}

run_coordinator::~run_coordinator()
{
    try {
        stop_active();
    }
    catch (const std::exception& ex) {
        write_diags(diags, "run_coordinator::~run_coordinator: ", ex.what());
    }
}

auto run_coordinator::handle(const control_event& event)
    -> std::optional<std::string>
{
    using result_type = std::optional<std::string>;
    write_diags(diags, "handling ", event);
    return std::visit(detail::overloaded{
        [this](const submit_event& e) -> result_type {
            submit(e.text);
            return {};
        },
        [this](const navigate_prev_event&) -> result_type {
            return log.prev();
        },
        [this](const navigate_next_event&) -> result_type {
            return log.next();
        },
        [this](const quit_event&) -> result_type {
            quit();
            return {};
        },
    }, event);
}

auto run_coordinator::effective_command(const std::string& text) const
    -> std::string
{
    return text.empty()? options.fallback_command: text;
}

auto run_coordinator::start(const std::string& text) -> run_phase
{
    const auto command = effective_command(text);

    // The old run must let go of the tee's live tail before the new
    // replay source can take it.
    stop_active();

    last_command = command;
    active.reset();
    auto state = std::make_unique<run_state>();
    sink(reset_event{command});
    try {
        state->handle = spawn(command, make_replay_source(tee),
                              state->stop.get_token(), options.spawn, diags);
    }
    catch (const shell_not_found& ex) {
        state->phase = run_phase::failed;
        write_diags(diags, "cannot run ", command, ": ", ex.what());
        sink(error_event{ex.what()});
    }
    catch (const std::system_error& ex) {
        state->phase = run_phase::failed;
        write_diags(diags, "cannot run ", command, ": ", ex.what());
        sink(error_event{ex.what()});
    }
    if (state->phase == run_phase::failed) {
        active = std::move(state);
        return run_phase::failed;
    }
    state->phase = run_phase::streaming;
    auto& st = *state;
    st.reader = std::async(std::launch::async, [this,&st](){
        stream(st);
    });
    active = std::move(state);
    return run_phase::streaming;
}

auto run_coordinator::submit(const std::string& text) -> run_phase
{
    log.append(effective_command(text));
    return start(text);
}

auto run_coordinator::quit() -> void
{
    stop_active();
}

auto run_coordinator::wait() -> run_phase
{
    if (active && active->reader.valid()) {
        active->reader.wait();
    }
    return phase();
}

auto run_coordinator::phase() const -> run_phase
{
    if (!active) {
        return run_phase::idle;
    }
    const std::lock_guard lock{active->mutex};
    return active->phase;
}

auto run_coordinator::output() const -> std::string
{
    if (!active) {
        return {};
    }
    const std::lock_guard lock{active->mutex};
    return active->output;
}

auto run_coordinator::byte_count() const -> std::size_t
{
    if (!active) {
        return 0u;
    }
    const std::lock_guard lock{active->mutex};
    return active->bytes;
}

auto run_coordinator::line_count() const -> std::size_t
{
    if (!active) {
        return 0u;
    }
    const std::lock_guard lock{active->mutex};
    return active->lines;
}

auto run_coordinator::write_transcript(std::ostream& os,
                                       std::string_view program) const
    -> void
{
    const auto text = output();
    os << text;
    if (!text.empty() && text.back() != '\n') {
        os << '\n';
    }
    os << '\n' << program << ": " << last_command << '\n';
}

auto run_coordinator::stop_active() -> void
{
    if (!active) {
        return;
    }
    auto& st = *active;
    st.stop.request_stop();
    if (st.reader.valid()) {
        st.reader.get();
    }
    const auto status = st.handle.wait();
    auto phase = run_phase::idle;
    {
        const std::lock_guard lock{st.mutex};
        if (!is_final(st.phase)) {
            st.phase = run_phase::cancelled;
        }
        phase = st.phase;
    }
    write_diags(diags, "run of ", last_command, " ", phase, ", ", status);
}

auto run_coordinator::stream(run_state& st) -> void
{
    mask_background_signals();
    auto chunk = std::vector<char>(options.chunk_size);
    for (;;) {
        const auto result = st.handle.read(chunk);
        if (st.stop.stop_requested()
            || std::holds_alternative<cancelled_read_result>(result)) {
            // Superseded: whatever else the run writes is never shown.
            return;
        }
        if (const auto p = std::get_if<data_read_result>(&result)) {
            const auto data = std::string_view{chunk.data(), p->size};
            auto bytes = std::size_t{};
            auto lines = std::size_t{};
            {
                const std::lock_guard lock{st.mutex};
                st.output.append(data);
                st.bytes += size(data);
                st.lines += static_cast<std::size_t>(
                    std::count(begin(data), end(data), '\n'));
                bytes = st.bytes;
                lines = st.lines;
            }
            sink(chunk_event{data, bytes, lines});
            continue;
        }
        auto bytes = std::size_t{};
        {
            const std::lock_guard lock{st.mutex};
            st.phase = run_phase::finished;
            bytes = st.bytes;
        }
        if (const auto p = std::get_if<error_read_result>(&result)) {
            write_diags(diags, "reading output of ", st.handle.id(),
                        " failed: ", p->data);
            sink(error_event{"reading output failed: " + to_string(p->data)});
            return;
        }
        // The write end is only closed after the child is reaped.
        sink(finished_event{st.handle.status(), bytes});
        return;
    }
}

}
