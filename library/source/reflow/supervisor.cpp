#include <array>
#include <cerrno> // for ESRCH
#include <exception> // for std::exception
#include <functional> // for std::function
#include <future>
#include <optional>
#include <utility> // for std::move
#include <vector>

#include "reflow/owning_descriptor.hpp"
#include "reflow/pipe.hpp"
#include "reflow/read_result.hpp"
#include "reflow/supervisor.hpp"
#include "reflow/utility.hpp"

namespace reflow {

struct run_handle::impl
{
    impl(child_process c, owning_descriptor out_read,
         owning_descriptor out_write, signal sig, std::ostream& d):
        child{std::move(c)},
        output_read{std::move(out_read)},
        output_write{std::move(out_write)},
        cancel_signal{sig},
        diags{d}
    {
        // Intentionally empty.
    }

    ~impl();

    child_process child;
    owning_descriptor output_read;

    /// @brief Parent's copy of the output pipe's write end.
    /// @note Only touched by the waiting task once started.
    owning_descriptor output_write;

    /// @brief Becomes readable for good once the run is cancelled.
    /// @note Lets reads of the output, and writes of the input, give up
    ///   on pipes that outlive the process group.
    pipe cancelled;

    std::stop_source feeder_stop;
    signal cancel_signal;
    std::ostream& diags;
    std::future<void> feeder;
    std::future<wait_status> waiter;
    std::optional<wait_status> final_status;
    std::optional<std::stop_callback<std::function<void()>>> on_cancel;
};

namespace {

constexpr auto wakeup_byte = '\0';

auto cancel_run(run_handle::impl& self) noexcept -> void
{
    self.feeder_stop.request_stop();
    const auto byte = std::array<char, 1u>{wakeup_byte};
    if (const auto err = write_all(self.cancelled.end(pipe::io::write), byte);
        err != os_error_code{}) {
        write_diags(self.diags, "waking tasks of ", self.child.id(),
                    " failed: ", err);
    }
    const auto err = self.child.signal_group(self.cancel_signal);
    if (err == os_error_code{}) {
        write_diags(self.diags, "sent ", self.cancel_signal,
                    " to group of ", self.child.id());
    }
    else if (err != os_error_code{ESRCH}) {
        write_diags(self.diags, "sending ", self.cancel_signal,
                    " to group of ", self.child.id(), " failed: ", err);
    }
}

auto feed(replay_source input, owning_descriptor destination,
          std::stop_token stop, reference_descriptor wakeup,
          std::size_t chunk_size, std::ostream& diags) -> void
{
    mask_background_signals();
    auto chunk = std::vector<char>(chunk_size);
    auto total = std::size_t{};
    for (;;) {
        const auto result = input.read(chunk, stop);
        if (const auto p = std::get_if<data_read_result>(&result)) {
            const auto err = write_all(destination,
                std::span<const char>{data(chunk), p->size}, wakeup);
            if (err != os_error_code{}) {
                write_diags(diags, "input to ", destination,
                            " stopped after ", total, "b: ", err);
                break;
            }
            total += p->size;
            continue;
        }
        write_diags(diags, "input to ", destination, " stopped after ",
                    total, "b: ", result);
        break;
    }
    input.close();
    if (const auto err = destination.close(); err != os_error_code{}) {
        write_diags(diags, "closing input pipe failed: ", err);
    }
}

auto await_exit(run_handle::impl& self) -> wait_status
{
    mask_background_signals();
    const auto id = self.child.id();
    if (const auto err = self.child.await_termination();
        err != os_error_code{}) {
        write_diags(self.diags, "waiting on ", id, " failed: ", err);
    }
    // Whatever the shell left running in its group goes with it.
    if (const auto err = self.child.signal_group(self.cancel_signal);
        (err != os_error_code{}) && (err != os_error_code{ESRCH})) {
        write_diags(self.diags, "signaling group of ", id, " failed: ", err);
    }
    const auto status = self.child.wait();
    if (const auto err = self.output_write.close(); err != os_error_code{}) {
        write_diags(self.diags, "closing output pipe failed: ", err);
    }
    self.feeder_stop.request_stop();
    write_diags(self.diags, id, " exited: ", status);
    return status;
}

}

run_handle::impl::~impl()
{
    // Tasks still running at this point would never finish otherwise.
    if (!final_status) {
        cancel_run(*this);
    }
}

run_handle::run_handle() noexcept = default;

run_handle::run_handle(std::unique_ptr<impl> p) noexcept: pimpl{std::move(p)}
{
    // Intentionally empty.
}

run_handle::run_handle(run_handle&& other) noexcept = default;

run_handle::~run_handle()
{
    if (pimpl) {
        cancel();
        try {
            wait();
        }
        catch (const std::exception& ex) {
            write_diags(pimpl->diags, "run_handle::~run_handle: ", ex.what());
        }
    }
}

auto run_handle::operator=(run_handle&& other) noexcept -> run_handle&
{
    if (&other != this) {
        auto retired = run_handle{std::move(*this)};
        pimpl = std::move(other.pimpl);
    }
    return *this;
}

auto run_handle::id() const noexcept -> reference_process_id
{
    return pimpl? pimpl->child.id(): invalid_process_id;
}

auto run_handle::output() const noexcept -> reference_descriptor
{
    return pimpl? reference_descriptor(pimpl->output_read):
                  descriptors::invalid_id;
}

auto run_handle::read(const std::span<char>& buffer) -> read_result
{
    if (!pimpl) {
        return eof_read_result{};
    }
    return reflow::read(pimpl->output_read, buffer,
                        pimpl->cancelled.end(pipe::io::read));
}

auto run_handle::cancel() noexcept -> void
{
    if (pimpl) {
        cancel_run(*pimpl);
    }
}

auto run_handle::wait() -> wait_status
{
    if (!pimpl) {
        return wait_unknown_status{};
    }
    auto& self = *pimpl;
    if (!self.final_status) {
        const auto status = self.waiter.get();
        self.feeder.get();
        self.on_cancel.reset();
        self.final_status = status;
    }
    return *self.final_status;
}

auto run_handle::status() const noexcept -> wait_status
{
    return pimpl? pimpl->child.status(): wait_status{wait_unknown_status{}};
}

auto spawn(const std::string& command,
           replay_source input,
           std::stop_token cancel,
           const spawn_options& opts,
           std::ostream& diags) -> run_handle
{
    const auto shell = opts.shell.empty()?
        resolve_shell(opts.environment): opts.shell;
    auto input_pipe = pipe{};
    auto output_pipe = pipe{};
    auto child = fork_exec(shell, make_shell_arguments(shell, command),
                           opts.environment,
                           input_pipe.end(pipe::io::read),
                           output_pipe.end(pipe::io::write),
                           diags);
    // Only the child may hold the read end, else writes never fail with
    // EPIPE once the child is gone.
    if (const auto err = input_pipe.close(pipe::io::read);
        err != os_error_code{}) {
        write_diags(diags, "closing input pipe read end failed: ", err);
    }
    auto p = std::make_unique<run_handle::impl>(std::move(child),
        output_pipe.release(pipe::io::read),
        output_pipe.release(pipe::io::write),
        opts.cancel_signal, diags);
    auto& self = *p;
    self.feeder = std::async(std::launch::async, feed, std::move(input),
                             input_pipe.release(pipe::io::write),
                             self.feeder_stop.get_token(),
                             self.cancelled.end(pipe::io::read), opts.chunk_size,
                             std::ref(diags));
    self.waiter = std::async(std::launch::async, [&self](){
        return await_exit(self);
    });
    // Runs in whichever thread requests the stop.
    self.on_cancel.emplace(std::move(cancel), [&self](){
        cancel_run(self);
    });
    return run_handle{std::move(p)};
}

}
