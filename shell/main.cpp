#include <unistd.h> // for isatty, STDIN_FILENO

#include <cerrno> // for errno, EINTR
#include <cstdio> // for std::FILE, std::fopen, std::fclose
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory> // for std::unique_ptr
#include <optional>
#include <span>
#include <sstream> // for std::ostringstream
#include <string>
#include <string_view>
#include <vector>

#include <histedit.h>

#include "reflow/capture_tee.hpp"
#include "reflow/control_event.hpp"
#include "reflow/environment_map.hpp"
#include "reflow/output_event.hpp"
#include "reflow/read_result.hpp"
#include "reflow/reference_descriptor.hpp"
#include "reflow/run_coordinator.hpp"
#include "reflow/shell.hpp"
#include "reflow/signal.hpp"
#include "reflow/utility.hpp"

namespace {

using arguments = std::vector<std::string>;

constexpr auto default_program_name = "reflow";
constexpr auto diags_env_name = "REFLOW_DIAGS";
constexpr auto emacs_editor_str = "emacs";
constexpr auto tty_path = "/dev/tty";
constexpr auto clear_screen = "\033[H\033[2J";

const auto help_argument = std::string{"--help"};

/// @brief Makes the stated return type from given argument count and vector.
/// @param[in] ac Argument count.
/// @param[in] av Argument vector.
/// @pre @c av is non-null if @c ac is 1 or more.
auto make_arguments(int ac, const char*av[]) -> arguments
{
    auto args = arguments{};
    for (auto i = 0; i < ac; ++i) {
        args.emplace_back(av[i]);
    }
    return args;
}

auto print_usage(std::ostream& os, const std::string_view& program) -> void
{
    os << "usage: <producer> | " << program << " [command...]\n\n";
    os << "Captures standard input once and reruns the given shell command\n";
    os << "over all of it, showing the command's output as it streams in.\n";
    os << "Every entered line replaces the command and restarts it over the\n";
    os << "input captured so far plus whatever arrives after. Up and down\n";
    os << "arrows recall earlier commands. Interrupt or end-of-file quits,\n";
    os << "writing the last output and command to standard output.\n\n";
    os << "The command defaults to " << reflow::coordinator_options::default_command;
    os << ". Diagnostics are appended to the file named by ";
    os << diags_env_name << " if set.\n";
}

struct EditLineDeleter
{
    void operator()(EditLine *p)
    {
        el_end(p);
    }
};

using edit_line_ptr = std::unique_ptr<EditLine, EditLineDeleter>;

struct FileCloser
{
    void operator()(std::FILE *p)
    {
        std::fclose(p);
    }
};

using file_ptr = std::unique_ptr<std::FILE, FileCloser>;

/// @brief State the line editor's callbacks get at through its client data.
struct session
{
    reflow::run_coordinator& coordinator;
    std::string prompt_buf;
};

auto get_session(EditLine *el) -> session&
{
    void *data{};
    el_get(el, EL_CLIENTDATA, &data);
    return *static_cast<session*>(data);
}

char *prompt(EditLine *el)
{
    auto& s = get_session(el);
    s.prompt_buf = "[" + std::to_string(s.coordinator.byte_count()) + "] -->| ";
    return s.prompt_buf.data();
}

auto replace_line(EditLine *el, const std::optional<std::string>& text)
    -> unsigned char
{
    if (!text) {
        return CC_REFRESH_BEEP;
    }
    const auto li = el_line(el);
    const auto total = static_cast<int>(li->lastchar - li->buffer);
    const auto after = static_cast<int>(li->lastchar - li->cursor);
    el_cursor(el, after);
    el_deletestr(el, total);
    if (el_insertstr(el, text->c_str()) == -1) {
        return CC_ERROR;
    }
    return CC_REDISPLAY;
}

unsigned char history_prev(EditLine *el, [[maybe_unused]] int ch)
{
    auto& s = get_session(el);
    return replace_line(el, s.coordinator.handle(reflow::navigate_prev_event{}));
}

unsigned char history_next(EditLine *el, [[maybe_unused]] int ch)
{
    auto& s = get_session(el);
    return replace_line(el, s.coordinator.handle(reflow::navigate_next_event{}));
}

auto make_sink(reflow::reference_descriptor tty, std::ostream& diags)
    -> reflow::output_sink
{
    const auto show = [tty,&diags](const std::string_view& text){
        const auto err = reflow::write_all(tty,
            std::span<const char>{data(text), size(text)});
        if (err != reflow::os_error_code{}) {
            reflow::write_diags(diags, "writing to ", tty, " failed: ", err);
        }
    };
    return [show](const reflow::output_event& event){
        std::visit(reflow::detail::overloaded{
            [&show](const reflow::reset_event&){
                show(clear_screen);
            },
            [&show](const reflow::chunk_event& e){
                show(e.data);
            },
            [&show](const reflow::error_event& e){
                std::ostringstream os;
                os << e << '\n';
                show(os.str());
            },
            [](const reflow::finished_event&){},
        }, event);
    };
}

}

auto main(int argc, const char * argv[]) -> int
{
    const auto args = make_arguments(argc, argv);
    const auto program = args.empty()? std::string{default_program_name}:
        std::filesystem::path{args[0]}.filename().string();
    const auto command_args = std::span<const std::string>{args}
        .subspan(args.empty()? 0u: 1u);
    for (auto&& arg: command_args) {
        if (arg == help_argument) {
            print_usage(std::cout, program);
            return 0;
        }
    }

    if (::isatty(STDIN_FILENO)) {
        std::cerr << program << ": standard input is a terminal, ";
        std::cerr << "pipe something into it instead\n";
        return 1;
    }

    auto options = reflow::coordinator_options{};
    options.spawn.environment = reflow::get_environ();
    try {
        options.spawn.shell = reflow::resolve_shell(options.spawn.environment);
    }
    catch (const reflow::shell_not_found& ex) {
        std::cerr << program << ": " << ex.what() << "\n";
        return 1;
    }

    auto diags = std::ofstream{};
    if (const auto path = reflow::find_value(options.spawn.environment,
                                             diags_env_name)) {
        diags.open(*path, std::ios_base::app);
    }
    else {
        diags.open("/dev/null");
    }

    const auto tty_in = file_ptr{std::fopen(tty_path, "re")};
    const auto tty_out = file_ptr{std::fopen(tty_path, "we")};
    if (!tty_in || !tty_out) {
        std::cerr << program << ": cannot open " << tty_path << ": ";
        std::cerr << reflow::last_os_error() << "\n";
        return 1;
    }
    const auto tty = reflow::reference_descriptor{::fileno(tty_out.get())};

    // Tasks started from here on only see signals meant for them.
    reflow::mask_background_signals();

    auto tee = reflow::capture_tee{reflow::descriptors::stdin_id};
    auto capturing = reflow::start_capture(tee, diags);
    reflow::set_signal_handler(reflow::signals::interrupt());

    auto status = 0;
    {
        auto coordinator = reflow::run_coordinator{
            tee, make_sink(tty, diags), options, diags
        };
        auto state = session{coordinator, {}};

        auto el = edit_line_ptr{
            el_init(program.c_str(), tty_in.get(), tty_out.get(), stderr)
        };
        el_set(el.get(), EL_CLIENTDATA, &state);
        el_set(el.get(), EL_SIGNAL, 1); // installs sig handlers for resizing, etc.
        el_set(el.get(), EL_PROMPT, prompt);
        el_set(el.get(), EL_EDITOR, emacs_editor_str);
        el_set(el.get(), EL_ADDFN, "reflow-prev",
               "Replaces the line with the previous command", history_prev);
        el_set(el.get(), EL_ADDFN, "reflow-next",
               "Replaces the line with the next command", history_next);
        el_set(el.get(), EL_BIND, "\\e[A", "reflow-prev", nullptr);
        el_set(el.get(), EL_BIND, "\\e[B", "reflow-next", nullptr);
        el_set(el.get(), EL_BIND, "\\eOA", "reflow-prev", nullptr);
        el_set(el.get(), EL_BIND, "\\eOB", "reflow-next", nullptr);
        el_set(el.get(), EL_BIND, "^P", "reflow-prev", nullptr);
        el_set(el.get(), EL_BIND, "^N", "reflow-next", nullptr);
        el_source(el.get(), nullptr);

        // The running command is where editing starts from.
        const auto initial = reflow::join(command_args);
        if (!initial.empty()) {
            el_push(el.get(), initial.c_str());
        }
        coordinator.start(initial);
        for (;;) {
            auto count = 0;
            errno = 0;
            const auto buf = el_gets(el.get(), &count);
            if (!buf || count <= 0) {
                if (reflow::take_signal(reflow::signals::interrupt())
                    || errno != EINTR) {
                    break;
                }
                continue;
            }
            auto line = std::string{buf, static_cast<std::size_t>(count)};
            if (!line.empty() && line.back() == '\n') {
                line.pop_back();
            }
            coordinator.handle(reflow::submit_event{line});
        }
        coordinator.handle(reflow::quit_event{});

        // Gives the terminal back before the transcript gets written.
        el.reset();
        coordinator.write_transcript(std::cout, program);
        std::cout.flush();
        if (!std::cout) {
            status = 1;
        }
    }

    if (const auto err = tee.interrupt(); err != reflow::os_error_code{}) {
        reflow::write_diags(diags, "interrupting capture failed: ", err);
    }
    reflow::write_diags(diags, "capture ended: ", capturing.get());
    return status;
}
