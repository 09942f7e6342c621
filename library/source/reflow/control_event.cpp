#include <iomanip> // for std::quoted

#include "reflow/control_event.hpp"

namespace reflow {

auto operator<<(std::ostream& os, const submit_event& value)
    -> std::ostream&
{
    os << "submit " << std::quoted(value.text);
    return os;
}

auto operator<<(std::ostream& os, const navigate_prev_event&)
    -> std::ostream&
{
    os << "navigate-prev";
    return os;
}

auto operator<<(std::ostream& os, const navigate_next_event&)
    -> std::ostream&
{
    os << "navigate-next";
    return os;
}

auto operator<<(std::ostream& os, const quit_event&)
    -> std::ostream&
{
    os << "quit";
    return os;
}

}
