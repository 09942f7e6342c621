#include "reflow/run_phase.hpp"

namespace reflow {

auto operator<<(std::ostream& os, run_phase value) -> std::ostream&
{
    os << to_cstring(value);
    return os;
}

}
