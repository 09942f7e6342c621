#include <iomanip> // for std::quoted

#include "reflow/output_event.hpp"

namespace reflow {

auto operator<<(std::ostream& os, const reset_event& value)
    -> std::ostream&
{
    os << "reset for " << std::quoted(value.command);
    return os;
}

auto operator<<(std::ostream& os, const chunk_event& value)
    -> std::ostream&
{
    os << "chunk of " << size(value.data) << "b";
    os << ", total=" << value.total_bytes << "b";
    os << ", lines=" << value.total_lines;
    return os;
}

auto operator<<(std::ostream& os, const error_event& value)
    -> std::ostream&
{
    os << "Error: " << value.message;
    return os;
}

auto operator<<(std::ostream& os, const finished_event& value)
    -> std::ostream&
{
    os << "finished with " << value.status;
    os << " after " << value.total_bytes << "b";
    return os;
}

}
