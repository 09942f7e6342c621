#include <fcntl.h> // for O_CLOEXEC
#include <unistd.h> // for pipe2

#include <array>
#include <cerrno> // for errno
#include <system_error>
#include <utility> // for std::move

#include "reflow/pipe.hpp"

namespace reflow {

pipe::pipe()
{
    auto fds = std::array<int, 2u>{-1, -1};
    if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
        throw std::system_error{errno, std::system_category(), "pipe2"};
    }
    read_end = owning_descriptor{fds[0]};
    write_end = owning_descriptor{fds[1]};
}

auto pipe::end(io side) const noexcept -> reference_descriptor
{
    return (side == io::read)? reference_descriptor(read_end):
                               reference_descriptor(write_end);
}

auto pipe::close(io side) noexcept -> os_error_code
{
    return (side == io::read)? read_end.close(): write_end.close();
}

auto pipe::release(io side) noexcept -> owning_descriptor
{
    return (side == io::read)? std::move(read_end): std::move(write_end);
}

auto operator<<(std::ostream& os, pipe::io value) -> std::ostream&
{
    os << ((value == pipe::io::read) ? "read": "write");
    return os;
}

auto operator<<(std::ostream& os, const pipe& value) -> std::ostream&
{
    os << "pipe{";
    os << reference_descriptor(value.read_end);
    os << ",";
    os << reference_descriptor(value.write_end);
    os << "}";
    return os;
}

}
