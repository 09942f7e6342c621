#include <unistd.h> // for close

#include <cerrno> // for errno
#include <utility> // for std::exchange

#include "reflow/owning_descriptor.hpp"

namespace reflow {

owning_descriptor::~owning_descriptor()
{
    close();
}

owning_descriptor::owning_descriptor(owning_descriptor&& other) noexcept
    : d{std::exchange(other.d, default_descriptor)} {}

auto owning_descriptor::operator=(owning_descriptor&& other) noexcept
    -> owning_descriptor&
{
    if (&other != this) {
        close();
        d = std::exchange(other.d, default_descriptor);
    }
    return *this;
}

auto owning_descriptor::close() noexcept -> os_error_code
{
    if (d != descriptors::invalid_id) {
        const auto fd = int(std::exchange(d, descriptors::invalid_id));
        if (::close(fd) == -1) {
            return os_error_code{errno};
        }
    }
    return os_error_code{};
}

auto owning_descriptor::release() noexcept -> reference_descriptor
{
    return std::exchange(d, descriptors::invalid_id);
}

}
