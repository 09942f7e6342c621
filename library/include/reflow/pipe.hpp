#ifndef reflow_pipe_hpp
#define reflow_pipe_hpp

#include <ostream>
#include <type_traits> // for std::is_nothrow_move_*

#include "reflow/owning_descriptor.hpp"

namespace reflow {

/// @brief POSIX pipe.
/// @note Both ends are opened close-on-exec, so only descriptors that are
///   explicitly duplicated into a child survive its <code>execve</code>.
/// @note This class is movable but not copyable.
struct pipe
{
    enum class io: unsigned {read = 0u, write = 1u};

    /// @throws std::system_error if the underlying OS call fails.
    pipe();

    pipe(pipe&& other) noexcept = default;
    auto operator=(pipe&& other) noexcept -> pipe& = default;

    // This class is not meant to be copied!
    pipe(const pipe& other) = delete;
    auto operator=(const pipe& other) -> pipe& = delete;

    [[nodiscard]] auto end(io side) const noexcept -> reference_descriptor;

    auto close(io side) noexcept -> os_error_code;

    /// @brief Takes ownership of the given side away from this pipe.
    auto release(io side) noexcept -> owning_descriptor;

    friend auto operator<<(std::ostream& os, const pipe& value)
        -> std::ostream&;

private:
    owning_descriptor read_end;
    owning_descriptor write_end;
};

static_assert(!std::is_copy_constructible_v<pipe>);
static_assert(!std::is_copy_assignable_v<pipe>);
static_assert(std::is_nothrow_move_constructible_v<pipe>);
static_assert(std::is_nothrow_move_assignable_v<pipe>);

auto operator<<(std::ostream& os, pipe::io value) -> std::ostream&;

auto operator<<(std::ostream& os, const pipe& value) -> std::ostream&;

}

#endif /* reflow_pipe_hpp */
