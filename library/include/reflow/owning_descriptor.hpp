#ifndef reflow_owning_descriptor_hpp
#define reflow_owning_descriptor_hpp

#include <type_traits> // for std::is_default_constructible_v

#include "reflow/os_error_code.hpp"
#include "reflow/reference_descriptor.hpp"

namespace reflow {

/// @brief Owning file descriptor.
/// @note Closes the descriptor it owns on destruction.
struct owning_descriptor
{
    static constexpr auto default_descriptor = descriptors::invalid_id;

    owning_descriptor() noexcept = default;
    explicit owning_descriptor(reference_descriptor d_) noexcept: d{d_} {}
    explicit owning_descriptor(int d_) noexcept: d{reference_descriptor(d_)} {}
    owning_descriptor(owning_descriptor&& other) noexcept;
    owning_descriptor(const owning_descriptor& other) = delete;
    ~owning_descriptor();

    auto operator=(owning_descriptor&& other) noexcept -> owning_descriptor&;
    auto operator=(const owning_descriptor& other) noexcept = delete;

    operator reference_descriptor() const noexcept { return d; }
    explicit operator int() const noexcept { return int(d); }

    explicit operator bool() const noexcept { return d != default_descriptor; }

    auto close() noexcept -> os_error_code;

    /// @brief Gives up ownership without closing.
    [[nodiscard]] auto release() noexcept -> reference_descriptor;

private:
    reference_descriptor d{default_descriptor};
};

static_assert(std::is_default_constructible_v<owning_descriptor>);
static_assert(std::is_move_constructible_v<owning_descriptor>);
static_assert(std::is_move_assignable_v<owning_descriptor>);
static_assert(!std::is_copy_constructible_v<owning_descriptor>);
static_assert(!std::is_copy_assignable_v<owning_descriptor>);

}

#endif /* reflow_owning_descriptor_hpp */
