#ifndef reflow_run_phase_hpp
#define reflow_run_phase_hpp

#include <ostream>

namespace reflow {

/// @brief Phase of a run.
/// @note Runs go from <code>idle</code> to <code>starting</code>, then to
///   <code>streaming</code> once the child is spawned, and end in one of
///   <code>finished</code>, <code>cancelled</code>, or <code>failed</code>.
enum class run_phase: unsigned {
    idle,
    starting,
    streaming,
    finished,
    cancelled,
    failed,
};

constexpr auto is_final(run_phase phase) noexcept -> bool
{
    switch (phase) {
    case run_phase::finished:
    case run_phase::cancelled:
    case run_phase::failed:
        return true;
    case run_phase::idle:
    case run_phase::starting:
    case run_phase::streaming:
        break;
    }
    return false;
}

constexpr auto to_cstring(run_phase phase) noexcept -> const char*
{
    switch (phase) {
    case run_phase::idle: return "idle";
    case run_phase::starting: return "starting";
    case run_phase::streaming: return "streaming";
    case run_phase::finished: return "finished";
    case run_phase::cancelled: return "cancelled";
    case run_phase::failed: return "failed";
    }
    return "unknown";
}

auto operator<<(std::ostream& os, run_phase value) -> std::ostream&;

}

#endif /* reflow_run_phase_hpp */
