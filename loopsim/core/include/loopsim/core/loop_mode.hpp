#pragma once

#include <string_view>

namespace loopsim::core {

/// @brief Scheduling model a loop driver implements.
///
/// `Paused` is the shared-clock model implemented by Loop: every loop reads
/// one VirtualClock and is always paused. `Legacy` names the superseded
/// per-loop-clock model; it is only used to label refused operations.
///
/// @see UnsupportedInModeError
/// @ingroup core_loops
enum class LoopMode {
    Legacy,
    Paused,
};

[[nodiscard]] constexpr std::string_view loop_mode_name(LoopMode mode) noexcept {
    switch (mode) {
        case LoopMode::Legacy: return "LEGACY";
        case LoopMode::Paused: return "PAUSED";
    }
    return "UNKNOWN";
}

} // namespace loopsim::core
