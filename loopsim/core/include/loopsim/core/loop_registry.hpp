#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace loopsim::core {

class Loop;

/// @brief Outcome of one LoopRegistry::teardown() pass.
/// @ingroup core_loops
struct TeardownSummary {
    std::size_t quit{0};    ///< Quit-allowed loops quit and dropped from tracking.
    std::size_t reset{0};   ///< Loops whose queue was cleared and kept tracked.
    std::size_t expired{0}; ///< Entries dropped because their loop no longer existed.
};

/// @brief Process-wide set of live loops, used for teardown between tests.
///
/// The registry holds `std::weak_ptr` references only: it never keeps a
/// loop alive, and entries whose loop has been destroyed are discarded at
/// the next teardown() or track().
///
/// teardown() quits and forgets every quit-allowed loop, and clears the
/// queue of every other loop (the main loop) while keeping it tracked for
/// the next test.
///
/// @see Loop, reset_after_test
/// @ingroup core_loops
class LoopRegistry {
public:
    LoopRegistry() = default;

    LoopRegistry(const LoopRegistry&) = delete;
    LoopRegistry& operator=(const LoopRegistry&) = delete;

    /// @brief The registry every Loop registers with on creation.
    [[nodiscard]] static LoopRegistry& global() noexcept;

    /// @brief Start tracking @p loop.
    void track(const std::shared_ptr<Loop>& loop);

    /// @brief Returns true if @p loop is currently tracked.
    [[nodiscard]] bool is_tracked(const Loop& loop) const;

    /// @brief Number of tracked loops that are still alive.
    [[nodiscard]] std::size_t tracked_count() const;

    /// @brief Strong references to every tracked live loop.
    [[nodiscard]] std::vector<std::shared_ptr<Loop>> live_loops() const;

    /// @brief Quit or reset every tracked loop.
    /// @return Counts of loops quit, reset, and expired entries dropped.
    TeardownSummary teardown();

private:
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<Loop>> loops_;
};

/// @brief Test-boundary lifecycle hook.
///
/// Runs LoopRegistry::global().teardown(), then resets the global virtual
/// clock to epoch.
///
/// @return The teardown summary.
TeardownSummary reset_after_test();

} // namespace loopsim::core
