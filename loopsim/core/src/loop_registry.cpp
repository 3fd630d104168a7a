#include <loopsim/core/loop_registry.hpp>
#include <loopsim/core/loop.hpp>
#include <loopsim/core/tracing.hpp>
#include <loopsim/core/virtual_clock.hpp>

#include <algorithm>

namespace loopsim::core {

LoopRegistry& LoopRegistry::global() noexcept {
    static LoopRegistry registry;
    return registry;
}

void LoopRegistry::track(const std::shared_ptr<Loop>& loop) {
    std::scoped_lock lock(mutex_);
    std::erase_if(loops_, [](const std::weak_ptr<Loop>& entry) { return entry.expired(); });
    loops_.push_back(loop);
}

bool LoopRegistry::is_tracked(const Loop& loop) const {
    std::scoped_lock lock(mutex_);
    return std::any_of(loops_.begin(), loops_.end(), [&loop](const std::weak_ptr<Loop>& entry) {
        auto tracked = entry.lock();
        return tracked.get() == &loop;
    });
}

std::size_t LoopRegistry::tracked_count() const {
    std::scoped_lock lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        loops_.begin(), loops_.end(),
        [](const std::weak_ptr<Loop>& entry) { return !entry.expired(); }));
}

std::vector<std::shared_ptr<Loop>> LoopRegistry::live_loops() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::shared_ptr<Loop>> result;
    result.reserve(loops_.size());
    for (const auto& entry : loops_) {
        if (auto loop = entry.lock()) {
            result.push_back(std::move(loop));
        }
    }
    return result;
}

TeardownSummary LoopRegistry::teardown() {
    TeardownSummary summary;
    std::vector<std::shared_ptr<Loop>> survivors;

    std::scoped_lock lock(mutex_);
    std::vector<std::weak_ptr<Loop>> kept;
    kept.reserve(loops_.size());

    for (const auto& entry : loops_) {
        auto loop = entry.lock();
        if (!loop) {
            ++summary.expired;
            continue;
        }
        if (loop->is_quit_allowed()) {
            loop->quit();
            ++summary.quit;
        } else {
            loop->queue().reset();
            kept.push_back(loop);
            ++summary.reset;
        }
        // Released after the lock: a loop destroyed here must not re-enter the registry
        survivors.push_back(std::move(loop));
    }
    loops_.swap(kept);

    trace([&](TraceWriter& w) {
        w.type("teardown");
        w.field("quit", static_cast<uint64_t>(summary.quit));
        w.field("reset", static_cast<uint64_t>(summary.reset));
        w.field("expired", static_cast<uint64_t>(summary.expired));
    });
    return summary;
}

TeardownSummary reset_after_test() {
    TeardownSummary summary = LoopRegistry::global().teardown();
    VirtualClock::global().reset();
    return summary;
}

} // namespace loopsim::core
