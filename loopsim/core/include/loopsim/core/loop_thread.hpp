#pragma once

#include <memory>
#include <string>
#include <thread>

namespace loopsim::core {

class Loop;

/// @brief Dedicated OS thread running one quit-allowed Loop.
///
/// The constructor starts the thread, which prepares a loop bound to itself
/// and then services cross-thread handoffs in Loop::loop() until the loop
/// quits. The constructor returns once the loop exists, so loop() is never
/// null.
///
/// The destructor quits the loop (unless teardown already did) and joins
/// the thread.
///
/// @see Loop::loop, LoopRegistry::teardown
/// @ingroup core_loops
class LoopThread {
public:
    /// @brief Start the thread and prepare its loop.
    /// @param name Diagnostic name of the loop; generated when empty.
    explicit LoopThread(std::string name = {});

    ~LoopThread();

    LoopThread(const LoopThread&) = delete;
    LoopThread& operator=(const LoopThread&) = delete;
    LoopThread(LoopThread&&) = delete;
    LoopThread& operator=(LoopThread&&) = delete;

    /// @brief The loop bound to the owned thread.
    [[nodiscard]] const std::shared_ptr<Loop>& loop() const noexcept { return loop_; }

    /// @brief Identifier of the owned thread.
    [[nodiscard]] std::thread::id thread_id() const noexcept { return thread_.get_id(); }

private:
    std::shared_ptr<Loop> loop_;
    std::thread thread_;
};

} // namespace loopsim::core
