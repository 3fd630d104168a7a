#include <loopsim/core/loop.hpp>
#include <loopsim/core/error.hpp>
#include <loopsim/core/handler.hpp>
#include <loopsim/core/idle_coordinator.hpp>
#include <loopsim/core/loop_registry.hpp>
#include <loopsim/core/message.hpp>
#include <loopsim/core/tracing.hpp>
#include <loopsim/core/virtual_clock.hpp>

#include <atomic>
#include <utility>

namespace loopsim::core {

namespace {

thread_local std::weak_ptr<Loop> t_current;

std::mutex g_main_mutex;
std::shared_ptr<Loop> g_main_loop;

std::atomic<uint64_t> g_next_loop_id{1};

} // anonymous namespace

Loop::Loop(PrivateTag /*tag*/, bool quit_allowed, bool is_main, std::string name,
           VirtualClock& clock)
    : is_main_(is_main)
    , name_(std::move(name))
    , thread_id_(std::this_thread::get_id())
    , queue_(quit_allowed, clock, name_) {}

std::shared_ptr<Loop> Loop::create(bool quit_allowed, bool is_main, std::string name) {
    if (auto existing = t_current.lock(); existing && !existing->is_quitting()) {
        throw InvalidStateError("Only one loop may be prepared per thread (already bound to '"
                                + existing->name() + "')");
    }
    if (name.empty()) {
        name = "loop-" + std::to_string(g_next_loop_id.fetch_add(1, std::memory_order_relaxed));
    }

    auto loop = std::make_shared<Loop>(PrivateTag{}, quit_allowed, is_main, std::move(name),
                                       VirtualClock::global());
    loop->handler_ = std::make_shared<Handler>(loop);
    t_current = loop;
    LoopRegistry::global().track(loop);

    trace([&](TraceWriter& w) {
        w.type("loop_prepared");
        w.field("loop", std::string_view{loop->name_});
        w.field("main", static_cast<uint64_t>(is_main ? 1 : 0));
        w.field("quit_allowed", static_cast<uint64_t>(quit_allowed ? 1 : 0));
    });
    return loop;
}

std::shared_ptr<Loop> Loop::prepare(bool quit_allowed, std::string name) {
    return create(quit_allowed, false, std::move(name));
}

std::shared_ptr<Loop> Loop::prepare_main_loop() {
    std::scoped_lock lock(g_main_mutex);
    if (g_main_loop) {
        throw InvalidStateError("The main loop has already been prepared");
    }
    g_main_loop = create(false, true, "main");
    return g_main_loop;
}

std::shared_ptr<Loop> Loop::main_loop() noexcept {
    std::scoped_lock lock(g_main_mutex);
    return g_main_loop;
}

std::shared_ptr<Loop> Loop::current() noexcept {
    return t_current.lock();
}

bool Loop::is_current_thread() const noexcept {
    return std::this_thread::get_id() == thread_id_;
}

void Loop::idle() {
    if (is_current_thread()) {
        IdleCoordinator coordinator(queue_);
        coordinator.drain();
        return;
    }
    check_foreign_driver_call("idle");
    hand_off_and_wait(IdleCoordinator::UNBOUNDED);
}

void Loop::idle_for(Duration d) {
    if (!is_current_thread()) {
        check_foreign_driver_call("idle_for");
    }
    queue_.clock().advance_by(d);
    idle();
}

bool Loop::is_idle() const {
    return queue_.is_idle();
}

void Loop::run_one_task() {
    if (is_current_thread()) {
        if (auto message = queue_.poll_ready()) {
            dispatch_message(std::move(*message), queue_.clock());
        }
        return;
    }
    check_foreign_driver_call("run_one_task");
    hand_off_and_wait(1);
}

void Loop::run_paused(const std::function<void()>& task) {
    require_main("run_paused");
    if (!is_current_thread()) {
        throw WrongThreadError("run_paused must be called from the main loop's thread");
    }
    task();
    idle();
}

bool Loop::post(std::function<void()> task, Duration delay) {
    return handler_->post(std::move(task), delay);
}

bool Loop::post_at_front(std::function<void()> task) {
    return handler_->post_at_front(std::move(task));
}

void Loop::pause() {
    require_main("pause");
}

void Loop::unpause() {
    throw UnsupportedInModeError("unpause", mode());
}

bool Loop::set_paused(bool paused) {
    if (!paused) {
        throw UnsupportedInModeError("set_paused(false)", mode());
    }
    return true;
}

void Loop::idle_constantly(bool /*enabled*/) {
    throw UnsupportedInModeError("idle_constantly", mode());
}

std::optional<TimePoint> Loop::next_scheduled_time() const {
    return queue_.next_scheduled_time();
}

std::optional<TimePoint> Loop::last_scheduled_time() const {
    return queue_.last_scheduled_time();
}

void Loop::quit_unchecked() {
    throw UnsupportedInModeError("quit_unchecked", mode());
}

bool Loop::has_quit() const {
    throw UnsupportedInModeError("has_quit", mode());
}

void Loop::reset_scheduler() {
    throw UnsupportedInModeError("reset_scheduler", mode());
}

void Loop::reset() {
    throw UnsupportedInModeError("reset", mode());
}

LegacyScheduler& Loop::scheduler() {
    throw UnsupportedInModeError("scheduler", mode());
}

void Loop::loop() {
    if (is_main_) {
        throw InvalidStateError("The main loop is driven by its owner and cannot run loop()");
    }
    if (!is_current_thread()) {
        throw WrongThreadError("loop() must be called on the thread bound to '" + name_ + "'");
    }

    for (;;) {
        std::function<void()> work;
        {
            std::unique_lock lock(handoff_mutex_);
            handoff_cv_.wait(lock, [this] { return handoff_closed_ || !handoff_.empty(); });
            if (handoff_closed_) {
                break;
            }
            work = std::move(handoff_.front());
            handoff_.pop_front();
        }
        work();
    }
}

void Loop::quit() {
    queue_.quit();

    std::deque<std::function<void()>> abandoned;
    {
        std::scoped_lock lock(handoff_mutex_);
        handoff_closed_ = true;
        abandoned.swap(handoff_);
    }
    handoff_cv_.notify_all();
    // Dropping the abandoned handoffs releases their waiters
}

bool Loop::hand_off(std::function<void()> work) {
    {
        std::scoped_lock lock(handoff_mutex_);
        if (handoff_closed_) {
            return false;
        }
        handoff_.push_back(std::move(work));
    }
    handoff_cv_.notify_one();
    return true;
}

void Loop::hand_off_and_wait(std::size_t dispatch_limit) {
    auto coordinator = std::make_shared<IdleCoordinator>(queue_, dispatch_limit);
    std::future<void> done = coordinator->completion();

    if (!hand_off([coordinator] { coordinator->run(); })) {
        trace_warning(name_, "idle requested on a loop that has quit");
        return;
    }
    // The loop thread now holds the only reference
    coordinator.reset();
    IdleCoordinator::wait_till_idle(done, name_);
}

void Loop::check_foreign_driver_call(std::string_view operation) const {
    if (is_main_) {
        throw WrongThreadError(std::string(operation)
                               + " on the main loop must be called from its own thread");
    }
}

void Loop::require_main(std::string_view operation) const {
    if (!is_main_) {
        throw WrongThreadError(std::string(operation) + " is only available on the main loop");
    }
}

} // namespace loopsim::core
