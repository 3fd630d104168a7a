#include <loopsim/core/loop_thread.hpp>
#include <loopsim/core/loop.hpp>

#include <exception>
#include <future>
#include <utility>

namespace loopsim::core {

LoopThread::LoopThread(std::string name) {
    std::promise<std::shared_ptr<Loop>> prepared;
    auto ready = prepared.get_future();

    thread_ = std::thread([prepared = std::move(prepared), name = std::move(name)]() mutable {
        std::shared_ptr<Loop> loop;
        try {
            loop = Loop::prepare(true, std::move(name));
        } catch (...) {
            prepared.set_exception(std::current_exception());
            return;
        }
        prepared.set_value(loop);
        loop->loop();
    });

    try {
        loop_ = ready.get();
    } catch (...) {
        thread_.join();
        throw;
    }
}

LoopThread::~LoopThread() {
    if (loop_ && !loop_->is_quitting()) {
        loop_->quit();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace loopsim::core
