#include <loopsim/io/scenario_runner.hpp>
#include <loopsim/io/error.hpp>

#include <loopsim/core/error.hpp>
#include <loopsim/core/handler.hpp>
#include <loopsim/core/loop.hpp>
#include <loopsim/core/loop_registry.hpp>
#include <loopsim/core/loop_thread.hpp>
#include <loopsim/core/message.hpp>
#include <loopsim/core/virtual_clock.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <utility>

namespace loopsim::io {

namespace {

using namespace loopsim::core;

// Shared with posted callbacks, which may outlive the run on the main loop
struct RunCounters {
    std::atomic<uint64_t> dispatched{0};
    std::atomic<uint64_t> rejected{0};
};

struct LabelledPost {
    std::shared_ptr<Handler> handler;
    std::string label;
    Duration repeat_every;
    uint64_t remaining;
    std::shared_ptr<RunCounters> counters;
};

bool send_labelled(const LabelledPost& post, Duration delay, bool at_front);

Message make_message(const LabelledPost& post) {
    Message message;
    message.tag = post.label;
    message.callback = [post]() {
        post.counters->dispatched.fetch_add(1, std::memory_order_relaxed);
        if (post.remaining > 0) {
            LabelledPost next = post;
            --next.remaining;
            send_labelled(next, next.repeat_every, false);
        }
    };
    return message;
}

bool send_labelled(const LabelledPost& post, Duration delay, bool at_front) {
    bool accepted = at_front ? post.handler->send_message_at_front(make_message(post))
                             : post.handler->send_message(make_message(post), delay);
    if (!accepted) {
        post.counters->rejected.fetch_add(1, std::memory_order_relaxed);
    }
    return accepted;
}

class ScenarioRun {
public:
    explicit ScenarioRun(const ScenarioData& scenario)
        : scenario_(scenario)
        , counters_(std::make_shared<RunCounters>()) {}

    RunSummary run() {
        VirtualClock::global().reset(scenario_.start_time);
        create_loops();

        for (std::size_t idx = 0; idx < scenario_.steps.size(); ++idx) {
            std::string ctx = "steps[" + std::to_string(idx) + "]";
            try {
                execute(scenario_.steps[idx], ctx);
            } catch (const LoopSimError& e) {
                throw ScenarioError(e.what(), ctx + " (" +
                                    std::string(step_op_name(scenario_.steps[idx].op)) + ")");
            }
        }

        RunSummary summary;
        summary.dispatched = counters_->dispatched.load();
        summary.rejected = counters_->rejected.load();
        summary.final_time = VirtualClock::global().now();
        for (const auto& spec : scenario_.loops) {
            summary.pending.push_back({spec.name, loops_.at(spec.name)->queue().size()});
        }
        return summary;
    }

private:
    void create_loops() {
        for (const auto& spec : scenario_.loops) {
            if (spec.main) {
                auto main = Loop::main_loop();
                if (!main) {
                    try {
                        main = Loop::prepare_main_loop();
                    } catch (const LoopSimError& e) {
                        throw ScenarioError(e.what(), "loop '" + spec.name + "'");
                    }
                }
                if (!main->is_current_thread()) {
                    throw ScenarioError("the main loop is bound to another thread",
                                        "loop '" + spec.name + "'");
                }
                loops_.emplace(spec.name, std::move(main));
            } else {
                threads_.push_back(std::make_unique<LoopThread>(spec.name));
                loops_.emplace(spec.name, threads_.back()->loop());
            }
        }
    }

    const std::shared_ptr<Loop>& find_loop(const std::string& name, const std::string& ctx) const {
        auto it = loops_.find(name);
        if (it == loops_.end()) {
            throw ScenarioError("unknown loop '" + name + "'", ctx);
        }
        return it->second;
    }

    void execute(const StepSpec& step, const std::string& ctx) {
        switch (step.op) {
            case StepOp::Post:
                send_labelled(LabelledPost{find_loop(step.loop, ctx)->handler(), step.label,
                                           step.repeat_every, step.repeat_count, counters_},
                              step.delay, false);
                break;
            case StepOp::PostAtFront:
                send_labelled(LabelledPost{find_loop(step.loop, ctx)->handler(), step.label,
                                           Duration::zero(), 0, counters_},
                              Duration::zero(), true);
                break;
            case StepOp::Advance:
                VirtualClock::global().advance_by(step.amount);
                break;
            case StepOp::Idle:
                find_loop(step.loop, ctx)->idle();
                break;
            case StepOp::IdleFor:
                find_loop(step.loop, ctx)->idle_for(step.amount);
                break;
            case StepOp::RunOneTask:
                find_loop(step.loop, ctx)->run_one_task();
                break;
            case StepOp::Teardown:
                LoopRegistry::global().teardown();
                break;
        }
    }

    const ScenarioData& scenario_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::shared_ptr<RunCounters> counters_;
    std::map<std::string, std::shared_ptr<Loop>> loops_;
    std::vector<std::unique_ptr<LoopThread>> threads_;
};

} // anonymous namespace

RunSummary run_scenario(const ScenarioData& scenario) {
    ScenarioRun run(scenario);
    return run.run();
}

} // namespace loopsim::io
