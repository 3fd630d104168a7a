#include <loopsim/core/error.hpp>
#include <loopsim/core/loop.hpp>
#include <loopsim/core/loop_registry.hpp>
#include <loopsim/core/virtual_clock.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

using namespace loopsim::core;

class LoopBasicTest : public ::testing::Test {
protected:
    void SetUp() override {
        main_ = Loop::main_loop();
        if (!main_) {
            main_ = Loop::prepare_main_loop();
        }
    }

    void TearDown() override { reset_after_test(); }

    static Duration ms(int64_t value) { return duration_from_millis(value); }

    std::shared_ptr<Loop> main_;
    std::vector<int> order_;
};

TEST_F(LoopBasicTest, MainLoopIdentity) {
    EXPECT_TRUE(main_->is_main());
    EXPECT_FALSE(main_->is_quit_allowed());
    EXPECT_EQ(main_->name(), "main");
    EXPECT_TRUE(main_->is_current_thread());
    EXPECT_EQ(Loop::current(), main_);
    EXPECT_EQ(main_->mode(), LoopMode::Paused);
    EXPECT_TRUE(main_->is_paused());
}

TEST_F(LoopBasicTest, SecondMainLoopRejected) {
    EXPECT_THROW(Loop::prepare_main_loop(), InvalidStateError);
}

TEST_F(LoopBasicTest, SecondLoopOnSameThreadRejected) {
    EXPECT_THROW(Loop::prepare(), InvalidStateError);
}

TEST_F(LoopBasicTest, IdleOnEmptyQueueIsIdempotent) {
    EXPECT_TRUE(main_->is_idle());
    main_->idle();
    main_->idle();
    EXPECT_TRUE(main_->is_idle());
    EXPECT_EQ(VirtualClock::global().now(), TimePoint::epoch());
}

TEST_F(LoopBasicTest, PostedTaskWaitsForIdle) {
    bool ran = false;
    main_->post([&ran]() { ran = true; });

    EXPECT_FALSE(ran);
    EXPECT_FALSE(main_->is_idle());

    main_->idle();
    EXPECT_TRUE(ran);
}

TEST_F(LoopBasicTest, DispatchOrderFollowsDelayNotPostOrder) {
    main_->post([this]() { order_.push_back(3); }, ms(30));
    main_->post([this]() { order_.push_back(1); }, ms(10));
    main_->post([this]() { order_.push_back(2); }, ms(20));

    main_->idle_for(ms(30));

    EXPECT_EQ(order_, (std::vector<int>{1, 2, 3}));
}

TEST_F(LoopBasicTest, PostAtFrontRunsBeforeEarlierPosts) {
    main_->post([this]() { order_.push_back(3); });
    main_->post_at_front([this]() { order_.push_back(1); });
    main_->post_at_front([this]() { order_.push_back(2); });

    main_->idle();

    EXPECT_EQ(order_, (std::vector<int>{1, 2, 3}));
}

TEST_F(LoopBasicTest, ZeroDelayPostDuringDrainRunsInSameDrain) {
    main_->post([this]() {
        order_.push_back(1);
        main_->post([this]() {
            order_.push_back(2);
            main_->post([this]() { order_.push_back(3); });
        });
    });

    main_->idle();

    EXPECT_EQ(order_, (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(main_->is_idle());
}

TEST_F(LoopBasicTest, RunOneTaskDispatchesExactlyOne) {
    main_->post([this]() { order_.push_back(1); });
    main_->post([this]() { order_.push_back(2); });

    main_->run_one_task();
    EXPECT_EQ(order_, (std::vector<int>{1}));

    main_->run_one_task();
    EXPECT_EQ(order_, (std::vector<int>{1, 2}));

    // Nothing ready: no-op
    main_->run_one_task();
    EXPECT_EQ(order_.size(), 2u);
}

TEST_F(LoopBasicTest, RunOneTaskIgnoresFutureMessages) {
    main_->post([this]() { order_.push_back(1); }, ms(5));

    main_->run_one_task();
    EXPECT_TRUE(order_.empty());
    EXPECT_EQ(VirtualClock::global().now(), TimePoint::epoch());
}

TEST_F(LoopBasicTest, RunPausedRunsTaskThenDrains) {
    main_->post([this]() { order_.push_back(2); });

    main_->run_paused([this]() {
        order_.push_back(1);
        main_->post([this]() { order_.push_back(3); });
    });

    EXPECT_EQ(order_, (std::vector<int>{1, 2, 3}));
}

TEST_F(LoopBasicTest, PauseIsNoOpOnMainLoop) {
    EXPECT_NO_THROW(main_->pause());
    EXPECT_TRUE(main_->is_paused());
    EXPECT_TRUE(main_->set_paused(true));
}

TEST_F(LoopBasicTest, IdleIfPausedDrains) {
    bool ran = false;
    main_->post([&ran]() { ran = true; });
    main_->idle_if_paused();
    EXPECT_TRUE(ran);
}

TEST_F(LoopBasicTest, ScheduledTimeDiagnostics) {
    EXPECT_FALSE(main_->next_scheduled_time().has_value());
    EXPECT_FALSE(main_->last_scheduled_time().has_value());

    main_->post([]() {}, ms(40));
    main_->post([]() {}, ms(15));

    EXPECT_EQ(main_->next_scheduled_time(), time_from_millis(15));
    EXPECT_EQ(main_->last_scheduled_time(), time_from_millis(40));
}

TEST_F(LoopBasicTest, ChronoIdleFor) {
    bool ran = false;
    main_->post([&ran]() { ran = true; }, ms(1000));

    main_->idle_for(std::chrono::seconds(1));

    EXPECT_TRUE(ran);
    EXPECT_EQ(VirtualClock::global().now(), time_from_millis(1000));
}

TEST_F(LoopBasicTest, PostFromForeignThreadRunsOnMainThread) {
    std::thread::id ran_on;
    std::thread poster([this, &ran_on]() {
        main_->post([&ran_on]() { ran_on = std::this_thread::get_id(); });
    });
    poster.join();

    main_->idle();
    EXPECT_EQ(ran_on, std::this_thread::get_id());
}

TEST_F(LoopBasicTest, PreparedLoopOnOtherThreadIsBoundThere) {
    std::shared_ptr<Loop> prepared;
    std::thread::id worker_id;
    std::thread worker([&prepared, &worker_id]() {
        prepared = Loop::prepare(true, "side");
        worker_id = std::this_thread::get_id();
        EXPECT_EQ(Loop::current(), prepared);
    });
    worker.join();

    ASSERT_TRUE(prepared);
    EXPECT_EQ(prepared->name(), "side");
    EXPECT_FALSE(prepared->is_main());
    EXPECT_TRUE(prepared->is_quit_allowed());
    EXPECT_EQ(prepared->thread_id(), worker_id);
    EXPECT_FALSE(prepared->is_current_thread());
    EXPECT_NE(Loop::current(), prepared);
}

TEST_F(LoopBasicTest, GeneratedNamesAreDistinct) {
    std::shared_ptr<Loop> first;
    std::shared_ptr<Loop> second;
    std::thread a([&first]() { first = Loop::prepare(); });
    a.join();
    std::thread b([&second]() { second = Loop::prepare(); });
    b.join();

    EXPECT_NE(first->name(), second->name());
    EXPECT_EQ(first->name().rfind("loop-", 0), 0u);
}

TEST_F(LoopBasicTest, QuitMainLoopRejected) {
    EXPECT_THROW(main_->quit(), InvalidStateError);
    EXPECT_THROW(main_->loop(), InvalidStateError);
}
