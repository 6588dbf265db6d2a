#include <gtest/gtest.h>
#include <peerlink/core/task.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace peerlink::core::test {

class TaskTest : public ::testing::Test {
protected:
    void SetUp() override {
        scheduler_ = make_task_scheduler();
    }

    void TearDown() override {
        scheduler_->stop();
        scheduler_.reset();
    }

    bool waitFor(const std::function<bool()>& predicate) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!predicate()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }

    std::unique_ptr<TaskScheduler> scheduler_;
};

TEST_F(TaskTest, SubmitBeforeStartFails) {
    auto result = scheduler_->submit([]() {});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidState);
}

TEST_F(TaskTest, MultipleTasks) {
    scheduler_->start(4);
    std::atomic<int> counter{0};

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(scheduler_->submit([&]() { counter++; }).is_ok());
    }

    EXPECT_TRUE(waitFor([&]() { return counter == 10; }));
}

// Dengan satu worker yang sedang sibuk, job berikutnya diurutkan menurut prioritas
TEST_F(TaskTest, TaskPriorities) {
    scheduler_->start(1);

    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    std::vector<int> sequence;

    ASSERT_TRUE(scheduler_->submit([&]() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&]() { return release; });
    }).is_ok());

    // Pastikan job blocker sudah diambil worker
    ASSERT_TRUE(waitFor([&]() { return scheduler_->queueSize() == 0; }));

    auto record = [&](int value) {
        return [&, value]() {
            std::lock_guard<std::mutex> lock(mutex);
            sequence.push_back(value);
        };
    };

    scheduler_->submit(record(1), TaskPriority::Low);
    scheduler_->submit(record(2), TaskPriority::Normal);
    scheduler_->submit(record(3), TaskPriority::Critical);
    scheduler_->submit(record(4), TaskPriority::Normal);

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();

    ASSERT_TRUE(waitFor([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return sequence.size() == 4;
    }));
    EXPECT_EQ(sequence, (std::vector<int>{3, 2, 4, 1}));
}

TEST_F(TaskTest, ThrowingJobDoesNotKillWorker) {
    scheduler_->start(1);
    std::atomic<bool> ran{false};

    scheduler_->submit([]() { throw Error(ErrorCode::Unknown, "job failed"); });
    scheduler_->submit([&]() { ran = true; });

    EXPECT_TRUE(waitFor([&]() { return ran.load(); }));
}

TEST_F(TaskTest, StopRejectsNewJobs) {
    scheduler_->start(2);
    EXPECT_TRUE(scheduler_->isRunning());

    scheduler_->stop();
    EXPECT_FALSE(scheduler_->isRunning());
    EXPECT_TRUE(scheduler_->submit([]() {}).is_error());
}

} // namespace peerlink::core::test
