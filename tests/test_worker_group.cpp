#include <gtest/gtest.h>

#include "util/worker_group.hpp"

#include <atomic>
#include <cerrno>
#include <system_error>

namespace ingest {
namespace {

// Starts `limit` threads, then reports resource exhaustion.
ThreadStarter LimitedStarter(int limit, int& attempts) {
    return [limit, &attempts](const std::function<void()>& fn) {
        if (attempts++ >= limit) {
            throw std::system_error(EAGAIN, std::generic_category(), "Resource temporarily unavailable");
        }
        return std::thread(fn);
    };
}

TEST(WorkerGroupTest, AllWorkersRunAndJoin) {
    std::atomic<int> ran{0};
    EXPECT_EQ(RunWorkers(4, [&] { ran.fetch_add(1); }), 4);
    EXPECT_EQ(ran.load(), 4);
}

TEST(WorkerGroupTest, StartFailureJoinsStartedThreadsAndDrainsQueue) {
    std::atomic<int> next{0};
    std::atomic<int> done{0};
    auto worker = [&] {
        while (next.fetch_add(1) < 100) done.fetch_add(1);
    };

    int attempts = 0;
    EXPECT_EQ(RunWorkers(4, worker, LimitedStarter(2, attempts)), 2);
    EXPECT_EQ(attempts, 3);
    EXPECT_EQ(done.load(), 100);
}

TEST(WorkerGroupTest, NoThreadStartedRunsOnCaller) {
    const auto caller = std::this_thread::get_id();
    std::thread::id ran_on;
    int attempts = 0;

    EXPECT_EQ(RunWorkers(3, [&] { ran_on = std::this_thread::get_id(); }, LimitedStarter(0, attempts)), 0);
    EXPECT_EQ(ran_on, caller);
}

TEST(WorkerGroupTest, ZeroCountRunsNothing) {
    bool ran = false;
    EXPECT_EQ(RunWorkers(0, [&] { ran = true; }), 0);
    EXPECT_FALSE(ran);
}

} // namespace
} // namespace ingest
