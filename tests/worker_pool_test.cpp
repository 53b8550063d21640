#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "encore/util/worker_pool.hpp"

#include "fakes.hpp"

using namespace encore;

TEST(WorkerPool, RunsEverythingPostedBeforeShutdown)
{
    std::atomic<int> ran{0};
    {
        util::worker_pool pool(3);
        for (int i = 0; i < 100; ++i) {
            pool.post([&ran] { ++ran; });
        }
    }
    EXPECT_EQ(ran.load(), 100);
}

TEST(WorkerPool, ThrowingTaskIsLoggedAndPoolKeepsGoing)
{
    std::mutex               mutex;
    std::vector<std::string> errors;
    std::atomic<int>         ran{0};

    {
        util::worker_pool pool(1, [&](dpp::loglevel level, const std::string& msg) {
            if (level == dpp::ll_error) {
                std::lock_guard<std::mutex> lock(mutex);
                errors.push_back(msg);
            }
        });
        pool.post([] { throw std::runtime_error("boom"); });
        pool.post([&ran] { ++ran; });
    }

    EXPECT_EQ(ran.load(), 1);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("boom"), std::string::npos);
}

TEST(WorkerPool, ZeroThreadsStillRuns)
{
    std::atomic<bool> ran{false};
    {
        util::worker_pool pool(0);
        pool.post([&ran] { ran = true; });
    }
    EXPECT_TRUE(ran.load());
}

TEST(WorkerPool, NonStandardThrowIsLoggedToo)
{
    std::mutex               mutex;
    std::vector<std::string> errors;
    std::atomic<int>         ran{0};

    {
        util::worker_pool pool(1, [&](dpp::loglevel level, const std::string& msg) {
            if (level == dpp::ll_error) {
                std::lock_guard<std::mutex> lock(mutex);
                errors.push_back(msg);
            }
        });
        pool.post([] { throw 42; });
        pool.post([&ran] { ++ran; });
    }

    EXPECT_EQ(ran.load(), 1);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("non-standard"), std::string::npos);
}

TEST(WorkerPool, BusyPoolDoesNotHoldUpAnother)
{
    test::gate release;
    test::gate continued;

    util::worker_pool blocking(1);
    util::worker_pool control(1);

    // A lookup that never returns until released
    blocking.post([&release] { release.wait(); });
    control.post([&continued] { continued.open(); });

    continued.wait();
    SUCCEED();
    release.open();
}
