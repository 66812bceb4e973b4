// test/test_memoize.cpp
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "TestMocks.hpp"
#include "../src/core/Memoize.hpp"

using ::testing::NiceMock;
using namespace std::chrono_literals;

class MemoizeTest : public ::testing::Test {
protected:
    boost::asio::io_context ioc_;
    std::shared_ptr<NiceMock<MockLogger>> mock_logger_ = std::make_shared<NiceMock<MockLogger>>();
    CacheConfig config_;

    std::shared_ptr<MemoCache> makeCache() {
        return std::make_shared<MemoCache>(ioc_, config_, mock_logger_);
    }
};

TEST_F(MemoizeTest, WrappedFunctionComputesOncePerArguments) {
    auto cache = makeCache();
    int computations = 0;
    auto greet = memoize(cache, [&computations](const std::string& name, int times) {
        ++computations;
        std::string out;
        for (int i = 0; i < times; ++i) out += "hi " + name + ";";
        return out;
    });

    EXPECT_EQ(greet(std::string("bob"), 2), "hi bob;hi bob;");
    EXPECT_EQ(greet(std::string("bob"), 2), "hi bob;hi bob;");
    EXPECT_EQ(greet(std::string("ann"), 1), "hi ann;");
    EXPECT_EQ(computations, 2);
    EXPECT_EQ(cache->info().hits, 1u);
}

TEST_F(MemoizeTest, WrappersOnOneCacheShareIt) {
    auto cache = makeCache();
    auto twice = memoize(cache, [](int x) { return x * 2; });
    auto more_twice = memoize(cache, [](int x) { return x * 2; });

    twice(4);
    more_twice(4);
    // Keys are derived from the arguments only
    EXPECT_EQ(cache->info().hits, 1u);
    EXPECT_EQ(cache->info().size, 1u);
}

TEST_F(MemoizeTest, InvalidateThroughTheCache) {
    auto cache = makeCache();
    int computations = 0;
    auto f = memoize(cache, [&computations](int x) {
        ++computations;
        return x;
    });
    f(1);
    cache->invalidate(1);
    f(1);
    EXPECT_EQ(computations, 2);
}

TEST_F(MemoizeTest, NullCacheRejected) {
    EXPECT_THROW(memoize(nullptr, [](int x) { return x; }), std::invalid_argument);
    EXPECT_THROW(memoizeAsync<int>(nullptr, [](int, MemoCache::ResultHandler<int>) {}), std::invalid_argument);
}

TEST_F(MemoizeTest, AsyncWrapperSharesOneFlight) {
    auto work_guard = boost::asio::make_work_guard(ioc_);
    std::thread runner([this]() { ioc_.run(); });

    auto cache = makeCache();
    std::atomic<int> computations{0};
    auto release = std::make_shared<std::promise<void>>();
    auto released = release->get_future().share();

    auto lookup = memoizeAsync<std::string>(cache,
        [&computations, released](const std::string& id, MemoCache::ResultHandler<std::string> done) {
            ++computations;
            // Complete from another thread once the test lets it go
            std::thread([released, id, done]() {
                released.wait();
                done(nullptr, "user:" + id);
            }).detach();
        });

    std::vector<std::future<std::string>> results;
    for (int i = 0; i < 4; ++i) {
        auto promise = std::make_shared<std::promise<std::string>>();
        results.push_back(promise->get_future());
        lookup([promise](std::exception_ptr error, std::optional<std::string> value) {
            if (error) {
                promise->set_exception(error);
            } else {
                promise->set_value(*value);
            }
        }, std::string("42"));
    }
    release->set_value();

    for (auto& result : results) {
        ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
        EXPECT_EQ(result.get(), "user:42");
    }
    EXPECT_EQ(computations.load(), 1);

    work_guard.reset();
    runner.join();
}
