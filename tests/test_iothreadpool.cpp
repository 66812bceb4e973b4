// test/test_iothreadpool.cpp
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "TestMocks.hpp"
#include "../src/core/IoThreadPool.hpp"

using ::testing::NiceMock;

class IoThreadPoolTest : public ::testing::Test {
protected:
    boost::asio::io_context ioc_;
    std::shared_ptr<NiceMock<MockLogger>> mock_logger_ = std::make_shared<NiceMock<MockLogger>>();
};

TEST_F(IoThreadPoolTest, RunsPostedWorkBeforeJoinReturns) {
    std::atomic<int> ran{0};
    IoThreadPool pool(ioc_, 2, mock_logger_);
    EXPECT_EQ(pool.size(), 2u);
    for (int i = 0; i < 10; ++i) {
        boost::asio::post(ioc_, [&ran]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++ran;
        });
    }
    pool.join();
    EXPECT_EQ(ran.load(), 10);
    EXPECT_TRUE(ioc_.stopped());
}

TEST_F(IoThreadPoolTest, JoinsWhenAnExceptionUnwindsPastThePool) {
    std::atomic<bool> ran{false};
    try {
        IoThreadPool pool(ioc_, 2, mock_logger_);
        boost::asio::post(ioc_, [&ran]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            ran = true;
        });
        throw std::runtime_error("async result failed");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "async result failed");
    }
    // Reaching this point without std::terminate means every thread was joined
    EXPECT_TRUE(ran.load());
}

TEST_F(IoThreadPoolTest, JoinTwiceIsHarmless) {
    IoThreadPool pool(ioc_, 1, mock_logger_);
    pool.join();
    pool.join();
    SUCCEED();
}

TEST_F(IoThreadPoolTest, InvalidArgumentsRejected) {
    EXPECT_THROW(IoThreadPool(ioc_, 0, mock_logger_), std::invalid_argument);
    EXPECT_THROW(IoThreadPool(ioc_, 2, nullptr), std::invalid_argument);
}
