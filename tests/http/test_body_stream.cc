#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "conduit/http/body_stream.h"
#include "conduit/http/client_errors.h"
#include "mocks/network_mocks.h"

namespace conduit {
namespace http {
namespace {

class BodyStreamTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = event::createLibeventDispatcherFactory()->createDispatcher(
        "test");
    dispatcher_->run(event::RunType::NonBlock);
    stream_ = std::make_shared<BodyStream>(*dispatcher_, 10);
    stream_->setReadControl([this](bool disable) {
      read_calls_.push_back(disable);
    });
  }

  BodySubscriptionPtr subscribeCollecting() {
    return stream_->subscribe(
        [this](std::string chunk) { chunks_.push_back(chunk); },
        [this](const optional<Error>& error) {
          done_ = true;
          error_ = error;
        });
  }

  event::DispatcherPtr dispatcher_;
  BodyStreamSharedPtr stream_;
  std::vector<bool> read_calls_;
  std::vector<std::string> chunks_;
  bool done_{false};
  optional<Error> error_;
};

TEST_F(BodyStreamTest, DeliversOnlyRequestedChunks) {
  auto subscription = subscribeCollecting();
  stream_->push("a");
  stream_->push("b");
  stream_->push("c");
  EXPECT_TRUE(chunks_.empty());

  subscription->request(2);
  EXPECT_EQ((std::vector<std::string>{"a", "b"}), chunks_);

  stream_->complete();
  EXPECT_FALSE(done_);

  subscription->request(1);
  EXPECT_EQ(3u, chunks_.size());
  EXPECT_TRUE(done_);
  EXPECT_FALSE(error_.has_value());
}

TEST_F(BodyStreamTest, BufferedBeforeSubscribe) {
  stream_->push("early");
  stream_->complete();

  auto subscription = subscribeCollecting();
  subscription->request(BodySubscription::kUnbounded);
  EXPECT_EQ((std::vector<std::string>{"early"}), chunks_);
  EXPECT_TRUE(done_);
}

TEST_F(BodyStreamTest, PausesReadsAboveHighWatermarkWithoutDemand) {
  auto subscription = subscribeCollecting();
  stream_->push("123456");
  EXPECT_TRUE(read_calls_.empty());
  stream_->push("789012");
  ASSERT_EQ(1u, read_calls_.size());
  EXPECT_TRUE(read_calls_[0]);
  EXPECT_TRUE(stream_->readsPaused());
  EXPECT_EQ(12u, stream_->bufferedBytes());

  // One chunk leaves 6 > 5 buffered: still paused
  subscription->request(1);
  EXPECT_EQ(1u, read_calls_.size());

  subscription->request(1);
  ASSERT_EQ(2u, read_calls_.size());
  EXPECT_FALSE(read_calls_[1]);
  EXPECT_FALSE(stream_->readsPaused());
  EXPECT_EQ(0u, stream_->bufferedBytes());
}

TEST_F(BodyStreamTest, NoPauseWhileDemandOutstanding) {
  auto subscription = subscribeCollecting();
  subscription->request(BodySubscription::kUnbounded);
  stream_->push(std::string(100, 'x'));
  EXPECT_TRUE(read_calls_.empty());
  EXPECT_EQ(1u, chunks_.size());
}

TEST_F(BodyStreamTest, FailDropsBufferedChunks) {
  auto subscription = subscribeCollecting();
  stream_->push("lost");
  stream_->fail(connectionClosed());

  EXPECT_TRUE(done_);
  ASSERT_TRUE(error_.has_value());
  EXPECT_TRUE(hasCode(*error_, ClientErrorCode::ConnectionClosed));
  EXPECT_TRUE(chunks_.empty());
}

TEST_F(BodyStreamTest, SecondSubscriberRejected) {
  auto first = subscribeCollecting();
  optional<Error> rejected;
  stream_->subscribe([](std::string) {},
                     [&](const optional<Error>& error) { rejected = error; });
  ASSERT_TRUE(rejected.has_value());
  EXPECT_TRUE(hasCode(*rejected, ClientErrorCode::NotActive));
}

TEST_F(BodyStreamTest, CancelRunsCallbackAndStopsDelivery) {
  int cancels = 0;
  stream_->setCancelCallback([&]() { ++cancels; });
  auto subscription = subscribeCollecting();
  stream_->push("a");

  subscription->cancel();
  subscription->cancel();
  EXPECT_EQ(1, cancels);

  subscription->request(5);
  stream_->push("b");
  stream_->complete();
  EXPECT_TRUE(chunks_.empty());
  EXPECT_FALSE(done_);
  EXPECT_EQ(0u, stream_->bufferedBytes());
}

TEST_F(BodyStreamTest, AggregateCollectsWholeBody) {
  Result<std::string> body = Error();
  stream_->aggregate().subscribe([&](Result<std::string> r) { body = r; });
  stream_->push("hello ");
  stream_->push("world");
  stream_->complete();
  EXPECT_EQ("hello world", get<std::string>(body));
}

TEST_F(BodyStreamTest, AggregatePropagatesFailure) {
  Result<std::string> body = std::string();
  stream_->aggregate().subscribe([&](Result<std::string> r) { body = r; });
  stream_->push("partial");
  stream_->fail(clientError(ClientErrorCode::Timeout, "slow"));
  ASSERT_TRUE(is_error(body));
  EXPECT_TRUE(hasCode(*get_error(body), ClientErrorCode::Timeout));
}

TEST_F(BodyStreamTest, RequestFromOtherThreadIsPosted) {
  auto subscription = subscribeCollecting();
  stream_->push("x");

  std::thread other([&]() { subscription->request(1); });
  other.join();
  EXPECT_TRUE(chunks_.empty());

  ASSERT_TRUE(test::runUntil(*dispatcher_, [&]() { return !chunks_.empty(); }));
  EXPECT_EQ("x", chunks_[0]);
}

}  // namespace
}  // namespace http
}  // namespace conduit
