#include <memory>
#include <vector>

#include <gtest/gtest.h>

#include "conduit/http/http_aggregator.h"
#include "mocks/network_mocks.h"

namespace conduit {
namespace http {
namespace {

class Collector : public network::ReadFilter {
 public:
  void initializeReadFilterCallbacks(network::ReadFilterCallbacks&) override {}
  void onRead(network::MessagePtr message) override {
    messages.push_back(std::move(message));
  }
  std::vector<network::MessagePtr> messages;
};

class HttpAggregatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = event::createLibeventDispatcherFactory()->createDispatcher(
        "test");
    channel_ = std::make_shared<test::FakeChannel>(*dispatcher_);
    collector_ = std::make_shared<Collector>();
  }

  void install(size_t max) {
    channel_->pipeline().addLast(HttpAggregator::kName,
                                 std::make_shared<HttpAggregator>(max));
    channel_->pipeline().addLast("collector", collector_);
  }

  void fire(network::MessagePtr message) {
    channel_->pipeline().fireRead(std::move(message));
  }

  std::unique_ptr<HttpResponseHead> head(int status) {
    auto h = std::make_unique<HttpResponseHead>();
    h->status = status;
    h->headers.add("Upgrade", "websocket");
    return h;
  }

  event::DispatcherPtr dispatcher_;
  std::shared_ptr<test::FakeChannel> channel_;
  std::shared_ptr<Collector> collector_;
};

TEST_F(HttpAggregatorTest, CombinesHeadAndContent) {
  install(64);
  fire(head(101));
  fire(std::make_unique<HttpContent>("ab"));
  EXPECT_TRUE(collector_->messages.empty());
  fire(std::make_unique<HttpLastContent>("cd"));

  ASSERT_EQ(1u, collector_->messages.size());
  auto* full = dynamic_cast<FullHttpResponse*>(collector_->messages[0].get());
  ASSERT_NE(nullptr, full);
  EXPECT_EQ(101, full->head.status);
  EXPECT_EQ("websocket", *full->head.headers.get("Upgrade"));
  EXPECT_EQ("abcd", full->body);
}

TEST_F(HttpAggregatorTest, OversizedBodyBecomesFailure) {
  install(4);
  fire(head(400));
  fire(std::make_unique<HttpContent>("12345"));
  fire(std::make_unique<HttpLastContent>("6"));

  ASSERT_EQ(1u, collector_->messages.size());
  auto* failure =
      dynamic_cast<HttpDecoderFailure*>(collector_->messages[0].get());
  ASSERT_NE(nullptr, failure);
  EXPECT_NE(std::string::npos, failure->reason.find("4 bytes"));

  // The next response aggregates normally
  fire(head(200));
  fire(std::make_unique<HttpLastContent>("ok"));
  ASSERT_EQ(2u, collector_->messages.size());
  EXPECT_NE(nullptr,
            dynamic_cast<FullHttpResponse*>(collector_->messages[1].get()));
}

TEST_F(HttpAggregatorTest, NonHttpMessagesPassThrough) {
  install(64);
  fire(std::make_unique<network::BytesMessage>("frame"));
  fire(std::make_unique<HttpDecoderFailure>("bad"));

  ASSERT_EQ(2u, collector_->messages.size());
  EXPECT_NE(nullptr,
            dynamic_cast<network::BytesMessage*>(collector_->messages[0].get()));
  EXPECT_NE(nullptr,
            dynamic_cast<HttpDecoderFailure*>(collector_->messages[1].get()));
}

TEST_F(HttpAggregatorTest, ContentWithoutHeadIsDropped) {
  install(64);
  fire(std::make_unique<HttpContent>("stray"));
  fire(std::make_unique<HttpLastContent>());
  EXPECT_TRUE(collector_->messages.empty());
}

}  // namespace
}  // namespace http
}  // namespace conduit
