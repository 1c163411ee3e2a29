#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "conduit/event/event_loop.h"
#include "conduit/network/operations_slot.h"
#include "conduit/network/pipeline.h"
#include "mocks/network_mocks.h"

namespace conduit {
namespace network {
namespace {

// Records what it sees, optionally rewriting before forwarding
class RecordingFilter : public ReadFilter {
 public:
  RecordingFilter(std::vector<std::string>& log, std::string tag)
      : log_(log), tag_(std::move(tag)) {}

  void initializeReadFilterCallbacks(ReadFilterCallbacks& callbacks) override {
    callbacks_ = &callbacks;
  }

  void onRead(MessagePtr message) override {
    auto* bytes = dynamic_cast<BytesMessage*>(message.get());
    std::string payload = bytes ? bytes->data().toString() : "?";
    log_.push_back(tag_ + ":" + payload);
    if (on_read) {
      on_read();
    }
    if (forward) {
      callbacks_->fireRead(
          std::make_unique<BytesMessage>(payload + suffix));
    }
  }

  void onChannelInactive() override { log_.push_back(tag_ + ":inactive"); }

  ReadFilterCallbacks* callbacks_{nullptr};
  bool forward{true};
  std::string suffix;
  std::function<void()> on_read;

 private:
  std::vector<std::string>& log_;
  std::string tag_;
};

class PipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ = event::createLibeventDispatcherFactory()->createDispatcher(
        "test");
    dispatcher_->run(event::RunType::NonBlock);
    channel_ = std::make_shared<test::FakeChannel>(*dispatcher_);
  }

  std::shared_ptr<RecordingFilter> filter(const std::string& tag) {
    return std::make_shared<RecordingFilter>(log_, tag);
  }

  event::DispatcherPtr dispatcher_;
  std::shared_ptr<test::FakeChannel> channel_;
  std::vector<std::string> log_;
};

TEST_F(PipelineTest, MessagesFlowInOrder) {
  auto codec = filter("codec");
  codec->suffix = "+decoded";
  auto bridge = filter("bridge");
  Pipeline& pipeline = channel_->pipeline();

  EXPECT_TRUE(pipeline.addLast("codec", codec));
  EXPECT_TRUE(pipeline.addLast("bridge", bridge));
  EXPECT_EQ((std::vector<std::string>{"codec", "bridge"}), pipeline.names());

  pipeline.fireRead(std::make_unique<BytesMessage>("abc"));
  EXPECT_EQ((std::vector<std::string>{"codec:abc", "bridge:abc+decoded"}),
            log_);
}

TEST_F(PipelineTest, DuplicateNamesRejected) {
  Pipeline& pipeline = channel_->pipeline();
  EXPECT_TRUE(pipeline.addLast("codec", filter("a")));
  EXPECT_FALSE(pipeline.addLast("codec", filter("b")));
  EXPECT_FALSE(pipeline.addBefore("codec", "codec", filter("c")));
  EXPECT_FALSE(pipeline.addBefore("missing", "x", filter("d")));
  EXPECT_FALSE(pipeline.addLast("null", nullptr));
  EXPECT_EQ(1u, pipeline.names().size());
}

TEST_F(PipelineTest, AddBeforeInsertsAhead) {
  Pipeline& pipeline = channel_->pipeline();
  pipeline.addLast("codec", filter("codec"));
  pipeline.addLast("bridge", filter("bridge"));
  EXPECT_TRUE(pipeline.addBefore("bridge", "aggregator", filter("agg")));

  EXPECT_EQ((std::vector<std::string>{"codec", "aggregator", "bridge"}),
            pipeline.names());

  pipeline.fireRead(std::make_unique<BytesMessage>("x"));
  EXPECT_EQ((std::vector<std::string>{"codec:x", "agg:x", "bridge:x"}), log_);
}

TEST_F(PipelineTest, RemovedStageStopsForwarding) {
  Pipeline& pipeline = channel_->pipeline();
  auto codec = filter("codec");
  auto bridge = filter("bridge");
  pipeline.addLast("codec", codec);
  pipeline.addLast("bridge", bridge);

  // Remove itself mid-dispatch, then try to forward
  codec->on_read = [&]() { EXPECT_EQ(codec, pipeline.remove("codec")); };
  pipeline.fireRead(std::make_unique<BytesMessage>("x"));

  EXPECT_EQ((std::vector<std::string>{"codec:x"}), log_);
  EXPECT_EQ(nullptr, pipeline.get("codec"));
  EXPECT_EQ(nullptr, pipeline.remove("codec"));

  pipeline.fireRead(std::make_unique<BytesMessage>("y"));
  EXPECT_EQ("bridge:y", log_.back());
}

TEST_F(PipelineTest, GetAsCastsToConcreteType) {
  Pipeline& pipeline = channel_->pipeline();
  pipeline.addLast("codec", filter("codec"));
  auto found = pipeline.getAs<RecordingFilter>("codec");
  ASSERT_NE(nullptr, found);
  EXPECT_EQ(nullptr, pipeline.getAs<RecordingFilter>("missing"));
}

TEST_F(PipelineTest, ChannelCloseNotifiesEveryStageThenClears) {
  Pipeline& pipeline = channel_->pipeline();
  pipeline.addLast("codec", filter("codec"));
  pipeline.addLast("bridge", filter("bridge"));

  channel_->close();

  EXPECT_EQ((std::vector<std::string>{"codec:inactive", "bridge:inactive"}),
            log_);
  EXPECT_TRUE(pipeline.empty());
}

TEST_F(PipelineTest, MessagePastLastStageIsDropped) {
  Pipeline& pipeline = channel_->pipeline();
  pipeline.addLast("only", filter("only"));
  pipeline.fireRead(std::make_unique<BytesMessage>("x"));
  EXPECT_EQ(1u, log_.size());
}

class NamedOperations : public ChannelOperations {
 public:
  explicit NamedOperations(std::string name) : name_(std::move(name)) {}
  void onInboundNext(MessagePtr) override {}
  void onInboundClose() override {}
  void onInboundError(const Error&) override {}
  std::string name() const override { return name_; }

 private:
  std::string name_;
};

TEST(OperationsSlotTest, CompareAndSetRequiresCurrentOwner) {
  OperationsSlot slot;
  auto http = std::make_shared<NamedOperations>("http");
  auto ws = std::make_shared<NamedOperations>("ws");
  auto other = std::make_shared<NamedOperations>("other");

  EXPECT_EQ(nullptr, slot.get());
  slot.set(http);
  EXPECT_EQ(http, slot.get());

  EXPECT_FALSE(slot.compareAndSet(other, ws));
  EXPECT_EQ(http, slot.get());

  EXPECT_TRUE(slot.compareAndSet(http, ws));
  EXPECT_EQ(ws, slot.get());

  // The old owner cannot take it back
  EXPECT_FALSE(slot.compareAndSet(http, other));
}

TEST(OperationsSlotTest, ConcurrentTransfersHaveOneWinner) {
  for (int round = 0; round < 50; ++round) {
    OperationsSlot slot;
    auto owner = std::make_shared<NamedOperations>("http");
    slot.set(owner);

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
      threads.emplace_back([&, i]() {
        auto next = std::make_shared<NamedOperations>("ws" + std::to_string(i));
        if (slot.compareAndSet(owner, next)) {
          winners++;
        }
      });
    }
    for (auto& t : threads) {
      t.join();
    }
    EXPECT_EQ(1, winners.load());
    EXPECT_NE(owner, slot.get());
  }
}

}  // namespace
}  // namespace network
}  // namespace conduit
