#include <cstring>
#include <memory>

#include <gtest/gtest.h>

#include "conduit/buffer.h"

using namespace conduit;

class BufferTest : public ::testing::Test {
 protected:
  std::unique_ptr<Buffer> buffer_;

  void SetUp() override { buffer_ = std::make_unique<OwnedBuffer>(); }
};

TEST_F(BufferTest, EmptyBuffer) {
  EXPECT_EQ(buffer_->length(), 0u);
  EXPECT_EQ("", buffer_->toString());
}

TEST_F(BufferTest, AddData) {
  const char* data = "Hello, World!";
  buffer_->add(data, strlen(data));

  EXPECT_EQ(buffer_->length(), strlen(data));
  EXPECT_EQ("Hello, World!", buffer_->toString());
}

TEST_F(BufferTest, AddBuffer) {
  OwnedBuffer source("Hello, World!");

  buffer_->add(source);

  EXPECT_EQ(buffer_->length(), 13u);
  EXPECT_EQ(source.length(), 13u);  // Source should remain unchanged
}

TEST_F(BufferTest, DrainData) {
  buffer_->add("Hello, World!");

  buffer_->drain(7);
  EXPECT_EQ("World!", buffer_->toString());

  buffer_->drain(100);
  EXPECT_EQ(buffer_->length(), 0u);
}

TEST_F(BufferTest, MovePartial) {
  buffer_->add("0123456789");
  OwnedBuffer destination;
  destination.add("ab");

  buffer_->move(destination, 4);

  EXPECT_EQ("ab0123", destination.toString());
  EXPECT_EQ("456789", buffer_->toString());

  buffer_->move(destination);
  EXPECT_EQ(0u, buffer_->length());
  EXPECT_EQ("ab0123456789", destination.toString());
}

TEST_F(BufferTest, LinearizeFront) {
  buffer_->add("abcdef");

  auto* view = static_cast<const char*>(buffer_->linearize(6));
  ASSERT_NE(nullptr, view);
  EXPECT_EQ(0, std::memcmp(view, "abcdef", 6));
  EXPECT_EQ(nullptr, buffer_->linearize(7));

  // The view starts at the unread front
  buffer_->drain(2);
  view = static_cast<const char*>(buffer_->linearize(4));
  ASSERT_NE(nullptr, view);
  EXPECT_EQ(0, std::memcmp(view, "cdef", 4));
}

TEST_F(BufferTest, LargeDrainCompacts) {
  std::string chunk(8192, 'a');
  buffer_->add(chunk);
  buffer_->add("tail");
  buffer_->drain(8000);

  EXPECT_EQ(196u, buffer_->length());
  EXPECT_EQ(std::string(192, 'a') + "tail", buffer_->toString());
}

TEST(WatermarkBufferTest, CrossingHighAndLowFiresOnce) {
  int above = 0;
  int below = 0;
  WatermarkBuffer buffer([&]() { ++below; }, [&]() { ++above; });
  buffer.setWatermarks(10);

  buffer.add(std::string(8, 'x'));
  EXPECT_EQ(0, above);

  buffer.add(std::string(4, 'x'));
  EXPECT_EQ(1, above);
  EXPECT_TRUE(buffer.aboveHighWatermark());

  buffer.add(std::string(4, 'x'));
  EXPECT_EQ(1, above);

  // Still above the low watermark (5)
  buffer.drain(10);
  EXPECT_EQ(0, below);

  buffer.drain(3);
  EXPECT_EQ(1, below);
  EXPECT_FALSE(buffer.aboveHighWatermark());
}

TEST(WatermarkBufferTest, MoveOutDropsBelowLow) {
  int below = 0;
  WatermarkBuffer buffer([&]() { ++below; }, []() {});
  buffer.setWatermarks(4);
  buffer.add("0123456789");
  ASSERT_TRUE(buffer.aboveHighWatermark());

  OwnedBuffer destination;
  buffer.move(destination);
  EXPECT_EQ(1, below);
  EXPECT_EQ("0123456789", destination.toString());
}

TEST(WatermarkBufferTest, SettingWatermarkBelowContentFiresHigh) {
  int above = 0;
  WatermarkBuffer buffer([]() {}, [&]() { ++above; });
  buffer.add(std::string(100, 'x'));
  EXPECT_EQ(0, above);

  buffer.setWatermarks(50);
  EXPECT_EQ(1, above);
  EXPECT_EQ(50u, buffer.highWatermark());
}

TEST(WatermarkBufferTest, ZeroDisablesCallbacks) {
  int calls = 0;
  WatermarkBuffer buffer([&]() { ++calls; }, [&]() { ++calls; });
  buffer.setWatermarks(0);
  buffer.add(std::string(1000, 'x'));
  buffer.drain(1000);
  EXPECT_EQ(0, calls);
}
