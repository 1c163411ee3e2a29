#include <algorithm>

#include "conduit/buffer.h"

namespace conduit {

namespace {
// Drained prefix is reclaimed once it dominates the storage
constexpr size_t kCompactThreshold = 4096;
}  // namespace

OwnedBuffer::OwnedBuffer(OwnedBuffer&& other) noexcept
    : storage_(std::move(other.storage_)), offset_(other.offset_) {
  other.storage_.clear();
  other.offset_ = 0;
}

OwnedBuffer& OwnedBuffer::operator=(OwnedBuffer&& other) noexcept {
  if (this != &other) {
    storage_ = std::move(other.storage_);
    offset_ = other.offset_;
    other.storage_.clear();
    other.offset_ = 0;
  }
  return *this;
}

void OwnedBuffer::add(const void* data, size_t size) {
  if (size == 0) {
    return;
  }
  storage_.append(static_cast<const char*>(data), size);
}

void OwnedBuffer::add(const std::string& data) {
  add(data.data(), data.size());
}

void OwnedBuffer::add(const Buffer& data) {
  std::string bytes = data.toString();
  add(bytes.data(), bytes.size());
}

void OwnedBuffer::drain(size_t size) {
  offset_ += std::min(size, length());
  if (offset_ == storage_.size()) {
    storage_.clear();
    offset_ = 0;
  } else if (offset_ > kCompactThreshold && offset_ > storage_.size() / 2) {
    compact();
  }
}

void OwnedBuffer::move(Buffer& destination) { move(destination, length()); }

void OwnedBuffer::move(Buffer& destination, size_t length) {
  length = std::min(length, this->length());
  if (length == 0) {
    return;
  }
  destination.add(storage_.data() + offset_, length);
  drain(length);
}

void* OwnedBuffer::linearize(size_t size) {
  if (size > length()) {
    return nullptr;
  }
  return &storage_[offset_];
}

size_t OwnedBuffer::length() const { return storage_.size() - offset_; }

std::string OwnedBuffer::toString() const { return storage_.substr(offset_); }

void OwnedBuffer::compact() {
  storage_.erase(0, offset_);
  offset_ = 0;
}

// WatermarkBuffer

void WatermarkBuffer::setWatermarks(uint32_t high_watermark) {
  high_watermark_ = high_watermark;
  low_watermark_ = high_watermark / 2;
  size_t current = length();
  above_high_watermark_ = false;
  if (high_watermark_ > 0 && current > high_watermark_) {
    above_high_watermark_ = true;
    if (above_high_watermark_callback_) {
      above_high_watermark_callback_();
    }
  }
}

void WatermarkBuffer::checkWatermarks(size_t old_size) {
  if (high_watermark_ == 0) {
    return;
  }
  size_t new_size = length();

  if (!above_high_watermark_ && old_size <= high_watermark_ &&
      new_size > high_watermark_) {
    above_high_watermark_ = true;
    if (above_high_watermark_callback_) {
      above_high_watermark_callback_();
    }
  } else if (above_high_watermark_ && new_size < low_watermark_) {
    above_high_watermark_ = false;
    if (below_low_watermark_) {
      below_low_watermark_();
    }
  }
}

void WatermarkBuffer::add(const void* data, size_t size) {
  size_t old_size = length();
  OwnedBuffer::add(data, size);
  checkWatermarks(old_size);
}

void WatermarkBuffer::add(const std::string& data) {
  size_t old_size = length();
  OwnedBuffer::add(data);
  checkWatermarks(old_size);
}

void WatermarkBuffer::add(const Buffer& data) {
  size_t old_size = length();
  OwnedBuffer::add(data);
  checkWatermarks(old_size);
}

void WatermarkBuffer::drain(size_t size) {
  size_t old_size = length();
  OwnedBuffer::drain(size);
  checkWatermarks(old_size);
}

void WatermarkBuffer::move(Buffer& destination) {
  size_t old_size = length();
  OwnedBuffer::move(destination);
  checkWatermarks(old_size);
}

void WatermarkBuffer::move(Buffer& destination, size_t length) {
  size_t old_size = this->length();
  OwnedBuffer::move(destination, length);
  checkWatermarks(old_size);
}

}  // namespace conduit
