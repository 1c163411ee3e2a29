#ifndef CONDUIT_BUFFER_H
#define CONDUIT_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace conduit {

/**
 * @brief Byte queue used for channel I/O
 *
 * Data is appended at the back and drained from the front.
 */
class Buffer {
 public:
  virtual ~Buffer() = default;

  virtual void add(const void* data, size_t size) = 0;
  virtual void add(const std::string& data) = 0;
  virtual void add(const Buffer& data) = 0;

  // Remove bytes from the front
  virtual void drain(size_t size) = 0;

  // Move all (or length) bytes to the back of destination
  virtual void move(Buffer& destination) = 0;
  virtual void move(Buffer& destination, size_t length) = 0;

  // Contiguous view of the first size bytes
  virtual void* linearize(size_t size) = 0;

  virtual size_t length() const = 0;

  virtual std::string toString() const = 0;
};

class OwnedBuffer : public Buffer {
 public:
  OwnedBuffer() = default;
  explicit OwnedBuffer(const std::string& data) { add(data); }
  OwnedBuffer(const OwnedBuffer&) = delete;
  OwnedBuffer& operator=(const OwnedBuffer&) = delete;
  OwnedBuffer(OwnedBuffer&& other) noexcept;
  OwnedBuffer& operator=(OwnedBuffer&& other) noexcept;

  void add(const void* data, size_t size) override;
  void add(const std::string& data) override;
  void add(const Buffer& data) override;
  void drain(size_t size) override;
  void move(Buffer& destination) override;
  void move(Buffer& destination, size_t length) override;
  void* linearize(size_t size) override;
  size_t length() const override;
  std::string toString() const override;

 private:
  void compact();

  std::string storage_;
  size_t offset_{0};
};

/**
 * @brief Buffer with flow-control callbacks
 *
 * above_high fires once when length crosses the high watermark upwards,
 * below_low fires once when it then drops under the low watermark.
 */
class WatermarkBuffer : public OwnedBuffer {
 public:
  using WatermarkCallback = std::function<void()>;

  WatermarkBuffer(WatermarkCallback below_low_watermark,
                  WatermarkCallback above_high_watermark)
      : below_low_watermark_(std::move(below_low_watermark)),
        above_high_watermark_callback_(std::move(above_high_watermark)) {}

  // Low watermark defaults to half the high watermark; 0 disables both
  void setWatermarks(uint32_t high_watermark);

  bool aboveHighWatermark() const { return above_high_watermark_; }
  uint32_t highWatermark() const { return high_watermark_; }

  void add(const void* data, size_t size) override;
  void add(const std::string& data) override;
  void add(const Buffer& data) override;
  void drain(size_t size) override;
  void move(Buffer& destination) override;
  void move(Buffer& destination, size_t length) override;

 private:
  void checkWatermarks(size_t old_size);

  uint32_t high_watermark_{0};
  uint32_t low_watermark_{0};
  WatermarkCallback below_low_watermark_;
  WatermarkCallback above_high_watermark_callback_;
  bool above_high_watermark_{false};
};

}  // namespace conduit

#endif  // CONDUIT_BUFFER_H
