#ifndef CONDUIT_NETWORK_PIPELINE_H
#define CONDUIT_NETWORK_PIPELINE_H

#include <memory>
#include <string>
#include <vector>

#include "conduit/network/filter.h"

namespace conduit {
namespace network {

/**
 * Ordered list of named read filters owned by one channel.
 *
 * Stages may be added or removed while a message is being dispatched; a
 * stage that was removed no longer forwards anything.
 * Only used from the channel's dispatcher thread.
 */
class Pipeline {
 public:
  explicit Pipeline(Channel& channel) : channel_(channel) {}

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // False if name is already taken
  bool addLast(const std::string& name, ReadFilterSharedPtr filter);

  // False if base_name is missing or name is already taken
  bool addBefore(const std::string& base_name,
                 const std::string& name,
                 ReadFilterSharedPtr filter);

  // Returns the removed filter, or nullptr
  ReadFilterSharedPtr remove(const std::string& name);

  ReadFilterSharedPtr get(const std::string& name) const;

  template <typename T>
  std::shared_ptr<T> getAs(const std::string& name) const {
    return std::dynamic_pointer_cast<T>(get(name));
  }

  std::vector<std::string> names() const;

  bool empty() const { return entries_.empty(); }

  // Deliver a message to the first stage
  void fireRead(MessagePtr message);

  void fireChannelInactive();

  void clear();

 private:
  class Entry : public ReadFilterCallbacks {
   public:
    Entry(Pipeline& parent, const std::string& name, ReadFilterSharedPtr filter)
        : parent_(parent), name_(name), filter_(std::move(filter)) {}

    Channel& channel() override { return parent_.channel_; }
    void fireRead(MessagePtr message) override;

    Pipeline& parent_;
    const std::string name_;
    ReadFilterSharedPtr filter_;
    bool removed_{false};
  };

  using EntrySharedPtr = std::shared_ptr<Entry>;

  bool insertAt(size_t index, const std::string& name,
                ReadFilterSharedPtr filter);
  int indexOf(const std::string& name) const;
  void dispatchFrom(size_t index, MessagePtr message);

  Channel& channel_;
  std::vector<EntrySharedPtr> entries_;
};

}  // namespace network
}  // namespace conduit

#endif  // CONDUIT_NETWORK_PIPELINE_H
