#include "conduit/network/pipeline.h"

#define CONDUIT_LOG_COMPONENT "network.pipeline"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace network {

bool Pipeline::addLast(const std::string& name, ReadFilterSharedPtr filter) {
  return insertAt(entries_.size(), name, std::move(filter));
}

bool Pipeline::addBefore(const std::string& base_name,
                         const std::string& name,
                         ReadFilterSharedPtr filter) {
  int index = indexOf(base_name);
  if (index < 0) {
    CONDUIT_LOG_DEBUG("cannot add {} before missing stage {}", name,
                      base_name);
    return false;
  }
  return insertAt(static_cast<size_t>(index), name, std::move(filter));
}

bool Pipeline::insertAt(size_t index,
                        const std::string& name,
                        ReadFilterSharedPtr filter) {
  if (!filter || indexOf(name) >= 0) {
    return false;
  }
  auto entry = std::make_shared<Entry>(*this, name, std::move(filter));
  entries_.insert(entries_.begin() + index, entry);
  entry->filter_->initializeReadFilterCallbacks(*entry);
  return true;
}

ReadFilterSharedPtr Pipeline::remove(const std::string& name) {
  int index = indexOf(name);
  if (index < 0) {
    return nullptr;
  }
  EntrySharedPtr entry = entries_[index];
  entries_.erase(entries_.begin() + index);
  entry->removed_ = true;
  return entry->filter_;
}

ReadFilterSharedPtr Pipeline::get(const std::string& name) const {
  int index = indexOf(name);
  return index < 0 ? nullptr : entries_[index]->filter_;
}

std::vector<std::string> Pipeline::names() const {
  std::vector<std::string> result;
  result.reserve(entries_.size());
  for (const auto& entry : entries_) {
    result.push_back(entry->name_);
  }
  return result;
}

void Pipeline::fireRead(MessagePtr message) {
  dispatchFrom(0, std::move(message));
}

void Pipeline::fireChannelInactive() {
  // Copy: stages may reshape the pipeline while being told
  std::vector<EntrySharedPtr> entries = entries_;
  for (auto& entry : entries) {
    if (!entry->removed_) {
      entry->filter_->onChannelInactive();
    }
  }
}

void Pipeline::clear() {
  for (auto& entry : entries_) {
    entry->removed_ = true;
  }
  entries_.clear();
}

int Pipeline::indexOf(const std::string& name) const {
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i]->name_ == name) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

void Pipeline::dispatchFrom(size_t index, MessagePtr message) {
  if (index >= entries_.size()) {
    CONDUIT_LOG_DEBUG("message reached the end of the pipeline, dropped");
    return;
  }
  // Keep the stage alive even if it removes itself
  EntrySharedPtr entry = entries_[index];
  entry->filter_->onRead(std::move(message));
}

void Pipeline::Entry::fireRead(MessagePtr message) {
  if (removed_) {
    CONDUIT_LOG_DEBUG("stage {} was removed, message dropped", name_);
    return;
  }
  int index = parent_.indexOf(name_);
  if (index < 0) {
    return;
  }
  parent_.dispatchFrom(static_cast<size_t>(index) + 1, std::move(message));
}

}  // namespace network
}  // namespace conduit
