#ifndef CONDUIT_HTTP_REDIRECT_HISTORY_H
#define CONDUIT_HTTP_REDIRECT_HISTORY_H

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace conduit {
namespace http {

/**
 * Ordered record of the URIs a request was redirected from.
 *
 * A value type: append() returns a new history that shares this one as
 * its prefix, so a history handed to a response never changes afterwards.
 * Safe to share between threads.
 */
class RedirectHistory {
 public:
  static constexpr size_t kMaxRedirects = 50;

  RedirectHistory() = default;

  RedirectHistory append(const std::string& uri) const;

  size_t size() const { return tail_ ? tail_->size : 0; }
  bool empty() const { return !tail_; }

  // Whether one more redirect may be followed under the given cap
  bool canFollow(size_t max_redirects = kMaxRedirects) const {
    return size() < max_redirects;
  }

  // Most recently appended URI; empty string when there is none
  const std::string& last() const;

  // Oldest first
  std::vector<std::string> entries() const;

  bool operator==(const RedirectHistory& other) const {
    return entries() == other.entries();
  }

 private:
  struct Node {
    std::string uri;
    std::shared_ptr<const Node> previous;
    size_t size;
  };

  explicit RedirectHistory(std::shared_ptr<const Node> tail)
      : tail_(std::move(tail)) {}

  std::shared_ptr<const Node> tail_;
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_REDIRECT_HISTORY_H
