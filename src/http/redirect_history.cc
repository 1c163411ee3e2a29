#include "conduit/http/redirect_history.h"

#include <algorithm>

namespace conduit {
namespace http {

RedirectHistory RedirectHistory::append(const std::string& uri) const {
  auto node = std::make_shared<Node>();
  node->uri = uri;
  node->previous = tail_;
  node->size = size() + 1;
  return RedirectHistory(std::move(node));
}

const std::string& RedirectHistory::last() const {
  static const std::string empty_uri;
  return tail_ ? tail_->uri : empty_uri;
}

std::vector<std::string> RedirectHistory::entries() const {
  std::vector<std::string> result;
  result.reserve(size());
  for (const Node* node = tail_.get(); node; node = node->previous.get()) {
    result.push_back(node->uri);
  }
  std::reverse(result.begin(), result.end());
  return result;
}

}  // namespace http
}  // namespace conduit
