#ifndef CONDUIT_HTTP_HTTP_HEADERS_H
#define CONDUIT_HTTP_HTTP_HEADERS_H

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "conduit/core/compat.h"

namespace conduit {
namespace http {

/**
 * HTTP headers container
 * Maintains header order and allows case-insensitive lookups
 */
class HttpHeaders {
 public:
  using Entry = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Entry>::const_iterator;

  // Append, keeping existing values
  void add(const std::string& name, const std::string& value);

  // Replace every value of name with one value
  void set(const std::string& name, const std::string& value);

  // Returns true if anything was removed
  bool remove(const std::string& name);

  // First value
  optional<std::string> get(const std::string& name) const;

  std::vector<std::string> getAll(const std::string& name) const;

  bool has(const std::string& name) const;

  // True if a comma-separated value of name contains token
  bool containsToken(const std::string& name, const std::string& token) const;

  void clear() { entries_.clear(); }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

 private:
  std::vector<Entry> entries_;
};

bool equalsIgnoreCase(const std::string& a, const std::string& b);

std::string toLower(std::string value);

std::string trim(const std::string& value);

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_HTTP_HEADERS_H
