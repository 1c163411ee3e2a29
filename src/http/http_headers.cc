#include "conduit/http/http_headers.h"

#include <algorithm>
#include <cctype>

namespace conduit {
namespace http {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string trim(const std::string& value) {
  size_t start = value.find_first_not_of(" \t");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = value.find_last_not_of(" \t");
  return value.substr(start, end - start + 1);
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
  entries_.emplace_back(name, value);
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry& e) { return equalsIgnoreCase(e.first, name); });
  if (it == entries_.end()) {
    entries_.emplace_back(name, value);
    return;
  }
  it->second = value;
  // Drop any further values, keeping the first position
  entries_.erase(std::remove_if(it + 1, entries_.end(),
                                [&](const Entry& e) {
                                  return equalsIgnoreCase(e.first, name);
                                }),
                 entries_.end());
}

bool HttpHeaders::remove(const std::string& name) {
  size_t before = entries_.size();
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [&](const Entry& e) {
                                  return equalsIgnoreCase(e.first, name);
                                }),
                 entries_.end());
  return entries_.size() != before;
}

optional<std::string> HttpHeaders::get(const std::string& name) const {
  for (const auto& entry : entries_) {
    if (equalsIgnoreCase(entry.first, name)) {
      return entry.second;
    }
  }
  return nullopt;
}

std::vector<std::string> HttpHeaders::getAll(const std::string& name) const {
  std::vector<std::string> values;
  for (const auto& entry : entries_) {
    if (equalsIgnoreCase(entry.first, name)) {
      values.push_back(entry.second);
    }
  }
  return values;
}

bool HttpHeaders::has(const std::string& name) const {
  return get(name).has_value();
}

bool HttpHeaders::containsToken(const std::string& name,
                                const std::string& token) const {
  for (const auto& value : getAll(name)) {
    size_t start = 0;
    while (start <= value.size()) {
      size_t comma = value.find(',', start);
      std::string part = trim(value.substr(
          start, comma == std::string::npos ? std::string::npos : comma - start));
      if (equalsIgnoreCase(part, token)) {
        return true;
      }
      if (comma == std::string::npos) {
        break;
      }
      start = comma + 1;
    }
  }
  return false;
}

}  // namespace http
}  // namespace conduit
