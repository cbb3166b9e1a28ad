#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace machdap::session {

// watch expressions keyed by name; last write wins
class watch_set {
public:
  void set(const std::string& name, const std::string& expression) { watches_[name] = expression; }
  bool remove(const std::string& name) { return watches_.erase(name) != 0; }
  void clear() { watches_.clear(); }

  std::optional<std::string> get(const std::string& name) const {
    auto it = watches_.find(name);
    if (it == watches_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  const std::map<std::string, std::string>& all() const { return watches_; }
  size_t size() const { return watches_.size(); }

private:
  std::map<std::string, std::string> watches_{};
};

} // namespace machdap::session
