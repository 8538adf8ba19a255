#pragma once

#include "types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace deck {

// Owns every collection, keyed by exact (case-sensitive) name.
class Registry {
public:
  using Map = std::map<std::string, Collection>;

  Registry() = default;

  std::vector<std::string> list_names() const;
  std::vector<CollectionCount> card_counts() const;

  // Names are trimmed; a blank name is rejected with EmptyField.
  Collection& create(const std::string& name);
  void remove(const std::string& name);

  Collection& get(const std::string& name);
  const Collection& get(const std::string& name) const;

  bool contains(const std::string& name) const;
  std::size_t size() const { return collections_.size(); }
  bool empty() const { return collections_.empty(); }

  const Map& collections() const { return collections_; }

  friend bool operator==(const Registry& lhs, const Registry& rhs) {
    return lhs.collections_ == rhs.collections_;
  }
  friend bool operator!=(const Registry& lhs, const Registry& rhs) { return !(lhs == rhs); }

private:
  Map collections_;
};

} // namespace deck
