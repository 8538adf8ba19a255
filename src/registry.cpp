#include "deck/registry.hpp"

#include "deck/text.hpp"

#include <utility>

namespace deck {
namespace {

Error collection_not_found(const std::string& name) {
  return Error(ErrorCode::NotFound, "Collection '" + name + "' not found");
}

} // namespace

std::vector<std::string> Registry::list_names() const {
  // std::map already iterates in byte-wise lexicographic order.
  std::vector<std::string> names;
  names.reserve(collections_.size());
  for (const auto& kv : collections_) {
    names.push_back(kv.first);
  }
  return names;
}

std::vector<CollectionCount> Registry::card_counts() const {
  std::vector<CollectionCount> counts;
  counts.reserve(collections_.size());
  for (const auto& kv : collections_) {
    counts.push_back({kv.first, kv.second.cards.size()});
  }
  return counts;
}

Collection& Registry::create(const std::string& name) {
  std::string key = text::trim(name);
  if (key.empty()) {
    throw Error(ErrorCode::EmptyField, "Collection name cannot be empty");
  }
  if (collections_.count(key) != 0) {
    throw Error(ErrorCode::DuplicateName, "A collection named '" + key + "' already exists");
  }
  Collection collection;
  collection.name = key;
  auto inserted = collections_.emplace(std::move(key), std::move(collection));
  return inserted.first->second;
}

void Registry::remove(const std::string& name) {
  auto it = collections_.find(name);
  if (it == collections_.end()) {
    throw collection_not_found(name);
  }
  collections_.erase(it);
}

Collection& Registry::get(const std::string& name) {
  auto it = collections_.find(name);
  if (it == collections_.end()) {
    throw collection_not_found(name);
  }
  return it->second;
}

const Collection& Registry::get(const std::string& name) const {
  auto it = collections_.find(name);
  if (it == collections_.end()) {
    throw collection_not_found(name);
  }
  return it->second;
}

bool Registry::contains(const std::string& name) const {
  return collections_.find(name) != collections_.end();
}

} // namespace deck
