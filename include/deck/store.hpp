#pragma once

#include "registry.hpp"

#include <filesystem>
#include <memory>

namespace deck {

class Store {
public:
  virtual ~Store() = default;

  // Never fails: a missing, unreadable or malformed backing store yields an
  // empty registry.
  virtual Registry load() = 0;

  // Writes the whole registry. Throws Error{PersistenceError} on failure.
  virtual void save(const Registry& registry) = 0;
};

std::unique_ptr<Store> make_json_store(std::filesystem::path path);

} // namespace deck
