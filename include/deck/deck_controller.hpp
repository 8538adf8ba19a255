#pragma once

#include "drill_session.hpp"
#include "id_generator.hpp"
#include "registry.hpp"
#include "store.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace deck {

// Owns the registry for the lifetime of the program. Every mutation is
// applied to a copy, saved, and only then published, so a failed operation
// (validation or persistence) leaves registry() exactly as it was.
class DeckController {
public:
  explicit DeckController(std::unique_ptr<Store> store);
  DeckController(std::unique_ptr<Store> store, IdGenerator ids, std::uint64_t drill_seed);

  const Registry& registry() const { return registry_; }

  std::vector<std::string> list_names() const;
  std::vector<CollectionCount> card_counts() const;
  const std::vector<Card>& cards(const std::string& collection) const;

  void create_collection(const std::string& name);
  void delete_collection(const std::string& name);

  Card add_card(const std::string& collection, const std::string& front,
                const std::string& back);
  Card edit_card(const std::string& collection, const std::string& id,
                 const std::optional<std::string>& new_front,
                 const std::optional<std::string>& new_back);
  void delete_card(const std::string& collection, const std::string& id);

  const Card& find_card(const std::string& collection, const std::string& id) const;
  std::vector<Card> search(const std::string& collection, const std::string& query) const;

  // Snapshots the collection; throws Error{NothingToLearn} when it is empty.
  DrillSession start_drill(const std::string& collection, OrderMode mode);

private:
  template <typename Mutation>
  void commit(Mutation&& mutation);

  std::unique_ptr<Store> store_;
  IdGenerator ids_;
  std::uint64_t drill_rng_state_;
  Registry registry_;
};

} // namespace deck
