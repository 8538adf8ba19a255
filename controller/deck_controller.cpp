#include "deck/deck_controller.hpp"

#include "deck/card_repository.hpp"
#include "deck/debug_log.hpp"
#include "../src/rng.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace deck {

DeckController::DeckController(std::unique_ptr<Store> store)
    : DeckController(std::move(store), IdGenerator(), entropy_seed()) {}

DeckController::DeckController(std::unique_ptr<Store> store, IdGenerator ids,
                               std::uint64_t drill_seed)
    : store_(std::move(store)), ids_(std::move(ids)),
      drill_rng_state_(drill_seed == 0 ? 1 : drill_seed) {
  if (!store_) {
    throw std::invalid_argument("DeckController requires a store");
  }
  registry_ = store_->load();
  for (const auto& name : registry_.list_names()) {
    const std::size_t renumbered = cards::reassign_duplicate_ids(registry_.get(name), ids_);
    if (renumbered > 0) {
      debug_log("deck", "gave " + std::to_string(renumbered) + " card(s) in '" + name +
                            "' a new id to remove duplicates");
    }
  }
}

template <typename Mutation>
void DeckController::commit(Mutation&& mutation) {
  Registry next = registry_;
  mutation(next);
  store_->save(next);
  registry_ = std::move(next);
}

std::vector<std::string> DeckController::list_names() const {
  return registry_.list_names();
}

std::vector<CollectionCount> DeckController::card_counts() const {
  return registry_.card_counts();
}

const std::vector<Card>& DeckController::cards(const std::string& collection) const {
  return registry_.get(collection).cards;
}

void DeckController::create_collection(const std::string& name) {
  commit([&name](Registry& registry) { registry.create(name); });
  debug_log("deck", "created collection '" + name + "'");
}

void DeckController::delete_collection(const std::string& name) {
  commit([&name](Registry& registry) { registry.remove(name); });
  debug_log("deck", "deleted collection '" + name + "'");
}

Card DeckController::add_card(const std::string& collection, const std::string& front,
                              const std::string& back) {
  // The generator only advances once the add is committed.
  IdGenerator ids = ids_;
  Card added;
  commit([&](Registry& registry) {
    added = cards::add(registry.get(collection), front, back, ids);
  });
  ids_ = ids;
  debug_log("deck", "added card " + added.id + " to '" + collection + "'");
  return added;
}

Card DeckController::edit_card(const std::string& collection, const std::string& id,
                               const std::optional<std::string>& new_front,
                               const std::optional<std::string>& new_back) {
  Card edited;
  commit([&](Registry& registry) {
    edited = cards::edit(registry.get(collection), id, new_front, new_back);
  });
  debug_log("deck", "edited card " + id + " in '" + collection + "'");
  return edited;
}

void DeckController::delete_card(const std::string& collection, const std::string& id) {
  commit([&](Registry& registry) { cards::remove(registry.get(collection), id); });
  debug_log("deck", "deleted card " + id + " from '" + collection + "'");
}

const Card& DeckController::find_card(const std::string& collection,
                                      const std::string& id) const {
  return cards::find(registry_.get(collection), id);
}

std::vector<Card> DeckController::search(const std::string& collection,
                                         const std::string& query) const {
  return cards::search(registry_.get(collection), query);
}

DrillSession DeckController::start_drill(const std::string& collection, OrderMode mode) {
  const Collection& source = registry_.get(collection);
  return DrillSession::start(source, mode, advance_rng(drill_rng_state_));
}

} // namespace deck
