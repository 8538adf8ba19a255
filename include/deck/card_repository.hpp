#pragma once

#include "id_generator.hpp"
#include "types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Card operations scoped to a single collection. Every function either
// completes or throws deck::Error without touching the collection.
namespace deck::cards {

const Card& add(Collection& collection, const std::string& front, const std::string& back,
                IdGenerator& ids);

Card& find(Collection& collection, const std::string& id);
const Card& find(const Collection& collection, const std::string& id);

// Blank or omitted values keep the current field.
const Card& edit(Collection& collection, const std::string& id,
                 const std::optional<std::string>& new_front,
                 const std::optional<std::string>& new_back);

void remove(Collection& collection, const std::string& id);

// Gives every card whose id repeats an earlier card's id a fresh one. The
// first holder keeps it. Returns the number of cards renumbered.
std::size_t reassign_duplicate_ids(Collection& collection, IdGenerator& ids);

// Case-insensitive substring match on front or back, in stored order.
// An empty query matches every card.
std::vector<Card> search(const Collection& collection, const std::string& query);

} // namespace deck::cards
