#include "deck/card_repository.hpp"

#include "deck/text.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace deck::cards {
namespace {

constexpr int kMaxIdAttempts = 64;

bool has_id(const Collection& collection, const std::string& id) {
  return std::any_of(collection.cards.begin(), collection.cards.end(),
                     [&id](const Card& card) { return card.id == id; });
}

std::string fresh_id(const Collection& collection, IdGenerator& ids) {
  for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    std::string id = ids.generate_id();
    if (!has_id(collection, id)) {
      return id;
    }
  }
  throw std::runtime_error("Unable to allocate a unique card id in '" + collection.name + "'");
}

Error card_not_found(const Collection& collection, const std::string& id) {
  return Error(ErrorCode::NotFound,
               "Card id '" + id + "' not found in collection '" + collection.name + "'");
}

} // namespace

const Card& add(Collection& collection, const std::string& front, const std::string& back,
                IdGenerator& ids) {
  std::string trimmed_front = text::trim(front);
  std::string trimmed_back = text::trim(back);
  if (trimmed_front.empty()) {
    throw Error(ErrorCode::EmptyField, "Card front cannot be empty");
  }
  if (trimmed_back.empty()) {
    throw Error(ErrorCode::EmptyField, "Card back cannot be empty");
  }

  Card card;
  card.id = fresh_id(collection, ids);
  card.front = std::move(trimmed_front);
  card.back = std::move(trimmed_back);
  collection.cards.push_back(std::move(card));
  return collection.cards.back();
}

Card& find(Collection& collection, const std::string& id) {
  auto it = std::find_if(collection.cards.begin(), collection.cards.end(),
                         [&id](const Card& card) { return card.id == id; });
  if (it == collection.cards.end()) {
    throw card_not_found(collection, id);
  }
  return *it;
}

const Card& find(const Collection& collection, const std::string& id) {
  auto it = std::find_if(collection.cards.begin(), collection.cards.end(),
                         [&id](const Card& card) { return card.id == id; });
  if (it == collection.cards.end()) {
    throw card_not_found(collection, id);
  }
  return *it;
}

const Card& edit(Collection& collection, const std::string& id,
                 const std::optional<std::string>& new_front,
                 const std::optional<std::string>& new_back) {
  Card& card = find(collection, id);
  if (new_front.has_value() && !text::is_blank(*new_front)) {
    card.front = text::trim(*new_front);
  }
  if (new_back.has_value() && !text::is_blank(*new_back)) {
    card.back = text::trim(*new_back);
  }
  return card;
}

void remove(Collection& collection, const std::string& id) {
  auto it = std::find_if(collection.cards.begin(), collection.cards.end(),
                         [&id](const Card& card) { return card.id == id; });
  if (it == collection.cards.end()) {
    throw card_not_found(collection, id);
  }
  collection.cards.erase(it);
}

std::size_t reassign_duplicate_ids(Collection& collection, IdGenerator& ids) {
  std::set<std::string> seen;
  std::size_t reassigned = 0;
  for (auto& card : collection.cards) {
    if (!seen.insert(card.id).second) {
      card.id = fresh_id(collection, ids);
      seen.insert(card.id);
      ++reassigned;
    }
  }
  return reassigned;
}

std::vector<Card> search(const Collection& collection, const std::string& query) {
  const std::string needle = text::to_lower(query);
  std::vector<Card> hits;
  for (const auto& card : collection.cards) {
    if (text::to_lower(card.front).find(needle) != std::string::npos ||
        text::to_lower(card.back).find(needle) != std::string::npos) {
      hits.push_back(card);
    }
  }
  return hits;
}

} // namespace deck::cards
