#include "json_bridge.hpp"

#include "deck/text.hpp"

#include <initializer_list>
#include <stdexcept>
#include <string_view>

namespace deck::bridge {
namespace {

void require_object(const nlohmann::json& value, std::string_view what) {
  if (!value.is_object()) {
    throw std::invalid_argument("Expected object for " + std::string(what));
  }
}

void require_exact_keys(const nlohmann::json& obj, std::initializer_list<const char*> keys,
                        std::string_view what) {
  for (const char* key : keys) {
    if (!obj.contains(key)) {
      throw std::invalid_argument("Missing field '" + std::string(key) + "' in " +
                                  std::string(what));
    }
  }
  if (obj.size() != keys.size()) {
    for (const auto& item : obj.items()) {
      bool known = false;
      for (const char* key : keys) {
        if (item.key() == key) {
          known = true;
        }
      }
      if (!known) {
        throw std::invalid_argument("Unknown field '" + item.key() + "' in " +
                                    std::string(what));
      }
    }
  }
}

std::string json_to_text(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  std::string out = value.get<std::string>();
  if (text::is_blank(out)) {
    throw std::invalid_argument("Field '" + std::string(key) + "' cannot be empty");
  }
  return out;
}

} // namespace

nlohmann::json to_json(const Card& card) {
  nlohmann::json json_card = nlohmann::json::object();
  json_card["id"] = card.id;
  json_card["front"] = card.front;
  json_card["back"] = card.back;
  return json_card;
}

Card card_from_json(const nlohmann::json& json_card) {
  require_object(json_card, "card");
  require_exact_keys(json_card, {"id", "front", "back"}, "card");
  Card card;
  card.id = json_to_text(json_card["id"], "id");
  card.front = json_to_text(json_card["front"], "front");
  card.back = json_to_text(json_card["back"], "back");
  return card;
}

nlohmann::json to_json(const Collection& collection) {
  nlohmann::json cards = nlohmann::json::array();
  for (const auto& card : collection.cards) {
    cards.push_back(to_json(card));
  }
  nlohmann::json json_collection = nlohmann::json::object();
  json_collection["cards"] = cards;
  return json_collection;
}

Collection collection_from_json(const std::string& name, const nlohmann::json& json_collection) {
  const std::string what = "collection '" + name + "'";
  require_object(json_collection, what);
  require_exact_keys(json_collection, {"cards"}, what);
  const auto& json_cards = json_collection["cards"];
  if (!json_cards.is_array()) {
    throw std::invalid_argument("Expected array for field 'cards' in " + what);
  }

  Collection collection;
  collection.name = name;
  collection.cards.reserve(json_cards.size());
  for (const auto& json_card : json_cards) {
    collection.cards.push_back(card_from_json(json_card));
  }
  return collection;
}

nlohmann::json to_json(const Registry& registry) {
  nlohmann::json collections = nlohmann::json::object();
  for (const auto& kv : registry.collections()) {
    collections[kv.first] = to_json(kv.second);
  }
  nlohmann::json document = nlohmann::json::object();
  document["collections"] = collections;
  return document;
}

Registry registry_from_json(const nlohmann::json& json_registry) {
  require_object(json_registry, "document");
  require_exact_keys(json_registry, {"collections"}, "document");
  const auto& json_collections = json_registry["collections"];
  require_object(json_collections, "field 'collections'");

  Registry registry;
  for (const auto& item : json_collections.items()) {
    const std::string& name = item.key();
    if (name.empty() || text::trim(name) != name) {
      throw std::invalid_argument("Invalid collection name '" + name + "'");
    }
    Collection parsed = collection_from_json(name, item.value());
    registry.create(name).cards = std::move(parsed.cards);
  }
  return registry;
}

nlohmann::json to_json(const DrillSummary& summary) {
  nlohmann::json json_summary = nlohmann::json::object();
  json_summary["state"] = to_string(summary.state);
  json_summary["correct"] = summary.tally.correct;
  json_summary["wrong"] = summary.tally.wrong;
  json_summary["skipped"] = summary.tally.skipped;
  json_summary["total_cards"] = summary.tally.total_cards;
  json_summary["cards_seen"] = summary.tally.cards_seen;
  return json_summary;
}

} // namespace deck::bridge
