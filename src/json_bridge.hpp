#pragma once

#include "deck/registry.hpp"
#include "deck/types.hpp"

#include <string>

#include <nlohmann/json.hpp>

// Strict conversions between the domain records and the stored document.
// The *_from_json functions throw std::invalid_argument on any unknown,
// missing or mistyped field.
namespace deck::bridge {

nlohmann::json to_json(const Card& card);
Card card_from_json(const nlohmann::json& json_card);

nlohmann::json to_json(const Collection& collection);
Collection collection_from_json(const std::string& name, const nlohmann::json& json_collection);

nlohmann::json to_json(const Registry& registry);
Registry registry_from_json(const nlohmann::json& json_registry);

nlohmann::json to_json(const DrillSummary& summary);

} // namespace deck::bridge
