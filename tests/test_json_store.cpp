#include "deck/card_repository.hpp"
#include "deck/registry.hpp"
#include "deck/store.hpp"

#include "json_bridge.hpp"
#include "test_suite.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

namespace {

fs::path make_scratch_dir(const std::string& label) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path dir = fs::temp_directory_path() / ("deck_" + label + "_" + std::to_string(stamp));
  fs::create_directories(dir);
  return dir;
}

void write_file(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::string read_file(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

deck::Registry sample_registry() {
  deck::Registry registry;
  deck::IdGenerator ids(21);
  auto& spanish = registry.create("Spanish");
  deck::cards::add(spanish, "hola", "hello", ids);
  deck::cards::add(spanish, "gato", "cat", ids);
  auto& greek = registry.create("Ελληνικά");
  deck::cards::add(greek, "γάτα", "cat", ids);
  registry.create("Empty");
  return registry;
}

} // namespace

int main() {
  deck::testing::TestSuite suite;
  const fs::path scratch = make_scratch_dir("store");

  {
    auto store = deck::make_json_store(scratch / "missing.json");
    suite.require(store->load().empty(), "Missing file loads as an empty registry");
  }

  {
    const auto path = scratch / "roundtrip.json";
    auto store = deck::make_json_store(path);
    const auto registry = sample_registry();
    store->save(registry);
    const auto loaded = store->load();
    suite.require(loaded == registry, "save followed by load reproduces an equal registry");
    suite.require(loaded.list_names() == registry.list_names(), "Names survive the round trip");
    suite.require(loaded.get("Spanish").cards[1].front == "gato",
                  "Card order survives the round trip");
    suite.require(!fs::exists(path.string() + ".tmp"), "Staging file is not left behind");

    const auto document = nlohmann::json::parse(read_file(path));
    suite.require(document.is_object() && document.size() == 1 &&
                      document.contains("collections"),
                  "Document has the single top-level 'collections' key");
    const auto& cards = document["collections"]["Spanish"]["cards"];
    suite.require(cards.is_array() && cards.size() == 2, "Cards are stored as an array");
    suite.require(cards[0].size() == 3 && cards[0]["front"] == "hola" &&
                      cards[0]["back"] == "hello" && cards[0]["id"].is_string(),
                  "Cards are stored as id/front/back objects");
    suite.require(document["collections"]["Empty"]["cards"].empty(),
                  "Empty collections are stored with an empty card list");
  }

  {
    const auto path = scratch / "nested" / "dir" / "data.json";
    auto store = deck::make_json_store(path);
    store->save(sample_registry());
    suite.require(fs::exists(path), "Saving creates missing parent directories");
  }

  {
    const auto path = scratch / "external.json";
    write_file(path, R"({"collections": {"Spanish": {"cards": [
        {"id": "a1b2c3d4", "front": "hola", "back": "hello"},
        {"id": "e5f6a7b8", "front": "gato", "back": "cat"}]}}})");
    const auto loaded = deck::make_json_store(path)->load();
    suite.require(loaded.size() == 1 && loaded.get("Spanish").cards.size() == 2 &&
                      loaded.get("Spanish").cards[1].id == "e5f6a7b8",
                  "A document in the shared format is loaded as-is");
  }

  {
    const auto path = scratch / "repeated_ids.json";
    write_file(path, R"({"collections": {"Spanish": {"cards": [
        {"id": "a1b2c3d4", "front": "hola", "back": "hello"},
        {"id": "a1b2c3d4", "front": "gato", "back": "cat"}]},
        "French": {"cards": [{"id": "0000aaaa", "front": "chat", "back": "cat"}]}}})");
    const auto loaded = deck::make_json_store(path)->load();
    suite.require(loaded.size() == 2 && loaded.get("Spanish").cards.size() == 2 &&
                      loaded.get("French").cards.size() == 1,
                  "Repeated card ids do not discard the document");
  }

  {
    struct Case {
      const char* label;
      const char* content;
    };
    const Case cases[] = {
        {"not json", "{ this is not json"},
        {"empty file", ""},
        {"array root", "[1, 2, 3]"},
        {"missing collections", R"({"decks": {}})"},
        {"collections not object", R"({"collections": []})"},
        {"extra top-level key", R"({"collections": {}, "version": 2})"},
        {"collection without cards", R"({"collections": {"A": {}}})"},
        {"cards not array", R"({"collections": {"A": {"cards": {}}}})"},
        {"card missing back", R"({"collections": {"A": {"cards": [{"id": "1", "front": "f"}]}}})"},
        {"card with unknown field",
         R"({"collections": {"A": {"cards": [{"id": "1", "front": "f", "back": "b", "x": 1}]}}})"},
        {"card with number front",
         R"({"collections": {"A": {"cards": [{"id": "1", "front": 5, "back": "b"}]}}})"},
        {"card with blank back",
         R"({"collections": {"A": {"cards": [{"id": "1", "front": "f", "back": "  "}]}}})"},
        {"blank collection name", R"({"collections": {" ": {"cards": []}}})"},
    };
    for (const auto& c : cases) {
      const auto path = scratch / "corrupt.json";
      write_file(path, c.content);
      const auto loaded = deck::make_json_store(path)->load();
      suite.require(loaded.empty(), std::string("Malformed store falls back to empty: ") + c.label);
    }
  }

  {
    // A regular file where a directory is expected makes every write fail.
    const auto blocker = scratch / "blocker";
    write_file(blocker, "not a directory");
    auto store = deck::make_json_store(blocker / "sub" / "data.json");
    suite.require(deck::testing::throws_code([&] { store->save(sample_registry()); },
                                             deck::ErrorCode::PersistenceError),
                  "Save failure is surfaced as PersistenceError");
  }

  {
    deck::DrillSummary summary;
    summary.state = deck::DrillState::TerminatedEarly;
    summary.tally.correct = 1;
    summary.tally.total_cards = 3;
    summary.tally.cards_seen = 2;
    const auto json = deck::bridge::to_json(summary);
    suite.require(json["state"] == "terminated_early" && json["cards_seen"] == 2 &&
                      json["total_cards"] == 3 && json["correct"] == 1,
                  "Drill summary serializes its tallies");
  }

  std::error_code ec;
  fs::remove_all(scratch, ec);

  return suite.finish("JSON store");
}
