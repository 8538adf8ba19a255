#include "deck/store.hpp"

#include "deck/debug_log.hpp"
#include "json_bridge.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace deck {
namespace {

constexpr int kIndent = 2;

Error persistence_error(const std::filesystem::path& path, const std::string& detail) {
  return Error(ErrorCode::PersistenceError,
               "Failed to save '" + path.string() + "': " + detail);
}

class JsonFileStore : public Store {
public:
  explicit JsonFileStore(std::filesystem::path path) : path_(std::move(path)) {}

  Registry load() override {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
      debug_log("store", "no data file at " + path_.string() + ", starting empty");
      return Registry();
    }

    std::ifstream stream(path_, std::ios::binary);
    if (!stream) {
      debug_log("store", "cannot open " + path_.string() + ", starting empty");
      return Registry();
    }
    std::string content((std::istreambuf_iterator<char>(stream)),
                        std::istreambuf_iterator<char>());
    if (stream.bad()) {
      debug_log("store", "read error on " + path_.string() + ", starting empty");
      return Registry();
    }

    auto document = nlohmann::json::parse(content, nullptr, false);
    if (document.is_discarded()) {
      debug_log("store", path_.string() + " is not valid JSON, starting empty");
      return Registry();
    }
    if (!document.is_object() || !document.contains("collections")) {
      debug_log("store", path_.string() + " has no 'collections' key, starting empty");
      return Registry();
    }

    try {
      Registry registry = bridge::registry_from_json(document);
      debug_log("store", "loaded " + std::to_string(registry.size()) + " collections from " +
                             path_.string());
      return registry;
    } catch (const std::exception& ex) {
      debug_log("store", "rejected " + path_.string() + ": " + ex.what() + ", starting empty");
      return Registry();
    }
  }

  void save(const Registry& registry) override {
    std::string payload;
    try {
      payload = bridge::to_json(registry).dump(kIndent);
    } catch (const nlohmann::json::exception& ex) {
      throw persistence_error(path_, ex.what());
    }
    payload.push_back('\n');

    std::error_code ec;
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        throw persistence_error(path_, ec.message());
      }
    }

    auto staging = path_;
    staging += ".tmp";
    {
      std::ofstream out(staging, std::ios::binary | std::ios::trunc);
      if (!out) {
        throw persistence_error(path_, "cannot open " + staging.string());
      }
      out << payload;
      out.flush();
      if (!out) {
        out.close();
        std::filesystem::remove(staging, ec);
        throw persistence_error(path_, "write failed");
      }
    }

    std::filesystem::rename(staging, path_, ec);
    if (ec) {
      const std::string detail = ec.message();
      std::filesystem::remove(staging, ec);
      throw persistence_error(path_, detail);
    }
    debug_log("store", "saved " + std::to_string(registry.size()) + " collections to " +
                           path_.string());
  }

private:
  std::filesystem::path path_;
};

} // namespace

std::unique_ptr<Store> make_json_store(std::filesystem::path path) {
  return std::make_unique<JsonFileStore>(std::move(path));
}

} // namespace deck
