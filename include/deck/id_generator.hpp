#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace deck {

// Produces short hex card identifiers. Uniqueness is the caller's concern.
class IdGenerator {
public:
  static constexpr std::size_t kIdLength = 8;

  IdGenerator();
  explicit IdGenerator(std::uint64_t seed);

  std::string generate_id();

private:
  std::uint64_t rng_state_;
};

} // namespace deck
