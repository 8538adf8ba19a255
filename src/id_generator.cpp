#include "deck/id_generator.hpp"

#include "rng.hpp"

namespace deck {

IdGenerator::IdGenerator() : rng_state_(entropy_seed()) {}

IdGenerator::IdGenerator(std::uint64_t seed) : rng_state_(seed == 0 ? 1 : seed) {}

std::string IdGenerator::generate_id() {
  static const char kHexDigits[] = "0123456789abcdef";
  std::uint64_t bits = advance_rng(rng_state_);
  std::string id(kIdLength, '0');
  for (std::size_t i = 0; i < kIdLength; ++i) {
    id[i] = kHexDigits[bits & 0xF];
    bits >>= 4;
  }
  return id;
}

} // namespace deck
