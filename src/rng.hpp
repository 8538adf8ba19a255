#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace deck {

inline std::uint64_t advance_rng(std::uint64_t& state) {
  if (state == 0) {
    state = 0x2545F4914F6CDD1DULL;
  }
  std::uint64_t x = state;
  x ^= x << 13;
  x ^= x >> 7;
  x ^= x << 17;
  state = x;
  return x;
}

inline std::size_t rand_index(std::uint64_t& state, std::size_t bound) {
  if (bound == 0) {
    throw std::invalid_argument("rand_index: empty interval");
  }
  return static_cast<std::size_t>(advance_rng(state) % static_cast<std::uint64_t>(bound));
}

inline std::uint64_t entropy_seed() {
  std::random_device device;
  std::uint64_t seed = (static_cast<std::uint64_t>(device()) << 32) ^ device();
  return seed == 0 ? 1 : seed;
}

// Fisher-Yates, walking down from the back.
template <typename T>
void shuffle_in_place(std::vector<T>& values, std::uint64_t& state) {
  for (std::size_t i = values.size(); i > 1; --i) {
    const std::size_t j = rand_index(state, i);
    using std::swap;
    swap(values[i - 1], values[j]);
  }
}

} // namespace deck
