#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace deck {

// One Learn-mode run over a snapshot of a collection's cards.
//
// Each card moves Presented -> Revealed -> (judged). Correct, Wrong and
// Skipped advance to the next card or to Completed; Quit moves straight to
// TerminatedEarly. Calls made in the wrong state throw std::runtime_error and
// leave the session untouched.
class DrillSession {
public:
  // Throws Error{NothingToLearn} when `cards` is empty. Random mode shuffles
  // the snapshot once, here, using `seed`.
  DrillSession(std::vector<Card> cards, OrderMode mode, std::uint64_t seed = 1);

  static DrillSession start(const Collection& collection, OrderMode mode,
                            std::uint64_t seed = 1);

  DrillState state() const { return state_; }
  bool finished() const;

  const Card& current() const;
  // 1-based index of the current card.
  std::size_t position() const;
  std::size_t size() const { return cards_.size(); }

  void reveal();
  void judge(Judgment judgment);

  const std::vector<Card>& order() const { return cards_; }
  const DrillTally& tally() const { return tally_; }
  DrillSummary summary() const;

  nlohmann::json debug_state() const;

private:
  void present(std::size_t index);
  void require_state(DrillState expected, const char* action) const;

  std::vector<Card> cards_;
  OrderMode mode_;
  DrillState state_ = DrillState::Presented;
  std::size_t index_ = 0;
  DrillTally tally_;
};

// Maps y/yes, n/no, s/skip and q/quit (case-insensitive, trimmed) to a
// judgment. Anything else yields nullopt.
std::optional<Judgment> parse_judgment(const std::string& input);

} // namespace deck
