#include "deck/drill_session.hpp"

#include "deck/debug_log.hpp"
#include "deck/text.hpp"
#include "rng.hpp"

#include <stdexcept>
#include <utility>

namespace deck {

DrillSession::DrillSession(std::vector<Card> cards, OrderMode mode, std::uint64_t seed)
    : cards_(std::move(cards)), mode_(mode) {
  if (cards_.empty()) {
    throw Error(ErrorCode::NothingToLearn, "No cards to learn yet.");
  }
  if (mode_ == OrderMode::Random) {
    std::uint64_t rng_state = seed == 0 ? 1 : seed;
    shuffle_in_place(cards_, rng_state);
  }
  tally_.total_cards = cards_.size();
  present(0);
  debug_log("drill", "started " + to_string(mode_) + " session with " +
                         std::to_string(cards_.size()) + " cards");
}

DrillSession DrillSession::start(const Collection& collection, OrderMode mode,
                                 std::uint64_t seed) {
  return DrillSession(collection.cards, mode, seed);
}

bool DrillSession::finished() const {
  return state_ == DrillState::Completed || state_ == DrillState::TerminatedEarly;
}

const Card& DrillSession::current() const {
  if (finished()) {
    throw std::runtime_error("Drill session has no current card once finished");
  }
  return cards_[index_];
}

std::size_t DrillSession::position() const {
  if (finished()) {
    throw std::runtime_error("Drill session has no current card once finished");
  }
  return index_ + 1;
}

void DrillSession::reveal() {
  require_state(DrillState::Presented, "reveal");
  state_ = DrillState::Revealed;
}

void DrillSession::judge(Judgment judgment) {
  require_state(DrillState::Revealed, "judge");
  switch (judgment) {
    case Judgment::Correct:
      ++tally_.correct;
      break;
    case Judgment::Wrong:
      ++tally_.wrong;
      break;
    case Judgment::Skipped:
      ++tally_.skipped;
      break;
    case Judgment::Quit:
      state_ = DrillState::TerminatedEarly;
      debug_log("drill", "terminated early after " + std::to_string(tally_.cards_seen) +
                             " of " + std::to_string(tally_.total_cards) + " cards");
      return;
  }

  if (index_ + 1 >= cards_.size()) {
    state_ = DrillState::Completed;
    debug_log("drill", "completed " + std::to_string(tally_.total_cards) + " cards");
    return;
  }
  present(index_ + 1);
}

DrillSummary DrillSession::summary() const {
  DrillSummary summary;
  summary.state = state_;
  summary.tally = tally_;
  return summary;
}

nlohmann::json DrillSession::debug_state() const {
  nlohmann::json info = nlohmann::json::object();
  info["state"] = to_string(state_);
  info["mode"] = to_string(mode_);
  info["total_cards"] = tally_.total_cards;
  info["cards_seen"] = tally_.cards_seen;
  info["correct"] = tally_.correct;
  info["wrong"] = tally_.wrong;
  info["skipped"] = tally_.skipped;
  if (finished()) {
    info["current_id"] = nullptr;
  } else {
    info["current_id"] = cards_[index_].id;
  }
  nlohmann::json order = nlohmann::json::array();
  for (const auto& card : cards_) {
    order.push_back(card.id);
  }
  info["order"] = order;
  return info;
}

void DrillSession::present(std::size_t index) {
  index_ = index;
  state_ = DrillState::Presented;
  ++tally_.cards_seen;
}

void DrillSession::require_state(DrillState expected, const char* action) const {
  if (state_ != expected) {
    throw std::runtime_error(std::string("Cannot ") + action + " while drill session is " +
                             to_string(state_));
  }
}

std::optional<Judgment> parse_judgment(const std::string& input) {
  const std::string answer = text::to_lower(text::trim(input));
  if (answer == "y" || answer == "yes") {
    return Judgment::Correct;
  }
  if (answer == "n" || answer == "no") {
    return Judgment::Wrong;
  }
  if (answer == "s" || answer == "skip") {
    return Judgment::Skipped;
  }
  if (answer == "q" || answer == "quit") {
    return Judgment::Quit;
  }
  return std::nullopt;
}

} // namespace deck
