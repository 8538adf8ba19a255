#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace deck {

enum class ErrorCode {
  DuplicateName,
  NotFound,
  EmptyField,
  NothingToLearn,
  PersistenceError
};

inline std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::DuplicateName: return "duplicate_name";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::EmptyField: return "empty_field";
    case ErrorCode::NothingToLearn: return "nothing_to_learn";
    case ErrorCode::PersistenceError: return "persistence_error";
  }
  return "unknown";
}

// Recoverable domain failure. The operation that throws it has not mutated
// any state.
class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

struct Card {
  std::string id;
  std::string front;
  std::string back;
};

inline bool operator==(const Card& lhs, const Card& rhs) {
  return lhs.id == rhs.id && lhs.front == rhs.front && lhs.back == rhs.back;
}

inline bool operator!=(const Card& lhs, const Card& rhs) {
  return !(lhs == rhs);
}

struct Collection {
  std::string name;
  std::vector<Card> cards;
};

inline bool operator==(const Collection& lhs, const Collection& rhs) {
  return lhs.name == rhs.name && lhs.cards == rhs.cards;
}

inline bool operator!=(const Collection& lhs, const Collection& rhs) {
  return !(lhs == rhs);
}

struct CollectionCount {
  std::string name;
  std::size_t cards = 0;
};

enum class OrderMode {
  Sequential,
  Random
};

inline std::string to_string(OrderMode mode) {
  switch (mode) {
    case OrderMode::Sequential: return "sequential";
    case OrderMode::Random: return "random";
  }
  return "sequential";
}

enum class Judgment {
  Correct,
  Wrong,
  Skipped,
  Quit
};

enum class DrillState {
  Presented,
  Revealed,
  Completed,
  TerminatedEarly
};

inline std::string to_string(DrillState state) {
  switch (state) {
    case DrillState::Presented: return "presented";
    case DrillState::Revealed: return "revealed";
    case DrillState::Completed: return "completed";
    case DrillState::TerminatedEarly: return "terminated_early";
  }
  return "presented";
}

struct DrillTally {
  std::size_t correct = 0;
  std::size_t wrong = 0;
  std::size_t skipped = 0;
  std::size_t total_cards = 0;
  std::size_t cards_seen = 0;
};

struct DrillSummary {
  DrillState state = DrillState::Completed;
  DrillTally tally;
};

} // namespace deck
