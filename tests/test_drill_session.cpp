#include "deck/drill_session.hpp"

#include "test_suite.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace {

static_assert(std::is_same<decltype(deck::DrillTally::correct), std::size_t>::value &&
                  std::is_same<decltype(deck::DrillTally::wrong), std::size_t>::value &&
                  std::is_same<decltype(deck::DrillTally::skipped), std::size_t>::value,
              "Tally counters share the size type of total_cards");

deck::Collection make_collection(int count) {
  deck::Collection collection;
  collection.name = "Numbers";
  for (int i = 0; i < count; ++i) {
    const std::string n = std::to_string(i);
    collection.cards.push_back({"id" + n, "front " + n, "back " + n});
  }
  return collection;
}

template <typename Fn>
bool throws_runtime(Fn&& fn) {
  try {
    fn();
  } catch (const deck::Error&) {
    return false;
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int main() {
  using deck::DrillState;
  using deck::Judgment;
  using deck::OrderMode;
  deck::testing::TestSuite suite;

  {
    const auto collection = make_collection(3);
    auto session = deck::DrillSession::start(collection, OrderMode::Sequential);

    std::vector<std::string> visited;
    suite.require(session.state() == DrillState::Presented, "Session starts on a presented card");
    suite.require(session.position() == 1 && session.size() == 3, "Position is 1-based");

    visited.push_back(session.current().id);
    session.reveal();
    session.judge(Judgment::Correct);

    visited.push_back(session.current().id);
    suite.require(session.position() == 2, "Judging advances to the next card");
    session.reveal();
    session.judge(Judgment::Quit);

    suite.require(session.state() == DrillState::TerminatedEarly, "Quit terminates the session");
    suite.require(session.finished(), "Terminated session is finished");
    suite.require(visited == std::vector<std::string>({"id0", "id1"}),
                  "Sequential mode visits cards in stored order");
    const auto& tally = session.tally();
    suite.require(tally.cards_seen == 2, "Quit on the 2nd card gives cards_seen = 2");
    suite.require(tally.correct == 1 && tally.wrong == 0 && tally.skipped == 0,
                  "Tallies reflect only judged cards");
    suite.require(tally.total_cards == 3, "total_cards is the snapshot size");
    suite.require(throws_runtime([&] { (void)session.current(); }),
                  "No current card once terminated, so the 3rd is never visited");
  }

  {
    const auto collection = make_collection(3);
    auto session = deck::DrillSession::start(collection, OrderMode::Sequential);
    const Judgment script[] = {Judgment::Correct, Judgment::Wrong, Judgment::Skipped};
    for (Judgment judgment : script) {
      session.reveal();
      session.judge(judgment);
    }
    const auto summary = session.summary();
    suite.require(summary.state == DrillState::Completed, "All cards judged completes the session");
    suite.require(summary.tally.correct == 1 && summary.tally.wrong == 1 &&
                      summary.tally.skipped == 1,
                  "Each judgment increments its own counter");
    suite.require(summary.tally.cards_seen == 3 && summary.tally.total_cards == 3,
                  "Completed session has seen every card");
  }

  {
    const auto collection = make_collection(2);
    auto session = deck::DrillSession::start(collection, OrderMode::Sequential);
    suite.require(throws_runtime([&] { session.judge(Judgment::Correct); }),
                  "Judging before reveal is rejected");
    suite.require(session.state() == DrillState::Presented && session.tally().correct == 0,
                  "Rejected judgment leaves the session unchanged");
    session.reveal();
    suite.require(throws_runtime([&] { session.reveal(); }), "Revealing twice is rejected");
    session.judge(Judgment::Skipped);
    session.reveal();
    session.judge(Judgment::Skipped);
    suite.require(throws_runtime([&] { session.reveal(); }),
                  "Finished session accepts no more input");
  }

  {
    const auto collection = make_collection(1);
    auto session = deck::DrillSession::start(collection, OrderMode::Sequential);
    session.reveal();
    session.judge(Judgment::Quit);
    suite.require(session.state() == DrillState::TerminatedEarly,
                  "Quit on the last card is still an early termination");
    suite.require(session.tally().cards_seen == 1, "The quit card counts as seen");
  }

  {
    auto collection = make_collection(10);
    const auto stored = collection.cards;
    auto session = deck::DrillSession::start(collection, OrderMode::Random, 12345);

    std::vector<std::string> visited;
    while (!session.finished()) {
      visited.push_back(session.current().id);
      session.reveal();
      session.judge(Judgment::Correct);
    }
    suite.require(visited.size() == 10, "Random mode visits N cards");
    std::set<std::string> unique(visited.begin(), visited.end());
    suite.require(unique.size() == 10, "Random mode visits each card exactly once");
    suite.require(collection.cards == stored, "Random mode never mutates the stored order");

    std::vector<std::string> order_ids;
    for (const auto& card : session.order()) {
      order_ids.push_back(card.id);
    }
    suite.require(order_ids == visited, "Visited order matches the shuffled snapshot");

    auto again = deck::DrillSession::start(collection, OrderMode::Random, 12345);
    suite.require(again.order() == session.order(), "Same seed gives the same permutation");
  }

  {
    auto collection = make_collection(8);
    bool any_reordered = false;
    for (std::uint64_t seed = 1; seed <= 20 && !any_reordered; ++seed) {
      auto session = deck::DrillSession::start(collection, OrderMode::Random, seed);
      any_reordered = session.order() != collection.cards;
    }
    suite.require(any_reordered, "Random mode should actually permute the cards");
  }

  {
    auto collection = make_collection(3);
    auto session = deck::DrillSession::start(collection, OrderMode::Sequential);
    collection.cards[1].front = "edited";
    collection.cards.pop_back();
    session.reveal();
    session.judge(Judgment::Correct);
    suite.require(session.current().front == "front 1",
                  "Later edits to the collection do not affect the snapshot");
    suite.require(session.size() == 3, "Snapshot size is fixed at session start");
  }

  {
    const auto empty = make_collection(0);
    suite.require(deck::testing::throws_code(
                      [&] { deck::DrillSession::start(empty, OrderMode::Sequential); },
                      deck::ErrorCode::NothingToLearn),
                  "Empty collection signals NothingToLearn");
  }

  {
    suite.require(deck::parse_judgment("y") == Judgment::Correct, "y is correct");
    suite.require(deck::parse_judgment(" YES ") == Judgment::Correct, "YES is correct");
    suite.require(deck::parse_judgment("n") == Judgment::Wrong, "n is wrong");
    suite.require(deck::parse_judgment("No") == Judgment::Wrong, "No is wrong");
    suite.require(deck::parse_judgment("s") == Judgment::Skipped, "s is skipped");
    suite.require(deck::parse_judgment("skip") == Judgment::Skipped, "skip is skipped");
    suite.require(deck::parse_judgment("q") == Judgment::Quit, "q is quit");
    suite.require(deck::parse_judgment("QUIT") == Judgment::Quit, "QUIT is quit");
    suite.require(!deck::parse_judgment("maybe").has_value(), "Unknown input is rejected");
    suite.require(!deck::parse_judgment("").has_value(), "Empty input is rejected");
  }

  {
    const auto collection = make_collection(2);
    auto session = deck::DrillSession::start(collection, OrderMode::Sequential);
    auto info = session.debug_state();
    suite.require(info["state"] == "presented", "Debug state reports the state");
    suite.require(info["current_id"] == "id0", "Debug state reports the current card");
    suite.require(info["order"].size() == 2, "Debug state lists the order");
  }

  return suite.finish("Drill session");
}
