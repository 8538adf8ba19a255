#include "deck/terminal_menu.hpp"

#include "deck/debug_log.hpp"
#include "deck/text.hpp"
#include "../src/json_bridge.hpp"

#include <istream>
#include <ostream>

namespace deck {
namespace {

const std::string kRule(40, '-');

bool all_digits(const std::string& value) {
  if (value.empty()) {
    return false;
  }
  for (char ch : value) {
    if (ch < '0' || ch > '9') {
      return false;
    }
  }
  return true;
}

} // namespace

TerminalMenu::TerminalMenu(DeckController& deck, std::istream& in, std::ostream& out)
    : TerminalMenu(deck, in, out, Options()) {}

TerminalMenu::TerminalMenu(DeckController& deck, std::istream& in, std::ostream& out,
                           Options options)
    : deck_(deck), in_(in), out_(out), options_(options) {}

void TerminalMenu::run() {
  while (!closed_) {
    clear();
    out_ << "Terminal Flashcards\n";
    out_ << std::string(20, '-') << "\n";
    out_ << "Collections: " << deck_.list_names().size() << "\n";
    out_ << "  1) Create collection\n";
    out_ << "  2) Open collection\n";
    out_ << "  3) List collections\n";
    out_ << "  4) Delete collection\n";
    out_ << "  0) Exit\n";

    auto choice = prompt_int("Choose: ", 0, 4);
    if (!choice) {
      return;
    }
    clear();

    switch (*choice) {
      case 0:
        out_ << "Bye!\n";
        return;
      case 1:
        create_collection();
        pause();
        break;
      case 2:
        open_collection();
        break;
      case 3:
        list_collections();
        pause();
        break;
      case 4:
        delete_collection();
        pause();
        break;
    }
  }
}

void TerminalMenu::create_collection() {
  auto name = prompt_nonempty("New collection name: ");
  if (!name) {
    return;
  }
  try {
    deck_.create_collection(*name);
    out_ << "Created collection '" << text::trim(*name) << "'.\n";
  } catch (const Error& ex) {
    out_ << ex.what() << "\n";
  }
}

void TerminalMenu::open_collection() {
  auto name = select_from_list("Open which collection?", deck_.list_names());
  if (!name) {
    return;
  }
  collection_menu(*name);
}

void TerminalMenu::list_collections() {
  const auto counts = deck_.card_counts();
  if (counts.empty()) {
    out_ << "(No collections yet.)\n";
    return;
  }
  for (const auto& entry : counts) {
    out_ << "- " << entry.name << " (" << entry.cards << " cards)\n";
  }
}

void TerminalMenu::delete_collection() {
  auto name = select_from_list("Delete which collection?", deck_.list_names());
  if (!name) {
    return;
  }
  auto confirmed = confirm("Delete collection '" + *name + "' and ALL its cards?");
  if (!confirmed || !*confirmed) {
    return;
  }
  try {
    deck_.delete_collection(*name);
    out_ << "Deleted.\n";
  } catch (const Error& ex) {
    out_ << ex.what() << "\n";
  }
}

void TerminalMenu::collection_menu(const std::string& name) {
  while (!closed_) {
    clear();
    out_ << "Collection: " << name << "  |  Cards: " << deck_.cards(name).size() << "\n";
    out_ << "  1) Learn\n";
    out_ << "  2) Add card\n";
    out_ << "  3) Manage cards\n";
    out_ << "  0) Back\n";

    auto choice = prompt_int("Choose: ", 0, 3);
    if (!choice) {
      return;
    }
    clear();

    switch (*choice) {
      case 0:
        return;
      case 1:
        learn(name);
        pause();
        break;
      case 2:
        add_card(name);
        pause();
        break;
      case 3:
        manage_cards_menu(name);
        break;
    }
  }
}

void TerminalMenu::manage_cards_menu(const std::string& name) {
  while (!closed_) {
    clear();
    out_ << "Collection: " << name << "  |  Cards: " << deck_.cards(name).size() << "\n";
    out_ << "Manage cards\n";
    out_ << "  1) List cards\n";
    out_ << "  2) Add card\n";
    out_ << "  3) Edit card\n";
    out_ << "  4) Delete card\n";
    out_ << "  5) Search\n";
    out_ << "  0) Back\n";

    auto choice = prompt_int("Choose: ", 0, 5);
    if (!choice) {
      return;
    }
    clear();

    switch (*choice) {
      case 0:
        return;
      case 1:
        list_cards(name);
        break;
      case 2:
        add_card(name);
        break;
      case 3:
        edit_card(name);
        break;
      case 4:
        delete_card(name);
        break;
      case 5:
        search_cards(name);
        break;
    }
    pause();
  }
}

void TerminalMenu::learn(const std::string& name) {
  if (deck_.cards(name).empty()) {
    out_ << "No cards to learn yet.\n";
    return;
  }

  out_ << "Learn mode:\n";
  out_ << "  1) In order\n";
  out_ << "  2) Random\n";
  auto order = prompt_int("Choose: ", 1, 2);
  if (!order) {
    return;
  }

  try {
    DrillSession session =
        deck_.start_drill(name, *order == 2 ? OrderMode::Random : OrderMode::Sequential);

    while (!session.finished()) {
      clear();
      const Card& card = session.current();
      out_ << "[" << name << "] Card " << session.position() << "/" << session.size()
           << "  (id: " << card.id << ")\n";
      out_ << kRule << "\n";
      out_ << "FRONT:\n" << card.front << "\n";
      out_ << kRule << "\n";
      if (!read_line("Press Enter to reveal the back...")) {
        return;
      }
      session.reveal();

      out_ << "\nBACK:\n" << card.back << "\n";
      out_ << kRule << "\n";

      std::optional<Judgment> judgment;
      while (!judgment) {
        auto answer = read_line("Got it? (y/n/skip/q): ");
        if (!answer) {
          return;
        }
        judgment = parse_judgment(*answer);
        if (!judgment) {
          out_ << "Please enter y, n, skip, or q.\n";
        }
      }
      session.judge(*judgment);
    }

    clear();
    const DrillTally& tally = session.tally();
    if (session.state() == DrillState::TerminatedEarly) {
      out_ << "Session ended early.\n";
      out_ << "Correct: " << tally.correct << ", Wrong: " << tally.wrong
           << ", Skipped: " << tally.skipped << "\n";
    } else {
      out_ << "Done!\n";
      out_ << "Correct: " << tally.correct << "\n";
      out_ << "Wrong:   " << tally.wrong << "\n";
      out_ << "Skipped: " << tally.skipped << "\n";
    }
    debug_log("menu", "drill summary " + bridge::to_json(session.summary()).dump());
  } catch (const Error& ex) {
    out_ << ex.what() << "\n";
  }
}

void TerminalMenu::list_cards(const std::string& name) {
  print_cards(deck_.cards(name));
}

void TerminalMenu::print_cards(const std::vector<Card>& cards) {
  if (cards.empty()) {
    out_ << "(No cards yet.)\n";
    return;
  }
  out_ << "Cards (" << cards.size() << "):\n";
  for (const auto& card : cards) {
    out_ << "- " << card.id << ": " << card.front << "  ->  " << card.back << "\n";
  }
}

void TerminalMenu::add_card(const std::string& name) {
  auto front = prompt_nonempty("Front: ");
  if (!front) {
    return;
  }
  auto back = prompt_nonempty("Back: ");
  if (!back) {
    return;
  }
  try {
    Card card = deck_.add_card(name, *front, *back);
    out_ << "Added card " << card.id << ".\n";
  } catch (const Error& ex) {
    out_ << ex.what() << "\n";
  }
}

void TerminalMenu::edit_card(const std::string& name) {
  const std::vector<Card> cards = deck_.cards(name);
  if (cards.empty()) {
    out_ << "No cards to edit.\n";
    return;
  }
  print_cards(cards);

  auto id = prompt_nonempty("Enter card id to edit: ");
  if (!id) {
    return;
  }
  Card card;
  try {
    card = deck_.find_card(name, text::trim(*id));
  } catch (const Error&) {
    out_ << "Card id not found.\n";
    return;
  }

  out_ << "Press Enter to keep the current value.\n";
  auto new_front = read_line("Front [" + card.front + "]: ");
  if (!new_front) {
    return;
  }
  auto new_back = read_line("Back  [" + card.back + "]: ");
  if (!new_back) {
    return;
  }

  try {
    deck_.edit_card(name, card.id, new_front, new_back);
    out_ << "Updated.\n";
  } catch (const Error& ex) {
    out_ << ex.what() << "\n";
  }
}

void TerminalMenu::delete_card(const std::string& name) {
  const std::vector<Card> cards = deck_.cards(name);
  if (cards.empty()) {
    out_ << "No cards to delete.\n";
    return;
  }
  print_cards(cards);

  auto id = prompt_nonempty("Enter card id to delete: ");
  if (!id) {
    return;
  }
  const std::string card_id = text::trim(*id);
  try {
    deck_.find_card(name, card_id);
  } catch (const Error&) {
    out_ << "Card id not found.\n";
    return;
  }

  auto confirmed = confirm("Delete card " + card_id + "?");
  if (!confirmed || !*confirmed) {
    return;
  }
  try {
    deck_.delete_card(name, card_id);
    out_ << "Deleted.\n";
  } catch (const Error& ex) {
    out_ << ex.what() << "\n";
  }
}

void TerminalMenu::search_cards(const std::string& name) {
  if (deck_.cards(name).empty()) {
    out_ << "No cards to search.\n";
    return;
  }
  auto query = prompt_nonempty("Search text: ");
  if (!query) {
    return;
  }
  const auto hits = deck_.search(name, text::trim(*query));
  if (hits.empty()) {
    out_ << "No matches.\n";
    return;
  }
  out_ << "Matches (" << hits.size() << "):\n";
  for (const auto& card : hits) {
    out_ << "- " << card.id << ": " << card.front << "  ->  " << card.back << "\n";
  }
}

std::optional<std::string> TerminalMenu::read_line(const std::string& prompt) {
  if (closed_) {
    return std::nullopt;
  }
  out_ << prompt << std::flush;
  std::string line;
  if (!std::getline(in_, line)) {
    closed_ = true;
    out_ << "\n";
    return std::nullopt;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

std::optional<int> TerminalMenu::prompt_int(const std::string& prompt, int lo, int hi) {
  while (true) {
    auto line = read_line(prompt);
    if (!line) {
      return std::nullopt;
    }
    const std::string value = text::trim(*line);
    if (all_digits(value) && value.size() <= 9) {
      const int parsed = std::stoi(value);
      if (parsed >= lo && parsed <= hi) {
        return parsed;
      }
    }
    out_ << "Please enter a number from " << lo << " to " << hi << ".\n";
  }
}

std::optional<std::string> TerminalMenu::prompt_nonempty(const std::string& prompt) {
  while (true) {
    auto line = read_line(prompt);
    if (!line) {
      return std::nullopt;
    }
    std::string value = text::trim(*line);
    if (!value.empty()) {
      return value;
    }
    out_ << "Input cannot be empty.\n";
  }
}

std::optional<bool> TerminalMenu::confirm(const std::string& prompt) {
  while (true) {
    auto line = read_line(prompt + " (y/n): ");
    if (!line) {
      return std::nullopt;
    }
    const std::string answer = text::to_lower(text::trim(*line));
    if (answer == "y" || answer == "yes") {
      return true;
    }
    if (answer == "n" || answer == "no") {
      return false;
    }
    out_ << "Please type y or n.\n";
  }
}

std::optional<std::string> TerminalMenu::select_from_list(const std::string& title,
                                                          const std::vector<std::string>& items) {
  if (items.empty()) {
    out_ << "Nothing to select.\n";
    return std::nullopt;
  }
  out_ << title << "\n";
  for (std::size_t i = 0; i < items.size(); ++i) {
    out_ << "  " << i + 1 << ") " << items[i] << "\n";
  }
  out_ << "  0) Cancel\n";

  auto choice = prompt_int("Choose: ", 0, static_cast<int>(items.size()));
  if (!choice || *choice == 0) {
    return std::nullopt;
  }
  return items[static_cast<std::size_t>(*choice - 1)];
}

void TerminalMenu::clear() {
  if (options_.clear_screen) {
    out_ << "\033[2J\033[H" << std::flush;
  }
}

void TerminalMenu::pause() {
  if (options_.clear_screen) {
    read_line("Press Enter to continue...");
  }
}

} // namespace deck
