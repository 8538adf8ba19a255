#pragma once

#include "deck_controller.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace deck {

// Line-oriented menu over arbitrary streams. run() returns when the user
// picks Exit or the input stream ends.
class TerminalMenu {
public:
  struct Options {
    // Clears the screen between menus and pauses after each action.
    bool clear_screen = true;
  };

  TerminalMenu(DeckController& deck, std::istream& in, std::ostream& out);
  TerminalMenu(DeckController& deck, std::istream& in, std::ostream& out, Options options);

  void run();

private:
  void create_collection();
  void open_collection();
  void list_collections();
  void delete_collection();

  void collection_menu(const std::string& name);
  void manage_cards_menu(const std::string& name);
  void learn(const std::string& name);

  void list_cards(const std::string& name);
  void add_card(const std::string& name);
  void edit_card(const std::string& name);
  void delete_card(const std::string& name);
  void search_cards(const std::string& name);
  void print_cards(const std::vector<Card>& cards);

  std::optional<std::string> read_line(const std::string& prompt);
  std::optional<int> prompt_int(const std::string& prompt, int lo, int hi);
  std::optional<std::string> prompt_nonempty(const std::string& prompt);
  std::optional<bool> confirm(const std::string& prompt);
  std::optional<std::string> select_from_list(const std::string& title,
                                              const std::vector<std::string>& items);
  void clear();
  void pause();

  DeckController& deck_;
  std::istream& in_;
  std::ostream& out_;
  Options options_;
  bool closed_ = false;
};

} // namespace deck
