#include "deck/config.hpp"
#include "deck/deck_controller.hpp"
#include "deck/debug_log.hpp"
#include "deck/store.hpp"
#include "deck/terminal_menu.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
  const std::string program = argc > 0 ? argv[0] : "deck";

  deck::Config config;
  try {
    config = deck::load_config(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n" << deck::usage(program);
    return 1;
  }
  if (config.show_help) {
    std::cout << deck::usage(program);
    return 0;
  }
  deck::set_debug_enabled(config.debug);
  deck::debug_log("main", "using data file " + config.data_file.string());

  try {
    deck::DeckController controller(deck::make_json_store(config.data_file));
    deck::TerminalMenu::Options options;
    options.clear_screen = config.clear_screen;
    deck::TerminalMenu menu(controller, std::cin, std::cout, options);
    menu.run();
  } catch (const std::exception& ex) {
    std::cerr << "deck: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
