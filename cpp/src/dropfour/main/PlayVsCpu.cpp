#include "dropfour/Difficulty.hpp"
#include "dropfour/GameRunner.hpp"
#include "dropfour/SearchEngine.hpp"
#include "dropfour/players/HumanTuiPlayer.hpp"
#include "dropfour/players/MinimaxPlayer.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options.hpp>

#include <spdlog/fmt/fmt.h>

#include <iostream>
#include <memory>
#include <string>

#ifdef MIT_TEST_MODE
static_assert(false, "MIT_TEST_MODE macro must not be defined for game-exe's");
#endif

namespace {

const size_t kMaxNameLength = 32;

struct Args {
  std::string color = "red";
  std::string name = "Human";
  std::string opponent = "cpu";
  std::string opponent_name = "Guest";
  bool play_again_prompt = true;

  // Throws util::CleanException.
  bool human_opponent() const {
    if (boost::algorithm::iequals(opponent, "cpu")) return false;
    if (boost::algorithm::iequals(opponent, "human")) return true;
    throw util::CleanException("Invalid opponent \"{}\" (expected cpu or human)", opponent);
  }

  void validate_names() const {
    for (const std::string& s : {name, opponent_name}) {
      CLEAN_ASSERT(!s.empty() && s.size() <= kMaxNameLength,
                   "Player names must be 1 to {} characters (got \"{}\")", kMaxNameLength, s);
    }
  }

  // Seat of the human player. Throws util::CleanException.
  dropfour::seat_index_t human_seat() const {
    if (boost::algorithm::iequals(color, "red")) return dropfour::kRed;
    if (boost::algorithm::iequals(color, "yellow")) return dropfour::kYellow;
    throw util::CleanException("Invalid color \"{}\" (expected red or yellow)", color);
  }

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Program options");

    return desc
      .template add_option<"color", 'c'>(po::value<std::string>(&color)->default_value(color),
                                         "your color: red (moves first) or yellow")
      .template add_option<"name">(po::value<std::string>(&name)->default_value(name),
                                   "your name")
      .template add_option<"opponent">(
        po::value<std::string>(&opponent)->default_value(opponent),
        "cpu, or human for two players sharing this terminal")
      .template add_option<"opponent-name">(
        po::value<std::string>(&opponent_name)->default_value(opponent_name),
        "name of the second player when --opponent=human")
      .template add_flag<"play-again-prompt", "no-play-again-prompt">(
        &play_again_prompt, "offer a rematch after each game", "play a single game");
  }
};

bool prompt_play_again() {
  std::cout << "Play again? [y/N]: ";
  std::cout.flush();
  std::string input;
  if (!std::getline(std::cin, input)) return false;
  return input == "y" || input == "Y";
}

}  // namespace

int main(int ac, char* av[]) {
  using namespace dropfour;

  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    MinimaxPlayer::Params cpu_params;
    SearchEngine::Params search_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(cpu_params.make_options_description())
                  .add(search_params.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);

    args.validate_names();
    seat_index_t human_seat = args.human_seat();
    HumanTuiPlayer human;
    human.set_name(args.name);

    std::unique_ptr<AbstractPlayer> opponent;
    if (args.human_opponent()) {
      auto guest = std::make_unique<HumanTuiPlayer>();
      guest->set_name(args.opponent_name);
      guest->set_hot_seat(true);
      human.set_hot_seat(true);
      opponent = std::move(guest);
    } else {
      auto cpu = std::make_unique<MinimaxPlayer>(cpu_params, search_params);
      cpu->set_name(cpu_params.difficulty.empty()
                      ? fmt::format("CPU-d{}", cpu->depth())
                      : fmt::format("CPU-{}", to_str(parse_difficulty(cpu_params.difficulty))));
      opponent = std::move(cpu);
    }

    GameRunner::player_array_t players;
    players[human_seat] = &human;
    players[1 - human_seat] = opponent.get();
    GameRunner runner(players);

    do {
      runner.run();
    } while (args.play_again_prompt && prompt_play_again());
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
