#include "dropfour/Match.hpp"
#include "dropfour/SearchEngine.hpp"
#include "dropfour/players/MinimaxPlayer.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <spdlog/fmt/fmt.h>

#include <iostream>
#include <string>

#ifdef MIT_TEST_MODE
static_assert(false, "MIT_TEST_MODE macro must not be defined for game-exe's");
#endif

namespace {

struct Args {
  int depth1 = 2;
  int depth2 = 4;

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Program options");

    return desc
      .template add_option<"depth1">(po::value<int>(&depth1)->default_value(depth1),
                                     "search depth of the first engine")
      .template add_option<"depth2">(po::value<int>(&depth2)->default_value(depth2),
                                     "search depth of the second engine");
  }
};

}  // namespace

int main(int ac, char* av[]) {
  using namespace dropfour;

  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    Match::Params match_params;
    SearchEngine::Params search_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(match_params.make_options_description())
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

    MinimaxPlayer::Params params1;
    params1.depth = args.depth1;
    MinimaxPlayer::Params params2;
    params2.depth = args.depth2;

    MinimaxPlayer cpu1(params1, search_params);
    MinimaxPlayer cpu2(params2, search_params);
    cpu1.set_name(fmt::format("CPU-A(d{})", cpu1.depth()));
    cpu2.set_name(fmt::format("CPU-B(d{})", cpu2.depth()));

    Match match(match_params, &cpu1, &cpu2);
    Match::record_array_t records = match.run();
    Match::print_summary(std::cout, records, {cpu1.get_name(), cpu2.get_name()});
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
