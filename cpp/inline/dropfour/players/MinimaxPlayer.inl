#include "dropfour/players/MinimaxPlayer.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace dropfour {

inline auto MinimaxPlayer::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("MinimaxPlayer options");

  return desc
    .template add_option<"depth", 'd'>(po::value<int>(&depth)->default_value(depth),
                                       "search depth in plies")
    .template add_option<"difficulty">(
      po::value<std::string>(&difficulty),
      "Easy (2), Medium (4), Hard (6), Expert (8) or Insane (10). Overrides --depth")
    .template add_flag<"verbose", "no-verbose">(&verbose, "print search stats after each move",
                                                "don't print search stats")
    .template add_option<"show-tree">(po::value<int>(&show_tree)->default_value(show_tree),
                                      "print the decision tree to this many plies (0 = off)");
}

}  // namespace dropfour
