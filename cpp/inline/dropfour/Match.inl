#include "dropfour/Match.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace dropfour {

inline auto Match::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Match options");

  return desc
    .template add_option<"num-games", 'G'>(po::value<int>(&num_games)->default_value(num_games),
                                           "number of games to play")
    .template add_option<"opening-plies">(
      po::value<int>(&num_opening_plies)->default_value(num_opening_plies),
      "number of uniformly random plies to start each pair of games with");
}

}  // namespace dropfour
