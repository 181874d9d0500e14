#include "dropfour/SearchEngine.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

#include <string>

namespace dropfour {

inline auto SearchEngine::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("SearchEngine options");

  return desc
    .template add_option<"max-nodes">(
      po::value<int64_t>(&max_nodes)->default_value(max_nodes),
      "node budget per search. Enables iterative deepening (0 = unlimited)")
    .template add_option<"max-seconds">(
      po2::default_value("{:.2f}", &max_seconds),
      "time budget per search, in seconds. Enables iterative deepening (0 = unlimited)")
    .template add_option<"move-ordering">(
      po::value<std::string>()
        ->default_value(move_ordering_to_str(move_ordering))
        ->notifier([this](const std::string& s) { move_ordering = parse_move_ordering(s); }),
      "move ordering: center (3,2,4,1,5,0,6) or eval (by static evaluation)")
    .template add_hidden_flag<"alpha-beta", "no-alpha-beta">(
      &alpha_beta, "enable alpha-beta pruning", "disable alpha-beta pruning")
    .template add_hidden_option<"win-ply-penalty">(
      po::value<score_t>(&win_ply_penalty)->default_value(win_ply_penalty),
      "points deducted from a win score per ply from the root");
}

}  // namespace dropfour
