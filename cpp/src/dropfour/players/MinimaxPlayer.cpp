#include "dropfour/players/MinimaxPlayer.hpp"

#include "dropfour/Difficulty.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

#include <spdlog/fmt/fmt.h>

#include <iostream>

namespace dropfour {

int MinimaxPlayer::Params::resolve_depth() const {
  int d = difficulty.empty() ? depth : to_depth(parse_difficulty(difficulty));
  CLEAN_ASSERT(d >= 1, "depth must be at least 1 (got {})", d);
  return d;
}

MinimaxPlayer::MinimaxPlayer(const Params& params, const SearchEngine::Params& search_params)
    : params_(params),
      depth_(params.resolve_depth()),
      engine_(adjust(params, search_params)) {}

SearchEngine::Params MinimaxPlayer::adjust(const Params& params,
                                           SearchEngine::Params search_params) {
  if (params.show_tree > 0) search_params.record_tree = true;
  return search_params;
}

column_t MinimaxPlayer::get_move(const Board& board, bool) {
  scratch_ = board;
  last_result_ = engine_.search(scratch_, depth_);
  RELEASE_ASSERT(scratch_ == board, "search did not restore the board");
  RELEASE_ASSERT(board.is_legal(last_result_.column), "search returned illegal move {}",
                 last_result_.column);

  LOG_DEBUG("{} plays {} (score={} depth={} nodes={} time={:.3f}s)", get_name(),
            Board::IO::move_to_str(last_result_.column), last_result_.score, last_result_.depth,
            last_result_.nodes, last_result_.seconds);

  if (params_.verbose || params_.show_tree > 0) {
    print_verbose(board);
  }
  return last_result_.column;
}

void MinimaxPlayer::print_verbose(const Board& board) const {
  const SearchResult& r = last_result_;
  std::cout << fmt::format("{} ({}) plays column {}: score={} depth={} nodes={} time={:.3f}s{}",
                           get_name(), Board::IO::player_to_str(board.current_player()),
                           Board::IO::move_to_str(r.column), r.score, r.depth, r.nodes, r.seconds,
                           r.budget_exceeded ? " (budget exceeded)" : "")
            << std::endl;

  if (params_.show_tree > 0 && r.tree) {
    r.tree->print(std::cout, params_.show_tree);
  }
}

}  // namespace dropfour
