#pragma once

#include "dropfour/Board.hpp"
#include "dropfour/SearchEngine.hpp"
#include "dropfour/players/AbstractPlayer.hpp"

#include <string>

namespace dropfour {

/*
 * Plays the move chosen by a SearchEngine at a fixed depth.
 *
 * The depth comes from --depth, or from --difficulty if a label is given (see Difficulty.hpp).
 */
class MinimaxPlayer : public AbstractPlayer {
 public:
  struct Params {
    int depth = 4;
    std::string difficulty;  // overrides depth if non-empty
    bool verbose = false;
    int show_tree = 0;  // print the decision tree down to this many plies after each move

    // Validates and returns the effective search depth. Throws util::CleanException.
    int resolve_depth() const;

    auto make_options_description();
  };

  MinimaxPlayer(const Params& params, const SearchEngine::Params& search_params);

  column_t get_move(const Board& board, bool undo_allowed) override;

  int depth() const { return depth_; }
  const SearchResult& last_result() const { return last_result_; }

 private:
  static SearchEngine::Params adjust(const Params&, SearchEngine::Params);

  void print_verbose(const Board& board) const;

  const Params params_;
  const int depth_;
  SearchEngine engine_;
  Board scratch_;
  SearchResult last_result_;
};

}  // namespace dropfour

#include "inline/dropfour/players/MinimaxPlayer.inl"
