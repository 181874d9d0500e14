#pragma once

#include "dropfour/Board.hpp"
#include "dropfour/Constants.hpp"
#include "dropfour/SearchTree.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace dropfour {

struct SearchResult {
  column_t column = kNoMove;  // kNoMove iff the board was already terminal
  score_t score = 0;          // from the point of view of the player to move at the root
  int depth = 0;              // depth of the deepest fully completed search
  int64_t nodes = 0;
  double seconds = 0;  // wall-clock time spent in search()
  bool budget_exceeded = false;
  std::optional<SearchTree> tree;  // set iff Params::record_tree
};

/*
 * Depth-bounded minimax search with alpha-beta pruning, in negamax form.
 *
 * search(board, depth) returns the best move for board.current_player(). Leaves (depth 0 or a
 * terminal position) are scored by Evaluator from the point of view of the player to move there;
 * every interior node returns the max over its children of the negated child score.
 *
 * Ties are broken by move order: a move replaces the current best only with a strictly greater
 * score, so the first move in the ordered sequence reaching the best score is chosen. Pruning never
 * changes the returned (column, score) pair, only the number of nodes visited.
 *
 * The board is mutated during the search with strictly paired apply_move()/undo() calls, and is
 * identical to the input when search() returns or throws.
 *
 * Without a budget, a single search to the requested depth is performed. With a node or time
 * budget, the engine deepens iteratively from depth 1, searching the previous iteration's best move
 * first, and returns the result of the deepest iteration that completed before the budget ran out.
 * The depth-1 iteration is never interrupted, so a legal move is always returned.
 *
 * Not thread-safe; use one SearchEngine per thread.
 */
class SearchEngine {
 public:
  enum MoveOrdering : int8_t {
    kCenterFirst,  // 3, 2, 4, 1, 5, 0, 6
    kStaticEval    // children sorted by static evaluation, best first; ties in center-first order
  };

  struct Params {
    MoveOrdering move_ordering = kCenterFirst;
    bool alpha_beta = true;   // false gives plain minimax, for verification
    bool record_tree = false;  // fill SearchResult::tree
    score_t win_ply_penalty = 1;

    int64_t max_nodes = 0;   // 0 = unlimited
    double max_seconds = 0;  // 0 = unlimited

    bool has_budget() const { return max_nodes > 0 || max_seconds > 0; }

    auto make_options_description();
  };

  static constexpr std::array<column_t, kNumColumns> kCenterFirstOrder = {3, 2, 4, 1, 5, 0, 6};
  static constexpr score_t kInfinity = 1000000000;

  SearchEngine();
  explicit SearchEngine(const Params& params);

  /*
   * On a terminal board, returns immediately with column == kNoMove and the terminal score.
   * Otherwise depth must be at least 1.
   */
  SearchResult search(Board& board, int depth);

  const Params& params() const { return params_; }

  static MoveOrdering parse_move_ordering(const std::string& str);
  static const char* move_ordering_to_str(MoveOrdering ordering);

 private:
  // Applies a move on construction and takes it back on destruction.
  class MoveGuard {
   public:
    MoveGuard(Board& board, column_t move) : board_(board) { board_.apply_move(move); }
    ~MoveGuard() { board_.undo(); }

    MoveGuard(const MoveGuard&) = delete;
    MoveGuard& operator=(const MoveGuard&) = delete;

   private:
    Board& board_;
  };

  // Returns false if the budget ran out before the root finished.
  bool search_root(Board& board, int depth, column_t first_move, column_t& best_move,
                   score_t& best_score);

  score_t negamax(Board& board, int depth, int ply, score_t alpha, score_t beta,
                  node_ix_t node_ix);

  // Legal moves in search order. first_move, if not kNoMove, is placed first.
  Board::MoveList order_moves(Board& board, column_t first_move) const;

  bool out_of_budget() const;

  using steady_clock_t = std::chrono::steady_clock;

  const Params params_;

  // per-search() state
  int64_t nodes_ = 0;
  bool budget_active_ = false;
  bool aborted_ = false;
  steady_clock_t::time_point deadline_;
  SearchTree* tree_ = nullptr;
};

}  // namespace dropfour

#include "inline/dropfour/SearchEngine.inl"
