#include "dropfour/SearchEngine.hpp"

#include "dropfour/Evaluator.hpp"
#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>
#include <utility>

namespace dropfour {

SearchEngine::SearchEngine() : SearchEngine(Params()) {}

SearchEngine::SearchEngine(const Params& params) : params_(params) {
  CLEAN_ASSERT(params_.max_nodes >= 0, "max-nodes must be non-negative (got {})",
               params_.max_nodes);
  CLEAN_ASSERT(params_.max_seconds >= 0, "max-seconds must be non-negative (got {})",
               params_.max_seconds);
  CLEAN_ASSERT(params_.win_ply_penalty >= 0, "win-ply-penalty must be non-negative (got {})",
               params_.win_ply_penalty);
}

SearchEngine::MoveOrdering SearchEngine::parse_move_ordering(const std::string& str) {
  if (str == "center") return kCenterFirst;
  if (str == "eval") return kStaticEval;
  throw util::CleanException("Invalid move ordering \"{}\" (expected center or eval)", str);
}

const char* SearchEngine::move_ordering_to_str(MoveOrdering ordering) {
  return ordering == kStaticEval ? "eval" : "center";
}

SearchResult SearchEngine::search(Board& board, int depth) {
  SearchResult result;
  const auto start_time = steady_clock_t::now();
  nodes_ = 0;
  aborted_ = false;
  budget_active_ = false;

  score_t terminal;
  if (Evaluator::terminal_score(board, board.current_player(), 0, params_.win_ply_penalty,
                                terminal)) {
    result.score = terminal;
    result.nodes = 1;
    return result;
  }

  CLEAN_ASSERT(depth >= 1, "Search depth must be at least 1 (got {})", depth);

  const bool budgeted = params_.has_budget();
  if (params_.max_seconds > 0) {
    auto budget = std::chrono::duration<double>(params_.max_seconds);
    deadline_ =
      steady_clock_t::now() + std::chrono::duration_cast<steady_clock_t::duration>(budget);
  }

  column_t first_move = kNoMove;
  for (int d = budgeted ? 1 : depth; d <= depth; ++d) {
    budget_active_ = budgeted && d > 1;

    SearchTree tree;
    tree_ = params_.record_tree ? &tree : nullptr;

    column_t move;
    score_t score;
    bool completed = search_root(board, d, first_move, move, score);
    tree_ = nullptr;

    if (!completed) {
      result.budget_exceeded = true;
      LOG_INFO("Search budget exhausted at depth {} after {} nodes; using depth {} result", d,
               nodes_, result.depth);
      break;
    }

    result.column = move;
    result.score = score;
    result.depth = d;
    if (params_.record_tree) result.tree = std::move(tree);
    first_move = move;

    LOG_DEBUG("search depth={} move={} score={} nodes={}", d, Board::IO::move_to_str(move), score,
              nodes_);
  }

  result.nodes = nodes_;
  result.seconds = std::chrono::duration<double>(steady_clock_t::now() - start_time).count();
  return result;
}

bool SearchEngine::search_root(Board& board, int depth, column_t first_move, column_t& best_move,
                               score_t& best_score) {
  ++nodes_;

  score_t alpha = -kInfinity;
  const score_t beta = kInfinity;
  best_move = kNoMove;
  best_score = -kInfinity;

  for (column_t move : order_moves(board, first_move)) {
    node_ix_t child_ix = tree_ ? tree_->add_child(0, move) : kNullNodeIx;

    score_t score;
    {
      MoveGuard guard(board, move);
      score = -negamax(board, depth - 1, 1, -beta, -alpha, child_ix);
    }
    if (aborted_) return false;

    if (score > best_score) {
      best_score = score;
      best_move = move;
      if (tree_) tree_->set_best_child(0, child_ix);
    }
    if (params_.alpha_beta) alpha = std::max(alpha, score);
  }

  if (tree_) tree_->set_score(0, best_score, true);
  return true;
}

score_t SearchEngine::negamax(Board& board, int depth, int ply, score_t alpha, score_t beta,
                              node_ix_t node_ix) {
  ++nodes_;
  if (budget_active_ && out_of_budget()) {
    aborted_ = true;
    return 0;
  }

  const seat_index_t me = board.current_player();
  score_t score;
  if (Evaluator::terminal_score(board, me, ply, params_.win_ply_penalty, score)) {
    if (tree_) tree_->set_score(node_ix, score, true);
    return score;
  }
  if (depth <= 0) {
    score = Evaluator::heuristic(board, me);
    if (tree_) tree_->set_score(node_ix, score, true);
    return score;
  }

  const score_t alpha_orig = alpha;
  score_t best_score = -kInfinity;

  for (column_t move : order_moves(board, kNoMove)) {
    node_ix_t child_ix = tree_ ? tree_->add_child(node_ix, move) : kNullNodeIx;
    {
      MoveGuard guard(board, move);
      score = -negamax(board, depth - 1, ply + 1, -beta, -alpha, child_ix);
    }
    if (aborted_) return 0;

    if (score > best_score) {
      best_score = score;
      if (tree_) tree_->set_best_child(node_ix, child_ix);
    }
    if (params_.alpha_beta) {
      alpha = std::max(alpha, score);
      if (alpha >= beta) break;
    }
  }

  if (tree_) {
    bool exact = !params_.alpha_beta || (best_score > alpha_orig && best_score < beta);
    tree_->set_score(node_ix, best_score, exact);
  }
  return best_score;
}

Board::MoveList SearchEngine::order_moves(Board& board, column_t first_move) const {
  Board::MoveList moves;
  for (column_t col : kCenterFirstOrder) {
    if (board.is_legal(col)) moves.push_back(col);
  }

  if (params_.move_ordering == kStaticEval) {
    const seat_index_t me = board.current_player();
    std::array<std::pair<score_t, column_t>, kNumColumns> keyed;
    int n = moves.size();
    for (int i = 0; i < n; ++i) {
      MoveGuard guard(board, moves[i]);
      keyed[i] = {Evaluator::evaluate(board, me, 1, params_.win_ply_penalty), moves[i]};
    }
    std::stable_sort(keyed.begin(), keyed.begin() + n,
                     [](const auto& a, const auto& b) { return a.first > b.first; });
    for (int i = 0; i < n; ++i) {
      moves[i] = keyed[i].second;
    }
  }

  if (first_move != kNoMove) {
    column_t* pos = std::find(moves.begin(), moves.end(), first_move);
    DEBUG_ASSERT(pos != moves.end(), "first_move {} is not legal", first_move);
    if (pos != moves.end()) std::rotate(moves.begin(), pos, pos + 1);
  }
  return moves;
}

bool SearchEngine::out_of_budget() const {
  if (params_.max_nodes > 0 && nodes_ > params_.max_nodes) return true;
  if (params_.max_seconds > 0 && (nodes_ & 1023) == 0) {
    return steady_clock_t::now() >= deadline_;
  }
  return false;
}

}  // namespace dropfour
