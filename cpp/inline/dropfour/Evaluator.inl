#include "dropfour/Evaluator.hpp"

#include <bit>

namespace dropfour {

inline constexpr score_t Evaluator::window_score(int mine, int theirs) {
  int empty = 4 - mine - theirs;

  if (mine == 4) return kFourScore;
  if (mine == 3 && empty == 1) return kThreeScore;
  if (mine == 2 && empty == 2) return kTwoScore;
  if (mine == 1 && empty == 3) return kOneScore;

  if (theirs == 3 && empty == 1) return kOpponentThreeScore;
  if (theirs == 2 && empty == 2) return kOpponentTwoScore;
  return 0;
}

inline score_t Evaluator::positional_score(mask_t pieces) {
  score_t score = 0;
  while (pieces) {
    int index = std::countr_zero(pieces);
    pieces &= pieces - 1;

    int col = index / kColumnStride;
    int row = index % kColumnStride;
    score += kCellWeights[row][col] + kColumnWeights[col];
  }
  return score;
}

inline score_t Evaluator::heuristic(const Board& board, seat_index_t perspective) {
  mask_t mine = board.mask(perspective);
  mask_t theirs = board.mask(1 - perspective);

  score_t score = 0;
  for (mask_t window : kWindows) {
    int m = std::popcount(window & mine);
    int t = std::popcount(window & theirs);
    score += window_score(m, t) - window_score(t, m);
  }

  score += positional_score(mine) - positional_score(theirs);
  return score;
}

inline bool Evaluator::terminal_score(const Board& board, seat_index_t perspective, int ply,
                                      score_t ply_penalty, score_t& score) {
  seat_index_t winner = board.winner();
  if (winner != kNoPlayer) {
    score_t win_score = kWinScore - ply * ply_penalty;
    score = winner == perspective ? win_score : -win_score;
    return true;
  }
  if (board.num_moves() == kNumCells) {
    score = 0;
    return true;
  }
  return false;
}

inline score_t Evaluator::evaluate(const Board& board, seat_index_t perspective, int ply,
                                   score_t ply_penalty) {
  score_t score;
  if (terminal_score(board, perspective, ply, ply_penalty, score)) return score;
  return heuristic(board, perspective);
}

}  // namespace dropfour
