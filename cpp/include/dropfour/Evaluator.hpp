#pragma once

#include "dropfour/Board.hpp"
#include "dropfour/Constants.hpp"

#include <array>

namespace dropfour {

namespace detail {

constexpr int kNumWindows = (kNumColumns - 3) * kNumRows         // horizontal
                            + kNumColumns * (kNumRows - 3)       // vertical
                            + 2 * (kNumColumns - 3) * (kNumRows - 3);  // both diagonals

using window_array_t = std::array<mask_t, kNumWindows>;

// Every run of 4 cells along the 4 line directions, as a mask.
constexpr window_array_t make_windows() {
  window_array_t windows{};
  int n = 0;

  constexpr int kDeltas[4][2] = {{0, 1}, {1, 0}, {1, 1}, {1, -1}};  // (row, col) steps
  for (const auto& delta : kDeltas) {
    for (int row = 0; row < kNumRows; ++row) {
      for (int col = 0; col < kNumColumns; ++col) {
        int end_row = row + 3 * delta[0];
        int end_col = col + 3 * delta[1];
        if (end_row >= kNumRows || end_col < 0 || end_col >= kNumColumns) continue;

        mask_t mask = 0;
        for (int i = 0; i < 4; ++i) {
          mask |= Board::cell_mask(row + i * delta[0], col + i * delta[1]);
        }
        windows[n++] = mask;
      }
    }
  }
  return windows;
}

}  // namespace detail

/*
 * Static evaluation of a position.
 *
 * All scores are from the point of view of a reference player P, against opponent O. The heuristic
 * is antisymmetric: heuristic(board, P) == -heuristic(board, O). SearchEngine relies on this to
 * use the negamax formulation.
 *
 * heuristic() = sum over all windows w of [window_score(w, P) - window_score(w, O)]
 *               + positional_score(P) - positional_score(O)
 *
 * See window_score() for the per-window table. positional_score() adds, for each piece, a cell
 * weight (favoring the center and the middle rows) plus a column weight (favoring the center
 * column).
 */
struct Evaluator {
  static constexpr int kNumWindows = detail::kNumWindows;
  static constexpr detail::window_array_t kWindows = detail::make_windows();

  static constexpr score_t kWinScore = 100000;

  static constexpr score_t kFourScore = 100000;
  static constexpr score_t kThreeScore = 1000;  // 3 pieces + 1 empty
  static constexpr score_t kTwoScore = 100;     // 2 pieces + 2 empty
  static constexpr score_t kOneScore = 10;      // 1 piece + 3 empty
  static constexpr score_t kOpponentThreeScore = -800;
  static constexpr score_t kOpponentTwoScore = -50;

  static constexpr std::array<score_t, kNumColumns> kColumnWeights = {
    40, 70, 120, 200, 120, 70, 40};

  // Row 0 is the bottom row.
  static constexpr std::array<std::array<score_t, kNumColumns>, kNumRows> kCellWeights = {{
    {3, 4, 5, 7, 5, 4, 3},
    {4, 6, 8, 10, 8, 6, 4},
    {5, 8, 11, 13, 11, 8, 5},
    {5, 8, 11, 13, 11, 8, 5},
    {4, 6, 8, 10, 8, 6, 4},
    {3, 4, 5, 7, 5, 4, 3},
  }};

  /*
   * Score of one window for the player owning `mine` of its cells, where `theirs` cells belong to
   * the other player:
   *
   * mine == 4                 -> kFourScore
   * mine == 3, 1 empty        -> kThreeScore
   * mine == 2, 2 empty        -> kTwoScore
   * mine == 1, 3 empty        -> kOneScore
   * theirs == 3, 1 empty      -> kOpponentThreeScore
   * theirs == 2, 2 empty      -> kOpponentTwoScore
   * otherwise                 -> 0
   */
  static constexpr score_t window_score(int mine, int theirs);

  static score_t positional_score(mask_t pieces);

  // Ignores whether the board is terminal.
  static score_t heuristic(const Board& board, seat_index_t perspective);

  /*
   * If the board is terminal, sets score and returns true. A win for perspective scores
   * kWinScore - ply * ply_penalty, a loss the negation of that, a draw 0. ply is the distance from
   * the search root, so faster wins and slower losses are preferred.
   */
  static bool terminal_score(const Board& board, seat_index_t perspective, int ply,
                             score_t ply_penalty, score_t& score);

  // terminal_score() if the board is terminal, heuristic() otherwise.
  static score_t evaluate(const Board& board, seat_index_t perspective, int ply = 0,
                          score_t ply_penalty = 1);
};

}  // namespace dropfour

#include "inline/dropfour/Evaluator.inl"
