#include "dropfour/Board.hpp"

#include "dropfour/Exceptions.hpp"

#include <bit>

namespace dropfour {

inline bool Board::MoveList::contains(column_t col) const {
  for (column_t c : *this) {
    if (c == col) return true;
  }
  return false;
}

inline Board::Board() : masks_{}, heights_{}, num_moves_(0) { history_.fill(kNoMove); }

inline Board::MoveList Board::legal_moves() const {
  MoveList moves;
  for (column_t col = 0; col < kNumColumns; ++col) {
    if (heights_[col] < kNumRows) moves.push_back(col);
  }
  return moves;
}

inline bool Board::is_legal(column_t col) const {
  return col >= 0 && col < kNumColumns && heights_[col] < kNumRows;
}

inline void Board::apply_move(column_t col) {
  if (col < 0 || col >= kNumColumns) {
    throw InvalidMoveError("Invalid column {} (must be in [0, {}))", col, kNumColumns);
  }
  if (heights_[col] >= kNumRows) {
    throw InvalidMoveError("Column {} is full", col);
  }

  masks_[current_player()] |= cell_mask(heights_[col], col);
  ++heights_[col];
  history_[num_moves_++] = col;
}

inline void Board::undo() {
  if (num_moves_ == 0) {
    throw EmptyHistoryError("Cannot undo: no moves have been played");
  }

  column_t col = history_[--num_moves_];
  history_[num_moves_] = kNoMove;
  --heights_[col];
  masks_[current_player()] &= ~cell_mask(heights_[col], col);
}

inline bool Board::is_draw() const {
  return num_moves_ == kNumCells && !is_win(kRed) && !is_win(kYellow);
}

inline bool Board::is_terminal() const {
  return num_moves_ == kNumCells || is_win(kRed) || is_win(kYellow);
}

inline seat_index_t Board::winner() const {
  if (is_win(kRed)) return kRed;
  if (is_win(kYellow)) return kYellow;
  return kNoPlayer;
}

inline seat_index_t Board::get_player_at(row_t row, column_t col) const {
  mask_t bit = cell_mask(row, col);
  if (masks_[kRed] & bit) return kRed;
  if (masks_[kYellow] & bit) return kYellow;
  return kNoPlayer;
}

inline bool Board::has_four(mask_t mask) {
  constexpr int kDirections[] = {1, kColumnStride, kColumnStride + 1, kColumnStride - 1};

  for (int d : kDirections) {
    if (mask & (mask >> d) & (mask >> (2 * d)) & (mask >> (3 * d))) return true;
  }
  return false;
}

inline constexpr mask_t Board::column_mask(column_t col) {
  return ((mask_t(1) << kNumRows) - 1) << (kColumnStride * col);
}

inline constexpr mask_t Board::full_board_mask() {
  mask_t mask = 0;
  for (column_t col = 0; col < kNumColumns; ++col) {
    mask |= column_mask(col);
  }
  return mask;
}

}  // namespace dropfour
