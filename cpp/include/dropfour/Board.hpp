#pragma once

#include "dropfour/Constants.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace dropfour {

/*
 * Bit order encoding for the board:
 *
 *  5 13 21 29 37 45 53
 *  4 12 20 28 36 44 52
 *  3 11 19 27 35 43 51
 *  2 10 18 26 34 42 50
 *  1  9 17 25 33 41 49
 *  0  8 16 24 32 40 48
 *
 * Bits 6 and 7 of every column are never set. Each player owns one mask; a line of four is found by
 * AND-ing the mask with copies of itself shifted by 1, 2 and 3 steps along a direction:
 *
 *   vertical: 1
 *   horizontal: kColumnStride (8)
 *   diagonal /: kColumnStride + 1 (9)
 *   diagonal \: kColumnStride - 1 (7)
 *
 * The empty rows at the top of each column absorb any shift that would otherwise carry a line from
 * one column into the next.
 *
 * Column indices are 0-indexed internally, but 1-indexed in all user-facing text (move strings,
 * printed boards, prompts).
 */
class Board {
 public:
  // Fixed-capacity list of columns, in the order they should be tried.
  class MoveList {
   public:
    using const_iterator = const column_t*;

    void push_back(column_t col) { moves_[size_++] = col; }
    void clear() { size_ = 0; }
    int size() const { return size_; }
    bool empty() const { return size_ == 0; }
    bool contains(column_t col) const;
    column_t operator[](int i) const { return moves_[i]; }
    column_t& operator[](int i) { return moves_[i]; }
    const_iterator begin() const { return moves_.data(); }
    const_iterator end() const { return moves_.data() + size_; }
    column_t* begin() { return moves_.data(); }
    column_t* end() { return moves_.data() + size_; }

   private:
    std::array<column_t, kNumColumns> moves_;
    int size_ = 0;
  };

  struct IO {
    static std::string move_to_str(column_t col) { return std::to_string(col + 1); }
    static std::string move_history_str(const Board& board);
    static std::string player_to_str(seat_index_t player);

    /*
     * Prints the 6x7 grid, top row first, followed by a column legend. On a terminal, pieces are
     * colored circles and the piece dropped by last_move blinks; otherwise pieces are R and Y.
     *
     * If player_names is non-null, a legend mapping colors to names is printed as well.
     */
    static void print_state(std::ostream&, const Board&, column_t last_move = kNoMove,
                            const std::array<std::string, kNumPlayers>* player_names = nullptr);

    // 6 lines joined by '\n' of 7 chars each, top row first, each char is in {'R', 'Y', '_'}
    static std::string compact_repr(const Board&);

   private:
    static int print_row(char* buf, int n, const Board&, row_t row, column_t blink_column);
  };

  Board();

  /*
   * Builds a board by playing the given moves in order. Each char is a 1-indexed column digit, so
   * "4453" plays columns 3, 3, 4, 2. Throws InvalidMoveError on a non-digit char or an illegal
   * move.
   */
  static Board from_moves(const std::string& moves);

  bool operator==(const Board&) const = default;
  size_t hash() const;

  MoveList legal_moves() const;
  bool is_legal(column_t col) const;

  // Drops a piece of current_player() into col. Throws InvalidMoveError if col is out of range or
  // full.
  void apply_move(column_t col);

  // Takes back the most recent move. Throws EmptyHistoryError if no move has been played.
  void undo();

  bool is_win(seat_index_t player) const { return has_four(masks_[player]); }
  bool is_draw() const;
  bool is_terminal() const;

  // The seat with four in a row, or kNoPlayer.
  seat_index_t winner() const;

  seat_index_t current_player() const { return num_moves_ % 2; }
  int num_moves() const { return num_moves_; }
  int height(column_t col) const { return heights_[col]; }
  column_t last_move() const { return num_moves_ ? history_[num_moves_ - 1] : kNoMove; }
  std::vector<column_t> move_history() const;

  mask_t mask(seat_index_t player) const { return masks_[player]; }
  mask_t full_mask() const { return masks_[kRed] | masks_[kYellow]; }

  // kRed, kYellow, or kNoPlayer for an empty cell.
  seat_index_t get_player_at(row_t row, column_t col) const;

  static bool has_four(mask_t mask);

  static constexpr int to_bit_index(row_t row, column_t col) { return kColumnStride * col + row; }
  static constexpr mask_t cell_mask(row_t row, column_t col) {
    return mask_t(1) << to_bit_index(row, col);
  }
  static constexpr mask_t column_mask(column_t col);
  static constexpr mask_t full_board_mask();

 private:
  std::array<mask_t, kNumPlayers> masks_;
  std::array<int8_t, kNumColumns> heights_;
  std::array<column_t, kMaxMovesPerGame> history_;  // entries past num_moves_ are kNoMove
  int8_t num_moves_;
};

}  // namespace dropfour

namespace std {

template <>
struct hash<dropfour::Board> {
  size_t operator()(const dropfour::Board& board) const { return board.hash(); }
};

}  // namespace std

#include "inline/dropfour/Board.inl"
