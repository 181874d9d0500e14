#include "dropfour/Board.hpp"

#include "dropfour/Exceptions.hpp"
#include "util/AnsiCodes.hpp"
#include "util/Asserts.hpp"
#include "util/Rendering.hpp"

#include <boost/functional/hash.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdio>

namespace dropfour {

Board Board::from_moves(const std::string& moves) {
  Board board;
  for (char c : moves) {
    if (c < '1' || c > '0' + kNumColumns) {
      throw InvalidMoveError("Invalid move char '{}' in \"{}\"", c, moves);
    }
    board.apply_move(c - '1');
  }
  return board;
}

size_t Board::hash() const {
  size_t seed = 0;
  boost::hash_combine(seed, masks_[kRed]);
  boost::hash_combine(seed, masks_[kYellow]);
  return seed;
}

std::vector<column_t> Board::move_history() const {
  return std::vector<column_t>(history_.begin(), history_.begin() + num_moves_);
}

std::string Board::IO::move_history_str(const Board& board) {
  std::string s;
  for (column_t col : board.move_history()) {
    s += move_to_str(col);
  }
  return s;
}

std::string Board::IO::player_to_str(seat_index_t player) {
  return (player == kRed)
           ? fmt::format("{}{}{}", ansi::kRed(""), ansi::kCircle("R"), ansi::kReset(""))
           : fmt::format("{}{}{}", ansi::kYellow(""), ansi::kCircle("Y"), ansi::kReset(""));
}

void Board::IO::print_state(std::ostream& ss, const Board& board, column_t last_move,
                            const std::array<std::string, kNumPlayers>* player_names) {
  constexpr int buf_size = 4096;
  char buffer[buf_size];
  int cx = 0;

  if (util::Rendering::mode() == util::Rendering::kText && last_move > kNoMove) {
    std::string s(2 * last_move + 1, ' ');
    cx += snprintf(buffer + cx, buf_size - cx, "%sx\n", s.c_str());
  }

  column_t blink_column = last_move;
  row_t blink_row = -1;
  if (blink_column >= 0) {
    blink_row = board.height(blink_column) - 1;
  }
  for (row_t row = kNumRows - 1; row >= 0; --row) {
    cx += print_row(buffer + cx, buf_size - cx, board, row, row == blink_row ? blink_column : -1);
  }
  cx += snprintf(buffer + cx, buf_size - cx, "|1|2|3|4|5|6|7|\n\n");

  RELEASE_ASSERT(cx < buf_size, "Buffer overflow ({} < {})", cx, buf_size);
  ss << buffer;

  // Names are unbounded, so the legend bypasses the fixed-size buffer.
  if (player_names) {
    ss << fmt::format("{}{}{}: {}\n", ansi::kRed(""), ansi::kCircle("R"), ansi::kReset(""),
                      (*player_names)[kRed]);
    ss << fmt::format("{}{}{}: {}\n\n", ansi::kYellow(""), ansi::kCircle("Y"), ansi::kReset(""),
                      (*player_names)[kYellow]);
  }
  ss << std::endl;
}

std::string Board::IO::compact_repr(const Board& board) {
  std::string repr;
  for (row_t row = kNumRows - 1; row >= 0; --row) {
    for (column_t col = 0; col < kNumColumns; ++col) {
      seat_index_t player = board.get_player_at(row, col);
      repr += player == kRed ? 'R' : (player == kYellow ? 'Y' : '_');
    }
    repr += '\n';
  }
  return repr;
}

int Board::IO::print_row(char* buf, int n, const Board& board, row_t row, column_t blink_column) {
  int cx = 0;

  for (column_t col = 0; col < kNumColumns; ++col) {
    seat_index_t player = board.get_player_at(row, col);
    bool occupied = player != kNoPlayer;

    const char* color = "";
    if (occupied) {
      color = player == kRed ? ansi::kRed("R") : ansi::kYellow("Y");
    }
    const char* c = occupied ? ansi::kCircle("") : " ";

    cx += snprintf(buf + cx, n - cx, "|%s%s%s%s", col == blink_column ? ansi::kBlink("") : "",
                   color, c, occupied ? ansi::kReset("") : "");
  }

  cx += snprintf(buf + cx, n - cx, "|\n");
  return cx;
}

}  // namespace dropfour
