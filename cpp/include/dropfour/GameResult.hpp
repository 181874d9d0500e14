#pragma once

#include "dropfour/Constants.hpp"

#include <string>
#include <vector>

namespace dropfour {

struct GameResult {
  seat_index_t winner = kNoPlayer;  // kNoPlayer for a draw
  std::vector<column_t> moves;      // full history, including any opening plies

  bool is_draw() const { return winner == kNoPlayer; }

  // "Red wins", "Yellow wins" or "Draw"
  std::string to_str() const;
};

}  // namespace dropfour
