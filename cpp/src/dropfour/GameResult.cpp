#include "dropfour/GameResult.hpp"

namespace dropfour {

std::string GameResult::to_str() const {
  if (winner == kRed) return "Red wins";
  if (winner == kYellow) return "Yellow wins";
  return "Draw";
}

}  // namespace dropfour
