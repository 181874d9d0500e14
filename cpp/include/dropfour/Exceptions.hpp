#pragma once

#include "util/Exception.hpp"

namespace dropfour {

// Thrown by Board::apply_move() for a column outside [0, kNumColumns) or a full column. This is a
// caller bug, never a game-over signal.
class InvalidMoveError : public util::Exception {
 public:
  using util::Exception::Exception;
};

// Thrown by Board::undo() when no move has been played.
class EmptyHistoryError : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace dropfour
