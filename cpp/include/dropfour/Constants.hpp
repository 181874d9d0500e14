#pragma once

#include <cstdint>

namespace dropfour {

using column_t = int8_t;
using row_t = int8_t;
using mask_t = uint64_t;
using seat_index_t = int8_t;
using score_t = int32_t;
using node_ix_t = int32_t;

const int kNumColumns = 7;
const int kNumRows = 6;
const int kNumCells = kNumColumns * kNumRows;
const int kMaxMovesPerGame = kNumColumns * kNumRows;
const int kNumPlayers = 2;

// Bits reserved per column in a mask_t. Rows kNumRows..kColumnStride-1 stay empty, which keeps
// shifted lines from wrapping into the neighboring column.
const int kColumnStride = 8;

const seat_index_t kRed = 0;  // moves first
const seat_index_t kYellow = 1;
const seat_index_t kNoPlayer = -1;

const column_t kNoMove = -1;
const column_t kUndoMove = -2;  // returned by get_move() to take back the last move pair

}  // namespace dropfour
