#pragma once

#include "dropfour/Board.hpp"
#include "dropfour/Constants.hpp"
#include "dropfour/GameResult.hpp"
#include "dropfour/players/AbstractPlayer.hpp"

#include <array>

namespace dropfour {

/*
 * Plays one game between two seated players. players[kRed] moves first from an empty board.
 *
 * Both players are notified of every move via receive_move(), including their own. A player that
 * returns an illegal move is a bug, reported as util::Exception.
 *
 * A player may answer kUndoMove once it has a move of its own on the board that was followed by an
 * opponent reply, both played after the starting position. The runner then takes back those two
 * moves, notifies both players via receive_undo(), and asks the same player again.
 */
class GameRunner {
 public:
  using player_array_t = std::array<AbstractPlayer*, kNumPlayers>;

  explicit GameRunner(const player_array_t& players) : players_(players) {}

  // Plays out the game from start, which may already contain opening moves.
  GameResult run(const Board& start = Board());

  static constexpr int kUndoPlies = 2;

 private:
  player_array_t players_;
};

}  // namespace dropfour
