#pragma once

#include "dropfour/Board.hpp"
#include "dropfour/Constants.hpp"
#include "dropfour/GameResult.hpp"

#include <array>
#include <string>

namespace dropfour {

/*
 * Base class for all players.
 *
 * There are 4 main virtual functions to override:
 *
 * - start_game()
 * - receive_move()
 * - get_move()
 * - end_game()
 *
 * start_game() and end_game() are called when a game starts or ends. A single player might play
 * multiple games in succession, so you should override these if there is state that you want to
 * clear between games.
 *
 * receive_move() is called after every move, with the board as it stands after the move. Note that
 * you get this callback even after your own move, as a sort of "echo".
 *
 * get_move() is called when it is your turn. The board is guaranteed to be non-terminal and
 * identical to the board last passed to receive_move() (or the starting board). The returned
 * column must be legal, or kUndoMove if undo_allowed is set.
 *
 * receive_undo() is called after a take-back, with the board as it stands after the undone moves
 * were removed.
 */
class AbstractPlayer {
 public:
  using player_name_array_t = std::array<std::string, kNumPlayers>;

  virtual ~AbstractPlayer() = default;
  void set_name(const std::string& name) { name_ = name; }
  const std::string& get_name() const { return name_; }
  const player_name_array_t& get_player_names() const { return player_names_; }
  seat_index_t get_my_seat() const { return my_seat_; }

  void init_game(const player_name_array_t& player_names, seat_index_t seat_assignment) {
    player_names_ = player_names;
    my_seat_ = seat_assignment;
  }

  virtual void start_game() {}
  virtual void receive_move(seat_index_t, const Board&, column_t) {}
  virtual void receive_undo(const Board&) {}
  virtual column_t get_move(const Board& board, bool undo_allowed) = 0;
  virtual void end_game(const Board&, const GameResult&) {}

 private:
  std::string name_;
  player_name_array_t player_names_;
  seat_index_t my_seat_ = kNoPlayer;
};

}  // namespace dropfour
