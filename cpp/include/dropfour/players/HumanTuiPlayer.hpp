#pragma once

#include "dropfour/players/AbstractPlayer.hpp"

#include <iostream>

namespace dropfour {

/*
 * Prompts for a 1-indexed column on a text stream, re-prompting until a legal move is entered.
 *
 * The board is printed before every prompt and once more at the end of the game. When rendering to
 * a terminal, the screen is cleared first. When an undo is allowed, "u" takes back the last move
 * pair.
 *
 * In hot-seat mode two players share one screen: prompts name the player to move, and only the
 * instance seated as Red prints the final board, announcing the winner by name.
 */
class HumanTuiPlayer : public AbstractPlayer {
 public:
  HumanTuiPlayer(std::istream& in = std::cin, std::ostream& out = std::cout)
      : in_(in), out_(out) {}

  void start_game() override;
  void receive_move(seat_index_t, const Board&, column_t) override;
  void receive_undo(const Board&) override;
  column_t get_move(const Board& board, bool undo_allowed) override;
  void end_game(const Board&, const GameResult&) override;

  void set_hot_seat(bool hot_seat) { hot_seat_ = hot_seat; }

 private:
  // Returns kNoMove if the line does not parse as a column number, and kUndoMove for "u" when
  // undo_allowed. Throws util::CleanException on end of input.
  column_t prompt_for_move(const Board& board, bool undo_allowed);

  void print_state(const Board& board);

  std::istream& in_;
  std::ostream& out_;
  column_t last_move_ = kNoMove;
  bool hot_seat_ = false;
};

}  // namespace dropfour
