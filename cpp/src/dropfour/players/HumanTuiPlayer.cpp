#include "dropfour/players/HumanTuiPlayer.hpp"

#include "util/Exception.hpp"
#include "util/Rendering.hpp"
#include "util/ScreenUtil.hpp"

#include <stdexcept>
#include <string>

namespace dropfour {

void HumanTuiPlayer::start_game() { last_move_ = kNoMove; }

void HumanTuiPlayer::receive_move(seat_index_t, const Board&, column_t move) {
  last_move_ = move;
}

void HumanTuiPlayer::receive_undo(const Board& board) { last_move_ = board.last_move(); }

column_t HumanTuiPlayer::get_move(const Board& board, bool undo_allowed) {
  print_state(board);

  bool complain = false;
  while (true) {
    if (complain) {
      out_ << "Invalid input!" << std::endl;
    }
    complain = true;

    column_t move = prompt_for_move(board, undo_allowed);
    if (move == kUndoMove || board.is_legal(move)) return move;
  }
}

void HumanTuiPlayer::end_game(const Board& board, const GameResult& result) {
  seat_index_t seat = get_my_seat();
  if (hot_seat_) {
    if (seat != kRed) return;
    print_state(board);
    if (result.is_draw()) {
      out_ << "The game has ended in a draw." << std::endl;
    } else {
      out_ << get_player_names()[result.winner] << " ("
           << Board::IO::player_to_str(result.winner) << ") wins!" << std::endl;
    }
    return;
  }

  print_state(board);
  if (result.is_draw()) {
    out_ << "The game has ended in a draw." << std::endl;
  } else if (result.winner == seat) {
    out_ << "Congratulations, you win!" << std::endl;
  } else {
    out_ << "Sorry, you lose." << std::endl;
  }
}

column_t HumanTuiPlayer::prompt_for_move(const Board& board, bool undo_allowed) {
  if (hot_seat_) {
    seat_index_t seat = board.current_player();
    out_ << get_player_names()[seat] << " (" << Board::IO::player_to_str(seat) << ") ";
  }
  if (undo_allowed) {
    out_ << "Enter move [1-" << int(kNumColumns) << "] or U to undo: ";
  } else {
    out_ << "Enter move [1-" << int(kNumColumns) << "]: ";
  }
  out_.flush();

  std::string input;
  if (!std::getline(in_, input)) {
    throw util::CleanException("End of input while waiting for a move");
  }

  if (input == "U" || input == "u") {
    return undo_allowed ? kUndoMove : kNoMove;
  }

  int col;
  try {
    size_t pos;
    col = std::stoi(input, &pos);
    if (input.find_first_not_of(" \t\r", pos) != std::string::npos) return kNoMove;
  } catch (const std::invalid_argument&) {
    return kNoMove;
  } catch (const std::out_of_range&) {
    return kNoMove;
  }

  if (col < 1 || col > kNumColumns) return kNoMove;
  return col - 1;
}

void HumanTuiPlayer::print_state(const Board& board) {
  if (util::Rendering::mode() == util::Rendering::kTerminal) {
    util::clearscreen();
  }
  Board::IO::print_state(out_, board, last_move_, &get_player_names());
}

}  // namespace dropfour
