#include "dropfour/GameRunner.hpp"

#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

namespace dropfour {

GameResult GameRunner::run(const Board& start) {
  AbstractPlayer::player_name_array_t names;
  for (seat_index_t seat = 0; seat < kNumPlayers; ++seat) {
    RELEASE_ASSERT(players_[seat], "no player in seat {}", seat);
    names[seat] = players_[seat]->get_name();
  }

  for (seat_index_t seat = 0; seat < kNumPlayers; ++seat) {
    players_[seat]->init_game(names, seat);
    players_[seat]->start_game();
  }

  LOG_INFO("Starting game: {} (Red) vs {} (Yellow), opening \"{}\"", names[kRed], names[kYellow],
           Board::IO::move_history_str(start));

  Board board = start;
  while (!board.is_terminal()) {
    seat_index_t seat = board.current_player();
    bool undo_allowed = board.num_moves() - start.num_moves() >= kUndoPlies;
    column_t move = players_[seat]->get_move(board, undo_allowed);
    if (move == kUndoMove) {
      RELEASE_ASSERT(undo_allowed, "Player {} ({}) requested an undo that is not permitted", seat,
                     names[seat]);
      for (int i = 0; i < kUndoPlies; ++i) {
        board.undo();
      }
      LOG_INFO("{} took back a move pair ({})", names[seat], Board::IO::move_history_str(board));
      for (AbstractPlayer* player : players_) {
        player->receive_undo(board);
      }
      continue;
    }
    if (!board.is_legal(move)) {
      throw util::Exception("Player {} ({}) returned illegal move {}", seat, names[seat], move);
    }
    board.apply_move(move);

    for (AbstractPlayer* player : players_) {
      player->receive_move(seat, board, move);
    }
  }

  GameResult result;
  result.winner = board.winner();
  result.moves = board.move_history();

  LOG_INFO("Game over: {} after {} moves ({})", result.to_str(), board.num_moves(),
           Board::IO::move_history_str(board));

  for (AbstractPlayer* player : players_) {
    player->end_game(board, result);
  }
  return result;
}

}  // namespace dropfour
