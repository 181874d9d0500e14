#include "dropfour/players/RandomPlayer.hpp"

#include "util/Random.hpp"

namespace dropfour {

column_t RandomPlayer::get_move(const Board& board, bool) {
  Board::MoveList moves = board.legal_moves();
  std::mt19937& prng = prng_ ? *prng_ : util::Random::default_prng();
  return moves[util::Random::uniform_sample(prng, 0, moves.size())];
}

}  // namespace dropfour
