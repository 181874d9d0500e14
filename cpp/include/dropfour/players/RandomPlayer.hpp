#pragma once

#include "dropfour/players/AbstractPlayer.hpp"

#include <random>

namespace dropfour {

/*
 * RandomPlayer always chooses uniformly at random among the set of legal moves.
 *
 * By default it draws from util::Random's default prng. Tests pass their own prng for
 * reproducibility.
 */
class RandomPlayer : public AbstractPlayer {
 public:
  explicit RandomPlayer(std::mt19937* prng = nullptr) : prng_(prng) {}

  column_t get_move(const Board& board, bool undo_allowed) override;

 private:
  std::mt19937* prng_;
};

}  // namespace dropfour
