#pragma once

#include "dropfour/Board.hpp"
#include "dropfour/Constants.hpp"
#include "dropfour/players/AbstractPlayer.hpp"

#include <array>
#include <ostream>
#include <random>
#include <string>

namespace dropfour {

/*
 * A series of games between two participants with alternating first player.
 *
 * Games are played in pairs: game 2k has participant 0 as Red and game 2k+1 swaps seats. When
 * random opening plies are requested, both games of a pair start from the same random opening, so
 * neither participant is favored by the opening draw. An opening that ends the game is redrawn;
 * run() throws util::CleanException if no playable opening turns up after kMaxOpeningAttempts.
 */
class Match {
 public:
  struct Params {
    int num_games = 2;
    int num_opening_plies = 0;

    auto make_options_description();
  };

  struct Record {
    int wins = 0;
    int draws = 0;
    int losses = 0;

    int num_games() const { return wins + draws + losses; }
  };

  using record_array_t = std::array<Record, 2>;

  // About half of all random openings this long are still undecided.
  static constexpr int kMaxOpeningPlies = 20;
  static constexpr int kMaxOpeningAttempts = 1000;

  // prng drives the random openings. If null, util::Random's default prng is used.
  Match(const Params& params, AbstractPlayer* p0, AbstractPlayer* p1,
        std::mt19937* prng = nullptr);

  // Returns the tally of each participant, indexed like the constructor arguments.
  record_array_t run();

  static void print_summary(std::ostream& os, const record_array_t& records,
                            const std::array<std::string, 2>& names);

 private:
  Board make_opening();

  const Params params_;
  std::array<AbstractPlayer*, 2> participants_;
  std::mt19937* prng_;
};

}  // namespace dropfour

#include "inline/dropfour/Match.inl"
