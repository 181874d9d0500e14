#include "dropfour/Match.hpp"

#include "dropfour/GameRunner.hpp"
#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <spdlog/fmt/fmt.h>

namespace dropfour {

Match::Match(const Params& params, AbstractPlayer* p0, AbstractPlayer* p1, std::mt19937* prng)
    : params_(params), participants_{p0, p1}, prng_(prng) {
  CLEAN_ASSERT(params_.num_games >= 1, "num-games must be positive (got {})", params_.num_games);
  CLEAN_ASSERT(params_.num_opening_plies >= 0 && params_.num_opening_plies <= kMaxOpeningPlies,
               "opening-plies must be in [0, {}] (got {})", kMaxOpeningPlies,
               params_.num_opening_plies);
}

Match::record_array_t Match::run() {
  record_array_t records;
  Board opening;

  for (int g = 0; g < params_.num_games; ++g) {
    if (g % 2 == 0) opening = make_opening();

    int red = g % 2;  // index of the participant playing Red
    GameRunner runner({participants_[red], participants_[1 - red]});
    GameResult result = runner.run(opening);

    for (int p = 0; p < 2; ++p) {
      seat_index_t seat = (p == red) ? kRed : kYellow;
      if (result.is_draw()) {
        records[p].draws++;
      } else if (result.winner == seat) {
        records[p].wins++;
      } else {
        records[p].losses++;
      }
    }

    LOG_INFO("Game {}/{}: {} [W-D-L {}-{}-{}]", g + 1, params_.num_games, result.to_str(),
             records[0].wins, records[0].draws, records[0].losses);
  }
  return records;
}

void Match::print_summary(std::ostream& os, const record_array_t& records,
                          const std::array<std::string, 2>& names) {
  for (int p = 0; p < 2; ++p) {
    const Record& r = records[p];
    os << fmt::format("{:<24} W{:>4}  D{:>4}  L{:>4}", names[p], r.wins, r.draws, r.losses)
       << std::endl;
  }
}

// Random plies are redrawn if they happen to end the game.
Board Match::make_opening() {
  std::mt19937& prng = prng_ ? *prng_ : util::Random::default_prng();

  for (int attempt = 0; attempt < kMaxOpeningAttempts; ++attempt) {
    Board board;
    for (int i = 0; i < params_.num_opening_plies && !board.is_terminal(); ++i) {
      Board::MoveList moves = board.legal_moves();
      board.apply_move(moves[util::Random::uniform_sample(prng, 0, moves.size())]);
    }
    if (!board.is_terminal()) return board;
  }
  throw util::CleanException("No non-terminal {}-ply opening found in {} attempts",
                             params_.num_opening_plies, kMaxOpeningAttempts);
}

}  // namespace dropfour
