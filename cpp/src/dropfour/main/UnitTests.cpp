#include "dropfour/Board.hpp"
#include "dropfour/Constants.hpp"
#include "dropfour/Difficulty.hpp"
#include "dropfour/Evaluator.hpp"
#include "dropfour/Exceptions.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"

#include <gtest/gtest.h>

#include <array>
#include <bit>
#include <random>
#include <sstream>
#include <string>
#include <unordered_set>

/*
 * Board, Evaluator and Difficulty tests.
 */

#ifndef MIT_TEST_MODE
static_assert(false, "MIT_TEST_MODE macro must be defined for unit tests");
#endif

using namespace dropfour;

namespace {

// A full board on which neither player ever completes four.
const char* kDrawMoves = "442761225377252342545563474175371666631311";

// Plays up to n uniformly random moves, stopping early if the game ends.
Board make_random_board(std::mt19937& prng, int n) {
  Board board;
  for (int i = 0; i < n && !board.is_terminal(); ++i) {
    Board::MoveList moves = board.legal_moves();
    board.apply_move(moves[util::Random::uniform_sample(prng, 0, moves.size())]);
  }
  return board;
}

// Scans every cell and direction of the grid, independent of the bit layout.
bool brute_force_is_win(const Board& board, seat_index_t player) {
  constexpr int kDeltas[4][2] = {{0, 1}, {1, 0}, {1, 1}, {1, -1}};
  for (int row = 0; row < kNumRows; ++row) {
    for (int col = 0; col < kNumColumns; ++col) {
      for (const auto& delta : kDeltas) {
        int i = 0;
        for (; i < 4; ++i) {
          int r = row + i * delta[0];
          int c = col + i * delta[1];
          if (r < 0 || r >= kNumRows || c < 0 || c >= kNumColumns) break;
          if (board.get_player_at(r, c) != player) break;
        }
        if (i == 4) return true;
      }
    }
  }
  return false;
}

}  // namespace

TEST(Board, initial_state) {
  Board board;
  EXPECT_EQ(board.num_moves(), 0);
  EXPECT_EQ(board.current_player(), kRed);
  EXPECT_EQ(board.last_move(), kNoMove);
  EXPECT_EQ(board.full_mask(), 0u);
  EXPECT_EQ(board.legal_moves().size(), kNumColumns);
  EXPECT_FALSE(board.is_terminal());
  EXPECT_EQ(board.winner(), kNoPlayer);
}

TEST(Board, apply_move) {
  Board board;
  board.apply_move(3);
  board.apply_move(3);
  board.apply_move(2);

  EXPECT_EQ(board.num_moves(), 3);
  EXPECT_EQ(board.current_player(), kYellow);
  EXPECT_EQ(board.height(3), 2);
  EXPECT_EQ(board.height(2), 1);
  EXPECT_EQ(board.last_move(), 2);
  EXPECT_EQ(board.get_player_at(0, 3), kRed);
  EXPECT_EQ(board.get_player_at(1, 3), kYellow);
  EXPECT_EQ(board.get_player_at(0, 2), kRed);
  EXPECT_EQ(board.get_player_at(2, 3), kNoPlayer);
  EXPECT_EQ(board.mask(kRed), Board::cell_mask(0, 3) | Board::cell_mask(0, 2));
  EXPECT_EQ(board.mask(kYellow), Board::cell_mask(1, 3));
  EXPECT_EQ(board.move_history(), (std::vector<column_t>{3, 3, 2}));
}

TEST(Board, from_moves) {
  Board board = Board::from_moves("434");
  EXPECT_EQ(board.move_history(), (std::vector<column_t>{3, 2, 3}));
  EXPECT_EQ(Board::IO::move_history_str(board), "434");

  EXPECT_THROW(Board::from_moves("48"), InvalidMoveError);
  EXPECT_THROW(Board::from_moves("40"), InvalidMoveError);
  EXPECT_THROW(Board::from_moves("4x"), InvalidMoveError);
  EXPECT_THROW(Board::from_moves("4444444"), InvalidMoveError);
}

TEST(Board, invalid_moves) {
  Board board = Board::from_moves("111111");
  EXPECT_FALSE(board.is_legal(0));
  EXPECT_FALSE(board.is_legal(-1));
  EXPECT_FALSE(board.is_legal(kNumColumns));
  EXPECT_FALSE(board.legal_moves().contains(0));
  EXPECT_EQ(board.legal_moves().size(), kNumColumns - 1);

  Board before = board;
  EXPECT_THROW(board.apply_move(0), InvalidMoveError);
  EXPECT_THROW(board.apply_move(-1), InvalidMoveError);
  EXPECT_THROW(board.apply_move(kNumColumns), InvalidMoveError);
  EXPECT_EQ(board, before);
}

TEST(Board, undo) {
  Board board;
  EXPECT_THROW(board.undo(), EmptyHistoryError);

  board.apply_move(4);
  board.undo();
  EXPECT_EQ(board, Board());
  EXPECT_THROW(board.undo(), EmptyHistoryError);
}

TEST(Board, apply_undo_round_trip) {
  std::mt19937 prng(1);

  for (int trial = 0; trial < 200; ++trial) {
    Board board = make_random_board(prng, util::Random::uniform_sample(prng, 0, kNumCells));
    if (board.is_terminal()) continue;

    Board before = board;
    for (column_t col : before.legal_moves()) {
      board.apply_move(col);
      EXPECT_NE(board, before);
      board.undo();
      EXPECT_EQ(board, before);
      EXPECT_EQ(board.mask(kRed), before.mask(kRed));
      EXPECT_EQ(board.mask(kYellow), before.mask(kYellow));
      EXPECT_EQ(board.current_player(), before.current_player());
      EXPECT_EQ(board.move_history(), before.move_history());
    }
  }
}

TEST(Board, wins) {
  Board horizontal = Board::from_moves("1122334");
  EXPECT_TRUE(horizontal.is_win(kRed));
  EXPECT_FALSE(horizontal.is_win(kYellow));
  EXPECT_EQ(horizontal.winner(), kRed);
  EXPECT_TRUE(horizontal.is_terminal());
  EXPECT_FALSE(horizontal.is_draw());

  Board vertical = Board::from_moves("7171717");
  EXPECT_EQ(vertical.winner(), kRed);

  // Red completes the / diagonal from the bottom-left corner.
  Board diagonal = Board::from_moves("1223343644");
  EXPECT_FALSE(diagonal.is_terminal());
  diagonal.apply_move(3);
  EXPECT_EQ(diagonal.winner(), kRed);
  EXPECT_TRUE(diagonal.mask(kRed) & Board::cell_mask(0, 0));
  EXPECT_TRUE(diagonal.mask(kRed) & Board::cell_mask(3, 3));

  // Mirror image: the \ diagonal from the bottom-right corner.
  Board anti_diagonal = Board::from_moves("7665545244");
  EXPECT_FALSE(anti_diagonal.is_terminal());
  anti_diagonal.apply_move(3);
  EXPECT_EQ(anti_diagonal.winner(), kRed);
  EXPECT_FALSE(anti_diagonal.is_win(kYellow));
}

// Three pieces at the top of one column and one at the bottom of the next must not count as four.
TEST(Board, no_wrap_between_columns) {
  mask_t mask = Board::cell_mask(3, 0) | Board::cell_mask(4, 0) | Board::cell_mask(5, 0) |
                Board::cell_mask(0, 1);
  EXPECT_FALSE(Board::has_four(mask));

  mask = Board::cell_mask(5, 0) | Board::cell_mask(0, 1) | Board::cell_mask(1, 1) |
         Board::cell_mask(2, 1);
  EXPECT_FALSE(Board::has_four(mask));

  mask = Board::cell_mask(2, 1) | Board::cell_mask(3, 1) | Board::cell_mask(4, 1) |
         Board::cell_mask(5, 1);
  EXPECT_TRUE(Board::has_four(mask));
}

TEST(Board, is_win_matches_brute_force) {
  std::mt19937 prng(2);

  int num_wins = 0;
  for (int trial = 0; trial < 1000; ++trial) {
    Board board = make_random_board(prng, util::Random::uniform_sample(prng, 0, kNumCells + 1));
    for (seat_index_t p : {kRed, kYellow}) {
      bool expected = brute_force_is_win(board, p);
      EXPECT_EQ(board.is_win(p), expected) << Board::IO::compact_repr(board);
      num_wins += expected;
    }
  }
  EXPECT_GT(num_wins, 100);
}

TEST(Board, draw) {
  Board board = Board::from_moves(kDrawMoves);
  EXPECT_EQ(board.num_moves(), kNumCells);
  EXPECT_EQ(board.full_mask(), Board::full_board_mask());
  EXPECT_TRUE(board.legal_moves().empty());
  EXPECT_FALSE(board.is_win(kRed));
  EXPECT_FALSE(board.is_win(kYellow));
  EXPECT_TRUE(board.is_draw());
  EXPECT_TRUE(board.is_terminal());
  EXPECT_EQ(board.winner(), kNoPlayer);
  EXPECT_EQ(std::popcount(board.mask(kRed)), kNumCells / 2);
}

TEST(Board, hash) {
  // Same position reached by different move orders.
  Board a = Board::from_moves("1234");
  Board b = Board::from_moves("3214");
  EXPECT_NE(a, b);
  EXPECT_EQ(a.hash(), b.hash());

  std::unordered_set<Board> set;
  set.insert(Board());
  set.insert(Board::from_moves("4"));
  set.insert(Board::from_moves("4"));
  EXPECT_EQ(set.size(), 2u);
}

TEST(Board, compact_repr) {
  Board board = Board::from_moves("434");
  std::string expected =
    "_______\n"
    "_______\n"
    "_______\n"
    "_______\n"
    "___R___\n"
    "__YR___\n";
  EXPECT_EQ(Board::IO::compact_repr(board), expected);
}

TEST(Board, print_state) {
  Board board = Board::from_moves("434");
  std::ostringstream ss;
  Board::IO::print_state(ss, board, board.last_move());

  std::string expected =
    "       x\n"
    "| | | | | | | |\n"
    "| | | | | | | |\n"
    "| | | | | | | |\n"
    "| | | | | | | |\n"
    "| | | |R| | | |\n"
    "| | |Y|R| | | |\n"
    "|1|2|3|4|5|6|7|\n"
    "\n"
    "\n";
  EXPECT_EQ(ss.str(), expected);
}

TEST(Board, print_state_long_names) {
  std::array<std::string, kNumPlayers> names = {std::string(5000, 'a'), "b"};
  std::ostringstream ss;
  EXPECT_NO_THROW(Board::IO::print_state(ss, Board::from_moves("4"), 3, &names));

  std::string text = ss.str();
  EXPECT_NE(text.find("R: " + names[kRed] + "\n"), std::string::npos);
  EXPECT_NE(text.find("Y: b\n"), std::string::npos);
}

TEST(Evaluator, windows) {
  EXPECT_EQ(Evaluator::kNumWindows, 69);
  mask_t all = 0;
  for (mask_t window : Evaluator::kWindows) {
    EXPECT_EQ(std::popcount(window), 4);
    EXPECT_TRUE(Board::has_four(window));
    all |= window;
  }
  EXPECT_EQ(all, Board::full_board_mask());
}

TEST(Evaluator, window_score) {
  static_assert(Evaluator::window_score(4, 0) == 100000);
  static_assert(Evaluator::window_score(3, 0) == 1000);
  static_assert(Evaluator::window_score(3, 1) == 0);
  static_assert(Evaluator::window_score(2, 0) == 100);
  static_assert(Evaluator::window_score(2, 1) == 0);
  static_assert(Evaluator::window_score(1, 0) == 10);
  static_assert(Evaluator::window_score(0, 3) == -800);
  static_assert(Evaluator::window_score(0, 2) == -50);
  static_assert(Evaluator::window_score(0, 1) == 0);
  static_assert(Evaluator::window_score(0, 0) == 0);
  EXPECT_EQ(Evaluator::window_score(1, 1), 0);
}

TEST(Evaluator, single_center_piece) {
  Board board = Board::from_moves("4");

  // Cell (0, 3) lies in 7 windows worth 10 each, plus cell weight 7 and column weight 200.
  EXPECT_EQ(Evaluator::positional_score(board.mask(kRed)), 207);
  EXPECT_EQ(Evaluator::heuristic(board, kRed), 277);
  EXPECT_EQ(Evaluator::heuristic(board, kYellow), -277);
  EXPECT_EQ(Evaluator::heuristic(Board(), kRed), 0);
}

TEST(Evaluator, antisymmetric) {
  std::mt19937 prng(3);
  for (int trial = 0; trial < 200; ++trial) {
    Board board = make_random_board(prng, util::Random::uniform_sample(prng, 0, kNumCells));
    EXPECT_EQ(Evaluator::heuristic(board, kRed), -Evaluator::heuristic(board, kYellow));
    EXPECT_EQ(Evaluator::evaluate(board, kRed, 2), -Evaluator::evaluate(board, kYellow, 2));
  }
}

TEST(Evaluator, terminal_scores) {
  Board board = Board::from_moves("1122334");
  score_t score;
  EXPECT_TRUE(Evaluator::terminal_score(board, kRed, 0, 1, score));
  EXPECT_EQ(score, Evaluator::kWinScore);
  EXPECT_TRUE(Evaluator::terminal_score(board, kYellow, 3, 1, score));
  EXPECT_EQ(score, -(Evaluator::kWinScore - 3));
  EXPECT_EQ(Evaluator::evaluate(board, kRed, 5, 2), Evaluator::kWinScore - 10);
  EXPECT_EQ(Evaluator::evaluate(board, kRed, 5, 0), Evaluator::kWinScore);

  Board draw = Board::from_moves(kDrawMoves);
  EXPECT_TRUE(Evaluator::terminal_score(draw, kRed, 4, 1, score));
  EXPECT_EQ(score, 0);
  EXPECT_EQ(Evaluator::evaluate(draw, kYellow), 0);

  EXPECT_FALSE(Evaluator::terminal_score(Board::from_moves("44"), kRed, 0, 1, score));
}

TEST(Difficulty, to_depth) {
  EXPECT_EQ(to_depth(Difficulty::kEasy), 2);
  EXPECT_EQ(to_depth(Difficulty::kMedium), 4);
  EXPECT_EQ(to_depth(Difficulty::kHard), 6);
  EXPECT_EQ(to_depth(Difficulty::kExpert), 8);
  EXPECT_EQ(to_depth(Difficulty::kInsane), 10);
}

TEST(Difficulty, parse) {
  EXPECT_EQ(parse_difficulty("Easy"), Difficulty::kEasy);
  EXPECT_EQ(parse_difficulty("medium"), Difficulty::kMedium);
  EXPECT_EQ(parse_difficulty("HARD"), Difficulty::kHard);
  EXPECT_EQ(parse_difficulty("eXpErT"), Difficulty::kExpert);
  EXPECT_EQ(parse_difficulty("insane"), Difficulty::kInsane);

  for (Difficulty d : kAllDifficulties) {
    EXPECT_EQ(parse_difficulty(to_str(d)), d);
  }

  EXPECT_THROW(parse_difficulty("impossible"), util::CleanException);
  EXPECT_THROW(parse_difficulty(""), util::CleanException);
  EXPECT_THROW(parse_difficulty("hard "), util::CleanException);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
