#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace dropfour {

/*
 * Named search depths offered to human players. The engine itself only ever sees a depth.
 */
enum class Difficulty : int8_t { kEasy, kMedium, kHard, kExpert, kInsane };

constexpr std::array<Difficulty, 5> kAllDifficulties = {
  Difficulty::kEasy, Difficulty::kMedium, Difficulty::kHard, Difficulty::kExpert,
  Difficulty::kInsane};

int to_depth(Difficulty difficulty);
const char* to_str(Difficulty difficulty);

// Case-insensitive: "hard", "Hard" and "HARD" all map to kHard. Throws util::CleanException on an
// unknown label.
Difficulty parse_difficulty(const std::string& label);

}  // namespace dropfour
