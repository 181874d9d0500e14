#include "dropfour/Difficulty.hpp"

#include "util/Exception.hpp"

#include <boost/algorithm/string/predicate.hpp>

namespace dropfour {

int to_depth(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::kEasy:
      return 2;
    case Difficulty::kMedium:
      return 4;
    case Difficulty::kHard:
      return 6;
    case Difficulty::kExpert:
      return 8;
    case Difficulty::kInsane:
      return 10;
  }
  throw util::Exception("Unknown difficulty {}", static_cast<int>(difficulty));
}

const char* to_str(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::kEasy:
      return "Easy";
    case Difficulty::kMedium:
      return "Medium";
    case Difficulty::kHard:
      return "Hard";
    case Difficulty::kExpert:
      return "Expert";
    case Difficulty::kInsane:
      return "Insane";
  }
  throw util::Exception("Unknown difficulty {}", static_cast<int>(difficulty));
}

Difficulty parse_difficulty(const std::string& label) {
  for (Difficulty difficulty : kAllDifficulties) {
    if (boost::algorithm::iequals(label, to_str(difficulty))) return difficulty;
  }
  throw util::CleanException(
    "Unknown difficulty \"{}\" (expected one of Easy, Medium, Hard, Expert, Insane)", label);
}

}  // namespace dropfour
