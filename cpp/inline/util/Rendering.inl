#include "util/Rendering.hpp"

#include <unistd.h>

namespace util {

inline Rendering::Rendering() : mode_(isatty(STDOUT_FILENO) ? kTerminal : kText) {}

inline Rendering& Rendering::instance() {
  static Rendering instance;
  return instance;
}

}  // namespace util
