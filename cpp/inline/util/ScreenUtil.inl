#include "util/ScreenUtil.hpp"

#include "util/Exception.hpp"

#include <sys/ioctl.h>

#include <cstdlib>
#include <unistd.h>

namespace util {

inline void clearscreen() {
  int rc = system("clear");
  if (rc) {
    throw util::Exception("clearscreen() failed (rc={})", rc);
  }
}

inline int get_screen_width() {
  static int width = 0;
  if (width == 0) {
    struct winsize w {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
      width = w.ws_col;
    } else {
      width = kDefaultScreenWidth;
    }
  }
  return width;
}

}  // namespace util
