#include "sweeper/game/error.h"

namespace sweeper {

const char* ErrorToString(Error error) {
  switch (error) {
    case Error::NONE:
      return "none";
    case Error::INVALID_CONFIGURATION:
      return "invalid configuration";
    case Error::OUT_OF_BOUNDS:
      return "out of bounds";
  }
  return "unknown";
}

}  // namespace sweeper
