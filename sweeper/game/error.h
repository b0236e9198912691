#ifndef SWEEPER_GAME_ERROR_H_
#define SWEEPER_GAME_ERROR_H_

namespace sweeper {

// Result codes for operations on boards and sessions.
//
// Operations that are valid but change nothing (uncovering an open cell,
// acting on a finished game) return NONE.
enum class Error {
  // The operation succeeded.
  NONE,

  // The board dimensions or mine count cannot form a game.
  INVALID_CONFIGURATION,

  // A row or column lies outside the board.
  OUT_OF_BOUNDS,
};

// Returns a stable, human readable name for the error.
const char* ErrorToString(Error error);

}  // namespace sweeper

#endif  // SWEEPER_GAME_ERROR_H_
