#ifndef SWEEPER_GAME_EVALUATOR_H_
#define SWEEPER_GAME_EVALUATOR_H_

#include "sweeper/game/board.h"
#include "sweeper/game/reveal.h"

namespace sweeper {

// Current game status.
enum class Status {
  // A new game is ready but no cell has been uncovered.
  IDLE,

  // The game is ongoing.
  PLAYING,

  // The game ended in a win.
  WON,

  // The game ended in a loss.
  LOST,
};

// Returns the status of a game after last_reveal was applied to board.
//
// LOST if the reveal opened a mine, WON if every cell without a mine is open,
// and PLAYING otherwise.
Status Evaluate(const Board& board, const RevealResult& last_reveal);

// Returns true for WON and LOST.
inline bool IsTerminal(Status status) {
  return status == Status::WON || status == Status::LOST;
}

// Returns a stable, lower case name for the status.
const char* StatusToString(Status status);

}  // namespace sweeper

#endif  // SWEEPER_GAME_EVALUATOR_H_
