#include "sweeper/game/evaluator.h"

namespace sweeper {

Status Evaluate(const Board& board, const RevealResult& last_reveal) {
  if (last_reveal.hit_mine) {
    return Status::LOST;
  }
  if (board.IsCleared()) {
    return Status::WON;
  }
  return Status::PLAYING;
}

const char* StatusToString(Status status) {
  switch (status) {
    case Status::IDLE:
      return "idle";
    case Status::PLAYING:
      return "playing";
    case Status::WON:
      return "won";
    case Status::LOST:
      return "lost";
  }
  return "unknown";
}

}  // namespace sweeper
