#ifndef SWEEPER_GAME_SESSION_H_
#define SWEEPER_GAME_SESSION_H_

#include <cstddef>
#include <memory>
#include <vector>

#include "sweeper/game/board.h"
#include "sweeper/game/cell.h"
#include "sweeper/game/config.h"
#include "sweeper/game/error.h"
#include "sweeper/game/evaluator.h"
#include "sweeper/game/grid.h"
#include "sweeper/game/reveal.h"

namespace sweeper {

// Events are generated in response to actions taken in a game.
struct Event {
  enum class Type {
    // A cell without a mine was opened.
    OPEN,

    // A cell was flagged.
    FLAG,

    // A cell was unflagged, either directly or because an empty area expanded
    // over it.
    UNFLAG,

    // The game was won.
    WIN,

    // The game was lost.
    LOSS,

    // Identifies a mine location. Only generated when a game is lost.
    IDENTIFY_MINE,

    // Identifies a location that was flagged but is not a mine. Only generated
    // when a game is lost.
    IDENTIFY_BAD_FLAG,
  };

  // The type of event.
  Type type;

  // The row and column for which the event was generated.
  // For a LOSS event this was the mine that caused the loss.
  // For a WIN event this was the last cell opened.
  std::size_t row;
  std::size_t col;

  // The number of mines in adjacent cells.
  // Only set for OPEN events.
  std::size_t adjacent_mines;
};

// Implementations of EventSubscriber may call Session::Subscribe to receive
// event updates as actions are executed.
class EventSubscriber {
 public:
  virtual ~EventSubscriber() = default;

  // Notifies the subscriber that an event occurred.
  virtual void NotifyEvent(const Event& event) = 0;
};

// The states a cell can take from a player's point of view.
enum class ViewState {
  // The cell is closed (but not flagged).
  CLOSED,

  // The cell is open.
  OPEN,

  // The cell is flagged. Once a game is lost, every cell still in this state
  // is a mine.
  FLAGGED,

  // The cell is a mine (revealed when the game is lost).
  MINE,

  // The cell is the mine that caused a loss.
  LOSING_MINE,

  // The cell is flagged but does not contain a mine (revealed when the game is
  // lost).
  BAD_FLAG,
};

// What a player may know about a cell.
struct ViewCell {
  ViewState state = ViewState::CLOSED;

  // The number of adjacent mines.
  // Only valid if the state is OPEN.
  std::size_t adjacent_mines = 0;
};

// A snapshot of a game for rendering.
struct BoardView {
  Status status;

  // The number of mines less the number of flags, or zero if there are more
  // flags than mines.
  std::size_t remaining_mines;

  Grid<ViewCell> cells;
};

// The result of a reveal or chord.
struct RevealOutcome {
  // Every cell opened, in the order it was opened. Empty if nothing changed.
  std::vector<CellLocation> opened;

  // Flags removed by the expansion of empty areas.
  std::vector<CellLocation> unflagged;

  // True if a mine was opened.
  bool hit_mine = false;

  // The game status after the action.
  Status status = Status::IDLE;
};

// The result of toggling a flag.
struct FlagOutcome {
  std::size_t row = 0;
  std::size_t col = 0;

  // The state of the cell after the action.
  CellState state = CellState::CLOSED;

  // False if the action was ignored.
  bool changed = false;
};

// The interface through which a game is played.
//
// A session owns its board. Mines are not placed until the first cell is
// uncovered, and never on or next to that cell when the board has room.
class Session {
 public:
  virtual ~Session() = default;

  // Uncovers the cell at (row, col), expanding empty areas.
  //
  // Does nothing if the cell is flagged or open, or the game is over. The
  // first reveal of a game places the mines.
  virtual Error Reveal(std::size_t row, std::size_t col,
                       RevealOutcome& outcome) = 0;

  // Toggles the flag on the cell at (row, col).
  //
  // Does nothing if the cell is open or the game is over. Flagging never ends
  // a game.
  virtual Error ToggleFlag(std::size_t row, std::size_t col,
                           FlagOutcome& outcome) = 0;

  // Uncovers the cells around the open cell at (row, col) if its adjacent
  // flags account for all of its adjacent mines.
  virtual Error Chord(std::size_t row, std::size_t col,
                      RevealOutcome& outcome) = 0;

  // Subscribes the given subscriber to receive event updates when actions are
  // executed. The subscriber must outlive the session.
  virtual void Subscribe(EventSubscriber* subscriber) = 0;

  // Returns a snapshot of the board as the player may see it.
  virtual BoardView GetBoardView() const = 0;

  // Returns the number of rows in the game.
  virtual std::size_t GetRows() const = 0;

  // Returns the number of columns in the game.
  virtual std::size_t GetCols() const = 0;

  // Returns the number of mines in the game.
  virtual std::size_t GetMines() const = 0;

  // Returns the number of mines less the number of flags, clamped at zero.
  virtual std::size_t GetRemainingMines() const = 0;

  // Returns the current game status.
  virtual Status GetStatus() const = 0;

  // Returns the seconds elapsed since the first cell was uncovered, stopping
  // when the game ends.
  virtual double GetElapsedSeconds() const = 0;

  // Returns true if the game is over.
  bool IsGameOver() const { return IsTerminal(GetStatus()); }
};

// Creates a new game. Mines are placed on the first reveal.
//
// Returns nullptr, and sets error if it is not null, if the configuration is
// invalid.
std::unique_ptr<Session> NewSession(const Config& config,
                                    Error* error = nullptr);

// Creates a new game on a board whose mines are already placed.
//
// Returns nullptr if the board has no cells.
std::unique_ptr<Session> NewSession(
    Board board, CascadePolicy policy = CascadePolicy::SKIP_FLAGGED);

}  // namespace sweeper

#endif  // SWEEPER_GAME_SESSION_H_
