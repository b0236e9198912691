#include "sweeper/game/session.h"

#include <algorithm>
#include <memory>
#include <utility>

#include <glib.h>
#include <glibmm/timer.h>

#include "sweeper/game/flag.h"
#include "sweeper/game/generator.h"

namespace sweeper {

namespace {

// Convenience function to create an OPEN event.
constexpr Event OpenEvent(std::size_t row, std::size_t col,
                          std::size_t adjacent_mines) {
  return Event{Event::Type::OPEN, row, col, adjacent_mines};
}

// Convenience function to create a FLAG event.
constexpr Event FlagEvent(std::size_t row, std::size_t col) {
  return Event{Event::Type::FLAG, row, col, 0};
}

// Convenience function to create an UNFLAG event.
constexpr Event UnflagEvent(std::size_t row, std::size_t col) {
  return Event{Event::Type::UNFLAG, row, col, 0};
}

// Convenience function to create a WIN event.
constexpr Event WinEvent(std::size_t row, std::size_t col) {
  return Event{Event::Type::WIN, row, col, 0};
}

// Convenience function to create a LOSS event.
constexpr Event LossEvent(std::size_t row, std::size_t col) {
  return Event{Event::Type::LOSS, row, col, 0};
}

// Convenience function to create an IDENTIFY_MINE event.
constexpr Event IdentifyMineEvent(std::size_t row, std::size_t col) {
  return Event{Event::Type::IDENTIFY_MINE, row, col, 0};
}

// Convenience function to create an IDENTIFY_BAD_FLAG event.
constexpr Event IdentifyBadFlagEvent(std::size_t row, std::size_t col) {
  return Event{Event::Type::IDENTIFY_BAD_FLAG, row, col, 0};
}

// The session implementation.
class SessionImpl : public Session {
 public:
  // A session whose mines are placed on the first reveal.
  explicit SessionImpl(const Config& config)
      : mines_(config.mines),
        seed_(config.seed),
        policy_(config.cascade_policy),
        mines_placed_(false),
        status_(Status::IDLE),
        board_(config.rows, config.cols) {}

  // A session on a board whose mines are already placed.
  SessionImpl(Board board, CascadePolicy policy)
      : mines_(board.GetMines()),
        seed_(0),
        policy_(policy),
        mines_placed_(true),
        status_(Status::IDLE),
        board_(std::move(board)) {}

  ~SessionImpl() final = default;

  Error Reveal(std::size_t row, std::size_t col,
               RevealOutcome& outcome) final {
    outcome = RevealOutcome();
    outcome.status = status_;
    if (!board_.IsValid(row, col)) {
      g_warning("Reveal at (%zu, %zu) is outside a %zux%zu board", row, col,
                GetRows(), GetCols());
      return Error::OUT_OF_BOUNDS;
    }
    if (IsGameOver() || !board_(row, col).IsClosed()) {
      return Error::NONE;
    }

    if (status_ == Status::IDLE) {
      if (!mines_placed_) {
        const Error error = PlaceMines(row, col);
        if (error != Error::NONE) {
          return error;
        }
      }
      SetStatus(Status::PLAYING);
      timer_.start();
    }

    RevealResult result;
    const Error error = sweeper::Reveal(board_, row, col, policy_, result);
    if (error != Error::NONE) {
      return error;
    }
    Finish(result, outcome);
    return Error::NONE;
  }

  Error ToggleFlag(std::size_t row, std::size_t col,
                   FlagOutcome& outcome) final {
    outcome = FlagOutcome();
    outcome.row = row;
    outcome.col = col;
    if (!board_.IsValid(row, col)) {
      g_warning("Flag at (%zu, %zu) is outside a %zux%zu board", row, col,
                GetRows(), GetCols());
      return Error::OUT_OF_BOUNDS;
    }

    const CellState before = board_(row, col).GetState();
    outcome.state = before;
    if (IsGameOver()) {
      return Error::NONE;
    }

    const Error error = sweeper::ToggleFlag(board_, row, col, outcome.state);
    if (error != Error::NONE) {
      return error;
    }
    outcome.changed = outcome.state != before;

    if (outcome.changed) {
      Notify(std::vector<Event>{outcome.state == CellState::FLAGGED
                                    ? FlagEvent(row, col)
                                    : UnflagEvent(row, col)});
    }
    return Error::NONE;
  }

  Error Chord(std::size_t row, std::size_t col, RevealOutcome& outcome) final {
    outcome = RevealOutcome();
    outcome.status = status_;
    if (!board_.IsValid(row, col)) {
      g_warning("Chord at (%zu, %zu) is outside a %zux%zu board", row, col,
                GetRows(), GetCols());
      return Error::OUT_OF_BOUNDS;
    }
    if (status_ != Status::PLAYING) {
      return Error::NONE;
    }

    RevealResult result;
    const Error error = sweeper::Chord(board_, row, col, policy_, result);
    if (error != Error::NONE) {
      return error;
    }
    Finish(result, outcome);
    return Error::NONE;
  }

  void Subscribe(EventSubscriber* subscriber) final {
    subscribers_.push_back(subscriber);
  }

  BoardView GetBoardView() const final {
    BoardView view;
    view.status = status_;
    view.remaining_mines = GetRemainingMines();
    view.cells.Reset(GetRows(), GetCols());

    const bool lost = status_ == Status::LOST;
    board_.ForEach([lost, &view](std::size_t row, std::size_t col,
                                 const Cell& cell) {
      ViewCell& view_cell = view.cells(row, col);
      switch (cell.GetState()) {
        case CellState::OPEN:
          if (cell.IsMine()) {
            // Only possible once the game is lost.
            view_cell.state = ViewState::LOSING_MINE;
          } else {
            view_cell.state = ViewState::OPEN;
            view_cell.adjacent_mines = cell.GetAdjacentMines();
          }
          break;
        case CellState::FLAGGED:
          view_cell.state = lost && !cell.IsMine() ? ViewState::BAD_FLAG
                                                   : ViewState::FLAGGED;
          break;
        case CellState::CLOSED:
          view_cell.state =
              lost && cell.IsMine() ? ViewState::MINE : ViewState::CLOSED;
          break;
      }
    });
    return view;
  }

  std::size_t GetRows() const final { return board_.GetRows(); }

  std::size_t GetCols() const final { return board_.GetCols(); }

  std::size_t GetMines() const final { return mines_; }

  std::size_t GetRemainingMines() const final {
    const std::size_t flags = board_.GetFlags();
    return flags < mines_ ? mines_ - flags : 0;
  }

  Status GetStatus() const final { return status_; }

  double GetElapsedSeconds() const final {
    if (status_ == Status::IDLE) {
      return 0;
    }
    return timer_.elapsed();
  }

 private:
  // Replaces the empty board with one holding the mines, sparing the cell at
  // (row, col) and its neighbors. Flags already placed are kept.
  Error PlaceMines(std::size_t row, std::size_t col) {
    Board generated;
    const Error error = GenerateBoard(GetRows(), GetCols(), mines_, row, col,
                                      seed_, generated);
    if (error != Error::NONE) {
      return error;
    }

    board_.ForEach([&generated](std::size_t row, std::size_t col,
                                const Cell& cell) {
      if (cell.IsFlagged()) {
        generated.ToggleFlagged(row, col);
      }
    });

    board_ = std::move(generated);
    mines_placed_ = true;
    return Error::NONE;
  }

  // Updates the status after a reveal or chord, fills in the outcome, and
  // notifies subscribers of the changes.
  void Finish(const RevealResult& result, RevealOutcome& outcome) {
    SetStatus(Evaluate(board_, result));
    outcome.opened = result.opened;
    outcome.unflagged = result.unflagged;
    outcome.hit_mine = result.hit_mine;
    outcome.status = status_;

    std::vector<Event> events;
    for (const CellLocation& location : result.opened) {
      if (std::find(result.unflagged.begin(), result.unflagged.end(),
                    location) != result.unflagged.end()) {
        events.push_back(UnflagEvent(location.row, location.col));
      }
      const Cell& cell = board_(location.row, location.col);
      if (!cell.IsMine()) {
        events.push_back(
            OpenEvent(location.row, location.col, cell.GetAdjacentMines()));
      }
    }

    if (IsGameOver() && !result.opened.empty()) {
      timer_.stop();
      const CellLocation& last = result.opened.back();
      if (status_ == Status::LOST) {
        ShowAllMinesAndLose(last.row, last.col, events);
      } else {
        events.push_back(WinEvent(last.row, last.col));
      }
    }

    Notify(events);
  }

  // Generates events to show all mines and bad flags, followed by a loss event
  // at the given location.
  void ShowAllMinesAndLose(std::size_t row, std::size_t col,
                           std::vector<Event>& events) const {
    board_.ForEach(
        [&events](std::size_t row, std::size_t col, const Cell& cell) {
          if (cell.IsMine() && cell.IsClosed()) {
            events.push_back(IdentifyMineEvent(row, col));
          } else if (!cell.IsMine() && cell.IsFlagged()) {
            events.push_back(IdentifyBadFlagEvent(row, col));
          }
        });

    events.push_back(LossEvent(row, col));
  }

  void SetStatus(Status status) {
    if (status != status_) {
      g_debug("Game status %s -> %s", StatusToString(status_),
              StatusToString(status));
      status_ = status;
    }
  }

  void Notify(const std::vector<Event>& events) const {
    for (const Event& event : events) {
      for (EventSubscriber* subscriber : subscribers_) {
        subscriber->NotifyEvent(event);
      }
    }
  }

  const std::size_t mines_;
  const unsigned seed_;
  const CascadePolicy policy_;
  bool mines_placed_;
  Status status_;
  Board board_;
  Glib::Timer timer_;
  std::vector<EventSubscriber*> subscribers_;
};

}  // namespace

std::unique_ptr<Session> NewSession(const Config& config, Error* error) {
  const Error validation = ValidateConfig(config);
  if (error != nullptr) {
    *error = validation;
  }
  if (validation != Error::NONE) {
    g_warning("Cannot create a %zux%zu game with %zu mines", config.rows,
              config.cols, config.mines);
    return nullptr;
  }
  return std::make_unique<SessionImpl>(config);
}

std::unique_ptr<Session> NewSession(Board board, CascadePolicy policy) {
  if (board.GetSize() == 0) {
    g_warning("Cannot create a game on an empty board");
    return nullptr;
  }
  return std::make_unique<SessionImpl>(std::move(board), policy);
}

}  // namespace sweeper
