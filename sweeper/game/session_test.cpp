#include "sweeper/game/session.h"

#include <cstddef>
#include <limits>
#include <memory>
#include <vector>

#include "gtest/gtest.h"

namespace sweeper {
namespace {

// Records every event it is notified of.
class RecordingSubscriber : public EventSubscriber {
 public:
  void NotifyEvent(const Event& event) final { events_.push_back(event); }

  std::size_t Count(Event::Type type) const {
    std::size_t count = 0;
    for (const Event& event : events_) {
      if (event.type == type) {
        ++count;
      }
    }
    return count;
  }

  const std::vector<Event>& GetEvents() const { return events_; }

  void Clear() { events_.clear(); }

 private:
  std::vector<Event> events_;
};

// A 3x3 game with a single mine in the top left corner.
std::unique_ptr<Session> CornerMineSession() {
  Board board;
  EXPECT_EQ(Board::Build(3, 3, {{0, 0}}, board), Error::NONE);
  return NewSession(board);
}

Config TestConfig(std::size_t rows, std::size_t cols, std::size_t mines,
                  unsigned seed) {
  return Config{rows, cols, mines, seed, CascadePolicy::SKIP_FLAGGED};
}

TEST(SessionTest, NewSessionIsIdle) {
  Error error = Error::OUT_OF_BOUNDS;
  auto session = NewSession(MakeConfig(kBeginnerDifficulty, 1), &error);
  ASSERT_NE(session, nullptr);
  EXPECT_EQ(error, Error::NONE);
  EXPECT_EQ(session->GetStatus(), Status::IDLE);
  EXPECT_EQ(session->GetRows(), 9u);
  EXPECT_EQ(session->GetCols(), 9u);
  EXPECT_EQ(session->GetMines(), 10u);
  EXPECT_EQ(session->GetRemainingMines(), 10u);
  EXPECT_EQ(session->GetElapsedSeconds(), 0.0);
  EXPECT_FALSE(session->IsGameOver());

  const BoardView view = session->GetBoardView();
  EXPECT_EQ(view.status, Status::IDLE);
  view.cells.ForEach(
      [](std::size_t, std::size_t, const ViewCell& cell) {
        EXPECT_EQ(cell.state, ViewState::CLOSED);
      });
}

TEST(SessionTest, InvalidConfiguration) {
  Error error = Error::NONE;
  EXPECT_EQ(NewSession(TestConfig(0, 9, 0, 0), &error), nullptr);
  EXPECT_EQ(error, Error::INVALID_CONFIGURATION);
  EXPECT_EQ(NewSession(TestConfig(3, 3, 9, 0), &error), nullptr);
  EXPECT_EQ(error, Error::INVALID_CONFIGURATION);
  EXPECT_EQ(NewSession(TestConfig(3, 3, 9, 0)), nullptr);
  EXPECT_EQ(NewSession(Board()), nullptr);
}

TEST(SessionTest, RejectsCellCountOverflow) {
  const std::size_t max = std::numeric_limits<std::size_t>::max();
  Error error = Error::NONE;
  EXPECT_EQ(NewSession(TestConfig(max / 2 + 2, 2, 0, 0), &error), nullptr);
  EXPECT_EQ(error, Error::INVALID_CONFIGURATION);
}

TEST(SessionTest, WinAfterLastSafeCell) {
  auto session = CornerMineSession();
  ASSERT_NE(session, nullptr);

  // Flag the empty cells so that each reveal opens exactly one cell.
  const std::vector<CellLocation> empty = {
      {0, 2}, {1, 2}, {2, 0}, {2, 1}, {2, 2}};
  FlagOutcome flag;
  for (const CellLocation& location : empty) {
    ASSERT_EQ(session->ToggleFlag(location.row, location.col, flag),
              Error::NONE);
    ASSERT_TRUE(flag.changed);
  }

  RevealOutcome outcome;
  for (const CellLocation& location :
       std::vector<CellLocation>{{0, 1}, {1, 0}, {1, 1}}) {
    ASSERT_EQ(session->Reveal(location.row, location.col, outcome),
              Error::NONE);
    EXPECT_EQ(outcome.opened.size(), 1u);
    EXPECT_EQ(outcome.status, Status::PLAYING);
  }

  for (std::size_t i = 0; i < empty.size(); ++i) {
    const CellLocation& location = empty[i];
    ASSERT_EQ(session->ToggleFlag(location.row, location.col, flag),
              Error::NONE);
    ASSERT_EQ(flag.state, CellState::CLOSED);
    ASSERT_EQ(session->Reveal(location.row, location.col, outcome),
              Error::NONE);
    EXPECT_EQ(outcome.opened.size(), 1u);
    EXPECT_FALSE(outcome.hit_mine);
    const Status expected =
        i + 1 == empty.size() ? Status::WON : Status::PLAYING;
    EXPECT_EQ(outcome.status, expected);
    EXPECT_EQ(session->GetStatus(), expected);
  }
  EXPECT_TRUE(session->IsGameOver());
}

TEST(SessionTest, LossOnMine) {
  auto session = CornerMineSession();
  ASSERT_NE(session, nullptr);
  RecordingSubscriber subscriber;
  session->Subscribe(&subscriber);

  RevealOutcome outcome;
  ASSERT_EQ(session->Reveal(0, 0, outcome), Error::NONE);
  EXPECT_TRUE(outcome.hit_mine);
  EXPECT_EQ(outcome.status, Status::LOST);
  ASSERT_EQ(outcome.opened.size(), 1u);
  EXPECT_EQ(outcome.opened[0], (CellLocation{0, 0}));
  EXPECT_EQ(session->GetStatus(), Status::LOST);

  ASSERT_EQ(subscriber.GetEvents().size(), 1u);
  EXPECT_EQ(subscriber.GetEvents()[0].type, Event::Type::LOSS);
  EXPECT_EQ(subscriber.GetEvents()[0].row, 0u);
  EXPECT_EQ(subscriber.GetEvents()[0].col, 0u);

  const BoardView view = session->GetBoardView();
  EXPECT_EQ(view.cells(0, 0).state, ViewState::LOSING_MINE);
  EXPECT_EQ(view.cells(2, 2).state, ViewState::CLOSED);
}

TEST(SessionTest, LossRevealsMinesAndBadFlags) {
  Board board;
  ASSERT_EQ(Board::Build(3, 3, {{0, 0}, {0, 2}, {2, 2}}, board), Error::NONE);
  auto session = NewSession(board);
  ASSERT_NE(session, nullptr);
  RecordingSubscriber subscriber;
  session->Subscribe(&subscriber);

  FlagOutcome flag;
  ASSERT_EQ(session->ToggleFlag(0, 2, flag), Error::NONE);
  ASSERT_EQ(session->ToggleFlag(1, 0, flag), Error::NONE);
  subscriber.Clear();

  RevealOutcome outcome;
  ASSERT_EQ(session->Reveal(0, 0, outcome), Error::NONE);
  EXPECT_EQ(outcome.status, Status::LOST);
  EXPECT_EQ(subscriber.Count(Event::Type::IDENTIFY_MINE), 1u);
  EXPECT_EQ(subscriber.Count(Event::Type::IDENTIFY_BAD_FLAG), 1u);
  ASSERT_FALSE(subscriber.GetEvents().empty());
  EXPECT_EQ(subscriber.GetEvents().back().type, Event::Type::LOSS);

  const BoardView view = session->GetBoardView();
  EXPECT_EQ(view.status, Status::LOST);
  EXPECT_EQ(view.cells(0, 0).state, ViewState::LOSING_MINE);
  EXPECT_EQ(view.cells(0, 2).state, ViewState::FLAGGED);
  EXPECT_EQ(view.cells(2, 2).state, ViewState::MINE);
  EXPECT_EQ(view.cells(1, 0).state, ViewState::BAD_FLAG);
  EXPECT_EQ(view.cells(1, 1).state, ViewState::CLOSED);
}

TEST(SessionTest, FinishedGameIgnoresActions) {
  auto session = CornerMineSession();
  ASSERT_NE(session, nullptr);
  RevealOutcome outcome;
  ASSERT_EQ(session->Reveal(0, 0, outcome), Error::NONE);
  ASSERT_EQ(session->GetStatus(), Status::LOST);

  ASSERT_EQ(session->Reveal(2, 2, outcome), Error::NONE);
  EXPECT_TRUE(outcome.opened.empty());
  EXPECT_EQ(outcome.status, Status::LOST);

  FlagOutcome flag;
  ASSERT_EQ(session->ToggleFlag(2, 2, flag), Error::NONE);
  EXPECT_FALSE(flag.changed);
  EXPECT_EQ(flag.state, CellState::CLOSED);

  ASSERT_EQ(session->Chord(0, 0, outcome), Error::NONE);
  EXPECT_TRUE(outcome.opened.empty());
  EXPECT_EQ(session->GetStatus(), Status::LOST);
}

TEST(SessionTest, FirstRevealIsSafe) {
  for (unsigned seed = 0; seed < 25; ++seed) {
    const std::size_t row = seed % 9;
    const std::size_t col = (seed * 7) % 9;
    auto session = NewSession(TestConfig(9, 9, 72, seed));
    ASSERT_NE(session, nullptr);

    RevealOutcome outcome;
    ASSERT_EQ(session->Reveal(row, col, outcome), Error::NONE);
    EXPECT_FALSE(outcome.hit_mine);
    EXPECT_NE(outcome.status, Status::LOST);

    const BoardView view = session->GetBoardView();
    EXPECT_EQ(view.cells(row, col).state, ViewState::OPEN);
    EXPECT_EQ(view.cells(row, col).adjacent_mines, 0u);
  }
}

TEST(SessionTest, FirstRevealWithFullBoardWins) {
  // 72 mines on a 9x9 board leave only the safe zone free.
  auto session = NewSession(TestConfig(9, 9, 72, 42));
  ASSERT_NE(session, nullptr);
  RevealOutcome outcome;
  ASSERT_EQ(session->Reveal(4, 4, outcome), Error::NONE);
  EXPECT_EQ(outcome.opened.size(), 9u);
  EXPECT_EQ(outcome.status, Status::WON);
}

TEST(SessionTest, RevealTwiceIsNoOp) {
  auto session = NewSession(MakeConfig(kIntermediateDifficulty, 3));
  ASSERT_NE(session, nullptr);
  RevealOutcome first;
  ASSERT_EQ(session->Reveal(8, 8, first), Error::NONE);
  EXPECT_FALSE(first.opened.empty());

  RevealOutcome second;
  ASSERT_EQ(session->Reveal(8, 8, second), Error::NONE);
  EXPECT_TRUE(second.opened.empty());
  EXPECT_EQ(second.status, first.status);
}

TEST(SessionTest, FlagsPlacedBeforeFirstRevealAreKept) {
  auto session = NewSession(MakeConfig(kBeginnerDifficulty, 11));
  ASSERT_NE(session, nullptr);
  FlagOutcome flag;
  ASSERT_EQ(session->ToggleFlag(0, 0, flag), Error::NONE);
  EXPECT_TRUE(flag.changed);
  EXPECT_EQ(flag.state, CellState::FLAGGED);
  EXPECT_EQ(session->GetStatus(), Status::IDLE);

  // Revealing a flagged cell does not start the game.
  RevealOutcome outcome;
  ASSERT_EQ(session->Reveal(0, 0, outcome), Error::NONE);
  EXPECT_TRUE(outcome.opened.empty());
  EXPECT_EQ(session->GetStatus(), Status::IDLE);

  ASSERT_EQ(session->Reveal(8, 8, outcome), Error::NONE);
  EXPECT_NE(session->GetStatus(), Status::IDLE);
  const BoardView view = session->GetBoardView();
  EXPECT_EQ(view.cells(0, 0).state, ViewState::FLAGGED);
  EXPECT_EQ(session->GetRemainingMines(), 9u);
}

TEST(SessionTest, FlagRoundTripKeepsStatus) {
  auto session = CornerMineSession();
  ASSERT_NE(session, nullptr);
  RevealOutcome outcome;
  ASSERT_EQ(session->Reveal(1, 1, outcome), Error::NONE);
  ASSERT_EQ(session->GetStatus(), Status::PLAYING);
  const BoardView before = session->GetBoardView();

  FlagOutcome flag;
  ASSERT_EQ(session->ToggleFlag(2, 2, flag), Error::NONE);
  EXPECT_EQ(flag.row, 2u);
  EXPECT_EQ(flag.col, 2u);
  EXPECT_EQ(flag.state, CellState::FLAGGED);
  EXPECT_EQ(session->GetStatus(), Status::PLAYING);
  EXPECT_EQ(session->GetRemainingMines(), 0u);

  ASSERT_EQ(session->ToggleFlag(2, 2, flag), Error::NONE);
  EXPECT_EQ(flag.state, CellState::CLOSED);
  EXPECT_EQ(session->GetStatus(), Status::PLAYING);
  EXPECT_EQ(session->GetRemainingMines(), 1u);

  const BoardView after = session->GetBoardView();
  after.cells.ForEach(
      [&before](std::size_t row, std::size_t col, const ViewCell& cell) {
        EXPECT_EQ(cell.state, before.cells(row, col).state);
        EXPECT_EQ(cell.adjacent_mines, before.cells(row, col).adjacent_mines);
      });
}

TEST(SessionTest, FlaggingOpenCellIsIgnored) {
  auto session = CornerMineSession();
  ASSERT_NE(session, nullptr);
  RevealOutcome outcome;
  ASSERT_EQ(session->Reveal(1, 1, outcome), Error::NONE);

  RecordingSubscriber subscriber;
  session->Subscribe(&subscriber);
  FlagOutcome flag;
  ASSERT_EQ(session->ToggleFlag(1, 1, flag), Error::NONE);
  EXPECT_FALSE(flag.changed);
  EXPECT_EQ(flag.state, CellState::OPEN);
  EXPECT_TRUE(subscriber.GetEvents().empty());
}

TEST(SessionTest, ChordWinsGame) {
  auto session = CornerMineSession();
  ASSERT_NE(session, nullptr);
  RecordingSubscriber subscriber;
  session->Subscribe(&subscriber);

  RevealOutcome outcome;
  ASSERT_EQ(session->Reveal(1, 1, outcome), Error::NONE);
  FlagOutcome flag;
  ASSERT_EQ(session->ToggleFlag(0, 0, flag), Error::NONE);
  ASSERT_EQ(session->Chord(1, 1, outcome), Error::NONE);
  EXPECT_EQ(outcome.opened.size(), 7u);
  EXPECT_EQ(outcome.status, Status::WON);

  EXPECT_EQ(subscriber.Count(Event::Type::OPEN), 8u);
  EXPECT_EQ(subscriber.Count(Event::Type::FLAG), 1u);
  EXPECT_EQ(subscriber.Count(Event::Type::WIN), 1u);
  EXPECT_EQ(subscriber.GetEvents().back().type, Event::Type::WIN);
}

TEST(SessionTest, ChordBeforeFirstRevealIsNoOp) {
  auto session = NewSession(MakeConfig(kBeginnerDifficulty, 0));
  ASSERT_NE(session, nullptr);
  RevealOutcome outcome;
  ASSERT_EQ(session->Chord(4, 4, outcome), Error::NONE);
  EXPECT_TRUE(outcome.opened.empty());
  EXPECT_EQ(outcome.status, Status::IDLE);
}

TEST(SessionTest, OpenEventsCarryAdjacentMines) {
  auto session = CornerMineSession();
  ASSERT_NE(session, nullptr);
  RecordingSubscriber subscriber;
  session->Subscribe(&subscriber);

  RevealOutcome outcome;
  ASSERT_EQ(session->Reveal(0, 1, outcome), Error::NONE);
  ASSERT_EQ(subscriber.GetEvents().size(), 1u);
  const Event& event = subscriber.GetEvents()[0];
  EXPECT_EQ(event.type, Event::Type::OPEN);
  EXPECT_EQ(event.row, 0u);
  EXPECT_EQ(event.col, 1u);
  EXPECT_EQ(event.adjacent_mines, 1u);

  const BoardView view = session->GetBoardView();
  EXPECT_EQ(view.cells(0, 1).state, ViewState::OPEN);
  EXPECT_EQ(view.cells(0, 1).adjacent_mines, 1u);
  EXPECT_EQ(view.cells(0, 0).state, ViewState::CLOSED);
}

TEST(SessionTest, CascadePolicyIsConfigurable) {
  Board board;
  ASSERT_EQ(Board::Build(3, 3, {{0, 0}}, board), Error::NONE);
  auto session = NewSession(board, CascadePolicy::OPEN_FLAGGED);
  ASSERT_NE(session, nullptr);
  RecordingSubscriber subscriber;
  session->Subscribe(&subscriber);

  FlagOutcome flag;
  ASSERT_EQ(session->ToggleFlag(2, 0, flag), Error::NONE);
  EXPECT_EQ(session->GetRemainingMines(), 0u);
  RevealOutcome outcome;
  ASSERT_EQ(session->Reveal(2, 2, outcome), Error::NONE);
  EXPECT_EQ(outcome.opened.size(), 8u);
  ASSERT_EQ(outcome.unflagged.size(), 1u);
  EXPECT_EQ(outcome.unflagged[0], (CellLocation{2, 0}));
  EXPECT_EQ(outcome.status, Status::WON);

  // Flag counts kept from events agree with the session.
  EXPECT_EQ(subscriber.Count(Event::Type::FLAG), 1u);
  EXPECT_EQ(subscriber.Count(Event::Type::UNFLAG), 1u);
  EXPECT_EQ(session->GetRemainingMines(), 1u);

  // The cell is unflagged before it is opened.
  const std::vector<Event>& events = subscriber.GetEvents();
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (events[i].type == Event::Type::UNFLAG) {
      ASSERT_LT(i + 1, events.size());
      EXPECT_EQ(events[i + 1].type, Event::Type::OPEN);
      EXPECT_EQ(events[i + 1].row, 2u);
      EXPECT_EQ(events[i + 1].col, 0u);
    }
  }
}

TEST(SessionTest, OutOfBounds) {
  auto session = NewSession(MakeConfig(kBeginnerDifficulty, 0));
  ASSERT_NE(session, nullptr);
  RevealOutcome outcome;
  EXPECT_EQ(session->Reveal(9, 0, outcome), Error::OUT_OF_BOUNDS);
  EXPECT_EQ(session->Chord(0, 9, outcome), Error::OUT_OF_BOUNDS);
  FlagOutcome flag;
  EXPECT_EQ(session->ToggleFlag(9, 9, flag), Error::OUT_OF_BOUNDS);
  EXPECT_FALSE(flag.changed);
  EXPECT_EQ(session->GetStatus(), Status::IDLE);
}

TEST(SessionTest, ElapsedTimeStopsWhenGameEnds) {
  auto session = CornerMineSession();
  ASSERT_NE(session, nullptr);
  EXPECT_EQ(session->GetElapsedSeconds(), 0.0);

  RevealOutcome outcome;
  ASSERT_EQ(session->Reveal(0, 0, outcome), Error::NONE);
  const double elapsed = session->GetElapsedSeconds();
  EXPECT_GE(elapsed, 0.0);
  EXPECT_EQ(session->GetElapsedSeconds(), elapsed);
}

TEST(SessionTest, SameSeedSameGame) {
  auto a = NewSession(MakeConfig(kExpertDifficulty, 77));
  auto b = NewSession(MakeConfig(kExpertDifficulty, 77));
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);

  RevealOutcome outcome_a;
  RevealOutcome outcome_b;
  ASSERT_EQ(a->Reveal(5, 5, outcome_a), Error::NONE);
  ASSERT_EQ(b->Reveal(5, 5, outcome_b), Error::NONE);
  EXPECT_EQ(outcome_a.opened, outcome_b.opened);
}

}  // namespace
}  // namespace sweeper
