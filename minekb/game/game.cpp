#include "minekb/game/game.h"

#include <algorithm>
#include <queue>
#include <random>
#include <utility>

#include "minekb/game/grid.h"

namespace minekb {

namespace {

// Builds an UNCOVER event.
Event UncoverEvent(const Cell& cell, std::size_t adjacent_mines) {
  return Event{Event::Type::UNCOVER, cell, adjacent_mines};
}

// Convenience function to create an event that carries no mine count.
Event SimpleEvent(Event::Type type, const Cell& cell) {
  return Event{type, cell, 0};
}

// A single square of the board.
class Square {
 public:
  // Returns true if the square contains a mine.
  bool IsMine() const { return is_mine_; }

  // Sets this square as a mine.
  //
  // Returns false if the square was already a mine.
  bool SetMine() {
    if (is_mine_) {
      return false;
    }
    is_mine_ = true;
    return true;
  }

  // Returns true if the square is flagged.
  bool IsFlagged() const { return state_ == State::FLAGGED; }

  // Returns true if the square is covered.
  bool IsCovered() const { return state_ == State::COVERED; }

  // Returns true if the square is flagged or covered.
  bool IsFlaggedOrCovered() const {
    return state_ == State::COVERED || state_ == State::FLAGGED;
  }

  // Toggles a square between flagged and covered.
  //
  // Returns false if the square is uncovered.
  bool ToggleFlagged() {
    switch (state_) {
      case State::COVERED:
        state_ = State::FLAGGED;
        return true;
      case State::FLAGGED:
        state_ = State::COVERED;
        return true;
      case State::UNCOVERED:
      default:
        return false;
    }
  }

  // Uncovers the square if it is covered.
  //
  // Returns false (and does nothing) if the square is flagged or uncovered.
  bool Uncover() {
    if (state_ != State::COVERED) {
      return false;
    }
    state_ = State::UNCOVERED;
    return true;
  }

 private:
  enum class State {
    COVERED,
    UNCOVERED,
    FLAGGED,
  };

  bool is_mine_ = false;
  State state_ = State::COVERED;
};

// A board held in a Grid of Squares.
class GameImpl : public Game {
 public:
  // Creates a game whose mines are placed by a PRNG. The first uncovered cell
  // is swapped with a spare safe cell if it would have been a mine.
  GameImpl(std::size_t rows, std::size_t cols, std::size_t mines,
           unsigned seed)
      : grid_(rows, cols) {
    std::default_random_engine rng(seed);
    std::uniform_int_distribution<std::size_t> d(0, rows * cols - 1);
    auto random_cell = [&]() {
      const std::size_t rnd = d(rng);
      return Cell{rnd / cols, rnd % cols};
    };

    for (std::size_t remaining_mines = mines; remaining_mines > 0;) {
      if (grid_(random_cell()).SetMine()) {
        --remaining_mines;
      }
    }
    mines_ = mines;

    // A board made only of mines has no safe square to swap with.
    if (mines < rows * cols) {
      do {
        backup_cell_ = random_cell();
      } while (grid_(backup_cell_).IsMine());
      has_backup_cell_ = true;
    }
    remaining_covered_ = rows * cols - mines_;
  }

  // Creates a game with a fixed mine layout.
  GameImpl(std::size_t rows, std::size_t cols, const std::vector<Cell>& mines)
      : grid_(rows, cols) {
    for (const Cell& cell : mines) {
      if (grid_(cell).SetMine()) {
        ++mines_;
      }
    }
    remaining_covered_ = rows * cols - mines_;
  }

  ~GameImpl() final = default;

  void Execute(const Action& action) final {
    if (IsGameOver() || !grid_.IsValid(action.cell)) {
      return;
    }

    std::vector<Event> events;
    switch (action.type) {
      case Action::Type::UNCOVER:
        Uncover(action.cell, events);
        break;
      case Action::Type::CHORD:
        Chord(action.cell, events);
        break;
      case Action::Type::FLAG:
        ToggleFlagged(action.cell, events);
        break;
    }

    if (state_ == State::NEW) {
      state_ = State::PLAYING;
    }

    // Subscribers may unsubscribe while being notified.
    const std::vector<EventSubscriber*> subscribers = subscribers_;
    for (const Event& event : events) {
      for (EventSubscriber* subscriber : subscribers) {
        subscriber->NotifyEvent(event);
      }
    }
  }

  void Subscribe(EventSubscriber* subscriber) final {
    subscribers_.push_back(subscriber);
  }

  void Unsubscribe(EventSubscriber* subscriber) final {
    subscribers_.erase(
        std::remove(subscribers_.begin(), subscribers_.end(), subscriber),
        subscribers_.end());
  }

  std::size_t GetRows() const final { return grid_.GetRows(); }

  std::size_t GetCols() const final { return grid_.GetCols(); }

  std::size_t GetMines() const final { return mines_; }

  State GetState() const final { return state_; }

  bool IsMine(const Cell& cell) const final {
    return grid_.IsValid(cell) && grid_(cell).IsMine();
  }

  std::size_t NearbyMines(const Cell& cell) const final {
    if (!grid_.IsValid(cell)) {
      return 0;
    }
    return grid_.ForEachAdjacent(
        cell,
        [this](const Cell& adjacent) { return grid_(adjacent).IsMine(); });
  }

 private:
  // On the first move a mine under the cell trades places with the backup
  // cell.
  void Uncover(const Cell& cell, std::vector<Event>& events) {
    if (state_ == State::NEW && has_backup_cell_ && grid_(cell).IsMine()) {
      std::swap(grid_(cell), grid_(backup_cell_));
    }

    UncoverAdjacent(cell, true, events);
  }

  // Uncovers the unflagged neighbors once the flags around cell account for
  // all of its mines.
  void Chord(const Cell& cell, std::vector<Event>& events) {
    // Only an uncovered number can be chorded.
    if (grid_(cell).IsFlaggedOrCovered()) {
      return;
    }

    const std::size_t flagged = grid_.ForEachAdjacent(
        cell,
        [this](const Cell& adjacent) { return grid_(adjacent).IsFlagged(); });
    if (NearbyMines(cell) != flagged) {
      return;
    }

    UncoverAdjacent(cell, false, events);
  }

  // Flagging exactly the set of mines wins the game.
  void ToggleFlagged(const Cell& cell, std::vector<Event>& events) {
    Square& square = grid_(cell);
    if (!square.ToggleFlagged()) {
      return;
    }

    if (square.IsFlagged()) {
      ++flagged_;
      correctly_flagged_ += square.IsMine() ? 1 : 0;
      events.push_back(SimpleEvent(Event::Type::FLAG, cell));
    } else {
      --flagged_;
      correctly_flagged_ -= square.IsMine() ? 1 : 0;
      events.push_back(SimpleEvent(Event::Type::UNFLAG, cell));
    }

    if (mines_ > 0 && flagged_ == mines_ && correctly_flagged_ == mines_) {
      events.push_back(SimpleEvent(Event::Type::WIN, cell));
      state_ = State::WIN;
    }
  }

  // Breadth first flood fill seeded with start itself, or with its neighbors
  // when start_at_current is false.
  void UncoverAdjacent(const Cell& start, bool start_at_current,
                       std::vector<Event>& events) {
    std::queue<Cell> uncover_queue;
    auto queue_cell = [this, &uncover_queue](const Cell& cell) {
      if (grid_(cell).IsCovered()) {
        uncover_queue.push(cell);
      }
      return false;
    };
    if (start_at_current) {
      uncover_queue.push(start);
    } else {
      grid_.ForEachAdjacent(start, queue_cell);
    }

    while (!uncover_queue.empty()) {
      const Cell cell = uncover_queue.front();
      uncover_queue.pop();
      Square& square = grid_(cell);

      if (!square.Uncover()) {
        // Flagged, or reached twice.
        continue;
      }

      if (square.IsMine()) {
        ShowAllMinesAndLose(cell, events);
        return;
      }

      const std::size_t adjacent_mines = NearbyMines(cell);
      events.push_back(UncoverEvent(cell, adjacent_mines));
      --remaining_covered_;

      if (remaining_covered_ == 0) {
        events.push_back(SimpleEvent(Event::Type::WIN, cell));
        state_ = State::WIN;
        return;
      }

      // A zero opens its whole neighborhood.
      if (adjacent_mines == 0) {
        grid_.ForEachAdjacent(cell, queue_cell);
      }
    }
  }

  // Generates events to show all mines and bad flags, followed by a loss event
  // at the given location.
  void ShowAllMinesAndLose(const Cell& losing_cell,
                           std::vector<Event>& events) {
    grid_.ForEach([&events, &losing_cell](const Cell& cell,
                                          const Square& square) {
      if (cell == losing_cell) {
        return;
      }
      if (square.IsMine() && !square.IsFlagged()) {
        events.push_back(SimpleEvent(Event::Type::IDENTIFY_MINE, cell));
      } else if (!square.IsMine() && square.IsFlagged()) {
        events.push_back(SimpleEvent(Event::Type::IDENTIFY_BAD_FLAG, cell));
      }
    });

    events.push_back(SimpleEvent(Event::Type::LOSS, losing_cell));
    state_ = State::LOSS;
  }

  std::size_t mines_ = 0;
  State state_ = State::NEW;
  std::size_t remaining_covered_ = 0;
  std::size_t flagged_ = 0;
  std::size_t correctly_flagged_ = 0;
  Grid<Square> grid_;
  bool has_backup_cell_ = false;
  Cell backup_cell_{0, 0};
  std::vector<EventSubscriber*> subscribers_;
};

}  // namespace

std::unique_ptr<Game> NewGame(std::size_t rows, std::size_t cols,
                              std::size_t mines, unsigned seed) {
  if (rows == 0 || cols == 0 || mines > rows * cols) {
    return nullptr;
  }
  return std::make_unique<GameImpl>(rows, cols, mines, seed);
}

std::unique_ptr<Game> NewGame(std::size_t rows, std::size_t cols,
                              const std::vector<Cell>& mines) {
  if (rows == 0 || cols == 0) {
    return nullptr;
  }
  for (const Cell& cell : mines) {
    if (cell.row >= rows || cell.col >= cols) {
      return nullptr;
    }
  }
  return std::make_unique<GameImpl>(rows, cols, mines);
}

}  // namespace minekb
