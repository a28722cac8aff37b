#ifndef MINEKB_GAME_GAME_H_
#define MINEKB_GAME_GAME_H_

#include <cstddef>
#include <memory>
#include <vector>

#include "minekb/game/cell.h"

namespace minekb {

// A player move.
struct Action {
  enum class Type {
    // Reveal the cell. Revealing a mine loses the game.
    UNCOVER,

    // Reveal every unflagged neighbor of an uncovered cell, provided the cell
    // has exactly as many flagged neighbors as adjacent mines.
    CHORD,

    // Place or remove a flag.
    FLAG,
  };

  Type type;
  Cell cell;
};

inline bool operator==(const Action& a, const Action& b) {
  return a.type == b.type && a.cell == b.cell;
}

// What a subscriber learns about the board. Executing one action may produce
// many events (a flood fill uncovers a whole region).
struct Event {
  enum class Type {
    UNCOVER,
    FLAG,
    UNFLAG,
    WIN,
    LOSS,

    // Sent for every unflagged mine once the game is lost.
    IDENTIFY_MINE,

    // Sent for every flag on a safe cell once the game is lost.
    IDENTIFY_BAD_FLAG,
  };

  Type type;

  // For WIN, the cell whose action ended the game. For LOSS, the mine that
  // was uncovered.
  Cell cell;

  // Mines among the cell's neighbors. Zero for anything but UNCOVER.
  std::size_t adjacent_mines;
};

// Receives the events of every action executed on a game it subscribed to.
class EventSubscriber {
 public:
  virtual ~EventSubscriber() = default;

  virtual void NotifyEvent(const Event& event) = 0;
};

// A minesweeper board. All observers, solvers included, learn about it
// through events.
class Game {
 public:
  enum class State {
    // No action has been executed yet.
    NEW,
    PLAYING,
    WIN,
    LOSS,
  };

  virtual ~Game() = default;

  // Applies the action and notifies every subscriber of the resulting events.
  // Actions on cells outside the board, or after the game ended, are
  // ignored.
  virtual void Execute(const Action& action) = 0;

  // Applies the actions in order until the game ends.
  void Execute(const std::vector<Action>& actions) {
    for (const Action& action : actions) {
      if (IsGameOver()) {
        return;
      }
      Execute(action);
    }
  }

  // The subscriber must outlive the game or be unsubscribed first.
  virtual void Subscribe(EventSubscriber* subscriber) = 0;
  virtual void Unsubscribe(EventSubscriber* subscriber) = 0;

  virtual std::size_t GetRows() const = 0;
  virtual std::size_t GetCols() const = 0;
  virtual std::size_t GetMines() const = 0;
  virtual State GetState() const = 0;

  // Returns true if the cell contains a mine.
  //
  // This reveals hidden information. It exists for tests and debugging output;
  // players and solvers must only learn about the board through events.
  virtual bool IsMine(const Cell& cell) const = 0;

  // Returns the number of mines adjacent to the cell, not counting the cell
  // itself.
  virtual std::size_t NearbyMines(const Cell& cell) const = 0;

  bool IsGameOver() const {
    return GetState() == State::WIN || GetState() == State::LOSS;
  }
};

// Returns a rows x cols game with mines placed by a PRNG seeded with seed.
// The first cell uncovered is never a mine, unless every cell is one.
//
// Returns nullptr if the dimensions are empty or there are more mines than
// cells.
std::unique_ptr<Game> NewGame(std::size_t rows, std::size_t cols,
                              std::size_t mines, unsigned seed);

// Creates a new game with mines at exactly the given cells.
//
// Returns nullptr if the dimensions are empty or any mine lies outside the
// board. Duplicate mine cells are counted once.
std::unique_ptr<Game> NewGame(std::size_t rows, std::size_t cols,
                              const std::vector<Cell>& mines);

}  // namespace minekb

#endif  // MINEKB_GAME_GAME_H_
