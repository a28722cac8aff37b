#include "minekb/ui/text_ui.h"

#include <cstddef>
#include <ios>
#include <istream>
#include <limits>
#include <ostream>
#include <string>
#include <vector>

#include "minekb/game/grid.h"

namespace minekb {
namespace ui {

namespace {

// How a cell is drawn.
enum class Mark {
  COVERED,
  UNCOVERED,
  FLAGGED,

  // Revealed after a loss.
  MINE,
  LOSING_MINE,
  BAD_FLAG,
};

// The board as the player sees it, rebuilt from events.
class BoardView : public EventSubscriber {
 public:
  BoardView(std::size_t rows, std::size_t cols) : grid_(rows, cols) {}

  void NotifyEvent(const Event& event) final {
    if (!grid_.IsValid(event.cell)) {
      return;
    }
    Square& square = grid_(event.cell);
    switch (event.type) {
      case Event::Type::UNCOVER:
        square.mark = Mark::UNCOVERED;
        square.adjacent_mines = event.adjacent_mines;
        break;
      case Event::Type::FLAG:
        square.mark = Mark::FLAGGED;
        break;
      case Event::Type::UNFLAG:
        square.mark = Mark::COVERED;
        break;
      case Event::Type::WIN:
        // No new knowledge.
        break;
      case Event::Type::LOSS:
        square.mark = Mark::LOSING_MINE;
        break;
      case Event::Type::IDENTIFY_MINE:
        square.mark = Mark::MINE;
        break;
      case Event::Type::IDENTIFY_BAD_FLAG:
        square.mark = Mark::BAD_FLAG;
        break;
    }
  }

  void Print(std::ostream& out) const {
    const std::size_t rows = grid_.GetRows();
    const std::size_t cols = grid_.GetCols();

    for (std::size_t row = 0; row < rows; ++row) {
      for (std::size_t col = 0; col < cols; ++col) {
        const Square& square = grid_(Cell{row, col});
        switch (square.mark) {
          case Mark::UNCOVERED:
            out << square.adjacent_mines;
            break;
          case Mark::COVERED:
            out << '-';
            break;
          case Mark::FLAGGED:
            out << 'F';
            break;
          case Mark::MINE:
            out << '*';
            break;
          case Mark::LOSING_MINE:
            out << 'X';
            break;
          case Mark::BAD_FLAG:
            out << '!';
            break;
        }
        out << ' ';
      }
      out << '\n';
    }
    out << '\n';
  }

 private:
  // What the player knows about a cell.
  struct Square {
    Mark mark = Mark::COVERED;

    // The number of adjacent mines.
    // Only valid if the mark is UNCOVERED.
    std::size_t adjacent_mines = 0;
  };

  Grid<Square> grid_;
};

class TextUiImpl : public TextUi {
 public:
  TextUiImpl(std::istream& in, std::ostream& out) : in_(in), out_(out) {}
  ~TextUiImpl() final = default;

  void Play(Game& game, solver::Solver& solver) final {
    BoardView view(game.GetRows(), game.GetCols());
    game.Subscribe(&view);

    bool quit = false;
    while (!quit && !game.IsGameOver()) {
      view.Print(out_);

      std::vector<Action> actions = solver.Analyze();
      if (actions.empty()) {
        // Analysis produced no actions. Get action from user.
        Action action;
        if (GetActionFromPlayer(solver, &action)) {
          actions.push_back(action);
        } else {
          quit = true;
        }
      }
      game.Execute(actions);
    }

    view.Print(out_);
    game.Unsubscribe(&view);

    if (game.GetState() == Game::State::WIN) {
      out_ << "You win!\n\n";
    } else if (game.GetState() == Game::State::LOSS) {
      out_ << "You lose.\n\n";
    }
  }

 private:
  // Prompts until the player enters a valid command.
  //
  // Returns false if the player quits or the input ends.
  bool GetActionFromPlayer(solver::Solver& solver, Action* action) {
    for (;;) {
      out_ << "Command: ";

      in_ >> std::ws;
      const int c = in_.get();
      if (c == std::char_traits<char>::eof()) {
        out_ << '\n';
        return false;
      }

      bool fail = false;
      switch (c) {
        case 'u':
        case 'U':
          action->type = Action::Type::UNCOVER;
          in_ >> action->cell.row >> action->cell.col;
          break;
        case 'c':
        case 'C':
          action->type = Action::Type::CHORD;
          in_ >> action->cell.row >> action->cell.col;
          break;
        case 'f':
        case 'F':
          action->type = Action::Type::FLAG;
          in_ >> action->cell.row >> action->cell.col;
          break;
        case 'a':
        case 'A':
          fail = !Suggest(solver, action);
          break;
        case 'q':
        case 'Q':
          return false;
        default:
          fail = true;
          out_ << "Invalid command.\n";
      }
      if (!in_) {
        fail = true;
        out_ << "Invalid command.\n";
      }

      in_.clear();
      in_.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

      if (!fail) {
        return true;
      }
    }
  }

  // Fills action with the solver's suggested move.
  bool Suggest(solver::Solver& solver, Action* action) {
    solver::Suggestion suggestion;
    if (!solver.Suggest(&suggestion)) {
      out_ << "No suggestion.\n";
      return false;
    }
    out_ << (suggestion.guess ? "Guessing " : "Uncovering safe cell ")
         << suggestion.cell << ".\n";
    action->type = Action::Type::UNCOVER;
    action->cell = suggestion.cell;
    return true;
  }

  std::istream& in_;
  std::ostream& out_;
};

}  // namespace

std::unique_ptr<TextUi> NewTextUi(std::istream& in, std::ostream& out) {
  return std::make_unique<TextUiImpl>(in, out);
}

}  // namespace ui
}  // namespace minekb
