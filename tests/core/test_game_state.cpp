#undef NDEBUG
#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/Board.hpp"
#include "core/Errors.hpp"
#include "core/GameState.hpp"
#include "core/MoveGenerator.hpp"
#include "core/MoveStrategy.hpp"

namespace {

const std::vector<Color> kTwoPlayers{Color::Red, Color::Green};

template <typename Exception, typename Fn>
bool Throws(Fn fn) {
    try {
        fn();
    } catch (const Exception&) {
        return true;
    }
    return false;
}

void TestInitialPosition() {
    Board board;
    GameState state = GameState::Initial(board, kTwoPlayers);
    assert(state.PieceCount(Color::Red) == kPegsPerColor);
    assert(state.PieceCount(Color::Green) == kPegsPerColor);
    assert(state.PieceCount(Color::Blue) == 0);
    assert(state.CheckInvariants());
    assert(state.CurrentColor() == Color::Red);
    for (int cell : state.PiecesOf(Color::Red)) {
        assert(board.InHome(cell, Color::Red));
    }
    assert(!state.Winner().has_value());
    assert(!state.IsTerminal());
    assert(state.MoveCount() == 0);
}

void TestRejectsBadColorSets() {
    Board board;
    assert(Throws<InvalidConfiguration>([&] { GameState s(board, {}); }));
    assert(Throws<InvalidConfiguration>([&] { GameState s(board, {Color::Red, Color::Red}); }));
    assert(Throws<InvalidConfiguration>([&] { GameState s(board, {Color::Red, Color::None}); }));
    // InvalidConfiguration is an invalid_argument.
    assert(Throws<std::invalid_argument>([&] { GameState s(board, {}); }));
}

void TestCellAccessBounds() {
    Board board;
    GameState state(board, kTwoPlayers);
    assert(Throws<std::out_of_range>([&] { state.At(-1); }));
    assert(Throws<std::out_of_range>([&] { state.At(board.CellCount()); }));
    assert(Throws<std::out_of_range>([&] { state.Place(200, Color::Red); }));
    assert(Throws<std::invalid_argument>([&] { state.Place(0, Color::Blue); }));

    assert(state.Place(0, Color::Red));
    assert(!state.Place(0, Color::Green));
    assert(state.At(0) == Color::Red);
    state.Clear(0);
    assert(state.IsEmpty(0));
}

void TestTurnOrder() {
    Board board;
    const std::vector<Color> three{Color::Red, Color::Yellow, Color::Blue};
    GameState state = GameState::Initial(board, three);
    assert(state.ColorAfter(Color::Red) == Color::Yellow);
    assert(state.ColorAfter(Color::Blue) == Color::Red);

    const auto moves = AllLegalMoves(state, Color::Red);
    state.PlayMove(moves.front());
    assert(state.CurrentColor() == Color::Yellow);
    assert(state.MoveCount() == 1);
    state.PassTurn();
    assert(state.CurrentColor() == Color::Blue);
    assert(state.MoveCount() == 1);
    state.SetCurrentColor(Color::Red);
    assert(state.CurrentColor() == Color::Red);
    assert(Throws<std::invalid_argument>([&] { state.SetCurrentColor(Color::Green); }));
}

void TestWinDetection() {
    Board board;
    GameState state(board, kTwoPlayers);
    const auto& target = board.TargetRegion(Color::Red);
    for (int cell : target) {
        state.Place(cell, Color::Red);
    }
    state.Place(board.HomeRegion(Color::Green).front(), Color::Green);
    assert(state.HasWon(Color::Red));
    assert(!state.HasWon(Color::Green));
    assert(state.Winner() == Color::Red);
    assert(state.IsTerminal());

    // One peg outside the target is enough to undo it.
    state.Clear(target.front());
    state.Place(board.IndexOf(Cube(0, 0, 0)), Color::Red);
    assert(!state.HasWon(Color::Red));
    assert(!state.Winner().has_value());

    // A color without pegs has not won.
    GameState empty(board, kTwoPlayers);
    assert(!empty.HasWon(Color::Red));
}

void TestPegCountsSurviveMoves() {
    Board board;
    GameState state = GameState::Initial(board, {Color::Red, Color::Yellow, Color::Blue});
    GreedyStrategy greedy;
    greedy.setLogUsage(false);
    for (int ply = 0; ply < 45; ++ply) {
        const Color color = state.CurrentColor();
        std::optional<Move> move = greedy.select(state, color);
        if (!move) {
            state.PassTurn();
            continue;
        }
        assert(state.ApplyMove(*move) == MoveError::None);
        assert(state.CheckInvariants());
        assert(state.CurrentColor() == state.ColorAfter(color));
    }
    assert(state.MoveCount() > 0);
}

void TestPrintAndFormat() {
    Board board;
    GameState state = GameState::Initial(board, kTwoPlayers);
    std::ostringstream out;
    state.print(out);
    const std::string text = out.str();
    assert(text.find('R') != std::string::npos);
    assert(text.find('G') != std::string::npos);
    assert(text.find('Y') == std::string::npos);

    int lines = 0;
    for (char ch : text) {
        if (ch == '\n') lines++;
    }
    assert(lines == Board::kDisplayRows + 3);

    const int origin = board.IndexAtDisplay(3, 9);
    const int destination = board.IndexAtDisplay(4, 8);
    assert(FormatMove(board, Move(origin, destination)) == "(3,9) -> (4,8)");
    assert(FormatMove(board, Move(origin, destination, {board.IndexAtDisplay(2, 10)})) ==
           "(3,9) -> (4,8) via (2,10)");
}

}  // namespace

int main() {
    TestInitialPosition();
    TestRejectsBadColorSets();
    TestCellAccessBounds();
    TestTurnOrder();
    TestWinDetection();
    TestPegCountsSurviveMoves();
    TestPrintAndFormat();
    std::cout << "All game state tests passed.\n";
    return 0;
}
