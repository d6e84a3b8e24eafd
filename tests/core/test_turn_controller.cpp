#undef NDEBUG
#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/Board.hpp"
#include "core/Errors.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/MoveGenerator.hpp"
#include "core/Player.hpp"
#include "core/TurnController.hpp"

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

int Cell(const Board& board, int x, int y, int z) {
    const int idx = board.IndexOf(Cube(x, y, z));
    assert(idx >= 0);
    return idx;
}

std::unique_ptr<Player> Greedy(Color color) {
    auto strategy = std::make_unique<GreedyStrategy>();
    strategy->setLogUsage(false);
    return std::make_unique<AIPlayer>(color, std::move(strategy));
}

std::vector<std::unique_ptr<Player>> Seats(std::unique_ptr<Player> a, std::unique_ptr<Player> b) {
    std::vector<std::unique_ptr<Player>> seats;
    seats.push_back(std::move(a));
    seats.push_back(std::move(b));
    return seats;
}

void TestWinEndsGame() {
    Board board;
    GameState state(board, kTwoPlayers);
    const int hole = Cell(board, -2, -3, 5);
    for (int cell : board.TargetRegion(Color::Red)) {
        if (cell != hole) state.Place(cell, Color::Red);
    }
    state.Place(Cell(board, -1, -3, 4), Color::Red);
    state.Place(Cell(board, 2, 2, -4), Color::Green);

    TurnController controller(state, Seats(Greedy(Color::Red), Greedy(Color::Green)));
    assert(controller.Status() == GameStatus::InProgress);
    assert(controller.PlayTurn() == TurnOutcome::Moved);
    assert(controller.Status() == GameStatus::Won);
    assert(controller.Winner() == Color::Red);
    assert(controller.IsOver());
    assert(controller.PlayTurn() == TurnOutcome::Finished);
    assert(controller.History().size() == 1);
    assert(controller.History().front().move->destination == hole);
    assert(Throws<std::logic_error>([&] { controller.SubmitMove(Move(hole, Cell(board, 0, 0, 0))); }));
}

void TestSeatsMustMatchColors() {
    Board board;
    GameState state = GameState::Initial(board, kTwoPlayers);
    assert(Throws<InvalidConfiguration>([&] {
        TurnController c(state, Seats(Greedy(Color::Red), Greedy(Color::Blue)));
    }));
    assert(Throws<InvalidConfiguration>([&] {
        TurnController c(state, Seats(Greedy(Color::Red), Greedy(Color::Red)));
    }));
    assert(Throws<InvalidConfiguration>([&] {
        std::vector<std::unique_ptr<Player>> one;
        one.push_back(Greedy(Color::Red));
        TurnController c(state, std::move(one));
    }));
    assert(Throws<InvalidConfiguration>([&] {
        TurnController c(state, Seats(Greedy(Color::Red), Greedy(Color::Green)), 0);
    }));
}

void TestConfigValidation() {
    assert(ActiveColorsFor(2) == (std::vector<Color>{Color::Red, Color::Green}));
    assert(ActiveColorsFor(3) == (std::vector<Color>{Color::Red, Color::Yellow, Color::Blue}));
    assert(ActiveColorsFor(4) == (std::vector<Color>{Color::Orange, Color::Yellow, Color::Blue, Color::Purple}));
    assert(ActiveColorsFor(6).size() == 6);
    assert(Throws<InvalidConfiguration>([] { ActiveColorsFor(5); }));
    assert(Throws<InvalidConfiguration>([] { ActiveColorsFor(1); }));

    GameConfig config;
    config.Validate();

    GameConfig badCount = config;
    badCount.playerCount = 5;
    assert(Throws<InvalidConfiguration>([&] { badCount.Validate(); }));

    GameConfig badSeats = config;
    badSeats.playerCount = 3;
    assert(Throws<InvalidConfiguration>([&] { badSeats.Validate(); }));

    GameConfig badDepth = config;
    badDepth.searchDepth = 0;
    assert(Throws<InvalidConfiguration>([&] { badDepth.Validate(); }));
    badDepth.seats = {SeatKind::Human, SeatKind::Greedy};
    badDepth.Validate();

    GameConfig badLimit = config;
    badLimit.moveLimit = -1;
    assert(Throws<InvalidConfiguration>([&] { badLimit.Validate(); }));

    assert(ParseSeatKind("Minimax") == SeatKind::Minimax);
    assert(ParseSeatKind("g") == SeatKind::Greedy);
    assert(std::string(SeatKindName(ParseSeatKind("M"))) == "minimax");
    assert(Throws<InvalidConfiguration>([] { ParseSeatKind("robot"); }));
}

void TestMakePlayers() {
    GameConfig config;
    config.playerCount = 3;
    config.seats = {SeatKind::Human, SeatKind::Greedy, SeatKind::Minimax};
    config.searchDepth = 3;
    config.moveLimit = 5;
    config.logSearch = false;
    auto players = MakePlayers(config, [](const GameState&, Color) { return std::optional<Move>(); });
    assert(players.size() == 3);
    assert(players[0]->Id() == Color::Red && players[0]->IsHuman());
    assert(players[1]->Id() == Color::Yellow && !players[1]->IsHuman());
    assert(players[2]->Id() == Color::Blue && !players[2]->IsHuman());

    const auto* greedySeat = dynamic_cast<const AIPlayer*>(players[1].get());
    assert(greedySeat != nullptr);
    assert(dynamic_cast<const GreedyStrategy*>(greedySeat->Strategy()) != nullptr);
    const auto* minimaxSeat = dynamic_cast<const AIPlayer*>(players[2].get());
    assert(minimaxSeat != nullptr);
    const auto* search = dynamic_cast<const MinimaxStrategy*>(minimaxSeat->Strategy());
    assert(search != nullptr);
    assert(search->getMaxDepth() == 3);
    assert(search->getMoveLimit() == 5);

    config.seats.pop_back();
    assert(Throws<InvalidConfiguration>([&] { MakePlayers(config); }));
}

void TestRejectedHumanMoveLeavesState() {
    Board board;
    GameState state = GameState::Initial(board, kTwoPlayers);
    int calls = 0;
    auto human = std::make_unique<HumanPlayer>(Color::Red, [&calls](const GameState& s, Color c) {
        calls++;
        if (calls == 1) {
            // Red peg to the far side: not reachable.
            return std::optional<Move>(Move(s.PiecesOf(c).back(), s.GetBoard().IndexOf(Cube(0, 0, 0))));
        }
        return std::optional<Move>(AllLegalMoves(s, c).front());
    });
    TurnController controller(state, Seats(std::move(human), Greedy(Color::Green)));

    assert(controller.PlayTurn() == TurnOutcome::Rejected);
    assert(controller.History().empty());
    assert(controller.State().CurrentColor() == Color::Red);
    assert(controller.State().PiecesOf(Color::Red) == state.PiecesOf(Color::Red));

    assert(controller.PlayTurn() == TurnOutcome::Moved);
    assert(controller.State().CurrentColor() == Color::Green);
    assert(controller.History().size() == 1);
    assert(calls == 2);
}

void TestPassAndForcedSkip() {
    Board board;
    // Red has no pegs, so its turns are skipped.
    GameState state(board, kTwoPlayers);
    state.Place(Cell(board, 0, 0, 0), Color::Green);
    auto passer = std::make_unique<HumanPlayer>(Color::Green, [](const GameState&, Color) {
        return std::optional<Move>();
    });
    TurnController controller(state, Seats(Greedy(Color::Red), std::move(passer)));

    assert(controller.PlayTurn() == TurnOutcome::Skipped);
    assert(controller.History().back().color == Color::Red);
    assert(controller.History().back().noLegalMove);
    assert(controller.State().CurrentColor() == Color::Green);

    assert(controller.PlayTurn() == TurnOutcome::Skipped);
    assert(controller.History().back().color == Color::Green);
    assert(!controller.History().back().noLegalMove);
    assert(!controller.History().back().move.has_value());
    assert(controller.State().CurrentColor() == Color::Red);

    controller.Resign();
    assert(controller.Status() == GameStatus::Aborted);
    assert(controller.PlayTurn() == TurnOutcome::Finished);
}

void TestStalemateDetected() {
    Board board;
    GameState state(board, kTwoPlayers);
    // Green pegs on their home point can still step out.
    for (int cell : board.HomeRegion(Color::Green)) {
        state.Place(cell, Color::Green);
    }
    assert(AnyColorCanMove(state));
    TurnController open(state, Seats(Greedy(Color::Red), Greedy(Color::Green)));
    assert(open.Status() == GameStatus::InProgress);

    // Nobody has a peg, so nobody can move.
    GameState empty(board, kTwoPlayers);
    TurnController frozen(empty, Seats(Greedy(Color::Red), Greedy(Color::Green)));
    assert(frozen.Status() == GameStatus::Stalemate);
    assert(frozen.PlayTurn() == TurnOutcome::Finished);
}

void TestPlyLimit() {
    Board board;
    TurnController controller(GameState::Initial(board, kTwoPlayers),
                              Seats(Greedy(Color::Red), Greedy(Color::Green)), 3);
    assert(controller.Run() == GameStatus::PlyLimit);
    assert(controller.Ply() == 3);
    assert(!controller.Winner().has_value());
}

void TestLogSwitch() {
    Board board;
    GameState state(board, kTwoPlayers);
    state.Place(Cell(board, 0, 0, 0), Color::Green);
    auto passer = std::make_unique<HumanPlayer>(Color::Green, [](const GameState&, Color) {
        return std::optional<Move>();
    });
    TurnController controller(state, Seats(Greedy(Color::Red), std::move(passer)), 3);

    std::ostringstream captured;
    std::streambuf* saved = std::cout.rdbuf(captured.rdbuf());
    controller.setLogUsage(false);
    const GameStatus status = controller.Run();
    std::cout.rdbuf(saved);
    assert(status == GameStatus::PlyLimit);
    assert(captured.str().empty());

    TurnController chatty(state, Seats(Greedy(Color::Red), Greedy(Color::Green)));
    saved = std::cout.rdbuf(captured.rdbuf());
    chatty.PlayTurn();
    std::cout.rdbuf(saved);
    assert(captured.str().find("[Turn] Red has no legal move") != std::string::npos);
}

void TestPromptHumanMove() {
    Board board;
    GameState state = GameState::Initial(board, kTwoPlayers);
    const int origin = board.IndexAtDisplay(3, 9);
    std::ostringstream out;

    std::istringstream pick("x\n5 5\n3 9\n0\n");
    std::optional<Move> move = PromptHumanMove(state, Color::Red, pick, out);
    assert(move.has_value());
    assert(move->origin == origin);
    assert(ValidateMove(state, *move) == MoveError::None);
    assert(out.str().find("[0]") != std::string::npos);

    std::istringstream pass("p\n");
    assert(!PromptHumanMove(state, Color::Red, pass, out).has_value());

    std::istringstream quit("q\n");
    assert(Throws<GameExit>([&] { PromptHumanMove(state, Color::Red, quit, out); }));

    std::istringstream closed("");
    assert(Throws<GameExit>([&] { PromptHumanMove(state, Color::Red, closed, out); }));
    std::istringstream cutOff("3 9\n");
    assert(Throws<GameExit>([&] { PromptHumanMove(state, Color::Red, cutOff, out); }));

    // End of input during a game resigns it instead of escaping the loop.
    auto reader = std::make_unique<HumanPlayer>(Color::Red, [](const GameState& s, Color c) {
        std::istringstream empty("");
        std::ostringstream sink;
        return PromptHumanMove(s, c, empty, sink);
    });
    TurnController controller(state, Seats(std::move(reader), Greedy(Color::Green)));
    controller.setLogUsage(false);
    try {
        controller.PlayTurn();
        assert(false);
    } catch (const GameExit&) {
        controller.Resign();
    }
    assert(controller.Status() == GameStatus::Aborted);
    assert(controller.History().empty());
}

void TestSelfPlayTerminates() {
    Board board;
    GameConfig config;
    config.seats = {SeatKind::Minimax, SeatKind::Minimax};
    config.searchDepth = 2;
    config.maxPlies = 600;
    config.logSearch = false;

    TurnController controller(GameState::Initial(board, config.ActiveColors(), config.Rules()),
                              MakePlayers(config), config.maxPlies);
    controller.setLogUsage(config.logSearch);
    int turns = 0;
    controller.setTurnListener([&](const TurnRecord& turn, const GameState& s) {
        turns++;
        assert(turn.ply == turns);
        assert(s.CheckInvariants());
        if (turn.move) {
            assert(s.At(turn.move->destination) == turn.color);
            assert(s.IsEmpty(turn.move->origin));
        }
    });

    const GameStatus status = controller.Run();
    assert(status == GameStatus::Won || status == GameStatus::Stalemate);
    assert(controller.Ply() < config.maxPlies);
    assert(turns == controller.Ply());
    if (status == GameStatus::Won) {
        assert(controller.State().HasWon(*controller.Winner()));
    }
}

}  // namespace

int main() {
    TestWinEndsGame();
    TestSeatsMustMatchColors();
    TestConfigValidation();
    TestMakePlayers();
    TestRejectedHumanMoveLeavesState();
    TestPassAndForcedSkip();
    TestStalemateDetected();
    TestPlyLimit();
    TestLogSwitch();
    TestPromptHumanMove();
    TestSelfPlayTerminates();
    std::cout << "All turn controller tests passed.\n";
    return 0;
}
