#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "core/GameState.hpp"
#include "core/Player.hpp"

enum class GameStatus { InProgress, Won, Stalemate, PlyLimit, Aborted };

/// Result of a single PlayTurn call.
enum class TurnOutcome {
    Moved,     // a move was applied
    Skipped,   // the side had no legal move or chose to pass
    Rejected,  // the seat supplied an illegal move; nothing changed
    Finished   // the game was already over
};

const char* GameStatusName(GameStatus status);

/**
 * One entry of the turn history. A turn without a move is a pass; noLegalMove
 * tells a forced skip from a voluntary one.
 */
struct TurnRecord {
    int ply{0};
    Color color{Color::None};
    std::optional<Move> move;
    bool noLegalMove{false};
};

/**
 * Drives a game: asks the seat of the side to move, validates and applies
 * its move, records the turn and detects the end of the game.
 */
class TurnController {
public:
    using TurnListener = std::function<void(const TurnRecord&, const GameState&)>;

    /// Needs exactly one player for every active color; throws InvalidConfiguration otherwise.
    TurnController(GameState initial, std::vector<std::unique_ptr<Player>> players, int maxPlies = 600);

    /// Plays one turn for the side to move.
    TurnOutcome PlayTurn();
    /// Applies a move chosen outside the seats for the side to move.
    MoveError SubmitMove(const Move& move);
    /// Passes the turn of the side to move.
    void PassTurn();
    /// Ends the game without a winner.
    void Resign();
    /// Plays turns until the game is over.
    GameStatus Run();

    const GameState& State() const { return state; }
    GameStatus Status() const { return status; }
    bool IsOver() const { return status != GameStatus::InProgress; }
    std::optional<Color> Winner() const { return winner; }
    const std::vector<TurnRecord>& History() const { return history; }
    int Ply() const { return static_cast<int>(history.size()); }
    int MaxPlies() const { return maxPlies; }
    /// Seat of the side to move.
    Player& CurrentPlayer() const;

    void setTurnListener(TurnListener listener);
    /// Enables or disables the [Turn] console lines.
    void setLogUsage(bool enable);

private:
    Player* playerFor(Color color) const;
    void finishTurn(TurnRecord record);
    void updateStatus();

    GameState state;
    std::vector<std::unique_ptr<Player>> players;
    int maxPlies;
    GameStatus status{GameStatus::InProgress};
    std::optional<Color> winner;
    std::vector<TurnRecord> history;
    TurnListener listener;
    bool logUsage{true};
};
