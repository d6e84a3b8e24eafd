#pragma once
#include "core/Board.hpp"
#include "core/Color.hpp"
#include "core/Errors.hpp"
#include "core/Move.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

/// Pegs each color starts with.
constexpr int kPegsPerColor = Board::kRegionCellCount;

/**
 * Optional movement rules.
 */
struct MoveRules {
    // Pegs may pass through any point but only stop in the center, their
    // home or their target.
    bool restrictForeignRegions{false};
};

/**
 * Snapshot of a game position with the side to move.
 *
 * Owns its occupancy; the Board is shared read-only. Copies are independent,
 * which is what search relies on.
 */
class GameState {
private:
    const Board* board_;
    std::vector<Color> cells_;    // one entry per cell id
    std::vector<Color> active_;   // turn order
    int sideIndex_{0};
    int moveCount_{0};
    MoveRules rules_;

    void advanceTurn();
public:
    /// Creates an empty position; the first active color moves first.
    GameState(const Board& board, std::vector<Color> activeColors, MoveRules rules = {});
    /// Creates the starting position with every active color on its home point.
    static GameState Initial(const Board& board, const std::vector<Color>& activeColors, MoveRules rules = {});

    const Board& GetBoard() const { return *board_; }
    const MoveRules& Rules() const { return rules_; }

    /// Occupant of a cell (Color::None when empty).
    Color At(int cell) const;
    bool IsEmpty(int cell) const { return At(cell) == Color::None; }
    /// Puts a peg on an empty cell while setting up a position.
    bool Place(int cell, Color color);
    /// Removes whatever peg is on a cell.
    void Clear(int cell);
    /// Cell ids holding pegs of a color, ascending.
    std::vector<int> PiecesOf(Color color) const;
    int PieceCount(Color color) const;

    const std::vector<Color>& ActiveColors() const { return active_; }
    bool IsActive(Color color) const;
    Color CurrentColor() const { return active_[sideIndex_]; }
    /// Hands the turn to an active color.
    void SetCurrentColor(Color color);
    /// Active color that plays after the given one.
    Color ColorAfter(Color color) const;
    /// Number of moves applied so far (passes excluded).
    int MoveCount() const { return moveCount_; }

    /// Validates a move for the side to move and applies it; the state is untouched on failure.
    /// applied receives the generated move that was played.
    MoveError ApplyMove(const Move& move, Move* applied = nullptr);
    /// Applies a generated move without validation and advances the turn.
    void PlayMove(const Move& move);
    /// Advances the turn without moving.
    void PassTurn();

    /// True when every peg of the color rests in its target point.
    bool HasWon(Color color) const;
    /// First active color that has won, if any.
    std::optional<Color> Winner() const;
    /// Winner found or no active color can move.
    bool IsTerminal() const;
    /// Active colors hold pegsPerColor pegs, inactive ones hold none.
    bool CheckInvariants(int pegsPerColor = kPegsPerColor) const;

    /// ASCII rendering with a row/column ruler.
    void print(std::ostream& os = std::cout) const;
};

/// "(row,col) -> (row,col)" with jump landings, in display coordinates.
std::string FormatMove(const Board& board, const Move& move);
