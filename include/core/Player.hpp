#pragma once
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include "core/GameState.hpp"
#include "core/MoveStrategy.hpp"

/// Source of moves for a human seat; returning nothing passes the turn.
using MoveInput = std::function<std::optional<Move>(const GameState&, Color)>;

/// Console prompt: asks for a peg by display row/column, then for one of its destinations.
/// Typing p passes; q or the end of input throws GameExit.
std::optional<Move> PromptHumanMove(const GameState& state, Color color, std::istream& in, std::ostream& out);

/**
 * Player base interface.
 */
class Player {
    public:
        /// Chooses a move for the current state; nothing means pass.
        virtual std::optional<Move> ChooseMove(const GameState& state) = 0;
        /// Returns the color this player moves.
        virtual Color Id() const = 0;
        /// True when moves come from a person.
        virtual bool IsHuman() const = 0;
        /// Virtual destructor for safe polymorphic cleanup.
        virtual ~Player() = default;
};

/**
 * Human player reading moves from the console or an injected source.
 */
class HumanPlayer : public Player {
    Color color; // immutable identity
    MoveInput input;
    public:
    /// Creates a human player prompting on stdin/stdout.
    explicit HumanPlayer(Color id);
    /// Creates a human player fed by input.
    HumanPlayer(Color id, MoveInput input);
    std::optional<Move> ChooseMove(const GameState& state) override;
    Color Id() const override;
    bool IsHuman() const override { return true; }
};

/**
 * AI player driven by a move strategy.
 */
class AIPlayer : public Player {
    Color color;
    std::unique_ptr<IMoveStrategy> strategy;
public:
    /// Creates an AI player with a default GreedyStrategy.
    explicit AIPlayer(Color id);
    /// Creates an AI player with a provided strategy.
    AIPlayer(Color id, std::unique_ptr<IMoveStrategy> s);
    /// Delegates move selection to the strategy.
    std::optional<Move> ChooseMove(const GameState& state) override;
    Color Id() const override;
    bool IsHuman() const override { return false; }
    /// Returns a const pointer to the strategy.
    const IMoveStrategy* Strategy() const;
};
