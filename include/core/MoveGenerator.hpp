#pragma once
#include "core/Errors.hpp"
#include "core/GameState.hpp"
#include "core/Move.hpp"
#include <optional>
#include <vector>

/// True when a peg of this color may come to rest on the cell under the state's rules.
bool CanRestAt(const GameState& state, Color color, int cell);

/**
 * Every legal move of the peg on origin: single steps to empty neighbors and
 * every prefix of every jump chain, one move per destination. Empty when the
 * cell is empty or the peg is blocked.
 */
std::vector<Move> LegalMoves(const GameState& state, int origin);

/// Union of LegalMoves over the color's pegs, in cell id order.
std::vector<Move> AllLegalMoves(const GameState& state, Color color);

/// True when at least one peg of the color can move.
bool HasAnyLegalMove(const GameState& state, Color color);

/// True when at least one active color can move.
bool AnyColorCanMove(const GameState& state);

/// Generated move with this origin and destination, if legal.
std::optional<Move> FindLegalMove(const GameState& state, int origin, int destination);

/// Checks a move for the side to move; MoveError::None when it may be applied.
MoveError ValidateMove(const GameState& state, const Move& move);
