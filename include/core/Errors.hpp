#pragma once
#include <stdexcept>
#include <string>

/// Why a submitted move was rejected (None when it is legal).
enum class MoveError {
    None,
    NotOnBoard,          // origin or destination is not a cell id
    NotOwned,            // origin is empty or holds another color
    DestinationOccupied,
    Unreachable          // no step or jump chain leads there
};

/// Human-readable reason for a rejected move.
const char* MoveErrorMessage(MoveError error);

/**
 * Unsupported game setup (player count, seats, search depth). Raised before
 * any game state is created.
 */
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what) : std::invalid_argument(what) {}
};

/// The human asked to leave the game.
class GameExit : public std::runtime_error {
public:
    explicit GameExit(const std::string& what = "Game exited") : std::runtime_error(what) {}
};
