#pragma once
#include <memory>
#include <string>
#include <vector>
#include "core/Color.hpp"
#include "core/GameState.hpp"
#include "core/Player.hpp"

/// What drives a seat.
enum class SeatKind { Human, Greedy, Minimax };

const char* SeatKindName(SeatKind kind);
/// Accepts human/greedy/minimax or their first letter; throws InvalidConfiguration otherwise.
SeatKind ParseSeatKind(const std::string& text);

/// Colors in play for a supported player count (2, 3, 4 or 6), in turn order.
std::vector<Color> ActiveColorsFor(int playerCount);

/**
 * Game setup shared by the front-ends.
 */
struct GameConfig {
    int playerCount = 2;
    std::vector<SeatKind> seats{SeatKind::Human, SeatKind::Minimax};
    int searchDepth = 2;
    int moveLimit = 0;        // 0 searches every move
    int parallelThreads = 1;
    int maxPlies = 600;
    bool restrictForeignRegions = false;
    bool logSearch = true;

    /// Throws InvalidConfiguration describing the first bad field.
    void Validate() const;
    std::vector<Color> ActiveColors() const { return ActiveColorsFor(playerCount); }
    MoveRules Rules() const;
    bool HasMinimaxSeat() const;
};

/// One player per active color, in turn order. Human seats use humanInput when given, the console otherwise.
std::vector<std::unique_ptr<Player>> MakePlayers(const GameConfig& config, MoveInput humanInput = MoveInput());
