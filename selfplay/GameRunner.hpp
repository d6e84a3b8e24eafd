#pragma once

#include "core/Board.hpp"
#include "core/GameConfig.hpp"
#include "core/TurnController.hpp"
#include "GameRecorder.hpp"

class GameRunner {
public:
    /// Throws InvalidConfiguration when config is unusable or has human seats.
    explicit GameRunner(const GameConfig& config);

    // Plays one full game from the starting position, records every turn, returns how it ended
    GameStatus playOne(GameRecorder& recorder);

    const Board& board() const { return starBoard; }

private:
    GameConfig config;
    Board starBoard;
};
