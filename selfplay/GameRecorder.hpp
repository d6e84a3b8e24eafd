#pragma once

#include <optional>
#include <vector>

#include "core/TurnController.hpp"

struct GameRecord {
    int game{0};
    int players{0};
    int depth{0};
    GameStatus status{GameStatus::InProgress};
    std::optional<Color> winner;
    std::vector<TurnRecord> turns;

    int plies() const { return static_cast<int>(turns.size()); }
};

class GameRecorder {
public:
    void beginGame(int players, int depth);
    void recordTurn(const TurnRecord& turn);
    void finalizeGame(GameStatus status, std::optional<Color> winner);
    void reset();
    const std::vector<GameRecord>& records() const { return allRecords; }
    std::vector<GameRecord> consumeRecords();

private:
    GameRecord current;
    bool inGame{false};
    int gamesStarted{0};
    std::vector<GameRecord> allRecords;
};
