#include "GameRecorder.hpp"

#include <stdexcept>

void GameRecorder::beginGame(int players, int depth) {
    if (inGame) {
        throw std::logic_error("beginGame called before the previous game was finalized");
    }
    current = GameRecord();
    current.game = ++gamesStarted;
    current.players = players;
    current.depth = depth;
    inGame = true;
}

void GameRecorder::recordTurn(const TurnRecord& turn) {
    if (!inGame) {
        throw std::logic_error("recordTurn called outside a game");
    }
    current.turns.push_back(turn);
}

void GameRecorder::finalizeGame(GameStatus status, std::optional<Color> winner) {
    if (!inGame) {
        throw std::logic_error("finalizeGame called outside a game");
    }
    current.status = status;
    current.winner = winner;
    allRecords.push_back(std::move(current));
    current = GameRecord();
    inGame = false;
}

void GameRecorder::reset() {
    current = GameRecord();
    inGame = false;
    gamesStarted = 0;
    allRecords.clear();
}

std::vector<GameRecord> GameRecorder::consumeRecords() {
    std::vector<GameRecord> out;
    out.swap(allRecords);
    return out;
}
