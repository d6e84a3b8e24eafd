#include "GameRunner.hpp"

#include <algorithm>
#include <stdexcept>

#include "core/Errors.hpp"

// Runs self-play games between computer seats
GameRunner::GameRunner(const GameConfig& cfg)
    : config(cfg) {
    config.Validate();
    if (std::find(config.seats.begin(), config.seats.end(), SeatKind::Human) != config.seats.end()) {
        throw InvalidConfiguration("Self-play needs computer seats only");
    }
}

GameStatus GameRunner::playOne(GameRecorder& recorder) {
    const int depth = config.HasMinimaxSeat() ? config.searchDepth : 1;
    recorder.beginGame(config.playerCount, depth);

    TurnController controller(GameState::Initial(starBoard, config.ActiveColors(), config.Rules()),
                              MakePlayers(config), config.maxPlies);
    controller.setLogUsage(config.logSearch);
    controller.setTurnListener([&recorder](const TurnRecord& turn, const GameState& state) {
        if (!state.CheckInvariants()) {
            throw std::logic_error("Peg count changed during self-play");
        }
        recorder.recordTurn(turn);
    });

    const GameStatus status = controller.Run();
    recorder.finalizeGame(status, controller.Winner());
    return status;
}
