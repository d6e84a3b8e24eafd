#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "core/Errors.hpp"
#include "core/GameConfig.hpp"
#include "GameRecorder.hpp"
#include "GameRecordWriter.hpp"
#include "GameRunner.hpp"

// Usage: starcheckers_selfplay [games] [depth] [output] [players] [maxPlies]
// Depth 0 seats greedy players instead of minimax.
int main(int argc, char** argv) {
    int games = 10;
    int depth = 2;
    std::string outputPath = "selfplay_games.jsonl";
    GameConfig config;

    if (argc > 1) games = std::atoi(argv[1]);
    if (argc > 2) depth = std::atoi(argv[2]);
    if (argc > 3) outputPath = argv[3];
    if (argc > 4) config.playerCount = std::atoi(argv[4]);
    if (argc > 5) config.maxPlies = std::atoi(argv[5]);

    if (games < 1) games = 1;
    config.logSearch = false;

    std::unique_ptr<GameRunner> runner;
    try {
        const std::size_t seats = ActiveColorsFor(config.playerCount).size();
        config.seats.assign(seats, depth > 0 ? SeatKind::Minimax : SeatKind::Greedy);
        config.searchDepth = depth > 0 ? depth : 1;
        runner = std::make_unique<GameRunner>(config);
    } catch (const InvalidConfiguration& e) {
        std::cerr << "[SelfPlay] Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    std::cout << "[SelfPlay] " << games << " games, " << config.playerCount << " players, "
              << SeatKindName(config.seats.front()) << " seats";
    if (config.HasMinimaxSeat()) std::cout << " at depth " << config.searchDepth;
    std::cout << ", ply limit " << config.maxPlies << "\n";

    GameRecorder recorder;
    std::map<std::string, int> tally;
    auto start = std::chrono::steady_clock::now();

    for (int i = 0; i < games; ++i) {
        GameStatus status = runner->playOne(recorder);
        const GameRecord& record = recorder.records().back();
        const std::string outcome = record.winner ? ColorName(*record.winner) : GameStatusName(status);
        tally[outcome]++;

        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start).count();
        double avgPerGame = static_cast<double>(elapsed) / static_cast<double>(i + 1);
        double remaining = avgPerGame * static_cast<double>(games - i - 1);

        std::cout << "[SelfPlay] Game " << (i + 1) << "/" << games
                  << " result: " << GameStatusName(status)
                  << " winner: " << (record.winner ? ColorName(*record.winner) : std::string("none"))
                  << " | plies: " << record.plies()
                  << " | elapsed: " << elapsed << "s"
                  << " | est. remaining: " << static_cast<long long>(remaining) << "s"
                  << "\n";
    }

    bool ok = GameRecordWriter::writeJsonl(recorder.records(), runner->board(), outputPath);
    if (!ok) {
        std::cerr << "[SelfPlay] Failed to write output to " << outputPath << "\n";
        return 1;
    }
    std::cout << "[SelfPlay] Wrote " << recorder.records().size() << " games to " << outputPath << "\n";
    for (const auto& entry : tally) {
        std::cout << "[SelfPlay]   " << entry.first << ": " << entry.second << "\n";
    }
    return 0;
}
