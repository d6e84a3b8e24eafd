#include "ui/StarGameUI.hpp"

#include "core/Errors.hpp"
#include "core/GameConfig.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

// Usage: starcheckers_ui [players] [seat...] [depth] [background image]
// Seats default to one human followed by minimax players.
int main(int argc, char** argv) {
    GameConfig config;
    std::string backgroundPath;
    try {
        if (argc > 1) config.playerCount = std::atoi(argv[1]);
        const int players = static_cast<int>(ActiveColorsFor(config.playerCount).size());
        config.seats.assign(static_cast<std::size_t>(players), SeatKind::Minimax);
        config.seats[0] = SeatKind::Human;
        for (int i = 0; i < players && 2 + i < argc; ++i) {
            config.seats[static_cast<std::size_t>(i)] = ParseSeatKind(argv[2 + i]);
        }
        if (argc > 2 + players) config.searchDepth = std::atoi(argv[2 + players]);
        if (argc > 3 + players) backgroundPath = argv[3 + players];
        config.Validate();
    } catch (const InvalidConfiguration& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    const float cellRadius = 14.0f;
    StarGameUI game(config, backgroundPath, cellRadius);
    return game.run();
}
