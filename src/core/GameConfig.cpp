#include "core/GameConfig.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cctype>

const char* SeatKindName(SeatKind kind) {
    switch (kind) {
        case SeatKind::Human: return "human";
        case SeatKind::Greedy: return "greedy";
        case SeatKind::Minimax: return "minimax";
    }
    return "unknown";
}

SeatKind ParseSeatKind(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "human" || lower == "h") return SeatKind::Human;
    if (lower == "greedy" || lower == "g") return SeatKind::Greedy;
    if (lower == "minimax" || lower == "m") return SeatKind::Minimax;
    throw InvalidConfiguration("Unknown seat kind '" + text + "' (expected human, greedy or minimax)");
}

std::vector<Color> ActiveColorsFor(int playerCount) {
    switch (playerCount) {
        case 2: return {Color::Red, Color::Green};
        case 3: return {Color::Red, Color::Yellow, Color::Blue};
        case 4: return {Color::Orange, Color::Yellow, Color::Blue, Color::Purple};
        case 6: return {Color::Red, Color::Orange, Color::Yellow, Color::Green, Color::Blue, Color::Purple};
        default: break;
    }
    throw InvalidConfiguration("Unsupported player count " + std::to_string(playerCount) +
                               " (expected 2, 3, 4 or 6)");
}

void GameConfig::Validate() const {
    ActiveColorsFor(playerCount);
    if (static_cast<int>(seats.size()) != playerCount) {
        throw InvalidConfiguration("Expected " + std::to_string(playerCount) + " seats, got " +
                                   std::to_string(seats.size()));
    }
    if (HasMinimaxSeat() && searchDepth <= 0) {
        throw InvalidConfiguration("Search depth must be positive, got " + std::to_string(searchDepth));
    }
    if (moveLimit < 0) {
        throw InvalidConfiguration("Move limit cannot be negative");
    }
    if (parallelThreads < 1) {
        throw InvalidConfiguration("Parallel threads must be at least 1");
    }
    if (maxPlies <= 0) {
        throw InvalidConfiguration("Ply limit must be positive, got " + std::to_string(maxPlies));
    }
}

MoveRules GameConfig::Rules() const {
    MoveRules rules;
    rules.restrictForeignRegions = restrictForeignRegions;
    return rules;
}

bool GameConfig::HasMinimaxSeat() const {
    return std::find(seats.begin(), seats.end(), SeatKind::Minimax) != seats.end();
}

std::vector<std::unique_ptr<Player>> MakePlayers(const GameConfig& config, MoveInput humanInput) {
    config.Validate();
    const std::vector<Color> colors = config.ActiveColors();
    std::vector<std::unique_ptr<Player>> players;
    players.reserve(colors.size());
    for (std::size_t i = 0; i < colors.size(); ++i) {
        switch (config.seats[i]) {
            case SeatKind::Human:
                if (humanInput) {
                    players.push_back(std::make_unique<HumanPlayer>(colors[i], humanInput));
                } else {
                    players.push_back(std::make_unique<HumanPlayer>(colors[i]));
                }
                break;
            case SeatKind::Greedy: {
                auto greedy = std::make_unique<GreedyStrategy>();
                greedy->setLogUsage(config.logSearch);
                players.push_back(std::make_unique<AIPlayer>(colors[i], std::move(greedy)));
                break;
            }
            case SeatKind::Minimax: {
                auto search = std::make_unique<MinimaxStrategy>(config.searchDepth, config.moveLimit);
                search->setLogUsage(config.logSearch);
                search->setParallelThreads(config.parallelThreads);
                players.push_back(std::make_unique<AIPlayer>(colors[i], std::move(search)));
                break;
            }
        }
    }
    return players;
}
