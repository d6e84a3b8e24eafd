#include "core/Board.hpp"
#include "core/Errors.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/Player.hpp"
#include "core/TurnController.hpp"
#include <iostream>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>

namespace {

// Reads one line; empty input keeps the default.
std::string promptLine(const std::string& question, const std::string& fallback) {
    std::cout << question << " [" << fallback << "]: ";
    std::string line;
    if (!std::getline(std::cin, line)) {
        throw GameExit("Input closed during setup");
    }
    std::istringstream trimmed(line);
    std::string word;
    trimmed >> word;
    return word.empty() ? fallback : word;
}

int promptInt(const std::string& question, int fallback) {
    const std::string text = promptLine(question, std::to_string(fallback));
    try {
        return std::stoi(text);
    } catch (const std::invalid_argument&) {
        throw InvalidConfiguration("'" + text + "' is not a number");
    } catch (const std::out_of_range&) {
        throw InvalidConfiguration("'" + text + "' is out of range");
    }
}

GameConfig promptConfig() {
    GameConfig config;
    config.playerCount = promptInt("Number of players (2, 3, 4 or 6)", config.playerCount);
    const std::vector<Color> colors = ActiveColorsFor(config.playerCount);

    config.seats.clear();
    for (std::size_t i = 0; i < colors.size(); ++i) {
        const std::string fallback = (i == 0) ? "human" : "minimax";
        const std::string kind = promptLine(ColorName(colors[i]) + " seat (human/greedy/minimax)", fallback);
        config.seats.push_back(ParseSeatKind(kind));
    }
    if (config.HasMinimaxSeat()) {
        config.searchDepth = promptInt("Minimax search depth", config.searchDepth);
        config.moveLimit = promptInt("Moves kept per node (0 = all)", config.moveLimit);
    }
    config.maxPlies = promptInt("Ply limit", config.maxPlies);
    const std::string restrict = promptLine("Only stop in center, home or target (y/n)", "n");
    config.restrictForeignRegions = (restrict == "y" || restrict == "Y");
    config.Validate();
    return config;
}

} // namespace

int main() {
    GameConfig config;
    try {
        config = promptConfig();
    } catch (const InvalidConfiguration& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    } catch (const GameExit& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    const std::vector<Color> colors = config.ActiveColors();
    for (std::size_t i = 0; i < colors.size(); ++i) {
        std::cout << ColorName(colors[i]) << ": " << SeatKindName(config.seats[i]) << "\n";
    }

    Board board;
    TurnController controller(GameState::Initial(board, colors, config.Rules()),
                              MakePlayers(config), config.maxPlies);
    controller.setLogUsage(config.logSearch);
    controller.setTurnListener([&board](const TurnRecord& turn, const GameState& state) {
        if (turn.move) {
            std::cout << "\n" << ColorName(turn.color) << " played " << FormatMove(board, *turn.move) << "\n";
        }
        state.print();
    });

    controller.State().print();
    try {
        while (!controller.IsOver()) {
            if (controller.PlayTurn() == TurnOutcome::Rejected) {
                std::cout << "Invalid move, try again.\n";
            }
        }
    } catch (const GameExit& e) {
        controller.Resign();
        std::cout << e.what() << "\n";
        return 0;
    }

    switch (controller.Status()) {
        case GameStatus::Won:
            std::cout << "\n" << ColorName(*controller.Winner()) << " wins after " << controller.Ply() << " plies!\n";
            break;
        case GameStatus::Stalemate:
            std::cout << "\nNo color can move: stalemate.\n";
            break;
        case GameStatus::PlyLimit:
            std::cout << "\nPly limit of " << controller.MaxPlies() << " reached without a winner.\n";
            break;
        default:
            break;
    }
    return 0;
}
