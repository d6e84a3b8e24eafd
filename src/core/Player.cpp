#include "core/Player.hpp"
#include "core/MoveGenerator.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

void discardLine(std::istream& in) {
    in.clear();
    in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

} // namespace

std::optional<Move> PromptHumanMove(const GameState& state, Color color, std::istream& in, std::ostream& out) {
    if (!HasAnyLegalMove(state, color)) {
        return std::nullopt;
    }
    const Board& board = state.GetBoard();

    while (true) {
        out << ColorName(color) << " to move. Enter row and column of a peg (p = pass, q = quit): ";
        std::string token;
        if (!(in >> token)) {
            throw GameExit("Move input closed");
        }
        if (token == "q") {
            throw GameExit(ColorName(color) + " quit the game");
        }
        if (token == "p") {
            return std::nullopt;
        }

        int row = -1;
        int col = -1;
        try {
            row = std::stoi(token);
        } catch (const std::invalid_argument&) {
            out << "Invalid move, try again.\n";
            discardLine(in);
            continue;
        } catch (const std::out_of_range&) {
            out << "Invalid move, try again.\n";
            discardLine(in);
            continue;
        }
        if (!(in >> col)) {
            if (in.eof()) throw GameExit("Move input closed");
            out << "Invalid move, try again.\n";
            discardLine(in);
            continue;
        }

        const int origin = board.IndexAtDisplay(row, col);
        if (origin < 0 || state.At(origin) != color) {
            out << "No " << ColorName(color) << " peg at (" << row << "," << col << "), try again.\n";
            continue;
        }
        const std::vector<Move> options = LegalMoves(state, origin);
        if (options.empty()) {
            out << "That peg cannot move, try again.\n";
            continue;
        }

        for (std::size_t i = 0; i < options.size(); ++i) {
            out << "  [" << i << "] " << FormatMove(board, options[i]) << "\n";
        }
        out << "Choose destination number: ";
        int choice = -1;
        if (!(in >> choice)) {
            if (in.eof()) throw GameExit("Move input closed");
            out << "Invalid move, try again.\n";
            discardLine(in);
            continue;
        }
        if (choice >= 0 && choice < static_cast<int>(options.size())) {
            return options[choice];
        }
        out << "Invalid move, try again.\n";
    }
}

HumanPlayer::HumanPlayer(Color id)
    : color(id),
      input([](const GameState& state, Color c) { return PromptHumanMove(state, c, std::cin, std::cout); }) {}

HumanPlayer::HumanPlayer(Color id, MoveInput in)
    : color(id), input(std::move(in)) {
    if (!input) {
        throw std::invalid_argument("HumanPlayer needs a move source");
    }
}

Color HumanPlayer::Id() const {
    return color;
}

std::optional<Move> HumanPlayer::ChooseMove(const GameState& state) {
    return input(state, color);
}

AIPlayer::AIPlayer(Color id, std::unique_ptr<IMoveStrategy> s)
    : color(id), strategy(std::move(s)) {
    if (!strategy) {
        throw std::invalid_argument("AIPlayer needs a strategy");
    }
}

AIPlayer::AIPlayer(Color id)
    : color(id), strategy(std::make_unique<GreedyStrategy>()) {}

Color AIPlayer::Id() const {
    return color;
}

// Delegate to configured strategy
std::optional<Move> AIPlayer::ChooseMove(const GameState& state) {
    return strategy->select(state, color);
}

const IMoveStrategy* AIPlayer::Strategy() const {
    return strategy.get();
}
