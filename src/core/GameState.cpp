#include "core/GameState.hpp"
#include "core/MoveGenerator.hpp"
#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <string>

GameState::GameState(const Board& board, std::vector<Color> activeColors, MoveRules rules)
    : board_(&board),
      cells_(board.CellCount(), Color::None),
      active_(std::move(activeColors)),
      rules_(rules) {
    if (active_.empty()) {
        throw InvalidConfiguration("At least one active color is required");
    }
    for (std::size_t i = 0; i < active_.size(); ++i) {
        if (active_[i] == Color::None) {
            throw InvalidConfiguration("Color::None cannot take part in a game");
        }
        if (std::find(active_.begin() + i + 1, active_.end(), active_[i]) != active_.end()) {
            throw InvalidConfiguration("Color " + ColorName(active_[i]) + " listed twice");
        }
    }
}

GameState GameState::Initial(const Board& board, const std::vector<Color>& activeColors, MoveRules rules) {
    GameState state(board, activeColors, rules);
    for (Color color : state.active_) {
        for (int cell : board.HomeRegion(color)) {
            state.cells_[cell] = color;
        }
    }
    return state;
}

Color GameState::At(int cell) const {
    if (!board_->Contains(cell)) {
        throw std::out_of_range("GameState::At cell " + std::to_string(cell) + " out of range");
    }
    return cells_[cell];
}

bool GameState::Place(int cell, Color color) {
    if (!board_->Contains(cell)) {
        throw std::out_of_range("GameState::Place cell " + std::to_string(cell) + " out of range");
    }
    if (!IsActive(color)) {
        throw std::invalid_argument("GameState::Place color " + ColorName(color) + " is not in play");
    }
    if (cells_[cell] != Color::None) return false;
    cells_[cell] = color;
    return true;
}

void GameState::Clear(int cell) {
    if (!board_->Contains(cell)) {
        throw std::out_of_range("GameState::Clear cell " + std::to_string(cell) + " out of range");
    }
    cells_[cell] = Color::None;
}

std::vector<int> GameState::PiecesOf(Color color) const {
    std::vector<int> pieces;
    if (color == Color::None) return pieces;
    for (int idx = 0; idx < static_cast<int>(cells_.size()); ++idx) {
        if (cells_[idx] == color) pieces.push_back(idx);
    }
    return pieces;
}

int GameState::PieceCount(Color color) const {
    if (color == Color::None) return 0;
    return static_cast<int>(std::count(cells_.begin(), cells_.end(), color));
}

bool GameState::IsActive(Color color) const {
    return std::find(active_.begin(), active_.end(), color) != active_.end();
}

void GameState::SetCurrentColor(Color color) {
    auto it = std::find(active_.begin(), active_.end(), color);
    if (it == active_.end()) {
        throw std::invalid_argument("Color " + ColorName(color) + " is not in play");
    }
    sideIndex_ = static_cast<int>(it - active_.begin());
}

Color GameState::ColorAfter(Color color) const {
    auto it = std::find(active_.begin(), active_.end(), color);
    if (it == active_.end() || ++it == active_.end()) return active_.front();
    return *it;
}

void GameState::advanceTurn() {
    sideIndex_ = (sideIndex_ + 1) % static_cast<int>(active_.size());
}

MoveError GameState::ApplyMove(const Move& move, Move* applied) {
    const MoveError result = ValidateMove(*this, move);
    if (result != MoveError::None) return result;
    // Legality is decided by origin and destination; the generated chain is the one played.
    std::optional<Move> canonical = FindLegalMove(*this, move.origin, move.destination);
    PlayMove(*canonical);
    if (applied) *applied = std::move(*canonical);
    return MoveError::None;
}

void GameState::PlayMove(const Move& move) {
    assert(board_->Contains(move.origin) && board_->Contains(move.destination));
    assert(cells_[move.origin] != Color::None);
    assert(cells_[move.destination] == Color::None);
    const Color mover = cells_[move.origin];
    cells_[move.origin] = Color::None;
    cells_[move.destination] = mover;
    moveCount_++;
    SetCurrentColor(mover);
    advanceTurn();
}

void GameState::PassTurn() {
    advanceTurn();
}

bool GameState::HasWon(Color color) const {
    if (color == Color::None) return false;
    int pegs = 0;
    for (int idx = 0; idx < static_cast<int>(cells_.size()); ++idx) {
        if (cells_[idx] != color) continue;
        if (!board_->InTarget(idx, color)) return false;
        pegs++;
    }
    return pegs > 0;
}

std::optional<Color> GameState::Winner() const {
    for (Color color : active_) {
        if (HasWon(color)) return color;
    }
    return std::nullopt;
}

bool GameState::IsTerminal() const {
    return Winner().has_value() || !AnyColorCanMove(*this);
}

bool GameState::CheckInvariants(int pegsPerColor) const {
    for (int c = 0; c < kColorCount; ++c) {
        const Color color = ColorFromIndex(c);
        const int expected = IsActive(color) ? pegsPerColor : 0;
        if (PieceCount(color) != expected) return false;
    }
    return true;
}

void GameState::print(std::ostream& os) const {
    const Board& board = *board_;
    os << "\n    ";
    for (int col = 0; col < Board::kDisplayCols; ++col) {
        os << ((col % 10 == 0) ? static_cast<char>('0' + col / 10) : ' ');
    }
    os << "\n    ";
    for (int col = 0; col < Board::kDisplayCols; ++col) {
        os << static_cast<char>('0' + col % 10);
    }
    os << "\n";
    for (int row = 0; row < Board::kDisplayRows; ++row) {
        os << (row < 10 ? " " : "") << row << "  ";
        std::string line(Board::kDisplayCols, ' ');
        for (int col = 0; col < Board::kDisplayCols; ++col) {
            const int cell = board.IndexAtDisplay(row, col);
            if (cell >= 0) line[col] = ColorSymbol(cells_[cell]);
        }
        line.erase(line.find_last_not_of(' ') + 1);
        os << line << "\n";
    }
}

std::string FormatMove(const Board& board, const Move& move) {
    auto cell = [&board](int idx) {
        return "(" + std::to_string(board.DisplayRow(idx)) + "," + std::to_string(board.DisplayCol(idx)) + ")";
    };
    std::string out = cell(move.origin) + " -> " + cell(move.destination);
    if (!move.path.empty()) {
        out += " via";
        for (int hop : move.path) out += " " + cell(hop);
    }
    return out;
}
