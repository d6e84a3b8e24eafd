#include "core/MoveGenerator.hpp"

#include <algorithm>
#include <deque>
#include <iterator>

const char* MoveErrorMessage(MoveError error) {
    switch (error) {
        case MoveError::None: return "legal move";
        case MoveError::NotOnBoard: return "cell is not on the board";
        case MoveError::NotOwned: return "origin does not hold a peg of the side to move";
        case MoveError::DestinationOccupied: return "destination is occupied";
        case MoveError::Unreachable: return "destination cannot be reached from origin";
    }
    return "unknown move error";
}

bool CanRestAt(const GameState& state, Color color, int cell) {
    if (!state.Rules().restrictForeignRegions) return true;
    const Board& board = state.GetBoard();
    const int region = board.RegionOf(cell);
    return region == Board::kCenterRegion || board.InHome(cell, color) || board.InTarget(cell, color);
}

std::vector<Move> LegalMoves(const GameState& state, int origin) {
    std::vector<Move> moves;
    const Board& board = state.GetBoard();
    if (!board.Contains(origin)) return moves;
    const Color color = state.At(origin);
    if (color == Color::None) return moves;

    const int cellCount = board.CellCount();
    std::vector<char> isStep(cellCount, 0);

    // Single steps
    for (int d = 0; d < 6; ++d) {
        const int nb = board.Neighbor(origin, d);
        if (nb < 0 || !state.IsEmpty(nb)) continue;
        isStep[nb] = 1;
        if (CanRestAt(state, color, nb)) {
            moves.emplace_back(origin, nb);
        }
    }

    // Jump chains, breadth first so each destination keeps its shortest chain.
    // The moving peg is lifted off origin for the whole chain.
    auto occupied = [&](int cell) { return cell != origin && !state.IsEmpty(cell); };
    std::vector<char> visited(cellCount, 0);
    std::vector<int> parent(cellCount, -1);
    std::deque<int> frontier;
    visited[origin] = 1;
    frontier.push_back(origin);

    while (!frontier.empty()) {
        const int cur = frontier.front();
        frontier.pop_front();
        for (int d = 0; d < 6; ++d) {
            const int over = board.Neighbor(cur, d);
            if (over < 0 || !occupied(over)) continue;
            const int land = board.Neighbor(over, d);
            if (land < 0 || occupied(land) || visited[land]) continue;
            visited[land] = 1;
            parent[land] = cur;
            frontier.push_back(land);

            if (isStep[land] || !CanRestAt(state, color, land)) continue;
            std::vector<int> path;
            for (int p = cur; p != origin; p = parent[p]) {
                path.push_back(p);
            }
            std::reverse(path.begin(), path.end());
            moves.emplace_back(origin, land, std::move(path));
        }
    }
    return moves;
}

std::vector<Move> AllLegalMoves(const GameState& state, Color color) {
    std::vector<Move> all;
    for (int cell : state.PiecesOf(color)) {
        std::vector<Move> moves = LegalMoves(state, cell);
        all.insert(all.end(), std::make_move_iterator(moves.begin()), std::make_move_iterator(moves.end()));
    }
    return all;
}

bool HasAnyLegalMove(const GameState& state, Color color) {
    for (int cell : state.PiecesOf(color)) {
        if (!LegalMoves(state, cell).empty()) return true;
    }
    return false;
}

bool AnyColorCanMove(const GameState& state) {
    for (Color color : state.ActiveColors()) {
        if (HasAnyLegalMove(state, color)) return true;
    }
    return false;
}

std::optional<Move> FindLegalMove(const GameState& state, int origin, int destination) {
    for (Move& move : LegalMoves(state, origin)) {
        if (move.destination == destination) return std::move(move);
    }
    return std::nullopt;
}

MoveError ValidateMove(const GameState& state, const Move& move) {
    const Board& board = state.GetBoard();
    if (!board.Contains(move.origin) || !board.Contains(move.destination)) {
        return MoveError::NotOnBoard;
    }
    if (state.At(move.origin) != state.CurrentColor()) {
        return MoveError::NotOwned;
    }
    if (!state.IsEmpty(move.destination)) {
        return MoveError::DestinationOccupied;
    }
    if (!FindLegalMove(state, move.origin, move.destination)) {
        return MoveError::Unreachable;
    }
    return MoveError::None;
}
