#include "core/Evaluator.hpp"
#include <algorithm>
#include <limits>

int Evaluator::Score(const GameState& state, Color color) const {
    if (std::optional<Color> winner = state.Winner()) {
        return (*winner == color) ? kWinScore : -kWinScore;
    }
    int rival = std::numeric_limits<int>::min();
    for (Color other : state.ActiveColors()) {
        if (other != color) rival = std::max(rival, Progress(state, other));
    }
    if (rival == std::numeric_limits<int>::min()) return Progress(state, color);
    return Progress(state, color) - rival;
}

int Evaluator::Progress(const GameState& state, Color color) const {
    const Board& board = state.GetBoard();
    const int apex = board.TargetApex(color);
    int score = 0;
    int farthest = 0;
    for (int cell : state.PiecesOf(color)) {
        const int dist = board.Distance(cell, apex);
        farthest = std::max(farthest, dist);
        score -= weights_.distance * dist;
        if (board.InTarget(cell, color)) score += weights_.targetBonus;
        else if (board.InHome(cell, color)) score -= weights_.homePenalty;
    }
    score -= weights_.straggler * farthest;
    return score;
}
