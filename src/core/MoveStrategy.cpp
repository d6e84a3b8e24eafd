#include "core/MoveStrategy.hpp"
#include "core/MoveGenerator.hpp"
#include <algorithm>
#include <cassert>
#include <future>
#include <iostream>
#include <limits>
#include <utility>

GreedyStrategy::GreedyStrategy(Evaluator evaluator)
    : evaluator(std::move(evaluator)) {}

void GreedyStrategy::setLogUsage(bool enable) {
    logUsage = enable;
}

std::optional<Move> GreedyStrategy::select(const GameState& state, Color color) {
    const std::vector<Move> moves = AllLegalMoves(state, color);
    if (moves.empty()) {
        if (logUsage) {
            std::cout << "[Greedy] " << ColorName(color) << " has no legal move\n";
        }
        return std::nullopt;
    }

    std::size_t best = 0;
    int bestScore = std::numeric_limits<int>::min();
    for (std::size_t i = 0; i < moves.size(); ++i) {
        GameState child(state);
        child.PlayMove(moves[i]);
        const int score = evaluator.Score(child, color);
        // Strict comparison keeps the first move on ties.
        if (score > bestScore) {
            bestScore = score;
            best = i;
        }
    }

    if (logUsage) {
        std::cout << "[Greedy] " << ColorName(color) << " | moves=" << moves.size()
                  << " choice=" << FormatMove(state.GetBoard(), moves[best])
                  << " score=" << bestScore << "\n";
    }
    return moves[best];
}

MinimaxStrategy::MinimaxStrategy(int maxDepth, int moveLimit, Evaluator evaluator)
    : maxDepth(maxDepth),
      moveLimit(std::max(0, moveLimit)),
      evaluator(std::move(evaluator)) {}

void MinimaxStrategy::setLogUsage(bool enable) {
    logUsage = enable;
}

void MinimaxStrategy::setParallelThreads(int threads) {
    parallelRootThreads = std::max(1, threads);
}

std::optional<Move> MinimaxStrategy::select(const GameState& state, Color color) {
    SearchResult res = Search(state, color, maxDepth);
    if (logUsage) {
        if (res.bestMove) {
            std::cout << "[Minimax] " << ColorName(color) << " | depth=" << res.depth
                      << " nodes=" << res.nodes
                      << " move=" << FormatMove(state.GetBoard(), *res.bestMove)
                      << " score=" << res.score << "\n";
        } else {
            std::cout << "[Minimax] " << ColorName(color) << " has no legal move\n";
        }
    }
    return res.bestMove;
}

std::vector<MinimaxStrategy::Child> MinimaxStrategy::expand(const GameState& state, Color rootColor, bool maximizing) const {
    std::vector<Child> children;
    std::vector<Move> moves = AllLegalMoves(state, state.CurrentColor());
    children.reserve(moves.size());
    for (Move& move : moves) {
        GameState next(state);
        next.PlayMove(move);
        const int score = evaluator.Score(next, rootColor);
        children.push_back(Child{std::move(move), std::move(next), score});
    }

    // Stable so equal scores keep generation order.
    if (maximizing) {
        std::stable_sort(children.begin(), children.end(),
                         [](const Child& a, const Child& b) { return a.score > b.score; });
    } else {
        std::stable_sort(children.begin(), children.end(),
                         [](const Child& a, const Child& b) { return a.score < b.score; });
    }
    if (moveLimit > 0 && static_cast<int>(children.size()) > moveLimit) {
        children.erase(children.begin() + moveLimit, children.end());
    }
    return children;
}

int MinimaxStrategy::minimax(const GameState& state, int depth, int alpha, int beta, Color rootColor, long long& nodes) const {
    nodes++;
    if (depth <= 0 || state.Winner()) {
        return evaluator.Score(state, rootColor);
    }

    const bool maximizing = (state.CurrentColor() == rootColor);
    const std::vector<Child> children = expand(state, rootColor, maximizing);
    if (children.empty()) {
        if (!AnyColorCanMove(state)) {
            return evaluator.Score(state, rootColor);
        }
        // Side to move is stuck: it passes and the ply still counts.
        GameState passed(state);
        passed.PassTurn();
        return minimax(passed, depth - 1, alpha, beta, rootColor, nodes);
    }

    if (maximizing) {
        int value = -INF;
        for (const Child& child : children) {
            int score = (depth == 1) ? child.score
                                     : minimax(child.state, depth - 1, alpha, beta, rootColor, nodes);
            if (depth == 1) nodes++;
            value = std::max(value, score);
            alpha = std::max(alpha, value);
            if (alpha >= beta) break;
        }
        return value;
    }

    int value = INF;
    for (const Child& child : children) {
        int score = (depth == 1) ? child.score
                                 : minimax(child.state, depth - 1, alpha, beta, rootColor, nodes);
        if (depth == 1) nodes++;
        value = std::min(value, score);
        beta = std::min(beta, value);
        if (alpha >= beta) break;
    }
    return value;
}

SearchResult MinimaxStrategy::Search(const GameState& state, Color color, int depth) const {
    if (depth <= 0) {
        GreedyStrategy greedy(evaluator);
        greedy.setLogUsage(false);
        GameState root(state);
        root.SetCurrentColor(color);
        SearchResult res;
        res.bestMove = greedy.select(root, color);
        res.depth = 0;
        if (res.bestMove) {
            root.PlayMove(*res.bestMove);
        }
        res.score = evaluator.Score(root, color);
        return res;
    }

    GameState root(state);
    root.SetCurrentColor(color);
    const std::vector<Child> children = expand(root, color, true);
    if (children.empty()) {
        SearchResult res;
        res.score = evaluator.Score(root, color);
        res.nodes = 1;
        res.depth = depth;
        return res;
    }

    if (parallelRootThreads > 1 && depth > 1 && children.size() > 1) {
        return searchParallelRoot(children, depth, color);
    }

    SearchResult best;
    best.depth = depth;
    best.nodes = 1;
    best.score = -INF;
    int alpha = -INF;
    std::size_t bestIdx = 0;
    for (std::size_t i = 0; i < children.size(); ++i) {
        int score = children[i].score;
        if (depth > 1) {
            score = minimax(children[i].state, depth - 1, alpha, INF, color, best.nodes);
        } else {
            best.nodes++;
        }
        if (score > best.score) {
            best.score = score;
            bestIdx = i;
        }
        alpha = std::max(alpha, best.score);
    }
    best.bestMove = children[bestIdx].move;
    return best;
}

// Root children are searched in batches with a full window each, then combined
// in child order so the pick matches the sequential search.
SearchResult MinimaxStrategy::searchParallelRoot(const std::vector<Child>& children, int depth, Color rootColor) const {
    struct TaskResult {
        int score;
        long long nodes;
    };

    std::vector<TaskResult> results;
    results.reserve(children.size());
    std::size_t next = 0;
    while (next < children.size()) {
        std::vector<std::future<TaskResult>> futures;
        futures.reserve(static_cast<std::size_t>(parallelRootThreads));
        for (int t = 0; t < parallelRootThreads && next < children.size(); ++t, ++next) {
            const Child* child = &children[next];
            futures.push_back(std::async(std::launch::async, [this, child, depth, rootColor]() {
                long long nodes = 0;
                int score = minimax(child->state, depth - 1, -INF, INF, rootColor, nodes);
                return TaskResult{score, nodes};
            }));
        }
        for (auto& f : futures) {
            results.push_back(f.get());
        }
    }
    assert(results.size() == children.size());

    SearchResult best;
    best.depth = depth;
    best.nodes = 1;
    best.score = -INF;
    std::size_t bestIdx = 0;
    for (std::size_t i = 0; i < results.size(); ++i) {
        best.nodes += results[i].nodes;
        if (results[i].score > best.score) {
            best.score = results[i].score;
            bestIdx = i;
        }
    }
    best.bestMove = children[bestIdx].move;
    return best;
}
