#pragma once
#include <optional>
#include <vector>
#include "core/Evaluator.hpp"
#include "core/GameState.hpp"
#include "core/Move.hpp"

/**
 * Strategy interface for selecting a move.
 */
class IMoveStrategy {
    public:
        /// Returns the chosen move for color, or nothing when color cannot move.
        virtual std::optional<Move> select(const GameState& state, Color color) = 0;
        /// Virtual destructor for safe polymorphic cleanup.
        virtual ~IMoveStrategy() = default;
};

/**
 * One-ply strategy: plays the move whose resulting position scores best.
 * Ties go to the move generated first.
 */
class GreedyStrategy : public IMoveStrategy {
public:
    explicit GreedyStrategy(Evaluator evaluator = Evaluator());
    /// Selects the best-scoring move after one ply.
    std::optional<Move> select(const GameState& state, Color color) override;
    /// Enables or disables per-move logging.
    void setLogUsage(bool enable);

private:
    Evaluator evaluator;
    bool logUsage{true};
};

/**
 * Minimax search result container.
 */
struct SearchResult {
    std::optional<Move> bestMove;
    int score{0};
    long long nodes{0};
    int depth{0};
};

/**
 * Depth-limited minimax with alpha-beta pruning.
 *
 * Scores are always taken from the searching color's point of view: its own
 * layers maximize, every other color minimizes. Children are ordered by their
 * one-ply score before being searched, and moveLimit > 0 keeps only the best
 * moveLimit of them at every node.
 */
class MinimaxStrategy : public IMoveStrategy {
public:
    /// Creates a search of the given depth; moveLimit 0 searches every move.
    MinimaxStrategy(int maxDepth, int moveLimit = 0, Evaluator evaluator = Evaluator());
    /// Selects the best move for color at the configured depth.
    std::optional<Move> select(const GameState& state, Color color) override;
    /// Runs a search for color at the given depth. Depth <= 0 behaves like the greedy strategy.
    SearchResult Search(const GameState& state, Color color, int depth) const;

    int getMaxDepth() const { return maxDepth; }
    int getMoveLimit() const { return moveLimit; }
    /// Enables or disables per-move logging.
    void setLogUsage(bool enable);
    /// Sets the number of threads searching root moves; 1 keeps the search sequential.
    void setParallelThreads(int threads);

private:
    struct Child {
        Move move;
        GameState state;
        int score;
    };

    /// Children of state for the side to move, ordered best first for that layer.
    std::vector<Child> expand(const GameState& state, Color rootColor, bool maximizing) const;
    int minimax(const GameState& state, int depth, int alpha, int beta, Color rootColor, long long& nodes) const;
    SearchResult searchParallelRoot(const std::vector<Child>& children, int depth, Color rootColor) const;

    int maxDepth;
    int moveLimit;
    Evaluator evaluator;
    bool logUsage{true};
    int parallelRootThreads{1};
    static constexpr int INF = Evaluator::kWinScore * 2;
};
