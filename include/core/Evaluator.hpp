#pragma once
#include "core/GameState.hpp"

/**
 * Positional heuristic: progress of a color's pegs toward the tip of its
 * target point, measured against the best placed opponent. Pure function of
 * the position, so an opponent's move changes the score as much as one's own.
 */
class Evaluator {
public:
    static constexpr int kWinScore = 1000000;

    struct Weights {
        int distance{10};   // per step between a peg and the target apex
        int targetBonus{6}; // per peg resting in the target point
        int homePenalty{4}; // per peg still on the home point
        int straggler{3};   // per step of the peg farthest from the apex
    };

    Evaluator() = default;
    explicit Evaluator(const Weights& weights) : weights_(weights) {}

    /// Progress of color minus the best progress among the other active colors;
    /// higher is better. +/-kWinScore once someone has won.
    int Score(const GameState& state, Color color) const;
    /// Progress of color's own pegs only (no win check, no opponents).
    int Progress(const GameState& state, Color color) const;

private:
    Weights weights_{};
};
