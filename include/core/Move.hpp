#pragma once
#include <utility>
#include <vector>

/**
 * One peg movement, in cell ids.
 *
 * path holds the intermediate landing cells of a jump chain (empty for a
 * single step or a single jump). Jumped-over pegs stay on the board.
 */
struct Move {
    int origin{-1};
    int destination{-1};
    std::vector<int> path;

    Move() = default;
    Move(int from, int to, std::vector<int> landings = {})
        : origin(from), destination(to), path(std::move(landings)) {}

    bool operator==(const Move& o) const noexcept {
        return origin == o.origin && destination == o.destination && path == o.path;
    }
    bool operator!=(const Move& o) const noexcept { return !(*this == o); }

    /// Origin, every landing, and destination in order.
    std::vector<int> Hops() const {
        std::vector<int> hops;
        hops.reserve(path.size() + 2);
        hops.push_back(origin);
        hops.insert(hops.end(), path.begin(), path.end());
        hops.push_back(destination);
        return hops;
    }
};
