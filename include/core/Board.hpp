#pragma once
#include <array>
#include <unordered_map>
#include <vector>
#include "core/Color.hpp"
#include "core/Cube.hpp"

/**
 * Standard six-point star topology (121 cells).
 *
 * Cells are addressed by id 0..120 in display order (top row first). The board
 * is immutable after construction and shared read-only by every GameState.
 */
class Board {
public:
    static constexpr int kTriangleSize = 4;   // rows in a star point
    static constexpr int kCellCount = 121;
    static constexpr int kCenterCellCount = 61;
    static constexpr int kRegionCellCount = 10;
    static constexpr int kCenterRegion = -1;
    static constexpr int kDisplayRows = 4 * kTriangleSize + 1;  // 17
    static constexpr int kDisplayCols = 6 * kTriangleSize + 1;  // 25

    /// Builds the star and validates its topology (throws std::logic_error).
    Board();

    int CellCount() const { return static_cast<int>(cells_.size()); }
    /// Coordinate of a cell id.
    const Cube& CellAt(int cell) const { return cells_[cell]; }
    /// Cell id for a coordinate, -1 when it is not on the board.
    int IndexOf(const Cube& cube) const;
    /// True when the coordinate lies on the star.
    bool IsValidCell(const Cube& cube) const;
    /// True when the id names a cell.
    bool Contains(int cell) const { return cell >= 0 && cell < CellCount(); }

    /// Neighbor of cell in direction dir (0..5), -1 off-board.
    int Neighbor(int cell, int dir) const { return adjacency_[cell][dir]; }
    /// All on-board neighbors (at most 6).
    std::vector<int> Neighbors(int cell) const;

    /// Region of a cell: 0..5 for the star points, kCenterRegion for the hexagon.
    int RegionOf(int cell) const { return regions_[cell]; }
    /// Cells of a star point.
    const std::vector<int>& RegionCells(int region) const { return regionCells_[region]; }
    /// Starting point of a color.
    const std::vector<int>& HomeRegion(Color color) const;
    /// Point a color must fill to win.
    const std::vector<int>& TargetRegion(Color color) const;
    bool InHome(int cell, Color color) const;
    bool InTarget(int cell, Color color) const;
    /// Tip cell of the target point of a color.
    int TargetApex(Color color) const;
    /// Hex distance between two cells.
    int Distance(int a, int b) const { return cells_[a].distance(cells_[b]); }

    /// Display grid position (row 0..16, doubled column 0..24).
    int DisplayRow(int cell) const;
    int DisplayCol(int cell) const;
    /// Cell at a display position, -1 when none.
    int IndexAtDisplay(int row, int col) const;

private:
    static bool OnStar(const Cube& cube);
    static int RegionOfCube(const Cube& cube);
    void validate() const;

    std::vector<Cube> cells_;
    std::unordered_map<long long, int> keyToIdx_;
    std::vector<std::array<int, 6>> adjacency_;
    std::vector<int> regions_;
    std::array<std::vector<int>, kColorCount> regionCells_;
    std::array<int, kColorCount> apex_{};
};
