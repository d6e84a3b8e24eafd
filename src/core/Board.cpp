#include "core/Board.hpp"
#include <stdexcept>
#include <string>

namespace {
constexpr int kRowOffset = 2 * Board::kTriangleSize;  // display row of z == 0
constexpr int kColOffset = 3 * Board::kTriangleSize;  // display column of the center

const std::vector<int>& ValidateRegionColor(const std::array<std::vector<int>, kColorCount>& regions, Color color) {
    if (color == Color::None) {
        throw std::invalid_argument("Color::None has no region");
    }
    return regions[ColorIndex(color)];
}
} // namespace

Board::Board() {
    // Walk the display grid so cell ids come out in top-to-bottom, left-to-right order.
    for (int row = 0; row < kDisplayRows; ++row) {
        for (int col = 0; col < kDisplayCols; ++col) {
            if ((row + col) % 2 != 0) continue;
            const int z = row - kRowOffset;
            const int x = (col - kColOffset - z) / 2;
            const Cube cube(x, -x - z, z);
            if (!OnStar(cube)) continue;
            keyToIdx_[cube.key()] = static_cast<int>(cells_.size());
            cells_.push_back(cube);
        }
    }

    adjacency_.resize(cells_.size());
    regions_.resize(cells_.size());
    for (int idx = 0; idx < CellCount(); ++idx) {
        for (int d = 0; d < 6; ++d) {
            adjacency_[idx][d] = IndexOf(cells_[idx] + CubeDirections[d]);
        }
        const int region = RegionOfCube(cells_[idx]);
        regions_[idx] = region;
        if (region != kCenterRegion) {
            regionCells_[region].push_back(idx);
        }
    }

    // The apex is the point cell farthest from the center.
    const Cube center;
    for (int region = 0; region < kColorCount; ++region) {
        int best = -1;
        for (int idx : regionCells_[region]) {
            if (best < 0 || cells_[idx].distance(center) > cells_[best].distance(center)) {
                best = idx;
            }
        }
        apex_[region] = best;
    }

    validate();
}

bool Board::OnStar(const Cube& cube) {
    if (cube.x + cube.y + cube.z != 0) return false;
    const int n = kTriangleSize;
    const bool upward = cube.x <= n && cube.y <= n && cube.z <= n;
    const bool downward = cube.x >= -n && cube.y >= -n && cube.z >= -n;
    return upward || downward;
}

// Points are numbered clockwise from the top one.
int Board::RegionOfCube(const Cube& cube) {
    const int n = kTriangleSize;
    if (cube.z < -n) return 0;
    if (cube.x > n) return 1;
    if (cube.y < -n) return 2;
    if (cube.z > n) return 3;
    if (cube.x < -n) return 4;
    if (cube.y > n) return 5;
    return kCenterRegion;
}

void Board::validate() const {
    if (CellCount() != kCellCount) {
        throw std::logic_error("Star board has " + std::to_string(CellCount()) + " cells, expected 121");
    }
    int centerCells = 0;
    for (int region : regions_) {
        if (region == kCenterRegion) centerCells++;
    }
    if (centerCells != kCenterCellCount) {
        throw std::logic_error("Star board center has " + std::to_string(centerCells) + " cells");
    }
    for (int region = 0; region < kColorCount; ++region) {
        if (static_cast<int>(regionCells_[region].size()) != kRegionCellCount) {
            throw std::logic_error("Star point " + std::to_string(region) + " does not have 10 cells");
        }
    }
    for (int idx = 0; idx < CellCount(); ++idx) {
        for (int d = 0; d < 6; ++d) {
            const int nb = adjacency_[idx][d];
            if (nb >= 0 && adjacency_[nb][(d + 3) % 6] != idx) {
                throw std::logic_error("Asymmetric adjacency at cell " + std::to_string(idx));
            }
        }
    }
}

int Board::IndexOf(const Cube& cube) const {
    auto it = keyToIdx_.find(cube.key());
    if (it == keyToIdx_.end() || cells_[it->second] != cube) return -1;  // also rejects x + y + z != 0
    return it->second;
}

bool Board::IsValidCell(const Cube& cube) const {
    return IndexOf(cube) >= 0;
}

std::vector<int> Board::Neighbors(int cell) const {
    std::vector<int> out;
    for (int nb : adjacency_[cell]) {
        if (nb >= 0) out.push_back(nb);
    }
    return out;
}

const std::vector<int>& Board::HomeRegion(Color color) const {
    return ValidateRegionColor(regionCells_, color);
}

const std::vector<int>& Board::TargetRegion(Color color) const {
    return ValidateRegionColor(regionCells_, OppositeColor(color));
}

bool Board::InHome(int cell, Color color) const {
    return color != Color::None && regions_[cell] == ColorIndex(color);
}

bool Board::InTarget(int cell, Color color) const {
    return color != Color::None && regions_[cell] == ColorIndex(OppositeColor(color));
}

int Board::TargetApex(Color color) const {
    if (color == Color::None) {
        throw std::invalid_argument("Color::None has no target");
    }
    return apex_[ColorIndex(OppositeColor(color))];
}

int Board::DisplayRow(int cell) const {
    return cells_[cell].z + kRowOffset;
}

int Board::DisplayCol(int cell) const {
    return 2 * cells_[cell].x + cells_[cell].z + kColOffset;
}

int Board::IndexAtDisplay(int row, int col) const {
    if (row < 0 || row >= kDisplayRows || col < 0 || col >= kDisplayCols) return -1;
    if ((row + col) % 2 != 0) return -1;
    const int z = row - kRowOffset;
    const int x = (col - kColOffset - z) / 2;
    return IndexOf(Cube(x, -x - z, z));
}
