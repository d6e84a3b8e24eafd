#pragma once
#include <array>

/**
 *Cube coordinates for hex-grid neighbor arithmetic (x + y + z == 0).
 */
class Cube {
    public:
    int x;
    int y;
    int z;
    /// Creates cube coordinates (x, y, z).
    Cube(int x_,int y_, int z_);
    /// Creates a zero coordinate (0,0,0).
    Cube();
    /// Returns a hashable key for the coordinate.
    long long key() const;
    /// Adds two cube coordinates.
    Cube operator+(const Cube& other) const;
    /// Subtracts two cube coordinates.
    Cube operator-(const Cube& other) const;
    bool operator==(const Cube& other) const;
    bool operator!=(const Cube& other) const;
    /// Hex distance between two coordinates.
    int distance(const Cube& other) const;
};

/// The six unit directions; direction d and (d + 3) % 6 are opposite.
extern const std::array<Cube, 6> CubeDirections;
