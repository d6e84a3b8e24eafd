#include "core/Cube.hpp"
#include <cstdlib>

// Implements cube coordinate utilities used for hex-grid neighbor calculations.
const std::array<Cube, 6> CubeDirections = {
    Cube(+1, -1, 0),
    Cube(+1, 0, -1),
    Cube(0, +1, -1),
    Cube(-1, +1, 0),
    Cube(-1, 0, +1),
    Cube(0, -1, +1)
};

Cube::Cube() : x(0), y(0), z(0) {}
Cube::Cube(int x_, int y_, int z_) : x(x_), y(y_), z(z_) {}
// y is implied by x and z, so packing those two is collision free.
long long Cube::key() const{
    const unsigned long long hi = static_cast<unsigned int>(x);
    const unsigned long long lo = static_cast<unsigned int>(z);
    return static_cast<long long>((hi << 32) | lo);
}
Cube Cube::operator+(const Cube& other) const{
    return Cube(x + other.x, y + other.y, z + other.z);
}
Cube Cube::operator-(const Cube& other) const{
    return Cube(x - other.x, y - other.y, z - other.z);
}
bool Cube::operator==(const Cube& other) const{
    return x == other.x && y == other.y && z == other.z;
}
bool Cube::operator!=(const Cube& other) const{
    return !(*this == other);
}
int Cube::distance(const Cube& other) const{
    const Cube d = *this - other;
    return (std::abs(d.x) + std::abs(d.y) + std::abs(d.z)) / 2;
}
