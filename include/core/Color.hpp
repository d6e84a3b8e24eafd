#pragma once
#include <cstdint>
#include <string>

/**
 * Peg colors. Each color starts in the star point with the same index
 * (0 = top, clockwise) and must fill the opposite point.
 */
enum class Color : std::int8_t {
    None = -1,
    Red = 0,
    Orange,
    Yellow,
    Green,
    Blue,
    Purple
};

constexpr int kColorCount = 6;

/// Region index of a color (0..5), -1 for Color::None.
inline int ColorIndex(Color color) { return static_cast<int>(color); }

/// Color for a region index; Color::None outside 0..5.
inline Color ColorFromIndex(int index) {
    if (index < 0 || index >= kColorCount) return Color::None;
    return static_cast<Color>(index);
}

/// Color whose home is this color's target.
inline Color OppositeColor(Color color) {
    if (color == Color::None) return Color::None;
    return ColorFromIndex((ColorIndex(color) + kColorCount / 2) % kColorCount);
}

/// Display name ("Red", ...), "None" for empty.
std::string ColorName(Color color);

/// Single-character board symbol ('R', ...), '.' for empty.
char ColorSymbol(Color color);
