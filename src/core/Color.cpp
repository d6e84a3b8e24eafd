#include "core/Color.hpp"

std::string ColorName(Color color) {
    switch (color) {
        case Color::Red: return "Red";
        case Color::Orange: return "Orange";
        case Color::Yellow: return "Yellow";
        case Color::Green: return "Green";
        case Color::Blue: return "Blue";
        case Color::Purple: return "Purple";
        case Color::None: break;
    }
    return "None";
}

char ColorSymbol(Color color) {
    switch (color) {
        case Color::Red: return 'R';
        case Color::Orange: return 'O';
        case Color::Yellow: return 'Y';
        case Color::Green: return 'G';
        case Color::Blue: return 'B';
        case Color::Purple: return 'P';
        case Color::None: break;
    }
    return '.';
}
