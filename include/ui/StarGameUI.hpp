#pragma once

#include <SFML/Graphics.hpp>
#include <memory>
#include <string>
#include <vector>

#include "core/Board.hpp"
#include "core/GameConfig.hpp"
#include "core/TurnController.hpp"

/**
 * SFML front-end: draws the star, lets human seats move by clicking a peg and
 * then one of its highlighted destinations, and lets computer seats move in
 * the frame loop. R restarts, P passes for a human seat, Esc closes.
 */
class StarGameUI {
public:
    StarGameUI(const GameConfig& config, const std::string& backgroundPath, float cellRadius);

    int run();

private:
    struct Cell {
        sf::CircleShape shape;
        sf::Vector2f center;
        int index;

        Cell(const sf::Vector2f& centerPos, int idx, float radius);
    };

    bool loadBackgroundTexture();
    void buildLayout();
    void updateCellColors();
    void handleClick(int cellIdx);
    int pickCellIndex(const sf::Vector2f& pos) const;
    void updateWindowTitle(sf::RenderWindow& window) const;
    void updateHover(const sf::RenderWindow& window);
    void printBoardStatus() const;
    void resetGame();
    void clearSelection();

    GameConfig config_;
    std::string backgroundPath_;
    float cellRadius_ = 14.0f;

    Board board_;
    std::unique_ptr<TurnController> controller_;
    int selectedIndex_ = -1;
    std::vector<Move> selectedMoves_;
    int hoveredIndex_ = -1;
    bool reported_ = false;

    sf::Texture backgroundTexture_;
    sf::Sprite backgroundSprite_;
    sf::RectangleShape gameOverOverlay_;
    sf::Vector2u windowSize_{0, 0};

    std::vector<Cell> cells_;
    std::string error_;
};
