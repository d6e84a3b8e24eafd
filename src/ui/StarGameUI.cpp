#include "ui/StarGameUI.hpp"

#include "core/Errors.hpp"
#include "core/GameState.hpp"
#include "core/MoveGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

constexpr float kWindowMargin = 24.0f;
constexpr float kCellSpacing = 2.4f;       // neighbor distance in radii
constexpr float kRowHeight = 0.8660254f;   // sqrt(3) / 2
constexpr sf::Uint8 kHoverAlpha = 180;
constexpr float kSelectedOutline = 3.0f;
constexpr float kTargetOutline = 2.0f;
constexpr sf::Uint8 kGameOverAlpha = 120;

namespace {

sf::Color pegColor(Color color) {
    switch (color) {
        case Color::Red: return sf::Color(210, 60, 60);
        case Color::Orange: return sf::Color(235, 145, 40);
        case Color::Yellow: return sf::Color(230, 210, 60);
        case Color::Green: return sf::Color(60, 165, 80);
        case Color::Blue: return sf::Color(70, 120, 210);
        case Color::Purple: return sf::Color(145, 80, 200);
        case Color::None: break;
    }
    return sf::Color(210, 210, 220);
}

// Human seats move through clicks, so the controller never asks them.
std::optional<Move> clickOnlyInput(const GameState&, Color) {
    return std::nullopt;
}

} // namespace

StarGameUI::Cell::Cell(const sf::Vector2f& centerPos, int idx, float radius)
    : center(centerPos), index(idx) {
    shape.setRadius(radius);
    shape.setOrigin(radius, radius);
    shape.setPosition(center);
    shape.setOutlineColor(sf::Color(40, 40, 50));
    shape.setOutlineThickness(1.0f);
}

StarGameUI::StarGameUI(const GameConfig& config, const std::string& backgroundPath, float cellRadius)
    : config_(config),
      backgroundPath_(backgroundPath),
      cellRadius_(cellRadius) {
    if (cellRadius_ <= 0.0f) {
        error_ = "Cell radius must be positive.";
        return;
    }
    try {
        config_.Validate();
    } catch (const InvalidConfiguration& e) {
        error_ = std::string("Invalid configuration: ") + e.what();
        return;
    }
    if (!loadBackgroundTexture()) {
        return;
    }

    buildLayout();
    resetGame();
}

bool StarGameUI::loadBackgroundTexture() {
    if (backgroundPath_.empty()) {
        return true;
    }
    if (!backgroundTexture_.loadFromFile(backgroundPath_)) {
        error_ = "Failed to load background texture: " + backgroundPath_;
        return false;
    }
    const sf::Vector2u backgroundSize = backgroundTexture_.getSize();
    if (backgroundSize.x == 0 || backgroundSize.y == 0) {
        error_ = "Invalid background texture size.";
        return false;
    }
    backgroundSprite_.setTexture(backgroundTexture_);
    return true;
}

void StarGameUI::buildLayout() {
    cells_.clear();

    // One display column is half the neighbor distance.
    const float dxCol = cellRadius_ * kCellSpacing * 0.5f;
    const float dyRow = cellRadius_ * kCellSpacing * kRowHeight;

    const float boardWidth = dxCol * (Board::kDisplayCols - 1) + 2.0f * cellRadius_;
    const float boardHeight = dyRow * (Board::kDisplayRows - 1) + 2.0f * cellRadius_;
    windowSize_ = sf::Vector2u(
        static_cast<unsigned int>(std::ceil(boardWidth + 2.0f * kWindowMargin)),
        static_cast<unsigned int>(std::ceil(boardHeight + 2.0f * kWindowMargin)));

    const sf::Vector2f offset(kWindowMargin + cellRadius_, kWindowMargin + cellRadius_);
    cells_.reserve(static_cast<std::size_t>(board_.CellCount()));
    for (int idx = 0; idx < board_.CellCount(); ++idx) {
        sf::Vector2f center(
            offset.x + dxCol * static_cast<float>(board_.DisplayCol(idx)),
            offset.y + dyRow * static_cast<float>(board_.DisplayRow(idx)));
        cells_.emplace_back(center, idx, cellRadius_);
    }
}

void StarGameUI::clearSelection() {
    selectedIndex_ = -1;
    selectedMoves_.clear();
}

void StarGameUI::updateCellColors() {
    const GameState& state = controller_->State();
    for (auto& cell : cells_) {
        sf::Color color = pegColor(state.At(cell.index));
        color.a = (cell.index == hoveredIndex_) ? kHoverAlpha : 255;
        cell.shape.setFillColor(color);
        cell.shape.setOutlineColor(sf::Color(40, 40, 50));
        cell.shape.setOutlineThickness(1.0f);
    }
    if (selectedIndex_ >= 0) {
        Cell& selected = cells_[static_cast<std::size_t>(selectedIndex_)];
        selected.shape.setOutlineColor(sf::Color::White);
        selected.shape.setOutlineThickness(kSelectedOutline);
        for (const Move& move : selectedMoves_) {
            Cell& target = cells_[static_cast<std::size_t>(move.destination)];
            target.shape.setOutlineColor(pegColor(state.CurrentColor()));
            target.shape.setOutlineThickness(kTargetOutline);
        }
    }
}

void StarGameUI::handleClick(int cellIdx) {
    if (cellIdx < 0 || controller_->IsOver() || !controller_->CurrentPlayer().IsHuman()) {
        return;
    }
    const GameState& state = controller_->State();

    if (selectedIndex_ >= 0) {
        auto it = std::find_if(selectedMoves_.begin(), selectedMoves_.end(),
                               [cellIdx](const Move& m) { return m.destination == cellIdx; });
        if (it != selectedMoves_.end()) {
            const Move chosen = *it;
            clearSelection();
            if (controller_->SubmitMove(chosen) == MoveError::None) {
                printBoardStatus();
            }
            updateCellColors();
            return;
        }
    }

    if (state.At(cellIdx) == state.CurrentColor()) {
        selectedIndex_ = cellIdx;
        selectedMoves_ = LegalMoves(state, cellIdx);
    } else {
        clearSelection();
    }
    updateCellColors();
}

int StarGameUI::pickCellIndex(const sf::Vector2f& pos) const {
    int bestIndex = -1;
    float bestDist2 = std::numeric_limits<float>::max();
    const float radius2 = cellRadius_ * cellRadius_;

    for (const auto& cell : cells_) {
        float dx = pos.x - cell.center.x;
        float dy = pos.y - cell.center.y;
        float dist2 = dx * dx + dy * dy;
        if (dist2 <= radius2 && dist2 < bestDist2) {
            bestDist2 = dist2;
            bestIndex = cell.index;
        }
    }
    return bestIndex;
}

void StarGameUI::updateWindowTitle(sf::RenderWindow& window) const {
    switch (controller_->Status()) {
        case GameStatus::Won:
            window.setTitle("Star Checkers - Winner " + ColorName(*controller_->Winner()));
            return;
        case GameStatus::Stalemate:
            window.setTitle("Star Checkers - Stalemate");
            return;
        case GameStatus::PlyLimit:
            window.setTitle("Star Checkers - Ply limit reached");
            return;
        case GameStatus::Aborted:
            window.setTitle("Star Checkers - Game Over");
            return;
        case GameStatus::InProgress:
            break;
    }
    const Color current = controller_->State().CurrentColor();
    const char* who = controller_->CurrentPlayer().IsHuman() ? "" : " (thinking)";
    window.setTitle("Star Checkers - Turn " + ColorName(current) + who);
}

void StarGameUI::updateHover(const sf::RenderWindow& window) {
    sf::Vector2i pixelPos = sf::Mouse::getPosition(window);
    if (pixelPos.x < 0 || pixelPos.y < 0 ||
        pixelPos.x >= static_cast<int>(window.getSize().x) ||
        pixelPos.y >= static_cast<int>(window.getSize().y)) {
        if (hoveredIndex_ != -1) {
            hoveredIndex_ = -1;
            updateCellColors();
        }
        return;
    }

    sf::Vector2f pos = window.mapPixelToCoords(pixelPos);
    int idx = pickCellIndex(pos);
    if (idx != hoveredIndex_) {
        hoveredIndex_ = idx;
        updateCellColors();
    }
}

void StarGameUI::printBoardStatus() const {
    controller_->State().print();
    switch (controller_->Status()) {
        case GameStatus::Won:
            std::cout << "\n" << ColorName(*controller_->Winner()) << " wins!\n";
            return;
        case GameStatus::InProgress:
            std::cout << "\n" << ColorName(controller_->State().CurrentColor()) << " turn\n";
            return;
        default:
            std::cout << "\nGame over (" << GameStatusName(controller_->Status()) << ").\n";
            return;
    }
}

void StarGameUI::resetGame() {
    controller_ = std::make_unique<TurnController>(
        GameState::Initial(board_, config_.ActiveColors(), config_.Rules()),
        MakePlayers(config_, clickOnlyInput),
        config_.maxPlies);
    controller_->setLogUsage(config_.logSearch);
    clearSelection();
    reported_ = false;
    gameOverOverlay_.setFillColor(sf::Color(0, 0, 0, 0));
    updateCellColors();
    std::cout << "[UI] New game, " << config_.playerCount << " players\n";
}

int StarGameUI::run() {
    if (!error_.empty()) {
        std::cerr << error_ << "\n";
        return 1;
    }
    if (windowSize_.x == 0 || windowSize_.y == 0) {
        std::cerr << "Invalid window size.\n";
        return 1;
    }

    sf::RenderWindow window(
        sf::VideoMode(windowSize_.x, windowSize_.y),
        "Star Checkers");
    window.setFramerateLimit(60);
    gameOverOverlay_.setSize(sf::Vector2f(windowSize_.x, windowSize_.y));
    gameOverOverlay_.setPosition(0.0f, 0.0f);
    if (backgroundTexture_.getSize().x != 0 && backgroundTexture_.getSize().y != 0) {
        const sf::Vector2u backgroundSize = backgroundTexture_.getSize();
        backgroundSprite_.setScale(
            static_cast<float>(windowSize_.x) / backgroundSize.x,
            static_cast<float>(windowSize_.y) / backgroundSize.y);
    }
    updateWindowTitle(window);
    printBoardStatus();

    while (window.isOpen()) {
        bool humanMovedThisFrame = false;
        sf::Event event;
        while (window.pollEvent(event)) {
            if (event.type == sf::Event::Closed ||
                (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::Escape)) {
                window.close();
            }
            if (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::R) {
                resetGame();
                printBoardStatus();
                updateWindowTitle(window);
            }
            if (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::P &&
                !controller_->IsOver() && controller_->CurrentPlayer().IsHuman()) {
                clearSelection();
                controller_->PassTurn();
                humanMovedThisFrame = true;
                updateCellColors();
                updateWindowTitle(window);
            }
            if (!controller_->IsOver() &&
                event.type == sf::Event::MouseButtonPressed &&
                event.mouseButton.button == sf::Mouse::Left) {
                sf::Vector2f pos = window.mapPixelToCoords(
                    sf::Vector2i(event.mouseButton.x, event.mouseButton.y));
                const int before = controller_->Ply();
                handleClick(pickCellIndex(pos));
                if (controller_->Ply() != before) {
                    humanMovedThisFrame = true;
                    updateWindowTitle(window);
                }
            }
        }

        updateHover(window);

        // Computer seats and forced skips advance one turn per frame.
        if (!controller_->IsOver() && !humanMovedThisFrame) {
            const GameState& state = controller_->State();
            if (!controller_->CurrentPlayer().IsHuman() || !HasAnyLegalMove(state, state.CurrentColor())) {
                controller_->PlayTurn();
                clearSelection();
                updateCellColors();
                printBoardStatus();
                updateWindowTitle(window);
            }
        }

        if (controller_->IsOver() && !reported_) {
            reported_ = true;
            gameOverOverlay_.setFillColor(sf::Color(0, 0, 0, kGameOverAlpha));
            std::cout << "[UI] Game finished: " << GameStatusName(controller_->Status())
                      << " after " << controller_->Ply() << " plies\n";
            updateWindowTitle(window);
        }

        window.clear(sf::Color(30, 30, 40));
        if (backgroundTexture_.getSize().x != 0 && backgroundTexture_.getSize().y != 0) {
            window.draw(backgroundSprite_);
        }
        for (const auto& cell : cells_) {
            window.draw(cell.shape);
        }
        if (controller_->IsOver()) {
            window.draw(gameOverOverlay_);
        }
        window.display();
    }
    return 0;
}
