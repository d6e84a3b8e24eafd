#include "core/TurnController.hpp"
#include "core/Errors.hpp"
#include "core/MoveGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

const char* GameStatusName(GameStatus status) {
    switch (status) {
        case GameStatus::InProgress: return "in_progress";
        case GameStatus::Won: return "won";
        case GameStatus::Stalemate: return "stalemate";
        case GameStatus::PlyLimit: return "ply_limit";
        case GameStatus::Aborted: return "aborted";
    }
    return "unknown";
}

TurnController::TurnController(GameState initial, std::vector<std::unique_ptr<Player>> seats, int plyLimit)
    : state(std::move(initial)), players(std::move(seats)), maxPlies(plyLimit) {
    if (maxPlies <= 0) {
        throw InvalidConfiguration("Ply limit must be positive");
    }
    if (players.size() != state.ActiveColors().size()) {
        throw InvalidConfiguration("Expected " + std::to_string(state.ActiveColors().size()) +
                                   " players, got " + std::to_string(players.size()));
    }
    if (std::find(players.begin(), players.end(), nullptr) != players.end()) {
        throw InvalidConfiguration("Empty player seat");
    }
    for (Color color : state.ActiveColors()) {
        const auto seated = std::count_if(players.begin(), players.end(), [color](const std::unique_ptr<Player>& p) {
            return p->Id() == color;
        });
        if (seated != 1) {
            throw InvalidConfiguration("Color " + ColorName(color) + " needs exactly one player");
        }
    }
    updateStatus();
}

Player* TurnController::playerFor(Color color) const {
    for (const auto& p : players) {
        if (p->Id() == color) return p.get();
    }
    return nullptr;
}

Player& TurnController::CurrentPlayer() const {
    Player* player = playerFor(state.CurrentColor());
    if (!player) {
        throw std::logic_error("No player seated for " + ColorName(state.CurrentColor()));
    }
    return *player;
}

void TurnController::setLogUsage(bool enable) {
    logUsage = enable;
}

void TurnController::setTurnListener(TurnListener l) {
    listener = std::move(l);
}

TurnOutcome TurnController::PlayTurn() {
    if (IsOver()) return TurnOutcome::Finished;

    const Color color = state.CurrentColor();
    if (!HasAnyLegalMove(state, color)) {
        if (logUsage) {
            std::cout << "[Turn] " << ColorName(color) << " has no legal move, turn skipped\n";
        }
        state.PassTurn();
        finishTurn(TurnRecord{Ply() + 1, color, std::nullopt, true});
        return TurnOutcome::Skipped;
    }

    Player& player = CurrentPlayer();
    std::optional<Move> choice = player.ChooseMove(state);
    if (!choice) {
        PassTurn();
        return TurnOutcome::Skipped;
    }

    const MoveError error = SubmitMove(*choice);
    if (error == MoveError::None) return TurnOutcome::Moved;

    if (!player.IsHuman()) {
        // Strategies only return generated moves.
        throw std::logic_error(std::string("Strategy for ") + ColorName(color) + " chose an illegal move: " +
                               MoveErrorMessage(error));
    }
    return TurnOutcome::Rejected;
}

MoveError TurnController::SubmitMove(const Move& move) {
    if (IsOver()) {
        throw std::logic_error("SubmitMove called after the game ended");
    }
    const Color color = state.CurrentColor();
    Move applied;
    const MoveError error = state.ApplyMove(move, &applied);
    if (error != MoveError::None) {
        if (logUsage) std::cout << "[Turn] Rejected move for " << ColorName(color) << ": " << MoveErrorMessage(error) << "\n";
        return error;
    }
    finishTurn(TurnRecord{Ply() + 1, color, std::move(applied), false});
    return MoveError::None;
}

void TurnController::PassTurn() {
    if (IsOver()) return;
    const Color color = state.CurrentColor();
    state.PassTurn();
    if (logUsage) {
        std::cout << "[Turn] " << ColorName(color) << " passes\n";
    }
    finishTurn(TurnRecord{Ply() + 1, color, std::nullopt, false});
}

void TurnController::Resign() {
    if (IsOver()) return;
    status = GameStatus::Aborted;
    if (logUsage) {
        std::cout << "[Turn] Game aborted at ply " << Ply() << "\n";
    }
}

GameStatus TurnController::Run() {
    while (!IsOver()) {
        PlayTurn();
    }
    return status;
}

void TurnController::finishTurn(TurnRecord record) {
    history.push_back(std::move(record));
    updateStatus();
    if (listener) {
        listener(history.back(), state);
    }
}

void TurnController::updateStatus() {
    winner = state.Winner();
    if (winner) {
        status = GameStatus::Won;
        if (logUsage) std::cout << "[Turn] " << ColorName(*winner) << " wins after " << Ply() << " plies\n";
    } else if (!AnyColorCanMove(state)) {
        status = GameStatus::Stalemate;
        if (logUsage) std::cout << "[Turn] Stalemate after " << Ply() << " plies\n";
    } else if (Ply() >= maxPlies) {
        status = GameStatus::PlyLimit;
        if (logUsage) std::cout << "[Turn] Ply limit " << maxPlies << " reached\n";
    }
}
