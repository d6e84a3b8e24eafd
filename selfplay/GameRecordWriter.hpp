#pragma once

#include <string>
#include <vector>

#include "core/Board.hpp"
#include "GameRecorder.hpp"

/**
 * Writes finished games as JSON Lines, one object per game. Cells are written
 * as [row, col] display coordinates of board.
 */
class GameRecordWriter {
public:
    static bool writeJsonl(const std::vector<GameRecord>& records, const Board& board, const std::string& path, bool append = false);
    /// One record as a single-line JSON object (no trailing newline).
    static std::string toJson(const GameRecord& record, const Board& board);
};
