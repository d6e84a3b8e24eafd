#include "GameRecordWriter.hpp"

#include <fstream>
#include <sstream>

namespace {

void writeCell(std::ostream& out, const Board& board, int cell) {
    out << "[" << board.DisplayRow(cell) << "," << board.DisplayCol(cell) << "]";
}

} // namespace

std::string GameRecordWriter::toJson(const GameRecord& record, const Board& board) {
    std::ostringstream out;
    out << "{";
    out << "\"game\":" << record.game << ",";
    out << "\"players\":" << record.players << ",";
    out << "\"depth\":" << record.depth << ",";
    out << "\"result\":\"" << GameStatusName(record.status) << "\",";
    out << "\"winner\":";
    if (record.winner) {
        out << "\"" << ColorName(*record.winner) << "\"";
    } else {
        out << "null";
    }
    out << ",";
    out << "\"plies\":" << record.plies() << ",";
    out << "\"turns\":[";
    for (size_t i = 0; i < record.turns.size(); ++i) {
        const TurnRecord& turn = record.turns[i];
        out << "{\"color\":\"" << ColorName(turn.color) << "\",";
        if (turn.move) {
            out << "\"from\":";
            writeCell(out, board, turn.move->origin);
            out << ",\"to\":";
            writeCell(out, board, turn.move->destination);
            out << ",\"path\":[";
            for (size_t j = 0; j < turn.move->path.size(); ++j) {
                writeCell(out, board, turn.move->path[j]);
                if (j + 1 < turn.move->path.size()) out << ",";
            }
            out << "]";
        } else {
            out << "\"pass\":true";
        }
        out << "}";
        if (i + 1 < record.turns.size()) out << ",";
    }
    out << "]";
    out << "}";
    return out.str();
}

bool GameRecordWriter::writeJsonl(const std::vector<GameRecord>& records, const Board& board, const std::string& path, bool append) {
    std::ios_base::openmode mode = append ? std::ios::app : std::ios::trunc;
    std::ofstream out(path, mode);
    if (!out.is_open()) return false;

    for (const auto& record : records) {
        out << toJson(record, board) << "\n";
    }
    out.flush();
    return static_cast<bool>(out);
}
