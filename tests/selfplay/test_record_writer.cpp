#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/Board.hpp"
#include "core/Errors.hpp"
#include "core/GameConfig.hpp"
#include "GameRecordWriter.hpp"
#include "GameRecorder.hpp"
#include "GameRunner.hpp"

namespace {

GameRecord SampleRecord(const Board& board) {
    GameRecorder recorder;
    recorder.beginGame(2, 2);
    const int from = board.IndexAtDisplay(3, 9);
    const int to = board.IndexAtDisplay(5, 9);
    TurnRecord jump{1, Color::Red, Move(from, to), false};
    TurnRecord pass{2, Color::Green, std::nullopt, true};
    recorder.recordTurn(jump);
    recorder.recordTurn(pass);
    recorder.finalizeGame(GameStatus::PlyLimit, std::nullopt);
    return recorder.consumeRecords().front();
}

void TestRecorderLifecycle() {
    GameRecorder recorder;
    assert(recorder.records().empty());
    bool threw = false;
    try {
        recorder.recordTurn(TurnRecord{});
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    recorder.beginGame(3, 1);
    recorder.recordTurn(TurnRecord{1, Color::Red, std::nullopt, true});
    recorder.finalizeGame(GameStatus::Stalemate, std::nullopt);
    recorder.beginGame(3, 1);
    recorder.finalizeGame(GameStatus::Won, Color::Blue);

    const auto& records = recorder.records();
    assert(records.size() == 2);
    assert(records[0].game == 1 && records[1].game == 2);
    assert(records[0].plies() == 1);
    assert(records[1].winner == Color::Blue);
    assert(recorder.consumeRecords().size() == 2);
    assert(recorder.records().empty());
}

void TestJsonShape() {
    Board board;
    const GameRecord record = SampleRecord(board);
    const std::string json = GameRecordWriter::toJson(record, board);
    assert(json.front() == '{' && json.back() == '}');
    assert(json.find("\"game\":1,") != std::string::npos);
    assert(json.find("\"players\":2,") != std::string::npos);
    assert(json.find("\"result\":\"ply_limit\"") != std::string::npos);
    assert(json.find("\"winner\":null") != std::string::npos);
    assert(json.find("\"plies\":2") != std::string::npos);
    assert(json.find("{\"color\":\"Red\",\"from\":[3,9],\"to\":[5,9],\"path\":[]}") != std::string::npos);
    assert(json.find("{\"color\":\"Green\",\"pass\":true}") != std::string::npos);
    assert(json.find('\n') == std::string::npos);
}

void TestWriteJsonl() {
    Board board;
    const GameRecord record = SampleRecord(board);
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "starcheckers_records_test.jsonl";

    assert(GameRecordWriter::writeJsonl({record, record}, board, path.string()));
    assert(GameRecordWriter::writeJsonl({record}, board, path.string(), true));
    std::ifstream in(path);
    int lines = 0;
    std::string line;
    while (std::getline(in, line)) {
        assert(line == GameRecordWriter::toJson(record, board));
        lines++;
    }
    assert(lines == 3);
    in.close();
    std::filesystem::remove(path);

    assert(!GameRecordWriter::writeJsonl({record}, board, "/nonexistent-dir/records.jsonl"));
}

void TestRunnerRecordsGame() {
    GameConfig config;
    config.seats = {SeatKind::Greedy, SeatKind::Greedy};
    config.maxPlies = 30;
    config.logSearch = false;
    GameRunner runner(config);
    GameRecorder recorder;

    const GameStatus status = runner.playOne(recorder);
    assert(status != GameStatus::InProgress && status != GameStatus::Aborted);
    assert(recorder.records().size() == 1);
    const GameRecord& record = recorder.records().front();
    assert(record.plies() <= 30);
    assert(record.players == 2);
    assert(record.status == status);
    assert(record.turns.front().color == Color::Red);

    GameConfig withHuman = config;
    withHuman.seats = {SeatKind::Human, SeatKind::Greedy};
    bool threw = false;
    try {
        GameRunner bad(withHuman);
    } catch (const InvalidConfiguration&) {
        threw = true;
    }
    assert(threw);
}

}  // namespace

int main() {
    TestRecorderLifecycle();
    TestJsonShape();
    TestWriteJsonl();
    TestRunnerRecordsGame();
    std::cout << "All self-play tests passed.\n";
    return 0;
}
