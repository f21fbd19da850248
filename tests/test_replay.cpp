#include <gtest/gtest.h>

#include "agents.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "replay.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace {

std::string tempPath(const std::string& name){
    return testing::TempDir() + "generals_" + name + ".replay";
}

std::string slurp(const std::string& path){
    std::ifstream f(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

void spit(const std::string& path, const std::string& data){
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(data.data(), (std::streamsize)data.size());
}

void putU32(std::string& data, size_t at, uint32_t v){
    for(int s=0;s<4;s++) data[at+s] = (char)((v >> (8*s)) & 0xff);
}

std::string u32(uint32_t v){
    std::string out(4, '\0');
    putU32(out, 0, v);
    return out;
}

// HEAD payload starts after magic, version, reserved, tag and length.
constexpr size_t HEAD_LENGTH = 12;
constexpr size_t HEAD_ROWS = 16;
constexpr size_t HEAD_COLS = 20;
constexpr size_t HEAD_SNAPSHOTS = 28;

// Plays a short recorded game and stores it; returns the in-memory log.
ReplayLog recordGame(const std::string& path){
    GridConfig cfg;
    cfg.rows = 6;
    cfg.cols = 7;
    cfg.cityDensity = 0.1;
    Grid grid = GridFactory(cfg).generate(21);
    GeneralsEngine eng(grid, {"red", "blue"});
    eng.startReplay();
    ExpanderAgent red("red", 1);
    RandomAgent blue("blue", 2);
    for(int i=0;i<40 && !eng.st.done;i++)
        eng.step({{"red", red.play(eng.getObservation(0))}, {"blue", blue.play(eng.getObservation(1))}});
    eng.replay()->store(path);
    return *eng.replay();
}

} // namespace

TEST(ReplayLog, StoreLoadRoundTrip) {
    const std::string path = tempPath("roundtrip");
    ReplayLog recorded = recordGame(path);
    ReplayLog loaded = ReplayLog::load(path);

    EXPECT_EQ(loaded, recorded);
    EXPECT_EQ(loaded.grid().serialize(), recorded.grid().serialize());
    ASSERT_EQ(loaded.agents().size(), 2u);
    EXPECT_EQ(loaded.agents()[0].name, "red");
    EXPECT_EQ(loaded.at(0).turn, 0);
    for(size_t i=1;i<loaded.size();i++)
        EXPECT_EQ(loaded.at(i).turn, loaded.at(i-1).turn + 1);
}

TEST(ReplayLog, KeepsAgentColors) {
    Grid grid = Grid::parse("A..\n..B");
    ReplayLog log(grid, {{"left", 1, 2, 3}, {"right", 250, 128, 0}});
    log.addState(GameState::fromGrid(grid, GameParams{}));
    const std::string path = tempPath("colors");
    log.store(path);

    ReplayLog loaded = ReplayLog::load(path);
    EXPECT_EQ(loaded.agents()[1], (AgentMeta{"right", 250, 128, 0}));
    EXPECT_EQ(loaded.size(), 1u);
}

TEST(ReplayLog, RejectsMismatchedInput) {
    Grid grid = Grid::parse("A..\n..B");
    EXPECT_THROW({ ReplayLog bad(grid, {{"only", 0, 0, 0}}); }, std::invalid_argument);

    ReplayLog log(grid, {{"a", 0, 0, 0}, {"b", 0, 0, 0}});
    GameState other = GameState::fromGrid(Grid::parse("A...\n...B"), GameParams{});
    EXPECT_THROW(log.addState(other), std::invalid_argument);
}

TEST(ReplayLog, MissingFileIsAnIOError) {
    EXPECT_THROW(ReplayLog::load(tempPath("does_not_exist")), ReplayIOError);
    Grid grid = Grid::parse("A..\n..B");
    ReplayLog log(grid, {{"a", 0, 0, 0}, {"b", 0, 0, 0}});
    EXPECT_THROW(log.store(testing::TempDir() + "no_such_dir/x.replay"), ReplayIOError);
}

TEST(ReplayLog, DetectsCorruption) {
    const std::string path = tempPath("corrupt_src");
    recordGame(path);
    const std::string good = slurp(path);
    const std::string bad = tempPath("corrupt");

    std::string data = good;
    data[0] = 'X';
    spit(bad, data);
    EXPECT_THROW(ReplayLog::load(bad), ReplayCorruptionError) << "magic";

    data = good;
    data[4] = 9;
    spit(bad, data);
    EXPECT_THROW(ReplayLog::load(bad), ReplayCorruptionError) << "version";

    spit(bad, good.substr(0, good.size() - 5));
    EXPECT_THROW(ReplayLog::load(bad), ReplayCorruptionError) << "truncated";

    spit(bad, good.substr(0, 6));
    EXPECT_THROW(ReplayLog::load(bad), ReplayCorruptionError) << "truncated header";

    data = good;
    putU32(data, HEAD_SNAPSHOTS, 1000);
    spit(bad, data);
    EXPECT_THROW(ReplayLog::load(bad), ReplayCorruptionError) << "snapshot count";

    data = good;
    putU32(data, HEAD_COLS, 8);
    spit(bad, data);
    EXPECT_THROW(ReplayLog::load(bad), ReplayCorruptionError) << "dimensions";

    data = good;
    putU32(data, HEAD_ROWS, 0);
    spit(bad, data);
    EXPECT_THROW(ReplayLog::load(bad), ReplayCorruptionError) << "zero rows";

    // a second header redefining the board, followed by a snapshot of that size
    data = good;
    data += "HEAD" + u32(16) + u32(1) + u32(2) + u32(2) + u32(1);
    data += "STAT" + u32(4 + 1 + 1 + 2 + 2*4 + 2) + u32(0) + std::string("\0\xff\1\1", 4)
          + u32(1) + u32(1) + std::string("\0\1", 2);
    spit(bad, data);
    EXPECT_THROW(ReplayLog::load(bad), ReplayCorruptionError) << "second HEAD";

    data = good;
    putU32(data, HEAD_LENGTH, 20);
    data.insert(HEAD_SNAPSHOTS + 4, u32(0));
    spit(bad, data);
    EXPECT_THROW(ReplayLog::load(bad), ReplayCorruptionError) << "HEAD trailing bytes";

    // last byte of the file is the owner of the bottom-right cell in the last snapshot
    data = good;
    data[data.size() - 1] = 7;
    spit(bad, data);
    EXPECT_THROW(ReplayLog::load(bad), ReplayCorruptionError) << "owner";
}

TEST(ReplayLog, SkipsUnknownSections) {
    const std::string path = tempPath("extra_src");
    ReplayLog recorded = recordGame(path);
    std::string data = slurp(path);

    std::string extra = "NOTE";
    extra += std::string("\x03\x00\x00\x00", 4);
    extra += "abc";
    data += extra;
    const std::string extended = tempPath("extra");
    spit(extended, data);

    EXPECT_EQ(ReplayLog::load(extended), recorded);
}
