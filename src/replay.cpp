#include "replay.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>

namespace {

constexpr uint32_t makeTag(const char (&s)[5]){
    return (uint32_t)(uint8_t)s[0] | (uint32_t)(uint8_t)s[1] << 8
         | (uint32_t)(uint8_t)s[2] << 16 | (uint32_t)(uint8_t)s[3] << 24;
}

constexpr uint32_t TAG_HEAD = makeTag("HEAD");
constexpr uint32_t TAG_GRID = makeTag("GRID");
constexpr uint32_t TAG_AGNT = makeTag("AGNT");
constexpr uint32_t TAG_STAT = makeTag("STAT");
const char MAGIC[4] = {'G', 'N', 'R', 'P'};

struct ByteWriter {
    std::string buf;

    void u8(uint8_t v){ buf.push_back((char)v); }
    void u16(uint16_t v){ u8(v & 0xff); u8(v >> 8); }
    void u32(uint32_t v){ for(int s=0;s<32;s+=8) u8((v >> s) & 0xff); }
    void i32(int32_t v){ u32((uint32_t)v); }
    void bytes(const std::string& s){ buf.append(s); }

    void section(uint32_t tag, const ByteWriter& payload){
        u32(tag);
        u32((uint32_t)payload.buf.size());
        buf.append(payload.buf);
    }
};

struct ByteReader {
    const std::string& buf;
    size_t pos;
    size_t end;

    ByteReader(const std::string& b, size_t from, size_t to) : buf(b), pos(from), end(to) {}

    void need(size_t n) const {
        if(end - pos < n) throw ReplayCorruptionError("unexpected end of data at byte " + std::to_string(pos));
    }
    uint8_t u8(){ need(1); return (uint8_t)buf[pos++]; }
    uint16_t u16(){ uint16_t lo = u8(); return (uint16_t)(lo | (u8() << 8)); }
    uint32_t u32(){
        uint32_t v = 0;
        for(int s=0;s<32;s+=8) v |= (uint32_t)u8() << s;
        return v;
    }
    int32_t i32(){ return (int32_t)u32(); }
    std::string bytes(size_t n){ need(n); std::string s = buf.substr(pos, n); pos += n; return s; }
    bool atEnd() const { return pos == end; }
};

struct Header {
    uint32_t rows = 0, cols = 0, agents = 0, snapshots = 0;
};

Grid readGrid(ByteReader& rd, const Header& h){
    const size_t n = (size_t)h.rows * h.cols;
    std::vector<Terrain> terrain(n);
    for(size_t i=0;i<n;i++){
        uint8_t t = rd.u8();
        if(t > (uint8_t)Terrain::General) throw ReplayCorruptionError("unknown terrain code " + std::to_string(t));
        terrain[i] = static_cast<Terrain>(t);
    }
    std::vector<int> cityArmy(n);
    for(size_t i=0;i<n;i++) cityArmy[i] = rd.i32();
    std::vector<Cell> generals(h.agents);
    for(auto& g : generals){
        g.row = (int)rd.u32();
        g.col = (int)rd.u32();
    }
    if(!rd.atEnd()) throw ReplayCorruptionError("GRID section larger than declared dimensions");
    try {
        return Grid((int)h.rows, (int)h.cols, std::move(terrain), std::move(cityArmy), std::move(generals));
    } catch(const InvalidGridError& e){
        throw ReplayCorruptionError(std::string("stored grid does not validate: ") + e.what());
    }
}

GameState readState(ByteReader& rd, const Header& h, const Grid& grid){
    GameState st;
    st.rows = (int)h.rows;
    st.cols = (int)h.cols;
    st.terrain = grid.terrainData();
    st.turn = (int)rd.u32();
    st.done = rd.u8() != 0;
    st.winner = (int8_t)rd.u8();
    if(st.winner < -1 || st.winner >= (int)h.agents)
        throw ReplayCorruptionError("winner " + std::to_string(st.winner) + " out of range");
    st.alive.resize(h.agents);
    for(auto& a : st.alive) a = rd.u8() ? 1 : 0;

    const size_t n = (size_t)h.rows * h.cols;
    st.army.resize(n);
    for(auto& v : st.army){
        v = rd.i32();
        if(v < 0) throw ReplayCorruptionError("negative army count in snapshot");
    }
    st.owner.resize(n);
    for(auto& o : st.owner){
        o = (int8_t)rd.u8();
        if(o < NEUTRAL || o >= (int)h.agents) throw ReplayCorruptionError("owner " + std::to_string(o) + " out of range");
    }
    if(!rd.atEnd()) throw ReplayCorruptionError("STAT section size does not match grid dimensions");
    return st;
}

} // namespace

ReplayLog::ReplayLog(Grid grid, std::vector<AgentMeta> agents)
: grid_(std::move(grid)), agents_(std::move(agents))
{
    if((int)agents_.size() != grid_.numAgents())
        throw std::invalid_argument("replay needs metadata for each of the " + std::to_string(grid_.numAgents()) + " agents");
}

void ReplayLog::addState(const GameState& st){
    if(st.rows != grid_.rows() || st.cols != grid_.cols() || st.numAgents() != grid_.numAgents())
        throw std::invalid_argument("snapshot does not match the replay grid");
    states_.push_back(st);
}

void ReplayLog::store(const std::string& path) const {
    ByteWriter out;
    out.buf.append(MAGIC, 4);
    out.u16(REPLAY_VERSION);
    out.u16(0);

    ByteWriter head;
    head.u32((uint32_t)grid_.rows());
    head.u32((uint32_t)grid_.cols());
    head.u32((uint32_t)grid_.numAgents());
    head.u32((uint32_t)states_.size());
    out.section(TAG_HEAD, head);

    ByteWriter grid;
    for(Terrain t : grid_.terrainData()) grid.u8((uint8_t)t);
    for(int v : grid_.cityArmyData()) grid.i32(v);
    for(const Cell& g : grid_.generals()){
        grid.u32((uint32_t)g.row);
        grid.u32((uint32_t)g.col);
    }
    out.section(TAG_GRID, grid);

    ByteWriter agents;
    for(const AgentMeta& m : agents_){
        agents.u16((uint16_t)m.name.size());
        agents.bytes(m.name);
        agents.u8(m.r);
        agents.u8(m.g);
        agents.u8(m.b);
    }
    out.section(TAG_AGNT, agents);

    for(const GameState& st : states_){
        ByteWriter s;
        s.u32((uint32_t)st.turn);
        s.u8(st.done ? 1 : 0);
        s.u8((uint8_t)(int8_t)st.winner);
        for(uint8_t a : st.alive) s.u8(a);
        for(int v : st.army) s.i32(v);
        for(int o : st.owner) s.u8((uint8_t)(int8_t)o);
        out.section(TAG_STAT, s);
    }

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if(!f) throw ReplayIOError("cannot open " + path + " for writing");
    f.write(out.buf.data(), (std::streamsize)out.buf.size());
    f.flush();
    if(!f){
        spdlog::error("writing replay {} failed", path);
        throw ReplayIOError("write to " + path + " failed");
    }
    spdlog::info("stored replay {} ({} snapshots, {} bytes)", path, states_.size(), out.buf.size());
}

ReplayLog ReplayLog::load(const std::string& path){
    std::ifstream f(path, std::ios::binary);
    if(!f) throw ReplayIOError("cannot open " + path);
    std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if(f.bad()) throw ReplayIOError("read from " + path + " failed");

    ByteReader rd(data, 0, data.size());
    if(rd.bytes(4) != std::string(MAGIC, 4)) throw ReplayCorruptionError("bad magic");
    uint16_t version = rd.u16();
    if(version != REPLAY_VERSION) throw ReplayCorruptionError("unsupported version " + std::to_string(version));
    rd.u16();

    Header h;
    bool haveHead = false;
    std::optional<Grid> grid;
    std::vector<AgentMeta> agents;
    bool haveAgents = false;
    std::vector<GameState> states;

    while(!rd.atEnd()){
        uint32_t tag = rd.u32();
        uint32_t len = rd.u32();
        rd.need(len);
        ByteReader sec(data, rd.pos, rd.pos + len);
        rd.pos += len;

        if(tag == TAG_HEAD){
            if(haveHead) throw ReplayCorruptionError("duplicate HEAD section");
            h.rows = sec.u32();
            h.cols = sec.u32();
            h.agents = sec.u32();
            h.snapshots = sec.u32();
            if(h.rows==0 || h.cols==0 || h.rows > 4096 || h.cols > 4096)
                throw ReplayCorruptionError("implausible grid dimensions "
                                            + std::to_string(h.rows) + "x" + std::to_string(h.cols));
            if(h.agents < 2 || h.agents > (uint32_t)MAX_AGENTS)
                throw ReplayCorruptionError("implausible agent count " + std::to_string(h.agents));
            if(!sec.atEnd()) throw ReplayCorruptionError("HEAD section has trailing bytes");
            haveHead = true;
            continue;
        }
        if(!haveHead) throw ReplayCorruptionError("section before HEAD");

        if(tag == TAG_GRID){
            if(grid) throw ReplayCorruptionError("duplicate GRID section");
            grid = readGrid(sec, h);
        } else if(tag == TAG_AGNT){
            if(haveAgents) throw ReplayCorruptionError("duplicate AGNT section");
            for(uint32_t a=0;a<h.agents;a++){
                AgentMeta m;
                m.name = sec.bytes(sec.u16());
                m.r = sec.u8();
                m.g = sec.u8();
                m.b = sec.u8();
                agents.push_back(std::move(m));
            }
            if(!sec.atEnd()) throw ReplayCorruptionError("AGNT section has trailing bytes");
            haveAgents = true;
        } else if(tag == TAG_STAT){
            if(!grid) throw ReplayCorruptionError("STAT section before GRID");
            states.push_back(readState(sec, h, *grid));
        } else {
            spdlog::debug("skipping unknown replay section {:#x} ({} bytes)", tag, len);
        }
    }

    if(!haveHead) throw ReplayCorruptionError("missing HEAD section");
    if(!grid) throw ReplayCorruptionError("missing GRID section");
    if(!haveAgents) throw ReplayCorruptionError("missing AGNT section");
    if(states.size() != h.snapshots)
        throw ReplayCorruptionError("header declares " + std::to_string(h.snapshots) + " snapshots, found "
                                    + std::to_string(states.size()));

    ReplayLog log(std::move(*grid), std::move(agents));
    for(const GameState& st : states){
        if(st.rows != log.grid_.rows() || st.cols != log.grid_.cols() || st.numAgents() != log.grid_.numAgents()
           || st.army.size() != (size_t)log.grid_.size())
            throw ReplayCorruptionError("snapshot at turn " + std::to_string(st.turn) + " does not match the stored grid");
    }
    log.states_ = std::move(states);
    spdlog::info("loaded replay {} ({} snapshots)", path, log.size());
    return log;
}
