#pragma once
#include "game_state.hpp"
#include "grid.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct AgentMeta {
    std::string name;
    uint8_t r = 0, g = 0, b = 0;

    bool operator==(const AgentMeta& o) const { return name==o.name && r==o.r && g==o.g && b==o.b; }
};

constexpr uint16_t REPLAY_VERSION = 1;

// Append-only record of a game: the grid, the agents and one GameState per
// turn, starting with the reset state. Playback reads snapshots back; it never
// re-runs the rules.
class ReplayLog {
public:
    ReplayLog(Grid grid, std::vector<AgentMeta> agents);

    void addState(const GameState& st);

    size_t size() const { return states_.size(); }
    const GameState& at(size_t i) const { return states_.at(i); }
    const std::vector<GameState>& states() const { return states_; }
    const Grid& grid() const { return grid_; }
    const std::vector<AgentMeta>& agents() const { return agents_; }

    // Layout: "GNRP" u16 version u16 reserved, then {u32 tag, u32 length,
    // payload} sections HEAD, GRID, AGNT and one STAT per snapshot.
    void store(const std::string& path) const;
    static ReplayLog load(const std::string& path);

    bool operator==(const ReplayLog& o) const {
        return grid_==o.grid_ && agents_==o.agents_ && states_==o.states_;
    }

private:
    Grid grid_;
    std::vector<AgentMeta> agents_;
    std::vector<GameState> states_;
};
