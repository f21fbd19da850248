#pragma once
#include "grid.hpp"

#include <cstdint>
#include <vector>

enum class Direction : uint8_t { Up, Down, Left, Right };

constexpr int NUM_DIRECTIONS = 4;

static inline int rowOffset(Direction d){
    if(d==Direction::Up) return -1;
    if(d==Direction::Down) return 1;
    return 0;
}
static inline int colOffset(Direction d){
    if(d==Direction::Left) return -1;
    if(d==Direction::Right) return 1;
    return 0;
}

struct GameParams {
    int landGrowthInterval = 50;
    int generalStartArmy = 1;
};

// One agent's order for one turn. pass=true is idle.
struct Action {
    bool pass = true;
    int row = 0;
    int col = 0;
    Direction dir = Direction::Up;
    bool split = false;

    static Action idle(){ return Action{}; }
    static Action move(int r, int c, Direction d, bool split = false){
        Action a;
        a.pass = false;
        a.row = r;
        a.col = c;
        a.dir = d;
        a.split = split;
        return a;
    }
};

// Flat mask index layout: ((row * cols) + col) * NUM_DIRECTIONS + direction.
static inline Action decodeAction(int index, int cols, bool split = false){
    int cell = index / NUM_DIRECTIONS;
    return Action::move(cell / cols, cell % cols, static_cast<Direction>(index % NUM_DIRECTIONS), split);
}

// Authoritative simulation state. Channels are row-major rows*cols arrays.
struct GameState {
    int rows = 0;
    int cols = 0;
    std::vector<int> army;
    std::vector<int> owner;          // agent index or NEUTRAL
    std::vector<Terrain> terrain;
    std::vector<uint8_t> alive;      // per agent
    int turn = 0;
    bool done = false;
    int winner = -1;

    static GameState fromGrid(const Grid& g, const GameParams& par);

    int index(int r, int c) const { return r*cols + c; }
    bool inBounds(int r, int c) const { return 0<=r && r<rows && 0<=c && c<cols; }
    int numAgents() const { return (int)alive.size(); }
    int aliveCount() const;

    int landOf(int agent) const;
    long long armyOf(int agent) const;

    bool operator==(const GameState& o) const;
    bool operator!=(const GameState& o) const { return !(*this == o); }
};
