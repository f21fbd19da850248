#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

enum class Terrain : uint8_t { Passable, Mountain, City, General };

constexpr int NEUTRAL = -1;
constexpr int CITY_BASE_ARMY = 40;   // city symbol '0'..'9' -> 40..49
constexpr int MAX_AGENTS = 26;       // general symbols 'A'..'Z'

struct Cell {
    int row = 0;
    int col = 0;
    bool operator==(const Cell& o) const { return row==o.row && col==o.col; }
    bool operator!=(const Cell& o) const { return !(*this == o); }
};

// Immutable terrain layout plus one general position per agent.
class Grid {
public:
    // generals[i] is the general cell of agent i; terrain at those cells must
    // be General. cityArmy is only read for City cells.
    Grid(int rows, int cols, std::vector<Terrain> terrain,
         std::vector<int> cityArmy, std::vector<Cell> generals);

    // One line per row: '.' passable, '#' mountain, '0'-'9' city with
    // 40+digit army, 'A'-'Z' general of agent 0-25.
    static Grid parse(const std::string& text);
    static Grid parse(const std::string& text, int numAgents);
    std::string serialize() const;

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    int numAgents() const { return (int)generals_.size(); }
    int size() const { return rows_ * cols_; }

    bool inBounds(int r, int c) const { return 0<=r && r<rows_ && 0<=c && c<cols_; }
    int index(int r, int c) const { return r*cols_ + c; }

    Terrain terrain(int r, int c) const { return terrain_[index(r,c)]; }
    int cityArmy(int r, int c) const { return cityArmy_[index(r,c)]; }
    // NEUTRAL unless (r,c) is a general.
    int generalOwner(int r, int c) const;
    Cell general(int agent) const { return generals_.at(agent); }

    const std::vector<Terrain>& terrainData() const { return terrain_; }
    const std::vector<int>& cityArmyData() const { return cityArmy_; }
    const std::vector<Cell>& generals() const { return generals_; }

    bool operator==(const Grid& o) const;
    bool operator!=(const Grid& o) const { return !(*this == o); }

private:
    int rows_;
    int cols_;
    std::vector<Terrain> terrain_;
    std::vector<int> cityArmy_;
    std::vector<Cell> generals_;

    void validate() const;
};

struct GridConfig {
    int rows = 10;
    int cols = 10;
    int numAgents = 2;
    double mountainDensity = 0.2;
    double cityDensity = 0.05;
    std::vector<Cell> generalPositions; // empty: random placement
    uint32_t seed = 0;
    int maxAttempts = 100;
};

class GridFactory {
public:
    GridFactory() = default;
    explicit GridFactory(GridConfig cfg) : cfg(std::move(cfg)) {}

    GridConfig cfg;

    Grid generate() const { return generate(cfg.seed); }
    Grid generate(uint32_t seed) const;
    Grid fromString(const std::string& text) const { return Grid::parse(text, cfg.numAgents); }
};
