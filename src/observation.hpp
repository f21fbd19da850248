#pragma once
#include "game_state.hpp"
#include "resolver.hpp"

#include <cstdint>
#include <vector>

constexpr int ARMY_UNKNOWN = -1;

enum class CellOwner : uint8_t { Self, Opponent, Neutral, Hidden };
enum class TerrainView : uint8_t { Unknown, Passable, Mountain, City, General };

// One agent's fog-limited view of the board. Channels are row-major.
struct Observation {
    int agent = 0;
    int rows = 0;
    int cols = 0;
    std::vector<int> army;                  // ARMY_UNKNOWN where hidden
    std::vector<CellOwner> ownership;
    std::vector<TerrainView> terrain;
    std::vector<uint8_t> visible;
    std::vector<uint8_t> structuresInFog;   // hidden city or mountain
    std::vector<uint8_t> actionMask;        // rows*cols*NUM_DIRECTIONS

    int ownedLand = 0;
    long long ownedArmy = 0;
    int opponentLand = 0;
    long long opponentArmy = 0;
    std::vector<int> alive;
    int turn = 0;
    bool done = false;
    bool isWinner = false;

    int index(int r, int c) const { return r*cols + c; }
    bool canMove(int r, int c, Direction d) const {
        return actionMask[index(r,c)*NUM_DIRECTIONS + static_cast<int>(d)] != 0;
    }
    int featureSize() const { return 8*rows*cols + 2; }

    // Planes: army, self, opponent, neutral, visible, mountain, city, general;
    // then turn and ownedLand scalars.
    std::vector<float> features() const;
};

// Per-agent record of which cells have ever been visible.
using Explored = std::vector<std::vector<uint8_t>>;

class ObservationBuilder {
public:
    explicit ObservationBuilder(const ActionResolver& resolver) : resolver(resolver) {}

    std::vector<uint8_t> visibility(const GameState& st, int agent) const;
    std::vector<uint8_t> actionMask(const GameState& st, int agent) const;

    // Marks every currently visible cell as explored for every living agent.
    void remember(const GameState& st, Explored& explored) const;

    Observation build(const GameState& st, int agent, const std::vector<uint8_t>& explored) const;

private:
    const ActionResolver& resolver;
};
