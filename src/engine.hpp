#pragma once
#include "game_state.hpp"
#include "grid.hpp"
#include "observation.hpp"
#include "replay.hpp"
#include "resolver.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

struct Info {
    long long army = 0;
    int land = 0;
    int turn = 0;
    bool done = false;
    bool isWinner = false;
    bool downgraded = false;   // the submitted move was absorbed as idle
    std::vector<int> alive;
};

// One game session. Agents are addressed by name in step(), by index
// (general letter order) everywhere else.
class GeneralsEngine {
public:
    GameParams par;
    GameState st;

    GeneralsEngine(Grid grid, std::vector<std::string> agentNames, GameParams par = GameParams{});
    GeneralsEngine(const GeneralsEngine&) = delete;
    GeneralsEngine& operator=(const GeneralsEngine&) = delete;

    void reset();
    void reset(Grid grid);

    int numAgents() const { return (int)names.size(); }
    int agentIndex(const std::string& name) const;
    const std::vector<std::string>& agentNames() const { return names; }
    const Grid& grid() const { return grid_; }

    struct StepResult {
        std::vector<Observation> observations;
        std::vector<Info> infos;
        bool done = false;
        int winner = -1;
    };
    // Every living agent needs an entry; Action::idle() passes.
    StepResult step(const std::map<std::string, Action>& actions);

    Observation getObservation(int agent) const;
    std::vector<uint8_t> getActionMask(int agent) const;
    Info getInfo(int agent) const;

    // Starts a fresh log seeded with the current state. Empty meta picks
    // default colors.
    void startReplay(std::vector<AgentMeta> meta = {});
    void stopReplay() { replay_.reset(); }
    const ReplayLog* replay() const { return replay_.get(); }

private:
    Grid grid_;
    std::vector<std::string> names;
    ActionResolver resolver;
    ObservationBuilder observer;
    Explored explored;
    std::vector<uint8_t> downgraded;
    std::unique_ptr<ReplayLog> replay_;

    void checkAgent(int agent) const;
};
