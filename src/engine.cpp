#include "engine.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <stdexcept>

static const uint8_t PALETTE[][3] = {
    {67, 70, 86}, {242, 61, 106}, {39, 146, 255}, {0, 128, 0},
    {255, 165, 0}, {128, 0, 128}, {0, 128, 128}, {165, 42, 42},
};

GeneralsEngine::GeneralsEngine(Grid grid, std::vector<std::string> agentNames, GameParams par)
: par(par), grid_(std::move(grid)), names(std::move(agentNames)),
  resolver(grid_, par), observer(resolver)
{
    if((int)names.size() != grid_.numAgents())
        throw std::invalid_argument(std::to_string(names.size()) + " agent names for a grid with "
                                    + std::to_string(grid_.numAgents()) + " generals");
    std::set<std::string> uniq(names.begin(), names.end());
    if(uniq.size() != names.size()) throw std::invalid_argument("agent names must be unique");
    reset();
}

void GeneralsEngine::reset(){
    st = GameState::fromGrid(grid_, par);
    explored.assign(numAgents(), std::vector<uint8_t>(grid_.size(), 0));
    observer.remember(st, explored);
    downgraded.assign(numAgents(), 0);
    if(replay_) startReplay(replay_->agents());
}

void GeneralsEngine::reset(Grid grid){
    if(grid.numAgents() != numAgents())
        throw std::invalid_argument("new grid has " + std::to_string(grid.numAgents())
                                    + " generals, engine has " + std::to_string(numAgents()) + " agents");
    grid_ = std::move(grid);
    resolver = ActionResolver(grid_, par);
    reset();
}

int GeneralsEngine::agentIndex(const std::string& name) const {
    for(int i=0;i<numAgents();i++)
        if(names[i] == name) return i;
    throw InvalidActionError("unknown agent '" + name + "'");
}

void GeneralsEngine::checkAgent(int agent) const {
    if(agent<0 || agent>=numAgents())
        throw std::out_of_range("agent index " + std::to_string(agent) + " out of range");
}

GeneralsEngine::StepResult GeneralsEngine::step(const std::map<std::string, Action>& actions){
    if(st.done) throw InvalidActionError("game already finished at turn " + std::to_string(st.turn));

    const int n = numAgents();
    std::vector<Action> ordered(n, Action::idle());
    std::vector<uint8_t> given(n, 0);
    for(const auto& [name, a] : actions){
        int i = agentIndex(name);
        // eliminated agents' actions are ignored, whatever their shape
        if(!st.alive[i]) continue;
        resolver.checkShape(st, a);
        ordered[i] = a;
        given[i] = 1;
    }
    for(int i=0;i<n;i++)
        if(st.alive[i] && !given[i]) throw InvalidActionError("no action for living agent '" + names[i] + "'");

    const int resolved = st.turn;
    TurnReport rep = resolver.resolve(st, ordered);
    downgraded = rep.downgraded;
    for(int victim : rep.eliminated)
        spdlog::info("turn {}: {} was eliminated", resolved, names[victim]);

    observer.remember(st, explored);
    if(replay_) replay_->addState(st);

    if(st.done){
        if(st.winner >= 0) spdlog::info("game over after {} turns, {} wins", st.turn, names[st.winner]);
        else spdlog::info("game over after {} turns, no winner", st.turn);
    }

    StepResult sr;
    sr.done = st.done;
    sr.winner = st.winner;
    for(int i=0;i<n;i++){
        sr.observations.push_back(getObservation(i));
        sr.infos.push_back(getInfo(i));
    }
    return sr;
}

Observation GeneralsEngine::getObservation(int agent) const {
    checkAgent(agent);
    return observer.build(st, agent, explored[agent]);
}

std::vector<uint8_t> GeneralsEngine::getActionMask(int agent) const {
    checkAgent(agent);
    return observer.actionMask(st, agent);
}

Info GeneralsEngine::getInfo(int agent) const {
    checkAgent(agent);
    Info info;
    info.army = st.armyOf(agent);
    info.land = st.landOf(agent);
    info.turn = st.turn;
    info.done = st.done;
    info.isWinner = st.done && st.winner == agent;
    info.downgraded = downgraded[agent] != 0;
    for(int a=0;a<numAgents();a++)
        if(st.alive[a]) info.alive.push_back(a);
    return info;
}

void GeneralsEngine::startReplay(std::vector<AgentMeta> meta){
    if(meta.empty()){
        const int colors = (int)(sizeof(PALETTE) / sizeof(PALETTE[0]));
        for(int i=0;i<numAgents();i++){
            const uint8_t* c = PALETTE[i % colors];
            meta.push_back({names[i], c[0], c[1], c[2]});
        }
    }
    replay_ = std::make_unique<ReplayLog>(grid_, std::move(meta));
    replay_->addState(st);
}
