#include "agents.hpp"

std::vector<int> legalMoves(const Observation& obs){
    std::vector<int> out;
    for(int i=0;i<(int)obs.actionMask.size();i++)
        if(obs.actionMask[i]) out.push_back(i);
    return out;
}

RandomAgent::RandomAgent(std::string name, uint32_t seed, double idleProb, double splitProb)
: Agent(std::move(name)), seed(seed), idleProb(idleProb), splitProb(splitProb), rng(seed)
{}

Action RandomAgent::play(const Observation& obs){
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    bool idle = unit(rng) < idleProb;
    bool split = unit(rng) < splitProb;

    std::vector<int> legal = legalMoves(obs);
    if(idle || legal.empty()) return Action::idle();

    std::uniform_int_distribution<size_t> pick(0, legal.size()-1);
    return decodeAction(legal[pick(rng)], obs.cols, split);
}

ExpanderAgent::ExpanderAgent(std::string name, uint32_t seed)
: Agent(std::move(name)), seed(seed), rng(seed)
{}

Action ExpanderAgent::play(const Observation& obs){
    std::vector<int> legal = legalMoves(obs);
    if(legal.empty()) return Action::idle();

    std::vector<int> toOpponent, toNeutral;
    for(int m : legal){
        Action a = decodeAction(m, obs.cols);
        int src = obs.index(a.row, a.col);
        int dst = obs.index(a.row + rowOffset(a.dir), a.col + colOffset(a.dir));
        // destinations of legal moves are always adjacent to our land, hence visible
        if(obs.army[src] <= obs.army[dst] + 1) continue;
        if(obs.ownership[dst]==CellOwner::Opponent) toOpponent.push_back(m);
        else if(obs.ownership[dst]==CellOwner::Neutral) toNeutral.push_back(m);
    }

    const std::vector<int>& pool = !toOpponent.empty() ? toOpponent
                                 : !toNeutral.empty() ? toNeutral : legal;
    std::uniform_int_distribution<size_t> pick(0, pool.size()-1);
    return decodeAction(pool[pick(rng)], obs.cols);
}
