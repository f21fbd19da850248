#include "resolver.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

ActionResolver::ActionResolver(const Grid& grid, GameParams par)
: par(par), generals(grid.generals())
{
    if(par.landGrowthInterval <= 0)
        throw std::invalid_argument("landGrowthInterval must be positive");
    if(par.generalStartArmy < 1)
        throw std::invalid_argument("generalStartArmy must be at least 1");
}

bool ActionResolver::growsThisTurn(const GameState& st, int i) const {
    int own = st.owner[i];
    if(own == NEUTRAL || !st.alive[own]) return false;
    if(st.terrain[i]==Terrain::General || st.terrain[i]==Terrain::City) return true;
    return st.turn % par.landGrowthInterval == 0;
}

int ActionResolver::armyAfterGrowth(const GameState& st, int r, int c) const {
    int i = st.index(r,c);
    return st.army[i] + (growsThisTurn(st, i) ? 1 : 0);
}

bool ActionResolver::isLegal(const GameState& st, int agent, const Action& a) const {
    if(a.pass || st.done) return false;
    if(agent<0 || agent>=st.numAgents() || !st.alive[agent]) return false;
    if(!st.inBounds(a.row, a.col)) return false;
    if(st.owner[st.index(a.row, a.col)] != agent) return false;
    if(armyAfterGrowth(st, a.row, a.col) <= 1) return false;
    int dr = a.row + rowOffset(a.dir), dc = a.col + colOffset(a.dir);
    if(!st.inBounds(dr, dc)) return false;
    return st.terrain[st.index(dr, dc)] != Terrain::Mountain;
}

void ActionResolver::checkShape(const GameState& st, const Action& a) const {
    if(a.pass) return;
    if(!st.inBounds(a.row, a.col))
        throw InvalidActionError("source (" + std::to_string(a.row) + ", " + std::to_string(a.col)
                                 + ") outside " + std::to_string(st.rows) + "x" + std::to_string(st.cols) + " grid");
    int d = static_cast<int>(a.dir);
    if(d<0 || d>=NUM_DIRECTIONS)
        throw InvalidActionError("direction " + std::to_string(d) + " out of range");
}

void ActionResolver::applyGrowth(GameState& st) const {
    for(int i=0;i<(int)st.army.size();i++)
        if(growsThisTurn(st, i)) st.army[i] += 1;
}

void ActionResolver::eliminate(GameState& st, int victim, int capturer) const {
    for(size_t i=0;i<st.owner.size();i++){
        if(st.owner[i] != victim) continue;
        st.owner[i] = capturer;
        st.army[i] /= 2;
    }
    st.alive[victim] = 0;
}

bool ActionResolver::applyMove(GameState& st, int agent, const Action& a, TurnReport& rep) const {
    int src = st.index(a.row, a.col);
    // an earlier move this turn may have taken or drained the source
    if(st.owner[src] != agent || st.army[src] <= 1) return false;

    int dst = st.index(a.row + rowOffset(a.dir), a.col + colOffset(a.dir));
    int moved = a.split ? st.army[src] / 2 : st.army[src] - 1;
    st.army[src] -= moved;

    int defender = st.owner[dst];
    if(defender == agent){
        st.army[dst] += moved;
        return true;
    }

    int result = st.army[dst] - moved;
    if(result > 0){
        st.army[dst] = result;
    } else if(result == 0){
        st.army[dst] = 0;
        if(st.terrain[dst] != Terrain::General) st.owner[dst] = NEUTRAL;
    } else {
        st.owner[dst] = agent;
        st.army[dst] = -result;
        if(defender != NEUTRAL && generals[defender].row*st.cols + generals[defender].col == dst){
            spdlog::debug("turn {}: agent {} captured the general of agent {}", st.turn, agent, defender);
            eliminate(st, defender, agent);
            rep.eliminated.push_back(defender);
        }
    }
    return true;
}

void ActionResolver::checkWinner(GameState& st) const {
    int left = st.aliveCount();
    if(left > 1) return;
    st.done = true;
    st.winner = -1;
    for(int a=0;a<st.numAgents();a++)
        if(st.alive[a]) st.winner = a;
}

TurnReport ActionResolver::resolve(GameState& st, const std::vector<Action>& actions) const {
    const int n = st.numAgents();
    TurnReport rep;
    rep.downgraded.assign(n, 0);

    std::vector<uint8_t> moving(n, 0);
    for(int a=0;a<n;a++){
        if(!st.alive[a] || actions[a].pass) continue;
        if(isLegal(st, a, actions[a])){
            moving[a] = 1;
        } else {
            rep.downgraded[a] = 1;
            spdlog::trace("turn {}: agent {} move from ({}, {}) is not legal, treated as idle",
                          st.turn, a, actions[a].row, actions[a].col);
        }
    }

    applyGrowth(st);

    for(int a=0;a<n;a++){
        if(!moving[a]) continue;
        if(!st.alive[a]){
            rep.downgraded[a] = 1;
            continue;
        }
        if(!applyMove(st, a, actions[a], rep)){
            rep.downgraded[a] = 1;
            spdlog::trace("turn {}: agent {} source ({}, {}) lost earlier this turn",
                          st.turn, a, actions[a].row, actions[a].col);
        }
    }

    checkWinner(st);
    st.turn++;
    return rep;
}
