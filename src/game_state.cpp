#include "game_state.hpp"

#include <algorithm>

GameState GameState::fromGrid(const Grid& g, const GameParams& par){
    GameState st;
    st.rows = g.rows();
    st.cols = g.cols();
    st.terrain = g.terrainData();
    st.army.assign(g.size(), 0);
    st.owner.assign(g.size(), NEUTRAL);
    st.alive.assign(g.numAgents(), 1);

    for(int i=0;i<g.size();i++)
        if(st.terrain[i] == Terrain::City) st.army[i] = g.cityArmyData()[i];

    for(int a=0;a<g.numAgents();a++){
        Cell c = g.general(a);
        int i = st.index(c.row, c.col);
        st.owner[i] = a;
        st.army[i] = par.generalStartArmy;
    }
    return st;
}

int GameState::aliveCount() const {
    return (int)std::count(alive.begin(), alive.end(), 1);
}

int GameState::landOf(int agent) const {
    return (int)std::count(owner.begin(), owner.end(), agent);
}

long long GameState::armyOf(int agent) const {
    long long total = 0;
    for(size_t i=0;i<owner.size();i++)
        if(owner[i] == agent) total += army[i];
    return total;
}

bool GameState::operator==(const GameState& o) const {
    return rows==o.rows && cols==o.cols && army==o.army && owner==o.owner
        && terrain==o.terrain && alive==o.alive && turn==o.turn
        && done==o.done && winner==o.winner;
}
