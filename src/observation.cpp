#include "observation.hpp"

static TerrainView viewOf(Terrain t){
    switch(t){
        case Terrain::Mountain: return TerrainView::Mountain;
        case Terrain::City:     return TerrainView::City;
        case Terrain::General:  return TerrainView::General;
        default:                return TerrainView::Passable;
    }
}

std::vector<uint8_t> ObservationBuilder::visibility(const GameState& st, int agent) const {
    std::vector<uint8_t> vis(st.rows*st.cols, 0);
    for(int r=0;r<st.rows;r++){
        for(int c=0;c<st.cols;c++){
            if(st.owner[st.index(r,c)] != agent) continue;
            for(int dr=-1;dr<=1;dr++)
                for(int dc=-1;dc<=1;dc++)
                    if(st.inBounds(r+dr, c+dc)) vis[st.index(r+dr, c+dc)] = 1;
        }
    }
    return vis;
}

std::vector<uint8_t> ObservationBuilder::actionMask(const GameState& st, int agent) const {
    std::vector<uint8_t> m(st.rows*st.cols*NUM_DIRECTIONS, 0);
    for(int r=0;r<st.rows;r++){
        for(int c=0;c<st.cols;c++){
            if(st.owner[st.index(r,c)] != agent) continue;
            for(int d=0;d<NUM_DIRECTIONS;d++){
                Action a = Action::move(r, c, static_cast<Direction>(d));
                m[st.index(r,c)*NUM_DIRECTIONS + d] = resolver.isLegal(st, agent, a) ? 1 : 0;
            }
        }
    }
    return m;
}

void ObservationBuilder::remember(const GameState& st, Explored& explored) const {
    for(int a=0;a<st.numAgents();a++){
        if(!st.alive[a]) continue;
        std::vector<uint8_t> vis = visibility(st, a);
        for(size_t i=0;i<vis.size();i++)
            if(vis[i]) explored[a][i] = 1;
    }
}

Observation ObservationBuilder::build(const GameState& st, int agent, const std::vector<uint8_t>& explored) const {
    const int n = st.rows*st.cols;
    Observation obs;
    obs.agent = agent;
    obs.rows = st.rows;
    obs.cols = st.cols;
    obs.visible = visibility(st, agent);
    obs.army.assign(n, ARMY_UNKNOWN);
    obs.ownership.assign(n, CellOwner::Hidden);
    obs.terrain.assign(n, TerrainView::Unknown);
    obs.structuresInFog.assign(n, 0);
    obs.actionMask = actionMask(st, agent);

    for(int i=0;i<n;i++){
        Terrain t = st.terrain[i];
        int own = st.owner[i];

        if(own == agent){
            obs.ownedLand++;
            obs.ownedArmy += st.army[i];
        } else if(own != NEUTRAL){
            obs.opponentLand++;
            obs.opponentArmy += st.army[i];
        }

        if(obs.visible[i]){
            obs.army[i] = st.army[i];
            obs.ownership[i] = own==agent ? CellOwner::Self
                             : own==NEUTRAL ? CellOwner::Neutral : CellOwner::Opponent;
            obs.terrain[i] = viewOf(t);
            continue;
        }
        if(t==Terrain::Mountain || explored[i]) obs.terrain[i] = viewOf(t);
        if(t==Terrain::Mountain || t==Terrain::City) obs.structuresInFog[i] = 1;
    }

    for(int a=0;a<st.numAgents();a++)
        if(st.alive[a]) obs.alive.push_back(a);
    obs.turn = st.turn;
    obs.done = st.done;
    obs.isWinner = st.done && st.winner == agent;
    return obs;
}

std::vector<float> Observation::features() const {
    const int n = rows*cols;
    std::vector<float> out(featureSize(), 0.f);
    for(int i=0;i<n;i++){
        if(visible[i]){
            out[i] = (float)army[i];
            out[4*n + i] = 1.f;
        }
        if(ownership[i]==CellOwner::Self)     out[1*n + i] = 1.f;
        if(ownership[i]==CellOwner::Opponent) out[2*n + i] = 1.f;
        if(ownership[i]==CellOwner::Neutral)  out[3*n + i] = 1.f;
        if(terrain[i]==TerrainView::Mountain) out[5*n + i] = 1.f;
        if(terrain[i]==TerrainView::City)     out[6*n + i] = 1.f;
        if(terrain[i]==TerrainView::General)  out[7*n + i] = 1.f;
    }
    out[8*n + 0] = (float)turn;
    out[8*n + 1] = (float)ownedLand;
    return out;
}
