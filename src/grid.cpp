#include "grid.hpp"
#include "errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <numeric>
#include <random>
#include <sstream>

static bool generalsReachable(int rows, int cols, const std::vector<Terrain>& terrain,
                              const std::vector<Cell>& generals){
    if(generals.empty()) return true;
    std::vector<uint8_t> seen(terrain.size(), 0);
    std::deque<Cell> q;
    q.push_back(generals[0]);
    seen[generals[0].row*cols + generals[0].col] = 1;
    static const int dr[4] = {-1, 1, 0, 0};
    static const int dc[4] = {0, 0, -1, 1};
    while(!q.empty()){
        Cell c = q.front();
        q.pop_front();
        for(int d=0;d<4;d++){
            int r = c.row + dr[d], k = c.col + dc[d];
            if(r<0 || r>=rows || k<0 || k>=cols) continue;
            int i = r*cols + k;
            if(seen[i] || terrain[i]==Terrain::Mountain) continue;
            seen[i] = 1;
            q.push_back({r, k});
        }
    }
    for(const Cell& g : generals)
        if(!seen[g.row*cols + g.col]) return false;
    return true;
}

Grid::Grid(int rows, int cols, std::vector<Terrain> terrain,
           std::vector<int> cityArmy, std::vector<Cell> generals)
: rows_(rows), cols_(cols),
  terrain_(std::move(terrain)), cityArmy_(std::move(cityArmy)), generals_(std::move(generals))
{
    if(rows_<=0 || cols_<=0) throw InvalidGridError("grid must have at least one row and column");
    if((int)terrain_.size() != rows_*cols_)
        throw InvalidGridError("terrain has " + std::to_string(terrain_.size()) + " cells, expected "
                               + std::to_string(rows_*cols_));
    if(cityArmy_.empty()) cityArmy_.assign(terrain_.size(), 0);
    if(cityArmy_.size() != terrain_.size())
        throw InvalidGridError("city army layer does not match grid dimensions");
    for(size_t i=0;i<terrain_.size();i++)
        if(terrain_[i] != Terrain::City) cityArmy_[i] = 0;
    validate();
}

void Grid::validate() const {
    int n = numAgents();
    if(n < 2) throw InvalidGridError("need at least two generals, got " + std::to_string(n));
    if(n > MAX_AGENTS) throw InvalidGridError("at most " + std::to_string(MAX_AGENTS) + " agents supported");

    for(int a=0;a<n;a++){
        const Cell& g = generals_[a];
        if(!inBounds(g.row, g.col))
            throw InvalidGridError("general of agent " + std::to_string(a) + " is off the grid");
        if(terrain(g.row, g.col) == Terrain::Mountain)
            throw InvalidGridError("general of agent " + std::to_string(a) + " placed on a mountain");
        if(terrain(g.row, g.col) != Terrain::General)
            throw InvalidGridError("general of agent " + std::to_string(a) + " not marked as general terrain");
        for(int b=0;b<a;b++)
            if(generals_[b] == g)
                throw InvalidGridError("agents " + std::to_string(b) + " and " + std::to_string(a)
                                       + " share a general cell");
    }

    int generalCells = (int)std::count(terrain_.begin(), terrain_.end(), Terrain::General);
    if(generalCells != n)
        throw InvalidGridError(std::to_string(generalCells) + " general cells for "
                               + std::to_string(n) + " agents");

    for(size_t i=0;i<terrain_.size();i++){
        if(terrain_[i] != Terrain::City) continue;
        if(cityArmy_[i] < CITY_BASE_ARMY || cityArmy_[i] > CITY_BASE_ARMY + 9)
            throw InvalidGridError("city army " + std::to_string(cityArmy_[i]) + " outside "
                                   + std::to_string(CITY_BASE_ARMY) + ".." + std::to_string(CITY_BASE_ARMY + 9));
    }

    if(!generalsReachable(rows_, cols_, terrain_, generals_))
        throw InvalidGridError("generals are walled off from each other by mountains");
}

int Grid::generalOwner(int r, int c) const {
    for(int a=0;a<numAgents();a++)
        if(generals_[a].row==r && generals_[a].col==c) return a;
    return NEUTRAL;
}

bool Grid::operator==(const Grid& o) const {
    return rows_==o.rows_ && cols_==o.cols_ && terrain_==o.terrain_
        && cityArmy_==o.cityArmy_ && generals_==o.generals_;
}

Grid Grid::parse(const std::string& text){
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while(std::getline(in, line)){
        auto b = line.find_first_not_of(" \t\r");
        auto e = line.find_last_not_of(" \t\r");
        lines.push_back(b==std::string::npos ? std::string() : line.substr(b, e-b+1));
    }
    while(!lines.empty() && lines.back().empty()) lines.pop_back();
    while(!lines.empty() && lines.front().empty()) lines.erase(lines.begin());
    if(lines.empty()) throw InvalidGridError("empty grid text");

    int rows = (int)lines.size();
    int cols = (int)lines[0].size();
    std::vector<Terrain> terrain(rows*cols, Terrain::Passable);
    std::vector<int> cityArmy(rows*cols, 0);
    std::vector<Cell> generals;
    std::vector<uint8_t> placed;

    for(int r=0;r<rows;r++){
        if((int)lines[r].size() != cols)
            throw InvalidGridError("row " + std::to_string(r) + " has " + std::to_string(lines[r].size())
                                   + " cells, expected " + std::to_string(cols));
        for(int c=0;c<cols;c++){
            char ch = lines[r][c];
            int i = r*cols + c;
            if(ch=='.') continue;
            if(ch=='#'){ terrain[i] = Terrain::Mountain; continue; }
            if(ch>='0' && ch<='9'){
                terrain[i] = Terrain::City;
                cityArmy[i] = CITY_BASE_ARMY + (ch - '0');
                continue;
            }
            if(ch>='A' && ch<='Z'){
                int a = ch - 'A';
                if(a >= (int)generals.size()){
                    generals.resize(a+1);
                    placed.resize(a+1, 0);
                }
                if(placed[a]) throw InvalidGridError(std::string("general '") + ch + "' appears more than once");
                placed[a] = 1;
                generals[a] = {r, c};
                terrain[i] = Terrain::General;
                continue;
            }
            throw InvalidGridError(std::string("unknown symbol '") + ch + "' at row " + std::to_string(r)
                                   + ", column " + std::to_string(c));
        }
    }
    for(size_t a=0;a<placed.size();a++)
        if(!placed[a]) throw InvalidGridError(std::string("general '") + char('A' + a) + "' is missing");

    return Grid(rows, cols, std::move(terrain), std::move(cityArmy), std::move(generals));
}

Grid Grid::parse(const std::string& text, int numAgents){
    Grid g = parse(text);
    if(g.numAgents() != numAgents)
        throw InvalidGridError(std::to_string(g.numAgents()) + " generals for "
                               + std::to_string(numAgents) + " agents");
    return g;
}

std::string Grid::serialize() const {
    std::string out;
    out.reserve(rows_*(cols_+1));
    for(int r=0;r<rows_;r++){
        if(r) out.push_back('\n');
        for(int c=0;c<cols_;c++){
            switch(terrain(r,c)){
                case Terrain::Passable: out.push_back('.'); break;
                case Terrain::Mountain: out.push_back('#'); break;
                case Terrain::City: out.push_back(char('0' + cityArmy(r,c) - CITY_BASE_ARMY)); break;
                case Terrain::General: out.push_back(char('A' + generalOwner(r,c))); break;
            }
        }
    }
    return out;
}

Grid GridFactory::generate(uint32_t seed) const {
    if(cfg.rows<=0 || cfg.cols<=0) throw InvalidGridError("grid dimensions must be positive");
    if(cfg.numAgents<2 || cfg.numAgents>MAX_AGENTS)
        throw InvalidGridError("cannot generate a grid for " + std::to_string(cfg.numAgents) + " agents");
    if(cfg.numAgents > cfg.rows*cfg.cols) throw InvalidGridError("more agents than cells");
    if(!cfg.generalPositions.empty()){
        if((int)cfg.generalPositions.size() != cfg.numAgents)
            throw InvalidGridError("general positions do not match the agent count");
        for(const Cell& g : cfg.generalPositions)
            if(g.row<0 || g.row>=cfg.rows || g.col<0 || g.col>=cfg.cols)
                throw InvalidGridError("general position off the grid");
    }

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_int_distribution<int> strength(0, 9);
    const int n = cfg.rows*cfg.cols;

    for(int attempt=1; attempt<=cfg.maxAttempts; ++attempt){
        std::vector<Terrain> terrain(n, Terrain::Passable);
        std::vector<int> cityArmy(n, 0);
        for(int i=0;i<n;i++){
            double x = unit(rng);
            if(x < cfg.mountainDensity){
                terrain[i] = Terrain::Mountain;
            } else if(x < cfg.mountainDensity + cfg.cityDensity){
                terrain[i] = Terrain::City;
                cityArmy[i] = CITY_BASE_ARMY + strength(rng);
            }
        }

        std::vector<Cell> generals = cfg.generalPositions;
        if(generals.empty()){
            std::vector<int> order(n);
            std::iota(order.begin(), order.end(), 0);
            std::shuffle(order.begin(), order.end(), rng);
            for(int a=0;a<cfg.numAgents;a++)
                generals.push_back({order[a] / cfg.cols, order[a] % cfg.cols});
        }
        for(const Cell& g : generals){
            terrain[g.row*cfg.cols + g.col] = Terrain::General;
            cityArmy[g.row*cfg.cols + g.col] = 0;
        }

        if(!generalsReachable(cfg.rows, cfg.cols, terrain, generals)){
            spdlog::debug("grid attempt {} (seed {}) left generals disconnected, retrying", attempt, seed);
            continue;
        }
        return Grid(cfg.rows, cfg.cols, std::move(terrain), std::move(cityArmy), std::move(generals));
    }
    throw InvalidGridError("no connected layout after " + std::to_string(cfg.maxAttempts) + " attempts");
}
