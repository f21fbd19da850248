#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "agents.hpp"
#include "bot_onnx.hpp"
#include "engine.hpp"
#include "match_config.hpp"

using namespace std;

static unique_ptr<Agent> makeAgent(const string& kind, const string& name, uint32_t seed){
    if(kind == "random") return make_unique<RandomAgent>(name, seed);
    if(kind == "expander") return make_unique<ExpanderAgent>(name, seed);
    if(kind.rfind("onnx:", 0) == 0) return make_unique<OnnxAgent>(name, kind.substr(5), true, seed);
    throw invalid_argument("unknown agent kind '" + kind + "'");
}

static int showReplay(const string& path){
    ReplayLog log = ReplayLog::load(path);
    const auto& agents = log.agents();
    cout << "Replay " << path << ": " << log.grid().rows() << "x" << log.grid().cols()
         << ", " << agents.size() << " agents, " << log.size() << " snapshots\n";
    cout << log.grid().serialize() << "\n";
    for(const GameState& st : log.states()){
        cout << "turn " << st.turn;
        for(size_t a=0;a<agents.size();a++){
            cout << " | " << agents[a].name << (st.alive[a] ? "" : " (out)")
                 << " land " << st.landOf((int)a) << " army " << st.armyOf((int)a);
        }
        cout << "\n";
    }
    return 0;
}

static string readFile(const string& path){
    ifstream in(path);
    if(!in) throw runtime_error("cannot open grid file " + path);
    stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int main(int argc, char* argv[]){
    spdlog::cfg::load_env_levels();

    MatchConfig cfg;
    try {
        cfg = parseArgs(argc, argv);
    } catch(const exception& e){
        cerr << e.what() << "\n\n";
        printUsage();
        return 2;
    }
    if(cfg.help){
        printUsage();
        return 0;
    }
    if(cfg.logLevelSet) spdlog::set_level(cfg.logLevel);

    try {
        if(!cfg.replayIn.empty()) return showReplay(cfg.replayIn);

        GridFactory factory(cfg.grid);
        Grid grid = cfg.gridFile.empty() ? factory.generate() : factory.fromString(readFile(cfg.gridFile));

        vector<unique_ptr<Agent>> agents;
        vector<string> names;
        for(size_t i=0;i<cfg.agents.size();i++){
            names.push_back(cfg.agents[i] + "-" + to_string(i));
            agents.push_back(makeAgent(cfg.agents[i], names.back(), cfg.grid.seed + (uint32_t)i));
        }

        GeneralsEngine eng(grid, names);
        if(!cfg.replayOut.empty()) eng.startReplay();
        spdlog::info("{}x{} grid, {} agents", grid.rows(), grid.cols(), names.size());

        while(!eng.st.done && eng.st.turn < cfg.maxTurns){
            map<string, Action> actions;
            for(int i=0;i<eng.numAgents();i++){
                if(!eng.st.alive[i]) continue;
                actions[names[i]] = agents[i]->play(eng.getObservation(i));
            }
            eng.step(actions);
        }

        if(!eng.st.done) spdlog::info("turn limit {} reached", cfg.maxTurns);
        for(int i=0;i<eng.numAgents();i++){
            Info info = eng.getInfo(i);
            cout << names[i] << ": land " << info.land << ", army " << info.army
                 << (info.isWinner ? " (winner)" : "") << "\n";
        }

        if(!cfg.replayOut.empty()) eng.replay()->store(cfg.replayOut);
    } catch(const exception& e){
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
