#include "match_config.hpp"

#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace std;

void printUsage(){
    cout << "generals_match: play agents against each other on a generals grid\n\n"
         << "Usage:\n"
         << "  generals_match [options]\n\n"
         << "Options:\n"
         << "  --grid <file>        Grid in text encoding (default: generated)\n"
         << "  --rows <n>           Generated grid rows (default: 10)\n"
         << "  --cols <n>           Generated grid columns (default: 10)\n"
         << "  --seed <n>           Generator and agent seed (default: 0)\n"
         << "  --agents <a,b,...>   random | expander | onnx:<model.onnx> (default: expander,random)\n"
         << "  --turns <n>          Stop after n turns (default: 500)\n"
         << "  --replay <file>      Record the match to a replay file\n"
         << "  --show-replay <file> Print per-turn totals of a stored replay and exit\n"
         << "  --log-level <lvl>    trace | debug | info | warn | error | critical | off (default: info)\n"
         << "  --help               Show this help message\n";
}

static vector<string> splitList(const string& s){
    vector<string> out;
    stringstream ss(s);
    string item;
    while(getline(ss, item, ',')) if(!item.empty()) out.push_back(item);
    return out;
}

spdlog::level::level_enum parseLogLevel(const string& name){
    // from_str maps anything it does not know to off
    spdlog::level::level_enum lvl = spdlog::level::from_str(name);
    if(lvl == spdlog::level::off && name != "off")
        throw invalid_argument("unknown log level '" + name + "'");
    return lvl;
}

MatchConfig parseArgs(int argc, const char* const argv[]){
    MatchConfig cfg;
    for(int i=1;i<argc;i++){
        auto value = [&](const char* flag) -> string {
            if(i+1 >= argc) throw invalid_argument(string(flag) + " needs a value");
            return argv[++i];
        };
        if(strcmp(argv[i], "--grid") == 0) cfg.gridFile = value("--grid");
        else if(strcmp(argv[i], "--rows") == 0) cfg.grid.rows = stoi(value("--rows"));
        else if(strcmp(argv[i], "--cols") == 0) cfg.grid.cols = stoi(value("--cols"));
        else if(strcmp(argv[i], "--seed") == 0) cfg.grid.seed = (uint32_t)stoul(value("--seed"));
        else if(strcmp(argv[i], "--agents") == 0) cfg.agents = splitList(value("--agents"));
        else if(strcmp(argv[i], "--turns") == 0) cfg.maxTurns = stoi(value("--turns"));
        else if(strcmp(argv[i], "--replay") == 0) cfg.replayOut = value("--replay");
        else if(strcmp(argv[i], "--show-replay") == 0) cfg.replayIn = value("--show-replay");
        else if(strcmp(argv[i], "--log-level") == 0){
            cfg.logLevel = parseLogLevel(value("--log-level"));
            cfg.logLevelSet = true;
        }
        else if(strcmp(argv[i], "--help") == 0) cfg.help = true;
        else throw invalid_argument(string("unknown option ") + argv[i]);
    }
    cfg.grid.numAgents = (int)cfg.agents.size();
    return cfg;
}
