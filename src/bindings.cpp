#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "engine.hpp"
#include "errors.hpp"

#include <stdexcept>

namespace py = pybind11;

PYBIND11_MODULE(generals_cpp, m) {
    auto& base = py::register_exception<GeneralsError>(m, "GeneralsError", PyExc_RuntimeError);
    py::register_exception<InvalidGridError>(m, "InvalidGridError", base.ptr());
    py::register_exception<InvalidActionError>(m, "InvalidActionError", base.ptr());
    py::register_exception<ReplayCorruptionError>(m, "ReplayCorruptionError", base.ptr());
    py::register_exception<ReplayIOError>(m, "ReplayIOError", base.ptr());

    py::enum_<Terrain>(m, "Terrain")
        .value("PASSABLE", Terrain::Passable)
        .value("MOUNTAIN", Terrain::Mountain)
        .value("CITY", Terrain::City)
        .value("GENERAL", Terrain::General);

    py::enum_<Direction>(m, "Direction")
        .value("UP", Direction::Up)
        .value("DOWN", Direction::Down)
        .value("LEFT", Direction::Left)
        .value("RIGHT", Direction::Right);

    py::enum_<CellOwner>(m, "CellOwner")
        .value("SELF", CellOwner::Self)
        .value("OPPONENT", CellOwner::Opponent)
        .value("NEUTRAL", CellOwner::Neutral)
        .value("HIDDEN", CellOwner::Hidden);

    py::enum_<TerrainView>(m, "TerrainView")
        .value("UNKNOWN", TerrainView::Unknown)
        .value("PASSABLE", TerrainView::Passable)
        .value("MOUNTAIN", TerrainView::Mountain)
        .value("CITY", TerrainView::City)
        .value("GENERAL", TerrainView::General);

    py::class_<Cell>(m, "Cell")
        .def(py::init<>())
        .def(py::init([](int r, int c){ return Cell{r, c}; }))
        .def_readwrite("row", &Cell::row)
        .def_readwrite("col", &Cell::col);

    py::class_<Grid>(m, "Grid")
        .def_static("parse", py::overload_cast<const std::string&>(&Grid::parse))
        .def("serialize", &Grid::serialize)
        .def("__str__", &Grid::serialize)
        .def_property_readonly("rows", &Grid::rows)
        .def_property_readonly("cols", &Grid::cols)
        .def_property_readonly("num_agents", &Grid::numAgents)
        .def("general", &Grid::general)
        .def("__eq__", [](const Grid& a, const Grid& b){ return a == b; });

    py::class_<GridConfig>(m, "GridConfig")
        .def(py::init<>())
        .def_readwrite("rows", &GridConfig::rows)
        .def_readwrite("cols", &GridConfig::cols)
        .def_readwrite("num_agents", &GridConfig::numAgents)
        .def_readwrite("mountain_density", &GridConfig::mountainDensity)
        .def_readwrite("city_density", &GridConfig::cityDensity)
        .def_readwrite("general_positions", &GridConfig::generalPositions)
        .def_readwrite("seed", &GridConfig::seed)
        .def_readwrite("max_attempts", &GridConfig::maxAttempts);

    py::class_<GridFactory>(m, "GridFactory")
        .def(py::init<>())
        .def(py::init<GridConfig>())
        .def_readwrite("config", &GridFactory::cfg)
        .def("generate", py::overload_cast<>(&GridFactory::generate, py::const_))
        .def("generate", py::overload_cast<uint32_t>(&GridFactory::generate, py::const_))
        .def("from_string", &GridFactory::fromString);

    py::class_<GameParams>(m, "GameParams")
        .def(py::init<>())
        .def_readwrite("land_growth_interval", &GameParams::landGrowthInterval)
        .def_readwrite("general_start_army", &GameParams::generalStartArmy);

    py::class_<Action>(m, "Action")
        .def(py::init<>())
        .def_static("idle", &Action::idle)
        .def_static("move", &Action::move, py::arg("row"), py::arg("col"), py::arg("direction"), py::arg("split") = false)
        .def_readwrite("pass_turn", &Action::pass)
        .def_readwrite("row", &Action::row)
        .def_readwrite("col", &Action::col)
        .def_readwrite("direction", &Action::dir)
        .def_readwrite("split", &Action::split);

    py::class_<Observation>(m, "Observation")
        .def_readonly("agent", &Observation::agent)
        .def_readonly("rows", &Observation::rows)
        .def_readonly("cols", &Observation::cols)
        .def_readonly("army", &Observation::army)
        .def_readonly("ownership", &Observation::ownership)
        .def_readonly("terrain", &Observation::terrain)
        .def_readonly("visible", &Observation::visible)
        .def_readonly("structures_in_fog", &Observation::structuresInFog)
        .def_readonly("action_mask", &Observation::actionMask)
        .def_readonly("owned_land", &Observation::ownedLand)
        .def_readonly("owned_army", &Observation::ownedArmy)
        .def_readonly("opponent_land", &Observation::opponentLand)
        .def_readonly("opponent_army", &Observation::opponentArmy)
        .def_readonly("alive", &Observation::alive)
        .def_readonly("turn", &Observation::turn)
        .def_readonly("done", &Observation::done)
        .def_readonly("is_winner", &Observation::isWinner)
        .def("features", &Observation::features);

    py::class_<Info>(m, "Info")
        .def_readonly("army", &Info::army)
        .def_readonly("land", &Info::land)
        .def_readonly("turn", &Info::turn)
        .def_readonly("done", &Info::done)
        .def_readonly("is_winner", &Info::isWinner)
        .def_readonly("downgraded", &Info::downgraded)
        .def_readonly("alive", &Info::alive);

    py::class_<GeneralsEngine::StepResult>(m, "StepResult")
        .def_readonly("observations", &GeneralsEngine::StepResult::observations)
        .def_readonly("infos", &GeneralsEngine::StepResult::infos)
        .def_readonly("done", &GeneralsEngine::StepResult::done)
        .def_readonly("winner", &GeneralsEngine::StepResult::winner);

    py::class_<AgentMeta>(m, "AgentMeta")
        .def(py::init<>())
        .def_readwrite("name", &AgentMeta::name)
        .def_readwrite("r", &AgentMeta::r)
        .def_readwrite("g", &AgentMeta::g)
        .def_readwrite("b", &AgentMeta::b);

    py::class_<ReplayLog>(m, "Replay")
        .def_static("load", &ReplayLog::load)
        .def("store", &ReplayLog::store)
        .def("__len__", &ReplayLog::size)
        .def_property_readonly("grid", &ReplayLog::grid)
        .def_property_readonly("agents", &ReplayLog::agents)
        .def("army", [](const ReplayLog& r, size_t i){ return r.at(i).army; })
        .def("owner", [](const ReplayLog& r, size_t i){ return r.at(i).owner; })
        .def("turn", [](const ReplayLog& r, size_t i){ return r.at(i).turn; });

    py::class_<GeneralsEngine>(m, "Engine")
        .def(py::init<Grid, std::vector<std::string>, GameParams>(),
             py::arg("grid"), py::arg("agents"), py::arg("params") = GameParams{})

        .def("reset", py::overload_cast<>(&GeneralsEngine::reset))
        .def("reset", py::overload_cast<Grid>(&GeneralsEngine::reset))

        .def("turn", [](GeneralsEngine& e){ return e.st.turn; })
        .def("done", [](GeneralsEngine& e){ return e.st.done; })
        .def("winner", [](GeneralsEngine& e){ return e.st.winner; })
        .def("agent_index", &GeneralsEngine::agentIndex)
        .def_property_readonly("agents", &GeneralsEngine::agentNames)
        .def_property_readonly("grid", &GeneralsEngine::grid)

        .def("get_observation", &GeneralsEngine::getObservation)
        .def("get_action_mask", &GeneralsEngine::getActionMask)
        .def("get_info", &GeneralsEngine::getInfo)
        .def("step", &GeneralsEngine::step)

        .def("start_replay", &GeneralsEngine::startReplay, py::arg("agents") = std::vector<AgentMeta>{})
        .def("stop_replay", &GeneralsEngine::stopReplay)
        .def("store_replay", [](GeneralsEngine& e, const std::string& path) {
            if(!e.replay()) throw std::runtime_error("replay recording is not active");
            e.replay()->store(path);
        });
}
