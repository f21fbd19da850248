#include <gtest/gtest.h>

#include "agents.hpp"
#include "engine.hpp"
#include "observation.hpp"

namespace {

struct View {
    Grid grid;
    GameParams par;
    ActionResolver resolver;
    ObservationBuilder builder;
    GameState st;

    explicit View(const std::string& text)
    : grid(Grid::parse(text)), resolver(grid, par), builder(resolver),
      st(GameState::fromGrid(grid, par)) {}

    void own(int r, int c, int agent, int army){
        st.owner[st.index(r,c)] = agent;
        st.army[st.index(r,c)] = army;
    }
    Observation look(int agent) const {
        return builder.build(st, agent, std::vector<uint8_t>(grid.size(), 0));
    }
};

const char* FIELD =
    "A....\n"
    ".....\n"
    "..#..\n"
    "...3.\n"
    "....B";

} // namespace

TEST(ObservationBuilder, SeesOwnCellsAndTheirNeighbours) {
    View v(FIELD);
    Observation obs = v.look(0);

    for(int r=0;r<5;r++){
        for(int c=0;c<5;c++){
            bool near = r<=1 && c<=1;
            EXPECT_EQ(obs.visible[obs.index(r,c)] != 0, near) << r << "," << c;
        }
    }
    EXPECT_EQ(obs.ownership[obs.index(0,0)], CellOwner::Self);
    EXPECT_EQ(obs.army[obs.index(0,0)], 1);
    EXPECT_EQ(obs.ownership[obs.index(1,1)], CellOwner::Neutral);
    EXPECT_EQ(obs.army[obs.index(1,1)], 0);
    EXPECT_EQ(obs.terrain[obs.index(1,1)], TerrainView::Passable);
}

TEST(ObservationBuilder, HiddenCellsAreUnknownNotEmpty) {
    View v(FIELD);
    Observation obs = v.look(0);

    int enemy = obs.index(4,4);
    EXPECT_EQ(obs.ownership[enemy], CellOwner::Hidden);
    EXPECT_EQ(obs.army[enemy], ARMY_UNKNOWN);
    EXPECT_EQ(obs.terrain[enemy], TerrainView::Unknown);

    int city = obs.index(3,3);
    EXPECT_EQ(obs.terrain[city], TerrainView::Unknown);
    EXPECT_EQ(obs.structuresInFog[city], 1);
    EXPECT_EQ(obs.army[city], ARMY_UNKNOWN);
}

TEST(ObservationBuilder, MountainsAreAlwaysKnown) {
    View v(FIELD);
    Observation obs = v.look(0);
    int m = obs.index(2,2);
    EXPECT_EQ(obs.visible[m], 0);
    EXPECT_EQ(obs.terrain[m], TerrainView::Mountain);
    EXPECT_EQ(obs.structuresInFog[m], 1);
    EXPECT_EQ(obs.ownership[m], CellOwner::Hidden);
}

TEST(ObservationBuilder, ExploredTerrainIsRemembered) {
    View v(FIELD);
    std::vector<uint8_t> explored(v.grid.size(), 0);
    explored[v.st.index(3,3)] = 1;
    explored[v.st.index(4,4)] = 1;
    Observation obs = v.builder.build(v.st, 0, explored);

    EXPECT_EQ(obs.terrain[obs.index(3,3)], TerrainView::City);
    EXPECT_EQ(obs.terrain[obs.index(4,4)], TerrainView::General);
    // terrain memory does not reveal the current army or owner
    EXPECT_EQ(obs.army[obs.index(4,4)], ARMY_UNKNOWN);
    EXPECT_EQ(obs.ownership[obs.index(4,4)], CellOwner::Hidden);
}

TEST(ObservationBuilder, ClassifiesOpponentsAndTotals) {
    View v(FIELD);
    v.own(0,1, 0, 4);
    v.own(1,2, 1, 3);
    Observation obs = v.look(0);

    EXPECT_EQ(obs.ownership[obs.index(1,2)], CellOwner::Opponent);
    EXPECT_EQ(obs.army[obs.index(1,2)], 3);
    EXPECT_EQ(obs.ownedLand, 2);
    EXPECT_EQ(obs.ownedArmy, 5);
    EXPECT_EQ(obs.opponentLand, 2);
    EXPECT_EQ(obs.opponentArmy, 4);
    EXPECT_EQ(obs.alive, (std::vector<int>{0, 1}));
    EXPECT_FALSE(obs.done);
    EXPECT_FALSE(obs.isWinner);
}

TEST(ObservationBuilder, MaskMatchesLegalMoves) {
    View v("A.#\n...\n..B");
    v.st.turn = 1;
    v.own(0,1, 0, 5);
    v.own(1,1, 0, 1);
    Observation obs = v.look(0);

    EXPECT_TRUE(obs.canMove(0,0, Direction::Right));     // general grows to 2
    EXPECT_TRUE(obs.canMove(0,0, Direction::Down));
    EXPECT_FALSE(obs.canMove(0,0, Direction::Up));
    EXPECT_FALSE(obs.canMove(0,0, Direction::Left));
    EXPECT_FALSE(obs.canMove(0,1, Direction::Right));    // mountain
    EXPECT_TRUE(obs.canMove(0,1, Direction::Down));
    EXPECT_TRUE(obs.canMove(0,1, Direction::Left));
    EXPECT_FALSE(obs.canMove(1,1, Direction::Down));     // army 1
    EXPECT_FALSE(obs.canMove(2,2, Direction::Up));       // not ours
}

TEST(ObservationBuilder, MaskIsExactAgainstStep) {
    GridConfig cfg;
    cfg.rows = 5;
    cfg.cols = 5;
    Grid grid = GridFactory(cfg).generate(11);
    GeneralsEngine eng(grid, {"red", "blue"});
    ActionResolver resolver(grid, eng.par);
    RandomAgent red("red", 1, 0.0, 0.3), blue("blue", 2, 0.0, 0.3);

    for(int turn=0; turn<60 && !eng.st.done; ++turn){
        for(int agent=0; agent<2; ++agent){
            std::vector<uint8_t> mask = eng.getActionMask(agent);
            for(int i=0;i<(int)mask.size();i++){
                GameState copy = eng.st;
                std::vector<Action> actions(2, Action::idle());
                actions[agent] = decodeAction(i, grid.cols());
                TurnReport rep = resolver.resolve(copy, actions);
                ASSERT_EQ(mask[i] == 1, rep.downgraded[agent] == 0)
                    << "turn " << turn << " agent " << agent << " move " << i;
            }
        }
        eng.step({{"red", red.play(eng.getObservation(0))},
                  {"blue", blue.play(eng.getObservation(1))}});
    }
}

TEST(ObservationBuilder, EliminatedAgentSeesNoMovesAndIsNotAlive) {
    View v("A....\n.....\n....B");
    v.st.turn = 1;
    v.own(2,3, 0, 10);
    std::vector<Action> actions = {Action::move(2, 3, Direction::Right), Action::idle()};
    v.resolver.resolve(v.st, actions);

    Observation loser = v.look(1);
    for(uint8_t m : loser.actionMask) EXPECT_EQ(m, 0);
    EXPECT_EQ(loser.alive, (std::vector<int>{0}));
    EXPECT_FALSE(loser.isWinner);
    EXPECT_TRUE(loser.done);

    Observation winner = v.look(0);
    EXPECT_TRUE(winner.isWinner);
    for(uint8_t m : winner.actionMask) EXPECT_EQ(m, 0);
}

TEST(Observation, FeaturesHaveFixedLayout) {
    View v(FIELD);
    Observation obs = v.look(0);
    std::vector<float> f = obs.features();
    const int n = 25;
    ASSERT_EQ((int)f.size(), obs.featureSize());
    EXPECT_FLOAT_EQ(f[0], 1.f);                     // army at own general
    EXPECT_FLOAT_EQ(f[1*n + 0], 1.f);               // self plane
    EXPECT_FLOAT_EQ(f[4*n + obs.index(4,4)], 0.f);  // enemy general hidden
    EXPECT_FLOAT_EQ(f[5*n + obs.index(2,2)], 1.f);  // mountain plane
    EXPECT_FLOAT_EQ(f[7*n + 0], 1.f);               // general plane
    EXPECT_FLOAT_EQ(f[8*n + 1], 1.f);               // owned land
}
