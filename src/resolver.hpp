#pragma once
#include "game_state.hpp"

#include <vector>

struct TurnReport {
    std::vector<uint8_t> downgraded;   // per agent: move absorbed as idle
    std::vector<int> eliminated;       // agents knocked out this turn, in order
};

// Resolves one simultaneous action set: validate, growth, movement/combat in
// ascending agent order, win check, turn advance.
class ActionResolver {
public:
    ActionResolver(const Grid& grid, GameParams par);

    GameParams par;

    // Army the cell will hold once this turn's growth has been applied.
    int armyAfterGrowth(const GameState& st, int r, int c) const;

    // True iff step() would execute this move rather than downgrade it.
    bool isLegal(const GameState& st, int agent, const Action& a) const;

    // Throws InvalidActionError for moves that do not fit the grid shape.
    void checkShape(const GameState& st, const Action& a) const;

    // actions[i] belongs to agent i; eliminated agents' entries are ignored.
    TurnReport resolve(GameState& st, const std::vector<Action>& actions) const;

private:
    std::vector<Cell> generals;

    bool growsThisTurn(const GameState& st, int i) const;
    void applyGrowth(GameState& st) const;
    bool applyMove(GameState& st, int agent, const Action& a, TurnReport& rep) const;
    void eliminate(GameState& st, int victim, int capturer) const;
    void checkWinner(GameState& st) const;
};
