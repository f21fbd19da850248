#pragma once
#include "observation.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

// Policy capability: map an observation to an action.
class Agent {
public:
    explicit Agent(std::string name) : name_(std::move(name)) {}
    virtual ~Agent() = default;

    virtual Action play(const Observation& obs) = 0;
    virtual void reset() {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Picks uniformly among legal moves; idles and splits at fixed rates.
class RandomAgent : public Agent {
public:
    RandomAgent(std::string name, uint32_t seed = 0, double idleProb = 0.1, double splitProb = 0.25);

    Action play(const Observation& obs) override;
    void reset() override { rng.seed(seed); }

private:
    uint32_t seed;
    double idleProb;
    double splitProb;
    std::mt19937 rng;
};

// Grabs opponent cells first, then neutral ones, else wanders.
class ExpanderAgent : public Agent {
public:
    ExpanderAgent(std::string name, uint32_t seed = 0);

    Action play(const Observation& obs) override;
    void reset() override { rng.seed(seed); }

private:
    uint32_t seed;
    std::mt19937 rng;
};

// Plays a fixed list of actions in order, then idles.
class ScriptedAgent : public Agent {
public:
    ScriptedAgent(std::string name, std::vector<Action> script)
    : Agent(std::move(name)), script(std::move(script)) {}

    Action play(const Observation&) override {
        return next < script.size() ? script[next++] : Action::idle();
    }
    void reset() override { next = 0; }

private:
    std::vector<Action> script;
    size_t next = 0;
};

// Indices into obs.actionMask that are set.
std::vector<int> legalMoves(const Observation& obs);
