#pragma once
#include "world_simulation.hpp"
#include <deque>
#include <random>
#include <unordered_set>
#include <cstdint>

// Bot that only sees the streets leaving its own intersection. Cleans any
// dirty street in sight, otherwise wanders toward unvisited intersections
// and backs up out of dead ends.
class WanderingSweeper {
public:
    WanderingSweeper(SweeperControls& sim, std::uint64_t seed);

    // One action. False when the bot is stuck (dead end it cannot back out of).
    bool step();

private:
    SweeperControls& sim_;
    std::mt19937_64 rng_;
    std::unordered_set<NodeId> visited_;
};

// Evaluation bot with full observability: drives the fastest route to the
// closest dirty street and cleans it.
class OracleSweeper {
public:
    explicit OracleSweeper(FullObservabilityView& view) : view_(view) {}

    // One action. False when no dirty street is reachable.
    bool step();

private:
    struct Leg { NodeId to; bool clean; };

    FullObservabilityView& view_;
    std::deque<Leg> plan_;

    bool plan_next_target();
};
