#include "sweeper_agents.hpp"
#include <limits>
#include <vector>

WanderingSweeper::WanderingSweeper(SweeperControls& sim, std::uint64_t seed)
    : sim_(sim), rng_(seed) {
    visited_.insert(sim_.current_location().location_id);
}

bool WanderingSweeper::step() {
    auto streets = sim_.scan_next_streets();
    if (streets.empty()) return sim_.backup(1).has_value();

    for (const auto& s : streets) {
        if (s.street.cleanliness != Cleanliness::Dirty) continue;
        auto moved = sim_.clean_and_move_to(s.end.location_id);
        if (moved) visited_.insert(*moved);
        return moved.has_value();
    }

    std::vector<NodeId> fresh, any;
    for (const auto& s : streets) {
        any.push_back(s.end.location_id);
        if (!visited_.count(s.end.location_id)) fresh.push_back(s.end.location_id);
    }
    const auto& pool = fresh.empty() ? any : fresh;
    std::uniform_int_distribution<size_t> pick(0, pool.size()-1);

    auto moved = sim_.move_to(pool[pick(rng_)]);
    if (moved) visited_.insert(*moved);
    return moved.has_value();
}

bool OracleSweeper::plan_next_target() {
    plan_.clear();
    NodeId here = view_.current_location().location_id;
    auto dist = view_.travel_times_from(here);

    const StreetView* best = nullptr;
    double best_dist = std::numeric_limits<double>::infinity();
    auto streets = view_.all_streets();
    for (const auto& s : streets) {
        // the bot can only ever clean the key-0 street between two intersections
        if (s.street.cleanliness != Cleanliness::Dirty || s.street.key != 0) continue;
        auto it = dist.find(s.start.location_id);
        if (it == dist.end() || it->second >= best_dist) continue;
        best = &s;
        best_dist = it->second;
    }
    if (!best) return false;

    auto path = view_.shortest_route(here, best->start.location_id);
    for (size_t i = 1; i < path.size(); ++i) plan_.push_back({path[i], false});
    plan_.push_back({best->end.location_id, true});
    return true;
}

bool OracleSweeper::step() {
    if (plan_.empty() && !plan_next_target()) return false;

    Leg leg = plan_.front();
    plan_.pop_front();
    auto moved = leg.clean ? view_.clean_and_move_to(leg.to) : view_.move_to(leg.to);
    if (!moved) {
        plan_.clear();
        return false;
    }
    return true;
}
