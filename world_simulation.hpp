#pragma once
#include "road_network.hpp"
#include "contamination.hpp"
#include <vector>
#include <random>
#include <string>
#include <optional>
#include <unordered_map>
#include <cstdint>

// Snapshots handed to observers. They own their data; mutating one never
// touches the simulation.
struct NodeView {
    NodeId location_id = 0;
    double x = 0.0, y = 0.0;
    Tags tags;
};

struct EdgeView {
    int key = 0;
    double length = 0.0;
    double speed_kph = 0.0;
    double travel_time = 0.0;
    std::string highway;
    Cleanliness cleanliness = Cleanliness::Clean;
};

struct StreetView {
    NodeView start;
    NodeView end;
    EdgeView street;
};

enum class BackupCost {
    Charged, // each step costs the reverse street's travel time and needs that street
    Free     // the bot is lifted back along its route
};

struct WorldConfig {
    std::string place = "grid:40x30";
    std::optional<std::uint64_t> seed;       // absent => non-reproducible
    double initial_battery = 72000.0;        // seconds in 20 hours
    BackupCost backup_cost = BackupCost::Charged;
    double fallback_speed_kph = 40.0;
    std::optional<NodeId> start_node;        // absent => random
    std::optional<std::vector<ContaminationRegion>> preset_regions; // replay instead of drawing
    ContaminationConfig contamination;
};

enum class StreetColor { Dirty, Clean };

inline StreetColor street_color(Cleanliness c) {
    return c == Cleanliness::Dirty ? StreetColor::Dirty : StreetColor::Clean;
}

// Partial-observability handle: everything the bot can sense or do is
// scoped to its current intersection. Bots are handed this interface only.
class SweeperControls {
public:
    virtual ~SweeperControls() = default;

    virtual std::vector<StreetView> scan_next_streets() const = 0;

    virtual std::optional<NodeId> move_to(NodeId other) = 0;
    virtual std::optional<NodeId> clean_and_move_to(NodeId other) = 0;
    // Undoes the last how_many moves along the route, each step travelling the
    // street from the vacated intersection back to the previous one.
    virtual std::optional<NodeId> backup(int how_many = 1) = 0;

    virtual double battery_life() const = 0;
    virtual double meters_cleaned() const = 0;
    virtual NodeView current_location() const = 0;
    virtual std::vector<NodeId> route() const = 0;
};

class FullObservabilityView;

class WorldSimulation : public SweeperControls {
public:
    // Loads cfg.place through load_network(). Throws on unresolvable places
    // and empty networks.
    explicit WorldSimulation(WorldConfig cfg);
    // Takes a network whose travel times are already computed.
    WorldSimulation(RoadNetwork network, WorldConfig cfg);

    std::vector<StreetView> scan_next_streets() const override;

    std::optional<NodeId> move_to(NodeId other) override;
    std::optional<NodeId> clean_and_move_to(NodeId other) override;
    std::optional<NodeId> backup(int how_many = 1) override;

    double battery_life() const override { return battery_life_; }
    double meters_cleaned() const override { return meters_cleaned_; }
    NodeView current_location() const override;

    std::vector<NodeId> route() const override { return route_; }
    NodeId start_location() const { return route_.front(); }
    BackupCost backup_cost() const { return cfg_.backup_cost; }

    // Global view for evaluation and rendering. Only the owner of the
    // simulation can hand one out.
    FullObservabilityView full_view();

private:
    friend class FullObservabilityView;

    WorldConfig cfg_;
    RoadNetwork g_;
    std::mt19937_64 rng_;
    std::vector<ContaminationRegion> regions_;

    int location_ = -1; // node index
    std::vector<NodeId> route_;
    double battery_life_ = 0.0;
    double meters_cleaned_ = 0.0;

    void setup();
    NodeView node_view(int idx) const;
    StreetView street_view(int e) const;
};

// Evaluation/debugging handle over the same simulation. Adds global
// lookups; mutation still only happens through the bot's actions.
class FullObservabilityView {
public:
    // bot protocol
    std::vector<StreetView> scan_next_streets() const { return sim_.scan_next_streets(); }
    std::optional<NodeId> move_to(NodeId other) { return sim_.move_to(other); }
    std::optional<NodeId> clean_and_move_to(NodeId other) { return sim_.clean_and_move_to(other); }
    std::optional<NodeId> backup(int how_many = 1) { return sim_.backup(how_many); }
    double battery_life() const { return sim_.battery_life(); }
    double meters_cleaned() const { return sim_.meters_cleaned(); }
    NodeView current_location() const { return sim_.current_location(); }
    std::vector<NodeId> route() const { return sim_.route(); }

    std::optional<NodeView> lookup_node(NodeId id) const;
    std::optional<StreetView> lookup_street(NodeId u, NodeId v) const;
    std::vector<StreetView> outgoing_from(NodeId id) const;
    std::vector<StreetView> incoming_to(NodeId id) const;
    std::vector<ContaminationRegion> contamination_regions() const { return sim_.regions_; }

    std::vector<StreetView> all_streets() const;
    double dirty_meters_remaining() const;
    size_t node_count() const { return sim_.g_.node_count(); }

    // Fastest route by travel time, empty if unreachable.
    std::vector<NodeId> shortest_route(NodeId from, NodeId to) const;
    // Travel time from `from` to every reachable intersection.
    std::unordered_map<NodeId, double> travel_times_from(NodeId from) const;

private:
    friend class WorldSimulation;
    explicit FullObservabilityView(WorldSimulation& sim) : sim_(sim) {}

    WorldSimulation& sim_;
};

inline FullObservabilityView WorldSimulation::full_view() { return FullObservabilityView(*this); }
