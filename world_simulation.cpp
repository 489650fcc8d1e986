#include "world_simulation.hpp"
#include "network_provider.hpp"
#include "dijkstra.hpp"
#include <stdexcept>
#include <utility>
#include <limits>

WorldSimulation::WorldSimulation(WorldConfig cfg)
    : WorldSimulation(load_network(cfg.place, cfg.fallback_speed_kph), cfg) {}

WorldSimulation::WorldSimulation(RoadNetwork network, WorldConfig cfg)
    : cfg_(std::move(cfg)),
      g_(std::move(network)),
      rng_(cfg_.seed ? *cfg_.seed : (std::uint64_t)std::random_device{}()) {
    setup();
}

void WorldSimulation::setup() {
    if (g_.node_count() == 0) throw std::invalid_argument("road network for '" + cfg_.place + "' has no intersections");

    // randomize dirty locations
    ContaminationGenerator gen(rng_, cfg_.contamination);
    if (cfg_.preset_regions) regions_ = gen.replay(g_, *cfg_.preset_regions);
    else                     regions_ = gen.contaminate(g_);

    int start = -1;
    if (cfg_.start_node) {
        start = g_.index_of(*cfg_.start_node);
        if (start < 0) throw std::invalid_argument("configured start node is not in the road network");
    } else {
        std::uniform_int_distribution<size_t> node_dist(0, g_.node_count()-1);
        start = (int)node_dist(rng_);
    }

    location_ = start;
    route_.assign(1, g_.node(start).id);
    battery_life_ = cfg_.initial_battery;
    meters_cleaned_ = 0.0;
}

NodeView WorldSimulation::node_view(int idx) const {
    const Node& n = g_.node(idx);
    NodeView v;
    v.location_id = n.id;
    v.x = n.x; v.y = n.y;
    v.tags = n.tags;
    return v;
}

StreetView WorldSimulation::street_view(int e) const {
    const Street& s = g_.street(e);
    StreetView sv;
    sv.start = node_view(s.from);
    sv.end = node_view(s.to);
    sv.street.key = s.key;
    sv.street.length = s.length;
    sv.street.speed_kph = s.speed_kph;
    sv.street.travel_time = s.travel_time;
    sv.street.highway = s.highway;
    sv.street.cleanliness = s.cleanliness;
    return sv;
}

std::vector<StreetView> WorldSimulation::scan_next_streets() const {
    std::vector<StreetView> out;
    for (int e : g_.out_streets(location_)) out.push_back(street_view(e));
    return out;
}

NodeView WorldSimulation::current_location() const {
    return node_view(location_);
}

std::optional<NodeId> WorldSimulation::move_to(NodeId other) {
    int e = g_.find_street(location_, g_.index_of(other));
    if (e < 0) return std::nullopt;

    const Street& s = g_.street(e);
    location_ = s.to;
    route_.push_back(other);
    battery_life_ -= s.travel_time;
    return other;
}

std::optional<NodeId> WorldSimulation::clean_and_move_to(NodeId other) {
    int e = g_.find_street(location_, g_.index_of(other));
    if (e < 0) return std::nullopt;

    // cleaning costs three times a plain move; move_to charges the third
    const Street& s = g_.street(e);
    battery_life_ -= 2 * s.travel_time;

    if (s.cleanliness == Cleanliness::Dirty) {
        meters_cleaned_ += s.length;
        g_.set_cleanliness(e, Cleanliness::Clean);
    }
    return move_to(other);
}

std::optional<NodeId> WorldSimulation::backup(int how_many) {
    if (how_many < 0 || (size_t)how_many >= route_.size()) return std::nullopt;
    if (how_many == 0) return route_.back();

    std::vector<double> costs;
    if (cfg_.backup_cost == BackupCost::Charged) {
        for (size_t k = route_.size()-1; k >= route_.size() - how_many; --k) {
            int vacated = g_.index_of(route_[k]);
            int prev = g_.index_of(route_[k-1]);
            int e = g_.find_street(vacated, prev);
            if (e < 0) return std::nullopt;
            costs.push_back(g_.street(e).travel_time);
        }
    }

    route_.resize(route_.size() - how_many);
    location_ = g_.index_of(route_.back());
    for (double c : costs) battery_life_ -= c;
    return route_.back();
}

std::optional<NodeView> FullObservabilityView::lookup_node(NodeId id) const {
    int idx = sim_.g_.index_of(id);
    if (idx < 0) return std::nullopt;
    return sim_.node_view(idx);
}

std::optional<StreetView> FullObservabilityView::lookup_street(NodeId u, NodeId v) const {
    const RoadNetwork& g = sim_.g_;
    int e = g.find_street(g.index_of(u), g.index_of(v));
    if (e < 0) return std::nullopt;
    return sim_.street_view(e);
}

std::vector<StreetView> FullObservabilityView::outgoing_from(NodeId id) const {
    std::vector<StreetView> out;
    int idx = sim_.g_.index_of(id);
    if (idx < 0) return out;
    for (int e : sim_.g_.out_streets(idx)) out.push_back(sim_.street_view(e));
    return out;
}

std::vector<StreetView> FullObservabilityView::incoming_to(NodeId id) const {
    std::vector<StreetView> out;
    int idx = sim_.g_.index_of(id);
    if (idx < 0) return out;
    for (int e : sim_.g_.in_streets(idx)) out.push_back(sim_.street_view(e));
    return out;
}

std::vector<StreetView> FullObservabilityView::all_streets() const {
    std::vector<StreetView> out;
    out.reserve(sim_.g_.street_count());
    for (int e = 0; e < (int)sim_.g_.street_count(); ++e) out.push_back(sim_.street_view(e));
    return out;
}

double FullObservabilityView::dirty_meters_remaining() const {
    double total = 0.0;
    for (int e = 0; e < (int)sim_.g_.street_count(); ++e) {
        const Street& s = sim_.g_.street(e);
        if (s.cleanliness == Cleanliness::Dirty) total += s.length;
    }
    return total;
}

std::vector<NodeId> FullObservabilityView::shortest_route(NodeId from, NodeId to) const {
    const RoadNetwork& g = sim_.g_;
    std::vector<NodeId> out;
    int a = g.index_of(from), b = g.index_of(to);
    if (a < 0 || b < 0) return out;
    for (int v : shortest_path(g, a, b, Weight::TravelTime)) out.push_back(g.node(v).id);
    return out;
}

std::unordered_map<NodeId, double> FullObservabilityView::travel_times_from(NodeId from) const {
    const RoadNetwork& g = sim_.g_;
    std::unordered_map<NodeId, double> out;
    int a = g.index_of(from);
    if (a < 0) return out;

    DijkstraOptions opt;
    opt.weight = Weight::TravelTime;
    auto dj = dijkstra(g, a, opt);
    for (int v = 0; v < (int)dj.dist.size(); ++v)
        if (dj.dist[v] < std::numeric_limits<double>::infinity()) out.emplace(g.node(v).id, dj.dist[v]);
    return out;
}
