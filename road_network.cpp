#include "road_network.hpp"
#include <utility>

int RoadNetwork::add_node(NodeId id, double x, double y, Tags tags) {
    auto it = index_.find(id);
    if (it != index_.end()) return it->second;

    int idx = (int)nodes_.size();
    nodes_.push_back({id, x, y, std::move(tags)});
    out_.emplace_back();
    in_.emplace_back();
    index_.emplace(id, idx);
    return idx;
}

int RoadNetwork::add_street(NodeId u, NodeId v, double length, double speed_kph, std::string highway) {
    int a = index_of(u), b = index_of(v);
    if (a < 0 || b < 0) return -1;

    int key = 0;
    for (int e : out_[a]) if (streets_[e].to == b) ++key;

    Street s;
    s.from = a; s.to = b;
    s.key = key;
    s.length = length;
    s.speed_kph = speed_kph;
    s.highway = std::move(highway);

    int e = (int)streets_.size();
    streets_.push_back(std::move(s));
    out_[a].push_back(e);
    in_[b].push_back(e);
    return e;
}

int RoadNetwork::index_of(NodeId id) const {
    auto it = index_.find(id);
    return it == index_.end() ? -1 : it->second;
}

int RoadNetwork::find_street(int u, int v) const {
    if (u < 0 || u >= (int)out_.size()) return -1;
    int best = -1;
    for (int e : out_[u]) {
        if (streets_[e].to != v) continue;
        if (best < 0 || streets_[e].key < streets_[best].key) best = e;
    }
    return best;
}

void impute_speeds(RoadNetwork& g, double fallback_kph) {
    std::map<std::string, std::pair<double, int>> known; // highway -> (sum, count)
    for (int e = 0; e < (int)g.street_count(); ++e) {
        const auto& s = g.street(e);
        if (s.speed_kph > 0.0) {
            auto& acc = known[s.highway];
            acc.first += s.speed_kph;
            acc.second += 1;
        }
    }
    for (int e = 0; e < (int)g.street_count(); ++e) {
        auto& s = g.street(e);
        if (s.speed_kph > 0.0) continue;
        auto it = known.find(s.highway);
        s.speed_kph = (it != known.end()) ? it->second.first / it->second.second : fallback_kph;
    }
}

void add_travel_times(RoadNetwork& g) {
    for (int e = 0; e < (int)g.street_count(); ++e) {
        auto& s = g.street(e);
        double mps = s.speed_kph / 3.6;
        s.travel_time = (mps > 0.0) ? s.length / mps : 0.0;
    }
}
