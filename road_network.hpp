#pragma once
#include <vector>
#include <map>
#include <string>
#include <unordered_map>
#include <cstdint>
#include <cstddef>

using NodeId = std::int64_t;
using Tags = std::map<std::string, std::string>;

enum class Cleanliness { Clean, Dirty };

struct Node {
    NodeId id = 0;
    double x = 0.0, y = 0.0; // lon/lat-like, for drawing
    Tags tags;
};

struct Street {
    int from = -1, to = -1;    // node indices
    int key = 0;               // disambiguates parallel streets from->to
    double length = 0.0;       // meters
    double speed_kph = 0.0;    // <= 0 means unknown until imputed
    double travel_time = 0.0;  // seconds
    std::string highway;
    Cleanliness cleanliness = Cleanliness::Clean;
};

// Directed multigraph. Nodes and streets are addressed by dense indices
// internally; NodeId is the caller-facing opaque id.
class RoadNetwork {
public:
    int add_node(NodeId id, double x, double y, Tags tags = {});

    // Returns the index of the new street, or -1 if an endpoint is unknown.
    int add_street(NodeId u, NodeId v, double length,
                   double speed_kph = 0.0, std::string highway = {});

    size_t node_count() const { return nodes_.size(); }
    size_t street_count() const { return streets_.size(); }

    int index_of(NodeId id) const;
    bool contains(NodeId id) const { return index_of(id) >= 0; }

    const Node& node(int idx) const { return nodes_[idx]; }
    const Street& street(int e) const { return streets_[e]; }
    Street& street(int e) { return streets_[e]; }

    const std::vector<int>& out_streets(int idx) const { return out_[idx]; }
    const std::vector<int>& in_streets(int idx) const { return in_[idx]; }

    // Lowest-key street u->v (node indices), -1 if none.
    int find_street(int u, int v) const;

    void set_cleanliness(int e, Cleanliness c) { streets_[e].cleanliness = c; }

private:
    std::vector<Node> nodes_;
    std::vector<Street> streets_;
    std::vector<std::vector<int>> out_, in_;
    std::unordered_map<NodeId, int> index_;
};

// Fill unknown speeds with the mean known speed of the same highway class,
// falling back to fallback_kph when the class has no known speed.
void impute_speeds(RoadNetwork& g, double fallback_kph = 40.0);

// travel_time = length / speed, in seconds.
void add_travel_times(RoadNetwork& g);
