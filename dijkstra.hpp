#pragma once
#include "road_network.hpp"
#include <queue>
#include <limits>
#include <utility>
#include <algorithm>
#include <functional>

enum class Weight { Length, TravelTime };

struct DijkstraResult {
    std::vector<double> dist;
    std::vector<int> parent; // node index, -1 for source/unreached
};

struct DijkstraOptions {
    Weight weight = Weight::Length;
    double cutoff = std::numeric_limits<double>::infinity(); // inclusive
    bool undirected = false; // also relax streets backwards
};

inline double street_weight(const Street& s, Weight w) {
    return w == Weight::Length ? s.length : s.travel_time;
}

inline DijkstraResult dijkstra(const RoadNetwork& g, int src, DijkstraOptions opt = {}) {
    const double INF = std::numeric_limits<double>::infinity();
    std::vector<double> d(g.node_count(), INF);
    std::vector<int> parent(g.node_count(), -1);
    if (src < 0 || src >= (int)g.node_count()) return {std::move(d), std::move(parent)};

    using P = std::pair<double,int>;
    std::priority_queue<P, std::vector<P>, std::greater<P>> pq;

    d[src] = 0.0;
    pq.push({0.0, src});

    auto relax = [&](int u, int v, double w) {
        double nd = d[u] + w;
        if (nd > opt.cutoff) return;
        if (d[v] > nd) {
            d[v] = nd;
            parent[v] = u;
            pq.push({nd, v});
        }
    };

    while(!pq.empty()) {
        auto [du,u] = pq.top(); pq.pop();
        if (du > d[u]) continue;
        for (int e : g.out_streets(u)) {
            const auto& s = g.street(e);
            relax(u, s.to, street_weight(s, opt.weight));
        }
        if (opt.undirected) {
            for (int e : g.in_streets(u)) {
                const auto& s = g.street(e);
                relax(u, s.from, street_weight(s, opt.weight));
            }
        }
    }
    return {std::move(d), std::move(parent)};
}

// Node indices within `radius` meters of `center`, ignoring street direction.
inline std::vector<int> bounded_neighborhood(const RoadNetwork& g, int center, double radius) {
    DijkstraOptions opt;
    opt.weight = Weight::Length;
    opt.cutoff = radius;
    opt.undirected = true;
    auto dj = dijkstra(g, center, opt);

    std::vector<int> out;
    for (int v = 0; v < (int)dj.dist.size(); ++v)
        if (dj.dist[v] <= radius) out.push_back(v);
    return out;
}

inline std::vector<int> reconstruct_path(int src, int dst, const std::vector<int>& parent) {
    std::vector<int> p;
    if (dst < 0 || dst >= (int)parent.size()) return p;
    for (int v = dst; v != -1; v = parent[v]) p.push_back(v);
    std::reverse(p.begin(), p.end());
    if (p.empty() || p.front() != src) return {};
    return p;
}

// Directed shortest path as node indices, empty if dst is unreachable.
inline std::vector<int> shortest_path(const RoadNetwork& g, int src, int dst, Weight w = Weight::TravelTime) {
    DijkstraOptions opt;
    opt.weight = w;
    auto dj = dijkstra(g, src, opt);
    return reconstruct_path(src, dst, dj.parent);
}
