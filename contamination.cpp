#include "contamination.hpp"
#include "dijkstra.hpp"
#include <algorithm>
#include <stdexcept>

std::pair<int,int> region_count_bounds(size_t n, const ContaminationConfig& cfg) {
    int lo = std::max((int)(n * cfg.min_region_fraction), 1);
    int hi = std::max((int)(n * cfg.max_region_fraction), 1);
    return {lo, std::max(lo, hi)};
}

ContaminationGenerator::ContaminationGenerator(std::mt19937_64& rng, ContaminationConfig cfg)
    : rng_(rng), cfg_(cfg) {}

std::vector<ContaminationRegion> ContaminationGenerator::draw_regions(const RoadNetwork& g) {
    if (g.node_count() == 0) throw std::invalid_argument("cannot contaminate an empty road network");

    auto [lo, hi] = region_count_bounds(g.node_count(), cfg_);
    std::uniform_int_distribution<int> count_dist(lo, hi);
    std::uniform_int_distribution<size_t> node_dist(0, g.node_count()-1);
    std::uniform_int_distribution<int> radius_dist(cfg_.min_radius, cfg_.max_radius);

    int k = count_dist(rng_);
    std::vector<ContaminationRegion> regions;
    regions.reserve(k);
    for (int i=0; i<k; ++i) {
        ContaminationRegion r;
        r.center = g.node((int)node_dist(rng_)).id;
        r.radius = radius_dist(rng_);
        regions.push_back(r);
    }
    return regions;
}

int ContaminationGenerator::apply(RoadNetwork& g, const ContaminationRegion& region) {
    int center = g.index_of(region.center);
    if (center < 0) throw std::invalid_argument("contamination center is not in the road network");

    std::vector<char> inside(g.node_count(), 0);
    for (int v : bounded_neighborhood(g, center, region.radius)) inside[v] = 1;

    int changed = 0;
    for (int e = 0; e < (int)g.street_count(); ++e) {
        const auto& s = g.street(e);
        if (!inside[s.from] || !inside[s.to]) continue;
        if (s.cleanliness == Cleanliness::Clean) ++changed;
        g.set_cleanliness(e, Cleanliness::Dirty);
    }
    return changed;
}

static void reset_clean(RoadNetwork& g) {
    for (int e = 0; e < (int)g.street_count(); ++e) g.set_cleanliness(e, Cleanliness::Clean);
}

std::vector<ContaminationRegion> ContaminationGenerator::contaminate(RoadNetwork& g) {
    reset_clean(g);
    auto regions = draw_regions(g);
    for (const auto& r : regions) apply(g, r);
    return regions;
}

std::vector<ContaminationRegion> ContaminationGenerator::replay(RoadNetwork& g, const std::vector<ContaminationRegion>& regions) {
    if (g.node_count() == 0) throw std::invalid_argument("cannot contaminate an empty road network");
    reset_clean(g);
    for (const auto& r : regions) apply(g, r);
    return regions;
}
