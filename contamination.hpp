#pragma once
#include "road_network.hpp"
#include <vector>
#include <random>
#include <utility>

struct ContaminationRegion {
    NodeId center = 0;
    int radius = 0; // meters

    bool operator==(const ContaminationRegion& o) const { return center == o.center && radius == o.radius; }
    bool operator!=(const ContaminationRegion& o) const { return !(*this == o); }
};

struct ContaminationConfig {
    double min_region_fraction = 0.002; // of node count
    double max_region_fraction = 0.005;
    int min_radius = 1;
    int max_radius = 2000;
};

// Inclusive [lo, hi] range of region counts for a network of n nodes.
std::pair<int,int> region_count_bounds(size_t n, const ContaminationConfig& cfg = {});

class ContaminationGenerator {
public:
    explicit ContaminationGenerator(std::mt19937_64& rng, ContaminationConfig cfg = {});

    // Draw region count, then per region a center node and a radius.
    std::vector<ContaminationRegion> draw_regions(const RoadNetwork& g);

    // Mark every street with both endpoints inside the region dirty.
    // Returns the number of streets that changed from clean to dirty.
    static int apply(RoadNetwork& g, const ContaminationRegion& region);

    // Reset every street to clean, then draw and apply fresh regions.
    std::vector<ContaminationRegion> contaminate(RoadNetwork& g);

    // Reset every street to clean, then apply known regions.
    static std::vector<ContaminationRegion> replay(RoadNetwork& g, const std::vector<ContaminationRegion>& regions);

private:
    std::mt19937_64& rng_;
    ContaminationConfig cfg_;
};
