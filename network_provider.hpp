#pragma once
#include "road_network.hpp"
#include <string>

// Resolves a place identifier to a raw road network (speeds possibly
// unknown, travel times not yet computed). Throws std::runtime_error when
// the place cannot be loaded.
class NetworkProvider {
public:
    virtual ~NetworkProvider() = default;
    virtual bool resolves(const std::string& place) const = 0;
    virtual RoadNetwork load(const std::string& place) const = 0;
};

// "grid:<cols>x<rows>[@<spacing_m>]" - synthetic downtown grid. Even rows are
// two-way primary avenues, odd rows alternate one-way residential streets,
// every third column is a two-way secondary street with no posted speed.
class GridNetworkProvider : public NetworkProvider {
public:
    bool resolves(const std::string& place) const override;
    RoadNetwork load(const std::string& place) const override;
};

// Path to a .yaml/.yml file with `nodes` and `edges` sequences.
class YamlNetworkProvider : public NetworkProvider {
public:
    bool resolves(const std::string& place) const override;
    RoadNetwork load(const std::string& place) const override;
};

// Load `place` with the first provider that resolves it, impute missing
// speeds and compute travel times.
RoadNetwork load_network(const std::string& place, double fallback_kph = 40.0);

void write_network_yaml(const RoadNetwork& g, const std::string& path);
