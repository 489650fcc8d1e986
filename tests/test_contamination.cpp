#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "contamination.hpp"
#include "dijkstra.hpp"
#include "network_provider.hpp"
#include "check.hpp"

static bool test_region_count_bounds() {
    CHECK((region_count_bounds(1) == std::pair<int,int>{1, 1}));
    CHECK((region_count_bounds(199) == std::pair<int,int>{1, 1}));
    CHECK((region_count_bounds(499) == std::pair<int,int>{1, 2}));
    CHECK((region_count_bounds(1000) == std::pair<int,int>{2, 5}));
    CHECK((region_count_bounds(10000) == std::pair<int,int>{20, 50}));
    return true;
}

static bool test_drawn_regions_stay_in_range() {
    const char* places[] = {"grid:3x3", "grid:20x10", "grid:50x40@60"};
    for (const char* place : places) {
        RoadNetwork g = load_network(place);
        auto [lo, hi] = region_count_bounds(g.node_count());
        for (std::uint64_t seed = 1; seed <= 20; ++seed) {
            std::mt19937_64 rng(seed);
            ContaminationGenerator gen(rng);
            auto regions = gen.draw_regions(g);
            CHECK((int)regions.size() >= lo && (int)regions.size() <= hi);
            for (const auto& r : regions) {
                CHECK(r.radius >= 1 && r.radius <= 2000);
                CHECK(g.contains(r.center));
            }
        }
    }
    return true;
}

// A street is dirty exactly when both ends lie within some region.
static bool test_dirty_streets_match_regions() {
    RoadNetwork g = load_network("grid:30x20@80");
    for (std::uint64_t seed = 1; seed <= 10; ++seed) {
        std::mt19937_64 rng(seed);
        ContaminationGenerator gen(rng);
        auto regions = gen.contaminate(g);

        std::vector<char> covered_street(g.street_count(), 0);
        for (const auto& r : regions) {
            std::vector<char> inside(g.node_count(), 0);
            for (int v : bounded_neighborhood(g, g.index_of(r.center), r.radius)) inside[v] = 1;
            for (int e = 0; e < (int)g.street_count(); ++e)
                if (inside[g.street(e).from] && inside[g.street(e).to]) covered_street[e] = 1;
        }
        for (int e = 0; e < (int)g.street_count(); ++e) {
            bool dirty = g.street(e).cleanliness == Cleanliness::Dirty;
            CHECK(dirty == (bool)covered_street[e]);
        }
    }
    return true;
}

static bool test_same_seed_same_world() {
    RoadNetwork a = load_network("grid:25x25");
    RoadNetwork b = load_network("grid:25x25");
    std::mt19937_64 ra(77), rb(77);
    ContaminationGenerator ga(ra), gb(rb);
    auto regions_a = ga.contaminate(a);
    auto regions_b = gb.contaminate(b);
    CHECK(regions_a == regions_b);
    for (int e = 0; e < (int)a.street_count(); ++e)
        CHECK(a.street(e).cleanliness == b.street(e).cleanliness);
    return true;
}

static bool test_apply_marks_parallel_streets_and_is_idempotent() {
    RoadNetwork g;
    g.add_node(1, 0, 0);
    g.add_node(2, 10, 0);
    g.add_node(3, 5000, 0);
    g.add_street(1, 2, 10.0);
    g.add_street(1, 2, 12.0);
    g.add_street(2, 3, 4990.0);

    ContaminationRegion r{1, 10};
    CHECK(ContaminationGenerator::apply(g, r) == 2);
    CHECK(g.street(0).cleanliness == Cleanliness::Dirty);
    CHECK(g.street(1).cleanliness == Cleanliness::Dirty);
    CHECK(g.street(2).cleanliness == Cleanliness::Clean);

    // overlapping region changes nothing new
    CHECK(ContaminationGenerator::apply(g, ContaminationRegion{2, 15}) == 0);

    auto replayed = ContaminationGenerator::replay(g, {ContaminationRegion{2, 1}});
    CHECK(replayed.size() == 1 && replayed[0].center == 2);
    CHECK(g.street(0).cleanliness == Cleanliness::Clean);
    return true;
}

static bool test_degenerate_inputs_throw() {
    RoadNetwork empty;
    std::mt19937_64 rng(1);
    ContaminationGenerator gen(rng);
    bool threw = false;
    try { gen.contaminate(empty); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw);

    RoadNetwork g;
    g.add_node(1, 0, 0);
    threw = false;
    try { ContaminationGenerator::apply(g, ContaminationRegion{42, 10}); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw);
    return true;
}

int main() {
    bool ok = true;
    ok &= test_region_count_bounds();
    ok &= test_drawn_regions_stay_in_range();
    ok &= test_dirty_streets_match_regions();
    ok &= test_same_seed_same_world();
    ok &= test_apply_marks_parallel_streets_and_is_idempotent();
    ok &= test_degenerate_inputs_throw();
    std::cout << (ok ? "ALL TESTS PASSED\n" : "TESTS FAILED\n");
    return ok ? 0 : 1;
}
