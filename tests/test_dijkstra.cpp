#include <algorithm>
#include <iostream>
#include <limits>
#include <vector>

#include "dijkstra.hpp"
#include "check.hpp"

// 1 -> 2 -> 3, lengths 100 and 50, all streets pointing at 3
static RoadNetwork line_toward_three() {
    RoadNetwork g;
    g.add_node(1, 0, 0);
    g.add_node(2, 100, 0);
    g.add_node(3, 150, 0);
    g.add_node(4, 900, 900); // isolated
    g.add_street(1, 2, 100.0);
    g.add_street(2, 3, 50.0);
    return g;
}

static bool contains(const std::vector<int>& v, int x) {
    return std::find(v.begin(), v.end(), x) != v.end();
}

static bool test_neighborhood_ignores_direction() {
    RoadNetwork g = line_toward_three();
    int n1 = g.index_of(1), n2 = g.index_of(2), n3 = g.index_of(3);

    auto hood = bounded_neighborhood(g, n3, 150.0);
    CHECK(hood.size() == 3);
    CHECK(contains(hood, n1) && contains(hood, n2) && contains(hood, n3));

    // following direction only, nothing leaves node 3
    DijkstraOptions directed;
    directed.cutoff = 150.0;
    auto dj = dijkstra(g, n3, directed);
    CHECK(std::isinf(dj.dist[n1]));
    CHECK(std::isinf(dj.dist[n2]));
    return true;
}

static bool test_neighborhood_cutoff_is_inclusive() {
    RoadNetwork g = line_toward_three();
    int n1 = g.index_of(1), n2 = g.index_of(2), n3 = g.index_of(3);

    auto exact = bounded_neighborhood(g, n1, 150.0);
    CHECK(contains(exact, n3));

    auto short_of = bounded_neighborhood(g, n1, 149.0);
    CHECK(contains(short_of, n1) && contains(short_of, n2));
    CHECK(!contains(short_of, n3));

    auto tiny = bounded_neighborhood(g, n1, 1.0);
    CHECK(tiny.size() == 1 && tiny[0] == n1);
    CHECK(!contains(bounded_neighborhood(g, n1, 5000.0), g.index_of(4)));
    return true;
}

static bool test_shortest_path_weights() {
    // direct 1->3 is short but slow, 1->2->3 is longer but fast
    RoadNetwork g;
    g.add_node(1, 0, 0);
    g.add_node(2, 1, 1);
    g.add_node(3, 2, 0);
    int direct = g.add_street(1, 3, 100.0);
    int a = g.add_street(1, 2, 80.0);
    int b = g.add_street(2, 3, 80.0);
    g.street(direct).travel_time = 60.0;
    g.street(a).travel_time = 10.0;
    g.street(b).travel_time = 10.0;

    int n1 = g.index_of(1), n2 = g.index_of(2), n3 = g.index_of(3);
    auto fast = shortest_path(g, n1, n3, Weight::TravelTime);
    CHECK((fast == std::vector<int>{n1, n2, n3}));

    auto shortest = shortest_path(g, n1, n3, Weight::Length);
    CHECK((shortest == std::vector<int>{n1, n3}));

    // no street back
    CHECK(shortest_path(g, n3, n1).empty());
    CHECK((shortest_path(g, n2, n2) == std::vector<int>{n2}));
    return true;
}

static bool test_parallel_streets_take_the_cheapest() {
    RoadNetwork g;
    g.add_node(10, 0, 0);
    g.add_node(20, 1, 0);
    g.add_street(10, 20, 300.0);
    g.add_street(10, 20, 120.0);
    auto dj = dijkstra(g, g.index_of(10));
    CHECK(near(dj.dist[g.index_of(20)], 120.0));
    CHECK(g.find_street(g.index_of(10), g.index_of(20)) == 0); // key 0 is still the first
    CHECK(g.street(1).key == 1);
    return true;
}

int main() {
    bool ok = true;
    ok &= test_neighborhood_ignores_direction();
    ok &= test_neighborhood_cutoff_is_inclusive();
    ok &= test_shortest_path_weights();
    ok &= test_parallel_streets_take_the_cheapest();
    std::cout << (ok ? "ALL TESTS PASSED\n" : "TESTS FAILED\n");
    return ok ? 0 : 1;
}
