// Headless session: run one bot until it stops, the step budget is spent or
// the battery is depleted, then print a report.
#include <cstdio>
#include <exception>
#include <memory>
#include <string>

#include "cli.hpp"
#include "network_provider.hpp"
#include "sweeper_agents.hpp"

int main(int argc, char** argv) {
    bool want_help = false;
    std::string help_text;
    Options opt = parse_args(argc, argv, want_help, help_text);
    if (want_help) { std::printf("%s\n", help_text.c_str()); return 0; }

    std::unique_ptr<WorldSimulation> sim;
    try {
        if (!opt.export_path.empty()) {
            write_network_yaml(load_network(opt.world.place, opt.world.fallback_speed_kph), opt.export_path);
            std::fprintf(stderr, "wrote %s\n", opt.export_path.c_str());
        }
        sim = std::make_unique<WorldSimulation>(opt.world);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to set up the world: %s\n", e.what());
        return 1;
    }

    FullObservabilityView view = sim->full_view();
    const double dirty_at_start = view.dirty_meters_remaining();

    std::printf("place            %s\n", opt.world.place.c_str());
    std::printf("intersections    %zu\n", view.node_count());
    std::printf("regions          %zu\n", view.contamination_regions().size());
    for (const auto& r : view.contamination_regions())
        std::printf("  center %lld radius %d m\n", (long long)r.center, r.radius);
    std::printf("dirty meters     %.1f\n", dirty_at_start);
    std::printf("start            %lld\n", (long long)sim->start_location());

    WanderingSweeper wanderer(*sim, opt.agent_seed);
    OracleSweeper oracle(view);

    std::size_t steps = 0;
    while (steps < opt.steps && sim->battery_life() > 0) {
        bool acted = (opt.agent == AgentKind::Oracle) ? oracle.step() : wanderer.step();
        if (!acted) {
            std::fprintf(stderr, "bot stopped after %zu actions\n", steps);
            break;
        }
        ++steps;
    }

    std::printf("actions          %zu\n", steps);
    std::printf("route length     %zu\n", sim->route().size());
    std::printf("meters cleaned   %.1f\n", sim->meters_cleaned());
    std::printf("dirty remaining  %.1f\n", view.dirty_meters_remaining());
    std::printf("battery          %.1f%s\n", sim->battery_life(), sim->battery_life() < 0 ? " (depleted)" : "");
    return 0;
}
