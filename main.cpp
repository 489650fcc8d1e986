#include <GLFW/glfw3.h>
#include <cstdio>
#include <algorithm>
#include <cmath>
#include <exception>
#include <memory>
#include <string>
#include <unordered_map>

#include "cli.hpp"
#include "network_provider.hpp"
#include "sweeper_agents.hpp"

struct Point { float x, y; };

static void drawCircle(float x, float y, float r) {
    glBegin(GL_TRIANGLE_FAN);
    glVertex2f(x,y);
    const int N=24;
    for(int i=0;i<=N;i++){
        float a = (float)i/N * 2.f * 3.1415926f;
        glVertex2f(x + r*std::cos(a), y + r*std::sin(a));
    }
    glEnd();
}

static void drawLine(float x1,float y1,float x2,float y2,float w){
    glLineWidth(w);
    glBegin(GL_LINES);
    glVertex2f(x1,y1); glVertex2f(x2,y2);
    glEnd();
}

// dirty streets brown, clean streets white
static void setStreetColor(StreetColor c) {
    if (c == StreetColor::Dirty) glColor3f(0.55f, 0.30f, 0.12f);
    else                         glColor3f(0.95f, 0.95f, 0.95f);
}

// Maps network coordinates into [-0.95, 0.95] keeping the aspect ratio.
struct Projection {
    double min_x = 0, min_y = 0, scale = 1;

    Point operator()(double x, double y) const {
        return {(float)((x - min_x) * scale - 0.95), (float)((y - min_y) * scale - 0.95)};
    }
};

int main(int argc, char** argv) {
    bool want_help = false;
    std::string help_text;
    Options opt = parse_args(argc, argv, want_help, help_text);
    if (want_help) { std::printf("%s\n", help_text.c_str()); return 0; }

    std::fprintf(stderr, "Setting up the map for %s. This may take a moment.\n", opt.world.place.c_str());
    std::unique_ptr<WorldSimulation> sim;
    try {
        if (!opt.export_path.empty()) write_network_yaml(load_network(opt.world.place, opt.world.fallback_speed_kph), opt.export_path);
        sim = std::make_unique<WorldSimulation>(opt.world);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to set up the world: %s\n", e.what());
        return 1;
    }

    FullObservabilityView view = sim->full_view();
    WanderingSweeper wanderer(*sim, opt.agent_seed);
    OracleSweeper oracle(view);
    std::fprintf(stderr, "%zu contamination regions, %.0f m of dirty street, bot starts at %lld\n",
                 view.contamination_regions().size(), view.dirty_meters_remaining(),
                 (long long)sim->start_location());

    // topology never changes, so positions are computed once
    std::unordered_map<NodeId, Point> pos;
    {
        double min_x = 1e300, min_y = 1e300, max_x = -1e300, max_y = -1e300;
        auto grow = [&](const NodeView& n) {
            min_x = std::min(min_x, n.x); max_x = std::max(max_x, n.x);
            min_y = std::min(min_y, n.y); max_y = std::max(max_y, n.y);
        };
        auto streets = view.all_streets();
        for (const auto& s : streets) { grow(s.start); grow(s.end); }
        grow(sim->current_location());
        Projection proj;
        proj.min_x = min_x; proj.min_y = min_y;
        double span = std::max(max_x - min_x, max_y - min_y);
        proj.scale = span > 0 ? 1.9 / span : 1.0;
        for (const auto& s : streets) {
            pos[s.start.location_id] = proj(s.start.x, s.start.y);
            pos[s.end.location_id] = proj(s.end.x, s.end.y);
        }
        auto here = sim->current_location();
        pos[here.location_id] = proj(here.x, here.y);
    }

    if(!glfwInit()){
        std::fprintf(stderr,"Failed to init GLFW\n");
        return 1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
    GLFWwindow* win = glfwCreateWindow(1100, 750, "Street Sweeper", nullptr, nullptr);
    if(!win){ std::fprintf(stderr,"Failed to create window\n"); glfwTerminate(); return 1; }
    glfwMakeContextCurrent(win);
    glfwSwapInterval(1);

    bool paused = false;
    bool stuck = false;
    std::size_t steps = 0;

    while(!glfwWindowShouldClose(win)){
        glfwPollEvents();

        if (glfwGetKey(win, GLFW_KEY_ESCAPE) == GLFW_PRESS) glfwSetWindowShouldClose(win, 1);

        if (glfwGetKey(win, GLFW_KEY_SPACE) == GLFW_PRESS) paused = true;
        if (glfwGetKey(win, GLFW_KEY_SPACE) == GLFW_RELEASE) paused = false;

        if (!paused && !stuck && steps < opt.steps) {
            bool acted = (opt.agent == AgentKind::Oracle) ? oracle.step() : wanderer.step();
            if (acted) ++steps;
            else {
                stuck = true;
                std::fprintf(stderr, "bot stopped after %zu actions\n", steps);
            }
        }

        int w,h; glfwGetFramebufferSize(win,&w,&h);
        glViewport(0,0,w,h);
        glClearColor(0.5f,0.5f,0.5f,1);
        glClear(GL_COLOR_BUFFER_BIT);

        for (const auto& s : view.all_streets()) {
            const Point& a = pos[s.start.location_id];
            const Point& b = pos[s.end.location_id];
            setStreetColor(street_color(s.street.cleanliness));
            drawLine(a.x, a.y, b.x, b.y, 2.0f);
        }

        // route in blue
        auto route = sim->route();
        glColor3f(0.2f,0.35f,0.95f);
        for (size_t i=1;i<route.size();++i){
            const Point& a = pos[route[i-1]];
            const Point& b = pos[route[i]];
            drawLine(a.x, a.y, b.x, b.y, 4.0f);
        }

        // contamination region centers
        glColor3f(0.35f,0.18f,0.05f);
        for (const auto& r : view.contamination_regions()) {
            const Point& c = pos[r.center];
            drawCircle(c.x, c.y, 0.008f);
        }

        // bot, fading to red as the battery runs down
        float charge = opt.world.initial_battery > 0
            ? (float)std::clamp(sim->battery_life() / opt.world.initial_battery, 0.0, 1.0) : 0.f;
        glColor3f(1.0f - charge, 0.25f + 0.6f*charge, 0.25f);
        const Point& bot = pos[sim->current_location().location_id];
        drawCircle(bot.x, bot.y, 0.015f);

        glfwSwapBuffers(win);
    }

    std::fprintf(stderr, "cleaned %.1f m, battery %.1f\n", sim->meters_cleaned(), sim->battery_life());
    glfwTerminate();
    return 0;
}
