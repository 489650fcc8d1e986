#include "network_provider.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdio>

namespace {

bool has_suffix(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

struct GridSpec {
    int cols = 0, rows = 0;
    double spacing = 100.0;
};

bool parse_grid(const std::string& place, GridSpec& out) {
    if (place.rfind("grid:", 0) != 0) return false;
    int cols = 0, rows = 0;
    double spacing = 100.0;
    char tail = 0;
    const char* body = place.c_str() + 5;
    int n = std::sscanf(body, "%dx%d@%lf%c", &cols, &rows, &spacing, &tail);
    if (n < 2 || n > 3 || cols <= 0 || rows <= 0 || spacing <= 0.0) return false;
    if (n == 2) {
        // reject trailing junk after "<cols>x<rows>"
        std::ostringstream canon;
        canon << cols << 'x' << rows;
        if (canon.str() != body) return false;
    }
    out.cols = cols; out.rows = rows; out.spacing = spacing;
    return true;
}

NodeId grid_id(int c, int r, int cols) { return 100000 + (NodeId)r * cols + c; }

} // namespace

bool GridNetworkProvider::resolves(const std::string& place) const {
    GridSpec spec;
    return parse_grid(place, spec);
}

RoadNetwork GridNetworkProvider::load(const std::string& place) const {
    GridSpec spec;
    if (!parse_grid(place, spec)) throw std::runtime_error("malformed grid place: " + place);

    RoadNetwork g;
    for (int r = 0; r < spec.rows; ++r) {
        for (int c = 0; c < spec.cols; ++c) {
            Tags tags;
            int degree = (c > 0) + (c + 1 < spec.cols) + (r > 0) + (r + 1 < spec.rows);
            tags["street_count"] = std::to_string(degree);
            g.add_node(grid_id(c, r, spec.cols), c * spec.spacing, r * spec.spacing, std::move(tags));
        }
    }

    auto two_way = [&](NodeId a, NodeId b, double kph, const char* hw) {
        g.add_street(a, b, spec.spacing, kph, hw);
        g.add_street(b, a, spec.spacing, kph, hw);
    };

    // horizontal
    for (int r = 0; r < spec.rows; ++r) {
        for (int c = 0; c + 1 < spec.cols; ++c) {
            NodeId a = grid_id(c, r, spec.cols), b = grid_id(c + 1, r, spec.cols);
            if (r % 2 == 0) { two_way(a, b, 50.0, "primary"); continue; }
            double kph = ((r + c) % 2 == 0) ? 30.0 : 0.0;
            if (r % 4 == 1) g.add_street(a, b, spec.spacing, kph, "residential");
            else            g.add_street(b, a, spec.spacing, kph, "residential");
        }
    }

    // vertical
    for (int c = 0; c < spec.cols; ++c) {
        for (int r = 0; r + 1 < spec.rows; ++r) {
            NodeId a = grid_id(c, r, spec.cols), b = grid_id(c, r + 1, spec.cols);
            if (c % 3 == 0) { two_way(a, b, 0.0, "secondary"); continue; }
            double kph = ((r + c) % 2 == 0) ? 30.0 : 0.0;
            if (c % 2 == 1) g.add_street(a, b, spec.spacing, kph, "residential");
            else            g.add_street(b, a, spec.spacing, kph, "residential");
        }
    }
    return g;
}

bool YamlNetworkProvider::resolves(const std::string& place) const {
    return has_suffix(place, ".yaml") || has_suffix(place, ".yml");
}

RoadNetwork YamlNetworkProvider::load(const std::string& place) const {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(place);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("cannot read network file " + place + ": " + e.what());
    }

    const YAML::Node nodes = doc["nodes"];
    const YAML::Node edges = doc["edges"];
    if (!nodes || !nodes.IsSequence()) throw std::runtime_error(place + ": missing 'nodes' sequence");

    RoadNetwork g;
    try {
        for (size_t i = 0; i < nodes.size(); ++i) {
            const YAML::Node& n = nodes[i];
            Tags tags;
            const YAML::Node tag_node = n["tags"];
            if (tag_node && tag_node.IsMap()) {
                for (auto it = tag_node.begin(); it != tag_node.end(); ++it)
                    tags[it->first.as<std::string>()] = it->second.as<std::string>();
            }
            g.add_node(n["id"].as<NodeId>(), n["x"].as<double>(), n["y"].as<double>(), std::move(tags));
        }

        if (edges && edges.IsSequence()) {
            for (size_t i = 0; i < edges.size(); ++i) {
                const YAML::Node& e = edges[i];
                NodeId u = e["from"].as<NodeId>(), v = e["to"].as<NodeId>();
                double kph = e["speed_kph"] ? e["speed_kph"].as<double>() : 0.0;
                std::string hw = e["highway"] ? e["highway"].as<std::string>() : std::string();
                if (g.add_street(u, v, e["length"].as<double>(), kph, hw) < 0) {
                    throw std::runtime_error(place + ": edge " + std::to_string(i) +
                                             " references an unknown node");
                }
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("malformed network file " + place + ": " + e.what());
    }
    return g;
}

RoadNetwork load_network(const std::string& place, double fallback_kph) {
    static const GridNetworkProvider grid;
    static const YamlNetworkProvider yaml;
    const NetworkProvider* providers[] = {&grid, &yaml};

    for (const NetworkProvider* p : providers) {
        if (!p->resolves(place)) continue;
        RoadNetwork g = p->load(place);
        impute_speeds(g, fallback_kph);
        add_travel_times(g);
        return g;
    }
    throw std::runtime_error("could not resolve place: " + place);
}

void write_network_yaml(const RoadNetwork& g, const std::string& path) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "nodes" << YAML::Value << YAML::BeginSeq;
    for (int i = 0; i < (int)g.node_count(); ++i) {
        const Node& n = g.node(i);
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << n.id;
        out << YAML::Key << "x" << YAML::Value << n.x;
        out << YAML::Key << "y" << YAML::Value << n.y;
        if (!n.tags.empty()) {
            out << YAML::Key << "tags" << YAML::Value << YAML::BeginMap;
            for (const auto& kv : n.tags) out << YAML::Key << kv.first << YAML::Value << kv.second;
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "edges" << YAML::Value << YAML::BeginSeq;
    for (int e = 0; e < (int)g.street_count(); ++e) {
        const Street& s = g.street(e);
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "from" << YAML::Value << g.node(s.from).id;
        out << YAML::Key << "to" << YAML::Value << g.node(s.to).id;
        out << YAML::Key << "length" << YAML::Value << s.length;
        if (s.speed_kph > 0.0) out << YAML::Key << "speed_kph" << YAML::Value << s.speed_kph;
        if (!s.highway.empty()) out << YAML::Key << "highway" << YAML::Value << s.highway;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    std::ofstream fout(path.c_str());
    if (!fout) throw std::runtime_error("cannot write network file " + path);
    fout << out.c_str() << "\n";
}
