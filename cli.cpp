// cli.cpp - command-line parsing using Boost.Program_options
#include "cli.hpp"
#include <boost/program_options.hpp>
#include <iostream>
#include <random>
#include <sstream>

namespace po = boost::program_options;

Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text) {
    Options opt;
    want_help = false;

    std::string agent_s = "wander";
    std::uint64_t seed = 0;
    NodeId start = 0;

    po::options_description desc("Street sweeper options");
    desc.add_options()
        ("help,h", "Show this help")
        ("place,p", po::value<std::string>(&opt.world.place)->default_value(opt.world.place),
            "Road network: grid:<cols>x<rows>[@<spacing>] or a .yaml network file")
        ("seed,s", po::value<std::uint64_t>(&seed), "Seed for a reproducible world (default: random)")
        ("battery,b", po::value<double>(&opt.world.initial_battery)->default_value(opt.world.initial_battery),
            "Initial battery budget in travel-time seconds")
        ("free-backup", "Backing up costs nothing and needs no reverse street")
        ("fallback-speed", po::value<double>(&opt.world.fallback_speed_kph)->default_value(opt.world.fallback_speed_kph),
            "Speed (km/h) for streets with no known speed")
        ("start", po::value<NodeId>(&start), "Start intersection id (default: random)")
        ("agent,a", po::value<std::string>(&agent_s)->default_value(agent_s), "Bot to run: wander or oracle")
        ("steps,n", po::value<std::size_t>(&opt.steps)->default_value(opt.steps), "Maximum bot actions")
        ("export", po::value<std::string>(&opt.export_path), "Write the loaded road network to this YAML file")
    ;
    std::ostringstream help;
    help << desc;
    help_text = help.str();

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n";
        want_help = true;
        return opt;
    }
    if (vm.count("help")) { want_help = true; return opt; }

    if (vm.count("seed")) {
        opt.world.seed = seed;
        opt.agent_seed = seed ^ 0x9E3779B97F4A7C15ULL;
    } else {
        opt.agent_seed = std::random_device{}();
    }
    if (vm.count("start")) opt.world.start_node = start;
    if (vm.count("free-backup")) opt.world.backup_cost = BackupCost::Free;

    if (agent_s == "wander") opt.agent = AgentKind::Wander;
    else if (agent_s == "oracle") opt.agent = AgentKind::Oracle;
    else {
        std::cerr << "Invalid --agent; expected wander or oracle.\n";
        want_help = true;
    }
    return opt;
}
