// cli.hpp - command-line options shared by the viewer and the batch runner
#pragma once
#include "world_simulation.hpp"
#include <string>
#include <cstddef>
#include <cstdint>

enum class AgentKind { Wander, Oracle };

struct Options {
    WorldConfig world;
    AgentKind agent = AgentKind::Wander;
    std::size_t steps = 2000;        // max bot actions per session
    std::uint64_t agent_seed = 0;    // wandering bot's own randomness
    std::string export_path;         // write the loaded network as YAML
};

// Parse CLI arguments with Boost.Program_options.
// Sets want_help/help_text for --help or invalid input.
Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text);
