#pragma once
#include "mazegen.hpp"
#include "shared/service_config.hpp"
#include <string>

namespace mazegen {

enum class OutputFormat {
    Yaml,
    Ascii
};

struct MazeRequest {
    GenerationConfig config;
    OutputFormat format = OutputFormat::Yaml;
};

// Defaults from the maze.* keys, falling back to GenerationConfig's own.
GenerationConfig generation_defaults(const config::ServiceConfig& cfg);

// Value of key in the query part of target; empty when absent.
std::string get_param(const std::string& target, const std::string& key);

// Parses /maze?width=&height=&seed=&algorithm=&goal=&format=. Values that do
// not parse keep the corresponding default. Dimensions are not validated here.
MazeRequest parse_maze_request(const std::string& target, const GenerationConfig& defaults);

} // namespace mazegen
