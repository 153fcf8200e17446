#include "maze_request.hpp"
#include <stdexcept>

namespace mazegen
{

GenerationConfig generation_defaults(const config::ServiceConfig& cfg)
    {
    GenerationConfig defaults;
    defaults.width = cfg.get_int("maze.width", defaults.width);
    defaults.height = cfg.get_int("maze.height", defaults.height);
    defaults.seed = cfg.get_ulonglong("maze.seed", defaults.seed);
    defaults.goal_in_center = cfg.get_bool("maze.goal_in_center", defaults.goal_in_center);

    std::string algorithm = cfg.get_string("maze.algorithm", algorithm_name(defaults.algorithm));
    parse_algorithm(algorithm, defaults.algorithm);

    return defaults;
    }

std::string get_param(const std::string& target, const std::string& key)
    {
    auto pos = target.find('?');
    if (pos == std::string::npos) return "";

    std::string query = target.substr(pos + 1);
    std::string search = key + "=";

    // Match only at the start of a key, so "seed" does not hit "reseed="
    pos = 0;
    while ((pos = query.find(search, pos)) != std::string::npos)
        {
        if (pos == 0 || query[pos - 1] == '&') break;
        pos += search.length();
        }
    if (pos == std::string::npos) return "";

    auto start = pos + search.length();
    auto end = query.find('&', start);
    return query.substr(start, end == std::string::npos ? std::string::npos : end - start);
    }

MazeRequest parse_maze_request(const std::string& target, const GenerationConfig& defaults)
    {
    MazeRequest request;
    request.config = defaults;

    // Each field falls back independently; stoi/stoull throw logic_error subclasses.
    try
        {
        auto width_str = get_param(target, "width");
        if (!width_str.empty()) request.config.width = std::stoi(width_str);
        }
        catch (const std::logic_error&)
            {
            request.config.width = defaults.width;
            }

    try
        {
        auto height_str = get_param(target, "height");
        if (!height_str.empty()) request.config.height = std::stoi(height_str);
        }
        catch (const std::logic_error&)
            {
            request.config.height = defaults.height;
            }

    try
        {
        auto seed_str = get_param(target, "seed");
        if (!seed_str.empty() && seed_str[0] != '-') request.config.seed = std::stoull(seed_str);
        }
        catch (const std::logic_error&)
            {
            request.config.seed = defaults.seed;
            }

    auto algorithm_str = get_param(target, "algorithm");
    if (!algorithm_str.empty()) parse_algorithm(algorithm_str, request.config.algorithm);

    auto goal_str = get_param(target, "goal");
    if (goal_str == "center") request.config.goal_in_center = true;
    else if (goal_str == "corner") request.config.goal_in_center = false;

    if (get_param(target, "format") == "ascii") request.format = OutputFormat::Ascii;

    return request;
    }

} // namespace mazegen
