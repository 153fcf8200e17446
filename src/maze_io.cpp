#include "maze_io.hpp"
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace mazegen {

namespace {

void emit_rows(YAML::Emitter& out, const char* key, const std::vector<std::vector<bool>>& rows) {
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& row : rows) {
        out << YAML::Flow << YAML::BeginSeq;
        for (bool wall : row) {
            out << wall;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndSeq;
}

// Non-sequence nodes read as empty; entries that are not booleans read as closed walls.
std::vector<std::vector<bool>> read_rows(const YAML::Node& node) {
    std::vector<std::vector<bool>> rows;
    if (!node || !node.IsSequence()) return rows;

    for (const auto& row_node : node) {
        std::vector<bool> row;
        if (row_node.IsSequence()) {
            for (const auto& cell : row_node) {
                row.push_back(cell.as<bool>(true));
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace

bool MazeState::operator==(const MazeState& other) const {
    return width == other.width && height == other.height &&
           seed == other.seed && algorithm == other.algorithm &&
           vertical_walls == other.vertical_walls &&
           horizontal_walls == other.horizontal_walls;
}

MazeState to_state(const MazeResult& maze) {
    MazeState state;
    state.width = maze.grid.width();
    state.height = maze.grid.height();
    state.seed = maze.seed;
    state.algorithm = maze.algorithm;
    state.vertical_walls = maze.grid.vertical_rows();
    state.horizontal_walls = maze.grid.horizontal_rows();
    return state;
}

std::string serialize(const MazeState& state) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "width" << YAML::Value << state.width;
    out << YAML::Key << "height" << YAML::Value << state.height;
    out << YAML::Key << "seed" << YAML::Value << state.seed;
    out << YAML::Key << "algorithm" << YAML::Value << algorithm_name(state.algorithm);
    emit_rows(out, "vertical_walls", state.vertical_walls);
    emit_rows(out, "horizontal_walls", state.horizontal_walls);
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

MazeState deserialize(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw MazeFormatError(std::string("maze payload is not valid YAML: ") + e.what());
    }

    MazeState state;
    if (root.IsNull()) {
        return state;
    }
    if (!root.IsMap()) {
        throw MazeFormatError("maze payload must be a YAML map");
    }

    state.width = root["width"].as<int>(state.width);
    state.height = root["height"].as<int>(state.height);
    state.seed = root["seed"].as<uint64_t>(state.seed);

    YAML::Node algorithm = root["algorithm"];
    if (algorithm && algorithm.IsScalar()) {
        parse_algorithm(algorithm.Scalar(), state.algorithm);
    }

    state.vertical_walls = read_rows(root["vertical_walls"]);
    state.horizontal_walls = read_rows(root["horizontal_walls"]);
    return state;
}

MazeResult restore(const MazeState& state, bool goal_in_center) {
    GenerationConfig config;
    config.width = state.width;
    config.height = state.height;
    config.seed = state.seed;
    config.algorithm = state.algorithm;
    config.goal_in_center = goal_in_center;

    auto [start, goal] = compute_start_goal(config);
    try {
        WallGrid grid = WallGrid::from_rows(state.width, state.height,
                                            state.vertical_walls, state.horizontal_walls);
        return MazeResult{ std::move(grid), start, goal, state.seed, state.algorithm };
    } catch (const std::invalid_argument& e) {
        throw MazeFormatError(std::string("maze wall arrays do not match its size: ") + e.what());
    }
}

void save_maze(const std::string& path, const MazeState& state) {
    std::ofstream out(path);
    if (!out) {
        throw MazeFormatError("cannot open " + path + " for writing");
    }
    out << serialize(state);
    if (!out) {
        throw MazeFormatError("failed writing maze to " + path);
    }
}

MazeState load_maze(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw MazeFormatError("cannot open " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return deserialize(buf.str());
}

} // namespace mazegen
