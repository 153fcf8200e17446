#pragma once
#include "mazegen.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace mazegen {

class MazeFormatError : public std::runtime_error {
public:
    explicit MazeFormatError(const std::string& what) : std::runtime_error(what) {}
};

// Persisted record. Wall arrays are row-major, height rows of width entries
// when well formed; deserialize() does not enforce that.
struct MazeState {
    int width = 16;
    int height = 16;
    uint64_t seed = 0;
    Algorithm algorithm = Algorithm::Prim;
    std::vector<std::vector<bool>> vertical_walls;
    std::vector<std::vector<bool>> horizontal_walls;

    bool operator==(const MazeState& other) const;
    bool operator!=(const MazeState& other) const { return !(*this == other); }
};

MazeState to_state(const MazeResult& maze);

std::string serialize(const MazeState& state);

// Lenient: missing or unconvertible fields keep their defaults. Throws
// MazeFormatError only when the text is not a YAML map.
MazeState deserialize(const std::string& text);

// Reload path. Throws InvalidDimension for non-positive sizes and
// MazeFormatError when either wall array is not height x width.
MazeResult restore(const MazeState& state, bool goal_in_center);

void save_maze(const std::string& path, const MazeState& state);
MazeState load_maze(const std::string& path);

} // namespace mazegen
