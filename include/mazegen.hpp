#pragma once
#include "wall_grid.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace mazegen {

using Rng = std::mt19937_64;

enum class Algorithm {
    Prim = 0,
    Kruskal = 1,
    Custom = 2   // opens every internal wall; not a perfect maze
};

const char* algorithm_name(Algorithm algorithm);

// Accepts "prim"/"kruskal"/"custom" in any case, or the ordinal 0/1/2.
// Returns false and leaves out untouched for anything else.
bool parse_algorithm(const std::string& text, Algorithm& out);

struct GenerationConfig {
    int width = 16;
    int height = 16;
    uint64_t seed = 0;  // 0 = fresh nondeterministic seed per run
    Algorithm algorithm = Algorithm::Prim;
    bool goal_in_center = false;
};

struct MazeResult {
    WallGrid grid;
    Cell start;
    Cell goal;
    uint64_t seed = 0;
    Algorithm algorithm = Algorithm::Prim;
};

struct Edge {
    Cell a;
    Cell b;
};

struct WorldPosition {
    double x = 0.0;
    double y = 0.0;
};

// Seed 0 draws from std::random_device, anything else seeds deterministically.
Rng make_rng(uint64_t seed);

// Carves a maze into a fresh, fully closed grid. Throws InvalidDimension
// before touching rng when the dimensions are not positive.
MazeResult generate(const GenerationConfig& config, Rng& rng);

// make_rng(config.seed) followed by generate().
MazeResult regenerate(const GenerationConfig& config);

void carve_prim(WallGrid& grid, Rng& rng);
void carve_kruskal(WallGrid& grid, Rng& rng);
void carve_custom(WallGrid& grid);

// Every wall between adjacent cells exactly once: for each cell in row-major
// order its right neighbour, then its down neighbour. 2wh - w - h entries.
std::vector<Edge> enumerate_edges(int width, int height);

// Fisher-Yates from the last index down, swapping with a uniform index in [0, i].
template <typename T>
void shuffle_edges(std::vector<T>& items, Rng& rng) {
    for (std::size_t i = items.size(); i-- > 1;) {
        std::uniform_int_distribution<std::size_t> pick(0, i);
        std::size_t j = pick(rng);
        std::swap(items[i], items[j]);
    }
}

// start is always (0,0). The centre goal rounds toward the lower index on even sides.
std::pair<Cell, Cell> compute_start_goal(const GenerationConfig& config);

// World mapping. cell_size must be finite and positive; these
// throw std::invalid_argument otherwise.
WorldPosition cell_center(Cell cell, double cell_size);
WorldPosition start_world_position(const MazeResult& maze, double cell_size);
WorldPosition goal_world_position(const MazeResult& maze, double cell_size);
Cell cell_containing(WorldPosition position, double cell_size);

// Box drawing with S/G markers, height*2+1 lines, no trailing newline.
std::string render_ascii(const MazeResult& maze);

} // namespace mazegen
