#include "mazegen.hpp"
#include "disjoint_set.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace mazegen {

static inline std::size_t cell_id(Cell c, int w) { return std::size_t(c.y) * std::size_t(w) + std::size_t(c.x); }

const char* algorithm_name(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::Prim:    return "prim";
        case Algorithm::Kruskal: return "kruskal";
        case Algorithm::Custom:  return "custom";
        default:                 return "unknown";
    }
}

bool parse_algorithm(const std::string& text, Algorithm& out) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return char(std::tolower(c)); });

    if (lower == "prim" || lower == "0") {
        out = Algorithm::Prim;
    } else if (lower == "kruskal" || lower == "1") {
        out = Algorithm::Kruskal;
    } else if (lower == "custom" || lower == "2") {
        out = Algorithm::Custom;
    } else {
        return false;
    }
    return true;
}

Rng make_rng(uint64_t seed) {
    if (seed == 0) {
        std::random_device rd;
        std::seed_seq seq{ rd(), rd(), rd(), rd() };
        return Rng(seq);
    }
    return Rng(seed);
}

void carve_prim(WallGrid& grid, Rng& rng) {
    struct FrontierEntry {
        Cell cell;
        std::optional<Cell> from;
    };

    const int w = grid.width();
    const int h = grid.height();
    std::vector<bool> visited(std::size_t(w) * std::size_t(h), false);
    std::vector<FrontierEntry> frontier;

    std::uniform_int_distribution<int> pick_x(0, w - 1);
    std::uniform_int_distribution<int> pick_y(0, h - 1);
    Cell start;
    start.x = pick_x(rng);
    start.y = pick_y(rng);
    visited[cell_id(start, w)] = true;
    frontier.push_back({ start, std::nullopt });

    while (!frontier.empty()) {
        std::uniform_int_distribution<std::size_t> pick(0, frontier.size() - 1);
        std::size_t i = pick(rng);
        FrontierEntry entry = frontier[i];
        frontier[i] = frontier.back();
        frontier.pop_back();

        if (entry.from) {
            grid.remove_wall_between(*entry.from, entry.cell);
        }
        // Mark on push so a cell is never queued twice.
        for (const Cell& n : grid.neighbors_in_bounds(entry.cell)) {
            std::size_t id = cell_id(n, w);
            if (visited[id]) continue;
            visited[id] = true;
            frontier.push_back({ n, entry.cell });
        }
    }
}

std::vector<Edge> enumerate_edges(int width, int height) {
    std::vector<Edge> edges;
    if (width <= 0 || height <= 0) return edges;

    edges.reserve(std::size_t(2) * width * height - width - height);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (x + 1 < width) edges.push_back({ Cell{ x, y }, Cell{ x + 1, y } });
            if (y + 1 < height) edges.push_back({ Cell{ x, y }, Cell{ x, y + 1 } });
        }
    }
    return edges;
}

void carve_kruskal(WallGrid& grid, Rng& rng) {
    const int w = grid.width();
    std::vector<Edge> edges = enumerate_edges(w, grid.height());
    DisjointSet sets(grid.cell_count());

    shuffle_edges(edges, rng);

    for (const Edge& e : edges) {
        if (sets.unite(cell_id(e.a, w), cell_id(e.b, w))) {
            grid.remove_wall_between(e.a, e.b);
        }
    }
}

void carve_custom(WallGrid& grid) {
    for (const Edge& e : enumerate_edges(grid.width(), grid.height())) {
        grid.remove_wall_between(e.a, e.b);
    }
}

std::pair<Cell, Cell> compute_start_goal(const GenerationConfig& config) {
    if (config.width <= 0 || config.height <= 0) {
        throw InvalidDimension(config.width, config.height);
    }
    Cell start{ 0, 0 };
    Cell goal;
    if (config.goal_in_center) {
        goal = Cell{ (config.width - 1) / 2, (config.height - 1) / 2 };
    } else {
        goal = Cell{ config.width - 1, config.height - 1 };
    }
    return { start, goal };
}

MazeResult generate(const GenerationConfig& config, Rng& rng) {
    auto [start, goal] = compute_start_goal(config);
    WallGrid grid(config.width, config.height);

    switch (config.algorithm) {
        case Algorithm::Prim:
            carve_prim(grid, rng);
            break;
        case Algorithm::Kruskal:
            carve_kruskal(grid, rng);
            break;
        case Algorithm::Custom:
            carve_custom(grid);
            break;
    }

    return MazeResult{ std::move(grid), start, goal, config.seed, config.algorithm };
}

MazeResult regenerate(const GenerationConfig& config) {
    Rng rng = make_rng(config.seed);
    return generate(config, rng);
}

static void check_cell_size(double cell_size) {
    if (!std::isfinite(cell_size) || cell_size <= 0.0) {
        throw std::invalid_argument("cell size must be positive, got " + std::to_string(cell_size));
    }
}

WorldPosition cell_center(Cell cell, double cell_size) {
    check_cell_size(cell_size);
    return WorldPosition{ (cell.x + 0.5) * cell_size, (cell.y + 0.5) * cell_size };
}

WorldPosition start_world_position(const MazeResult& maze, double cell_size) {
    return cell_center(maze.start, cell_size);
}

WorldPosition goal_world_position(const MazeResult& maze, double cell_size) {
    return cell_center(maze.goal, cell_size);
}

Cell cell_containing(WorldPosition position, double cell_size) {
    check_cell_size(cell_size);
    return Cell{ int(std::floor(position.x / cell_size)), int(std::floor(position.y / cell_size)) };
}

std::string render_ascii(const MazeResult& maze) {
    const WallGrid& g = maze.grid;
    std::ostringstream out;

    // Top border
    for (int x = 0; x < g.width(); ++x) {
        out << '+' << (g.has_north_wall(Cell{ x, 0 }) ? "---" : "   ");
    }
    out << '+';

    for (int y = 0; y < g.height(); ++y) {
        out << '\n' << (g.has_west_wall(Cell{ 0, y }) ? '|' : ' ');
        for (int x = 0; x < g.width(); ++x) {
            Cell c{ x, y };
            char mark = ' ';
            if (c == maze.start) mark = 'S';
            if (c == maze.goal) mark = 'G';
            out << ' ' << mark << ' ' << (g.has_east_wall(c) ? '|' : ' ');
        }
        out << "\n+";
        for (int x = 0; x < g.width(); ++x) {
            out << (g.has_south_wall(Cell{ x, y }) ? "---" : "   ") << '+';
        }
    }

    return out.str();
}

} // namespace mazegen
