#include "wall_grid.hpp"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace mazegen {

namespace {

// north, east, south, west
const int kDx[4] = { 0, 1, 0, -1 };
const int kDy[4] = { -1, 0, 1, 0 };

std::string dimension_message(int width, int height) {
    std::ostringstream oss;
    oss << "invalid maze dimensions " << width << "x" << height
        << ": width and height must be positive";
    return oss.str();
}

} // namespace

InvalidDimension::InvalidDimension(int width, int height)
    : std::invalid_argument(dimension_message(width, height)) {}

std::string to_string(const Cell& cell) {
    return "(" + std::to_string(cell.x) + "," + std::to_string(cell.y) + ")";
}

NeighborRange::iterator::iterator(const NeighborRange* range, int dir)
    : range_(range), dir_(dir) {
    settle();
}

NeighborRange::iterator& NeighborRange::iterator::operator++() {
    ++dir_;
    settle();
    return *this;
}

// Advances dir_ to the next direction that lands inside the grid.
void NeighborRange::iterator::settle() {
    for (; dir_ < 4; ++dir_) {
        int nx = range_->origin_.x + kDx[dir_];
        int ny = range_->origin_.y + kDy[dir_];
        if (nx >= 0 && nx < range_->width_ && ny >= 0 && ny < range_->height_) {
            current_ = Cell{ nx, ny };
            return;
        }
    }
}

WallGrid::WallGrid(int width, int height)
    : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw InvalidDimension(width, height);
    }
    vertical_.assign(std::size_t(width) * std::size_t(height), true);
    horizontal_.assign(std::size_t(width) * std::size_t(height), true);
}

WallGrid WallGrid::from_rows(int width, int height,
                             const std::vector<std::vector<bool>>& vertical_walls,
                             const std::vector<std::vector<bool>>& horizontal_walls) {
    WallGrid grid(width, height);

    auto fill = [&](const std::vector<std::vector<bool>>& rows, std::vector<bool>& out, const char* name) {
        if (rows.size() != std::size_t(height)) {
            throw std::invalid_argument(std::string(name) + " has " + std::to_string(rows.size()) +
                                        " rows, expected " + std::to_string(height));
        }
        for (int y = 0; y < height; ++y) {
            const auto& row = rows[y];
            if (row.size() != std::size_t(width)) {
                throw std::invalid_argument(std::string(name) + " row " + std::to_string(y) + " has " +
                                            std::to_string(row.size()) + " entries, expected " +
                                            std::to_string(width));
            }
            for (int x = 0; x < width; ++x) {
                out[grid.idx(x, y)] = row[x];
            }
        }
    };

    fill(vertical_walls, grid.vertical_, "vertical_walls");
    fill(horizontal_walls, grid.horizontal_, "horizontal_walls");
    return grid;
}

bool WallGrid::in_bounds(Cell c) const {
    return c.x >= 0 && c.x < width_ && c.y >= 0 && c.y < height_;
}

void WallGrid::remove_wall_between(Cell a, Cell b) {
    if (!in_bounds(a) || !in_bounds(b) ||
        std::abs(a.x - b.x) + std::abs(a.y - b.y) != 1) {
        throw NotAdjacent("cells " + to_string(a) + " and " + to_string(b) + " do not share a wall");
    }
    if (a.x == b.x) {
        horizontal_[idx(a.x, std::min(a.y, b.y))] = false;
    } else {
        vertical_[idx(std::min(a.x, b.x), a.y)] = false;
    }
}

bool WallGrid::is_open(Cell a, Cell b) const {
    if (!in_bounds(a) || !in_bounds(b) ||
        std::abs(a.x - b.x) + std::abs(a.y - b.y) != 1) {
        return false;
    }
    if (a.x == b.x) {
        return !horizontal_[idx(a.x, std::min(a.y, b.y))];
    }
    return !vertical_[idx(std::min(a.x, b.x), a.y)];
}

bool WallGrid::has_north_wall(Cell c) const {
    return c.y == 0 || horizontal_[idx(c.x, c.y - 1)];
}

bool WallGrid::has_east_wall(Cell c) const {
    return c.x == width_ - 1 || vertical_[idx(c.x, c.y)];
}

bool WallGrid::has_south_wall(Cell c) const {
    return c.y == height_ - 1 || horizontal_[idx(c.x, c.y)];
}

bool WallGrid::has_west_wall(Cell c) const {
    return c.x == 0 || vertical_[idx(c.x - 1, c.y)];
}

std::size_t WallGrid::open_wall_count() const {
    std::size_t open = 0;
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            if (x < width_ - 1 && !vertical_[idx(x, y)]) ++open;
            if (y < height_ - 1 && !horizontal_[idx(x, y)]) ++open;
        }
    }
    return open;
}

std::vector<std::vector<bool>> WallGrid::rows_of(const std::vector<bool>& walls) const {
    std::vector<std::vector<bool>> rows(height_);
    for (int y = 0; y < height_; ++y) {
        rows[y].reserve(width_);
        for (int x = 0; x < width_; ++x) {
            rows[y].push_back(walls[idx(x, y)]);
        }
    }
    return rows;
}

std::vector<std::vector<bool>> WallGrid::vertical_rows() const {
    return rows_of(vertical_);
}

std::vector<std::vector<bool>> WallGrid::horizontal_rows() const {
    return rows_of(horizontal_);
}

bool WallGrid::operator==(const WallGrid& other) const {
    return width_ == other.width_ && height_ == other.height_ &&
           vertical_ == other.vertical_ && horizontal_ == other.horizontal_;
}

} // namespace mazegen
