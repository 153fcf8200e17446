#pragma once
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace mazegen {

// Thrown for width or height <= 0, before any grid exists.
class InvalidDimension : public std::invalid_argument {
public:
    InvalidDimension(int width, int height);
};

// Precondition violation in remove_wall_between. Indicates a bug in the caller.
class NotAdjacent : public std::logic_error {
public:
    explicit NotAdjacent(const std::string& what) : std::logic_error(what) {}
};

struct Cell {
    int x = 0;
    int y = 0;

    bool operator==(const Cell& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

std::string to_string(const Cell& cell);

class WallGrid;

// Up to four in-bounds neighbours of a cell, visited in the order
// north, east, south, west. Nothing is materialized; begin() restarts it.
class NeighborRange {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Cell;
        using difference_type = std::ptrdiff_t;
        using pointer = const Cell*;
        using reference = const Cell&;

        iterator(const NeighborRange* range, int dir);

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }
        iterator& operator++();
        iterator operator++(int) { iterator tmp = *this; ++(*this); return tmp; }
        bool operator==(const iterator& other) const { return dir_ == other.dir_; }
        bool operator!=(const iterator& other) const { return dir_ != other.dir_; }

    private:
        void settle();

        const NeighborRange* range_;
        int dir_;
        Cell current_;
    };

    NeighborRange(int width, int height, Cell origin)
        : width_(width), height_(height), origin_(origin) {}

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, 4); }

private:
    int width_;
    int height_;
    Cell origin_;
};

class WallGrid {
public:
    // Every wall starts closed.
    WallGrid(int width, int height);

    // Rebuilds a grid from persisted rows. Each array must be height rows of
    // width entries; throws std::invalid_argument otherwise.
    static WallGrid from_rows(int width, int height,
                              const std::vector<std::vector<bool>>& vertical_walls,
                              const std::vector<std::vector<bool>>& horizontal_walls);

    int width() const { return width_; }
    int height() const { return height_; }
    std::size_t cell_count() const { return std::size_t(width_) * std::size_t(height_); }
    bool in_bounds(Cell c) const;

    void remove_wall_between(Cell a, Cell b);
    bool is_open(Cell a, Cell b) const;
    NeighborRange neighbors_in_bounds(Cell c) const { return NeighborRange(width_, height_, c); }

    // Wall between (x,y) and (x+1,y) / (x,y) and (x,y+1).
    bool vertical_wall(int x, int y) const { return vertical_[idx(x, y)]; }
    bool horizontal_wall(int x, int y) const { return horizontal_[idx(x, y)]; }

    // Rendering contract: border sides always count as walls.
    bool has_north_wall(Cell c) const;
    bool has_east_wall(Cell c) const;
    bool has_south_wall(Cell c) const;
    bool has_west_wall(Cell c) const;

    // Open entries among the defined walls; width*height-1 for a perfect maze.
    std::size_t open_wall_count() const;

    std::vector<std::vector<bool>> vertical_rows() const;
    std::vector<std::vector<bool>> horizontal_rows() const;

    bool operator==(const WallGrid& other) const;
    bool operator!=(const WallGrid& other) const { return !(*this == other); }

private:
    std::size_t idx(int x, int y) const { return std::size_t(y) * std::size_t(width_) + std::size_t(x); }
    std::vector<std::vector<bool>> rows_of(const std::vector<bool>& walls) const;

    int width_;
    int height_;
    std::vector<bool> vertical_;
    std::vector<bool> horizontal_;
};

} // namespace mazegen
