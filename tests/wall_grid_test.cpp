#include "wall_grid.hpp"
#include <gtest/gtest.h>
#include <vector>

using namespace mazegen;

TEST(WallGridTest, StartsFullyClosed) {
    WallGrid grid(5, 4);

    EXPECT_EQ(grid.width(), 5);
    EXPECT_EQ(grid.height(), 4);
    EXPECT_EQ(grid.open_wall_count(), 0u);
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 5; ++x) {
            EXPECT_TRUE(grid.vertical_wall(x, y));
            EXPECT_TRUE(grid.horizontal_wall(x, y));
        }
    }
}

TEST(WallGridTest, RejectsNonPositiveDimensions) {
    EXPECT_THROW(WallGrid(0, 5), InvalidDimension);
    EXPECT_THROW(WallGrid(5, 0), InvalidDimension);
    EXPECT_THROW(WallGrid(-3, 2), InvalidDimension);
}

TEST(WallGridTest, RemoveVerticalWall) {
    WallGrid grid(3, 3);
    grid.remove_wall_between(Cell{ 2, 1 }, Cell{ 1, 1 });

    EXPECT_FALSE(grid.vertical_wall(1, 1)) << "Wall sits at the smaller x";
    EXPECT_TRUE(grid.is_open(Cell{ 1, 1 }, Cell{ 2, 1 }));
    EXPECT_TRUE(grid.is_open(Cell{ 2, 1 }, Cell{ 1, 1 }));
    EXPECT_EQ(grid.open_wall_count(), 1u);
}

TEST(WallGridTest, RemoveHorizontalWall) {
    WallGrid grid(3, 3);
    grid.remove_wall_between(Cell{ 0, 1 }, Cell{ 0, 2 });

    EXPECT_FALSE(grid.horizontal_wall(0, 1));
    EXPECT_TRUE(grid.is_open(Cell{ 0, 2 }, Cell{ 0, 1 }));
    EXPECT_FALSE(grid.is_open(Cell{ 0, 0 }, Cell{ 0, 1 }));
}

TEST(WallGridTest, RemoveRejectsNonAdjacentCells) {
    WallGrid grid(4, 4);

    EXPECT_THROW(grid.remove_wall_between(Cell{ 0, 0 }, Cell{ 1, 1 }), NotAdjacent) << "Diagonal";
    EXPECT_THROW(grid.remove_wall_between(Cell{ 0, 0 }, Cell{ 2, 0 }), NotAdjacent) << "Two apart";
    EXPECT_THROW(grid.remove_wall_between(Cell{ 1, 1 }, Cell{ 1, 1 }), NotAdjacent) << "Same cell";
    EXPECT_THROW(grid.remove_wall_between(Cell{ 3, 0 }, Cell{ 4, 0 }), NotAdjacent) << "Out of bounds";
    EXPECT_EQ(grid.open_wall_count(), 0u);
}

TEST(WallGridTest, IsOpenFalseForNonAdjacentCells) {
    WallGrid grid(2, 2);
    grid.remove_wall_between(Cell{ 0, 0 }, Cell{ 1, 0 });
    grid.remove_wall_between(Cell{ 1, 0 }, Cell{ 1, 1 });

    EXPECT_FALSE(grid.is_open(Cell{ 0, 0 }, Cell{ 1, 1 }));
    EXPECT_FALSE(grid.is_open(Cell{ 0, 0 }, Cell{ 0, 0 }));
}

TEST(WallGridTest, NeighborsFollowNorthEastSouthWest) {
    WallGrid grid(3, 3);

    std::vector<Cell> got;
    for (const Cell& n : grid.neighbors_in_bounds(Cell{ 1, 1 })) {
        got.push_back(n);
    }
    std::vector<Cell> expected = { Cell{ 1, 0 }, Cell{ 2, 1 }, Cell{ 1, 2 }, Cell{ 0, 1 } };
    EXPECT_EQ(got, expected);
}

TEST(WallGridTest, NeighborsSkipOutOfBounds) {
    WallGrid grid(3, 3);

    std::vector<Cell> corner;
    for (const Cell& n : grid.neighbors_in_bounds(Cell{ 0, 0 })) corner.push_back(n);
    std::vector<Cell> expected_corner = { Cell{ 1, 0 }, Cell{ 0, 1 } };
    EXPECT_EQ(corner, expected_corner);

    std::vector<Cell> far;
    for (const Cell& n : grid.neighbors_in_bounds(Cell{ 2, 2 })) far.push_back(n);
    std::vector<Cell> expected_far = { Cell{ 2, 1 }, Cell{ 1, 2 } };
    EXPECT_EQ(far, expected_far);

    WallGrid single(1, 1);
    auto none = single.neighbors_in_bounds(Cell{ 0, 0 });
    EXPECT_TRUE(none.begin() == none.end());
}

TEST(WallGridTest, NeighborRangeIsRestartable) {
    WallGrid grid(4, 4);
    auto range = grid.neighbors_in_bounds(Cell{ 0, 2 });

    int first = 0;
    for (auto it = range.begin(); it != range.end(); ++it) ++first;
    int second = 0;
    for (auto it = range.begin(); it != range.end(); ++it) ++second;

    EXPECT_EQ(first, 3);
    EXPECT_EQ(second, 3);
}

TEST(WallGridTest, BorderCountsAsWall) {
    WallGrid grid(2, 2);
    grid.remove_wall_between(Cell{ 0, 0 }, Cell{ 1, 0 });
    grid.remove_wall_between(Cell{ 0, 0 }, Cell{ 0, 1 });

    EXPECT_TRUE(grid.has_north_wall(Cell{ 0, 0 }));
    EXPECT_TRUE(grid.has_west_wall(Cell{ 0, 0 }));
    EXPECT_FALSE(grid.has_east_wall(Cell{ 0, 0 }));
    EXPECT_FALSE(grid.has_south_wall(Cell{ 0, 0 }));
    EXPECT_FALSE(grid.has_west_wall(Cell{ 1, 0 }));
    EXPECT_TRUE(grid.has_east_wall(Cell{ 1, 0 }));
    EXPECT_TRUE(grid.has_south_wall(Cell{ 1, 1 }));
    EXPECT_TRUE(grid.has_north_wall(Cell{ 1, 1 }));
}

TEST(WallGridTest, UnusedEdgeEntriesAreIgnored) {
    // Column width-1 of the vertical array and row height-1 of the
    // horizontal array describe the border and never count as open.
    std::vector<std::vector<bool>> vertical = { { true, false }, { true, false } };
    std::vector<std::vector<bool>> horizontal = { { true, true }, { false, false } };
    WallGrid grid = WallGrid::from_rows(2, 2, vertical, horizontal);

    EXPECT_EQ(grid.open_wall_count(), 0u);
    EXPECT_TRUE(grid.has_east_wall(Cell{ 1, 0 }));
    EXPECT_TRUE(grid.has_south_wall(Cell{ 0, 1 }));
}

TEST(WallGridTest, FromRowsRoundTrip) {
    WallGrid grid(3, 2);
    grid.remove_wall_between(Cell{ 0, 0 }, Cell{ 1, 0 });
    grid.remove_wall_between(Cell{ 2, 0 }, Cell{ 2, 1 });

    WallGrid copy = WallGrid::from_rows(3, 2, grid.vertical_rows(), grid.horizontal_rows());
    EXPECT_EQ(copy, grid);
}

TEST(WallGridTest, FromRowsRejectsWrongShape) {
    std::vector<std::vector<bool>> ok = { { true, true }, { true, true } };
    std::vector<std::vector<bool>> short_rows = { { true, true } };
    std::vector<std::vector<bool>> narrow = { { true }, { true } };

    EXPECT_THROW(WallGrid::from_rows(2, 2, short_rows, ok), std::invalid_argument);
    EXPECT_THROW(WallGrid::from_rows(2, 2, ok, narrow), std::invalid_argument);
    EXPECT_NO_THROW(WallGrid::from_rows(2, 2, ok, ok));
}
