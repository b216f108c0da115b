#include "main.h"

int main() {
    const char* base_map =
        "  *  \n"
        "     \n"
        " .~- \n"
        "T R T\n";

    Board board;
    Position start;
    EXPECT_EQ(PARSE_OK, parse_board(base_map, &board, &start));
    board.print(&start);

    EXPECT_EQ(5, board.width());
    EXPECT_EQ(3, board.height());
    EXPECT_EQ(2, board.exit_column());
    EXPECT_TRUE(start == Position(2, 2));

    EXPECT_EQ(OPEN, board.tile_at(Position(0, 0)));
    EXPECT_EQ(WALL, board.tile_at(Position(1, 1)));
    EXPECT_EQ(PIT, board.tile_at(Position(2, 1)));
    EXPECT_EQ(ICE, board.tile_at(Position(3, 1)));
    EXPECT_EQ(TELEPORT, board.tile_at(Position(0, 2)));
    EXPECT_EQ(TELEPORT, board.tile_at(Position(4, 2)));
    // The start marker is open floor.
    EXPECT_EQ(OPEN, board.tile_at(Position(2, 2)));

    // The row above the grid is a wall with a single gap.
    EXPECT_EQ(EXIT, board.tile_at(Position(2, -1)));
    EXPECT_EQ(WALL, board.tile_at(Position(1, -1)));
    EXPECT_EQ(WALL, board.tile_at(Position(3, -1)));
    EXPECT_EQ(WALL, board.tile_at(Position(2, -2)));
    EXPECT_EQ(WALL, board.tile_at(Position(-1, 0)));
    EXPECT_EQ(WALL, board.tile_at(Position(5, 0)));
    EXPECT_EQ(WALL, board.tile_at(Position(0, 3)));

    bool contained = true;
    bool stable = true;
    for (int y = -4; y < 8; ++y) {
        for (int x = -4; x < 9; ++x) {
            Position p(x, y);
            Tile tile = board.tile_at(p);
            if (tile != board.tile_at(p)) {
                stable = false;
            }
            bool inside = x >= 0 && x < 5 && y >= 0 && y < 3;
            if (!inside && p != Position(2, -1) && tile != WALL) {
                contained = false;
            }
        }
    }
    EXPECT_TRUE(stable);
    EXPECT_TRUE(contained);

    EXPECT_TRUE(board.teleport_partner(Position(0, 2)) == Position(4, 2));
    EXPECT_TRUE(board.teleport_partner(Position(4, 2)) == Position(0, 2));

    return test_result();
}
