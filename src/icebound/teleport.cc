#include "main.h"

int main() {
    const char* base_map =
        "*  \n"
        "T..\n"
        "...\n"
        " RT\n";

    {
        Board board;
        Position start;
        EXPECT_EQ(PARSE_OK, parse_board(base_map, &board, &start));
        MoveOutcome outcome = resolve_move(RIGHT, board, start);
        EXPECT_EQ(MoveOutcome::ARRIVED, outcome.kind_);
        EXPECT_TRUE(outcome.at_ == Position(0, 0));
    }

    // Either end of the teleporter leads to the other one.
    {
        Board board;
        Position start;
        EXPECT_EQ(PARSE_OK, parse_board("*    \n"
                                        "T R T\n",
                                        &board, &start));
        MoveOutcome outcome = resolve_move(LEFT, board, Position(1, 0));
        EXPECT_TRUE(outcome.at_ == Position(4, 0));
        outcome = resolve_move(RIGHT, board, Position(3, 0));
        EXPECT_TRUE(outcome.at_ == Position(0, 0));
    }

    Puzzle puzzle = make_puzzle(base_map);
    EXPECT_STREQ("RU", search(puzzle));

    std::vector<Direction> path;
    EXPECT_EQ(SEARCH_FOUND, solve_puzzle(puzzle, &path));
    EXPECT_EQ(SUCCEEDED, replay(puzzle, path));

    return test_result();
}
