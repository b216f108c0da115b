#include "main.h"

int main() {
    const char* map_a =
        "*\n"
        "R\n";
    const char* map_b =
        "* \n"
        " R\n";

    Puzzle puzzle = make_puzzle(map_a, map_b);
    EXPECT_EQ(2, puzzle.token_count());

    Turn start(puzzle);
    // Token A exits but token B only bumps into the wall.
    EXPECT_EQ(FAILED, start.expand(puzzle, UP).status());

    Turn left = start.expand(puzzle, LEFT);
    EXPECT_EQ(ONGOING, left.status());
    EXPECT_TRUE(left.joint().tokens_[0] == Position(0, 0));
    EXPECT_TRUE(left.joint().tokens_[1] == Position(0, 0));
    EXPECT_EQ(SUCCEEDED, left.expand(puzzle, UP).status());

    EXPECT_STREQ("LU", search(puzzle));
    EXPECT_STREQ("LU", search(make_puzzle(map_b, map_a)));

    std::vector<Direction> path;
    SearchOutcome outcome = SEARCH_EXHAUSTED;
    EXPECT_EQ(PARSE_OK, solve_text(map_a, map_b, &path, &outcome));
    EXPECT_EQ(SEARCH_FOUND, outcome);
    EXPECT_EQ(SUCCEEDED, replay(puzzle, path));

    // Token A can only ever exit on its own.
    {
        Puzzle stuck = make_puzzle(map_a,
                                   "*\n"
                                   " \n"
                                   "R\n");
        EXPECT_STREQ("", search(stuck));
        EXPECT_EQ(SEARCH_EXHAUSTED, solve_puzzle(stuck, &path));
    }

    return test_result();
}
