#include "main.h"

int main() {
    const char* base_map =
        " *   \n"
        "     \n"
        "     \n"
        "     \n"
        "     \n"
        "   R \n";

    Puzzle puzzle = make_puzzle(base_map);
    EXPECT_STREQ("UUUULLU", search(puzzle));
    // Same puzzle, same answer.
    EXPECT_STREQ("UUUULLU", search(puzzle));

    std::vector<Direction> path;
    SearchOutcome outcome = SEARCH_EXHAUSTED;
    EXPECT_EQ(PARSE_OK, solve_text(base_map, NULL, &path, &outcome));
    EXPECT_EQ(SEARCH_FOUND, outcome);
    EXPECT_STREQ("UUUULLU", path_string(path));
    EXPECT_EQ(SUCCEEDED, replay(puzzle, path));

    // Replays of partial or overlong paths.
    EXPECT_EQ(ONGOING, replay(puzzle, { UP, UP }));
    EXPECT_EQ(ONGOING, replay(puzzle, {}));
    EXPECT_EQ(FAILED, replay(puzzle, { UP, DOWN }));
    path.push_back(LEFT);
    EXPECT_EQ(FAILED, replay(puzzle, path));

    // Bumping into the wall leaves the token in place, which is a
    // loss.
    EXPECT_EQ(FAILED, Turn(puzzle).expand(puzzle, DOWN).status());

    // One depth short of the solution.
    {
        TestPolicy policy;
        std::vector<Direction> path;
        EXPECT_EQ(SEARCH_DEPTH_LIMIT,
                  solve_puzzle(puzzle, &policy, &path, 6));
        EXPECT_EQ(0, path.size());
        EXPECT_EQ(0, policy.traced_);
    }
    {
        TestPolicy policy;
        std::vector<Direction> path;
        EXPECT_EQ(SEARCH_FOUND, solve_puzzle(puzzle, &policy, &path, 7));
        EXPECT_EQ(7, path.size());
        EXPECT_EQ(8, policy.traced_);
    }

    return test_result();
}
