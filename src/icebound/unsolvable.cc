#include "main.h"

int main() {
    // The exit is above a wall.
    {
        Puzzle puzzle = make_puzzle("   *\n"
                                    "R  .\n");
        TestPolicy policy;
        std::vector<Direction> path;
        EXPECT_EQ(SEARCH_EXHAUSTED, solve_puzzle(puzzle, &policy, &path));
        EXPECT_EQ(0, path.size());
        EXPECT_EQ(3, policy.kept_.size());
        EXPECT_EQ(1, policy.kept_[0]);
        EXPECT_EQ(1, policy.kept_[1]);
        EXPECT_EQ(0, policy.kept_[2]);
    }

    // Every move bounces or kills the token.
    {
        Puzzle puzzle = make_puzzle("  *\n"
                                    "R.~\n");
        TestPolicy policy;
        std::vector<Direction> path;
        EXPECT_EQ(SEARCH_EXHAUSTED, solve_puzzle(puzzle, &policy, &path));
        EXPECT_EQ(1, policy.kept_.size());
        EXPECT_EQ(0, policy.kept_[0]);
    }

    // Revisits are only pruned within a lineage. Both paths to the
    // bottom right cell are kept.
    {
        Puzzle puzzle = make_puzzle("  *\n"
                                    "R .\n"
                                    "  .\n");
        TestPolicy policy;
        std::vector<Direction> path;
        EXPECT_EQ(SEARCH_EXHAUSTED, solve_puzzle(puzzle, &policy, &path));
        EXPECT_EQ(4, policy.kept_.size());
        EXPECT_EQ(2, policy.kept_[0]);
        EXPECT_EQ(2, policy.kept_[1]);
        EXPECT_EQ(2, policy.kept_[2]);
        EXPECT_EQ(0, policy.kept_[3]);
    }

    // The depth limit is reported separately from running out of
    // states.
    {
        Puzzle puzzle = make_puzzle("  *\n"
                                    "R .\n"
                                    "  .\n");
        TestPolicy policy;
        std::vector<Direction> path;
        EXPECT_EQ(SEARCH_DEPTH_LIMIT,
                  solve_puzzle(puzzle, &policy, &path, 2));
        EXPECT_EQ(2, policy.kept_.size());
    }

    return test_result();
}
