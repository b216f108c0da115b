#include "main.h"

int main() {
    const char* base_map =
        "*  \n"
        "   \n"
        "~R \n";

    Puzzle puzzle = make_puzzle(base_map);
    Turn start(puzzle);
    EXPECT_EQ(MoveOutcome::DEAD,
              resolve_move(LEFT, puzzle.board(0), puzzle.start(0)).kind_);
    EXPECT_EQ(FAILED, start.expand(puzzle, LEFT).status());
    // Nothing can be done after falling in.
    EXPECT_EQ(FAILED, start.expand(puzzle, LEFT).expand(puzzle, UP).status());

    EXPECT_STREQ("ULU", search(puzzle));

    std::vector<Direction> path;
    EXPECT_EQ(SEARCH_FOUND, solve_puzzle(puzzle, &path));
    EXPECT_EQ(SUCCEEDED, replay(puzzle, path));

    // The token never steps on the pit along the way.
    bool safe = true;
    Position at = puzzle.start(0);
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        MoveOutcome outcome = resolve_move(path[i], puzzle.board(0), at);
        if (outcome.kind_ != MoveOutcome::ARRIVED ||
            puzzle.board(0).tile_at(outcome.at_) == PIT) {
            safe = false;
        }
        at = outcome.at_;
    }
    EXPECT_TRUE(safe);

    // Pits around the start leave some depth 1 states without
    // children, so the parent indices in a run skip ahead of the
    // indices of the run itself.
    {
        Puzzle pits = make_puzzle("*   \n"
                                  "    \n"
                                  " ~  \n"
                                  " R ~\n"
                                  ". ~ \n");
        TestPolicy policy;
        std::vector<Direction> path;
        EXPECT_EQ(SEARCH_FOUND, solve_puzzle(pits, &policy, &path));
        EXPECT_STREQ("LUUU", path_string(path));
        EXPECT_EQ(3, policy.kept_.size());
        EXPECT_EQ(3, policy.kept_[0]);
        EXPECT_EQ(2, policy.kept_[1]);
        EXPECT_EQ(3, policy.kept_[2]);
    }

    return test_result();
}
