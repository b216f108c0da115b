#include "main.h"

// Moves the start token of a single board puzzle once.
MoveOutcome move_from_start(const char* map, Direction dir) {
    Board board;
    Position start;
    EXPECT_EQ(PARSE_OK, parse_board(map, &board, &start));
    return resolve_move(dir, board, start);
}

int main() {
    // A wall stops the slide on the last ice tile.
    {
        MoveOutcome outcome = move_from_start("*   \n"
                                              " R-.\n",
                                              RIGHT);
        EXPECT_EQ(MoveOutcome::ARRIVED, outcome.kind_);
        EXPECT_TRUE(outcome.at_ == Position(2, 0));
    }

    // The slide carries on over consecutive ice to open floor.
    {
        const char* map = "*     \n"
                          "R--- .\n";
        MoveOutcome outcome = move_from_start(map, RIGHT);
        EXPECT_EQ(MoveOutcome::ARRIVED, outcome.kind_);
        EXPECT_TRUE(outcome.at_ == Position(4, 0));

        Board board;
        Position start;
        EXPECT_EQ(PARSE_OK, parse_board(map, &board, &start));
        outcome = resolve_move(LEFT, board, Position(4, 0));
        EXPECT_EQ(MoveOutcome::ARRIVED, outcome.kind_);
        EXPECT_TRUE(outcome.at_ == Position(0, 0));
    }

    // The edge of the grid stops the slide too.
    {
        MoveOutcome outcome = move_from_start("*  \n"
                                              "R--\n",
                                              RIGHT);
        EXPECT_EQ(MoveOutcome::ARRIVED, outcome.kind_);
        EXPECT_TRUE(outcome.at_ == Position(2, 0));
    }

    EXPECT_EQ(MoveOutcome::DEAD,
              move_from_start("*   \n"
                              "R--~\n",
                              RIGHT).kind_);

    EXPECT_EQ(MoveOutcome::EXITED,
              move_from_start("*\n"
                              "-\n"
                              "-\n"
                              "R\n",
                              UP).kind_);

    {
        MoveOutcome outcome = move_from_start("*     \n"
                                              "R-T  T\n",
                                              RIGHT);
        EXPECT_EQ(MoveOutcome::ARRIVED, outcome.kind_);
        EXPECT_TRUE(outcome.at_ == Position(5, 0));
    }

    {
        const char* map =
            "  *\n"
            "R- \n";
        Puzzle puzzle = make_puzzle(map);
        EXPECT_STREQ("RU", search(puzzle));
    }

    {
        const char* map =
            "  *\n"
            "R- \n";
        Puzzle puzzle = make_puzzle(map);
        TestPolicy policy;
        std::vector<Direction> path;
        EXPECT_EQ(SEARCH_FOUND, solve_puzzle(puzzle, &policy, &path));
        EXPECT_EQ(1, policy.kept_.size());
        EXPECT_EQ(3, policy.traced_);
        EXPECT_EQ(SUCCEEDED, replay(puzzle, path));
    }

    return test_result();
}
