#include <cstring>

#include "main.h"

ParseError parse(const char* text) {
    Board board;
    Position start;
    return parse_board(text, &board, &start);
}

int main() {
    EXPECT_EQ(PARSE_EMPTY_INPUT, parse(""));
    EXPECT_EQ(PARSE_EMPTY_INPUT, parse(NULL));
    EXPECT_EQ(PARSE_EMPTY_INPUT, parse("\n\n"));
    EXPECT_EQ(PARSE_MISSING_EXIT, parse("   \n"
                                        "R  \n"));
    EXPECT_EQ(PARSE_MISSING_START, parse("*\n"));
    EXPECT_EQ(PARSE_MISSING_START, parse("*  \n"
                                         "   \n"));
    EXPECT_EQ(PARSE_DUPLICATE_START, parse("*  \n"
                                           "R R\n"));
    EXPECT_EQ(PARSE_UNKNOWN_TILE, parse("*  \n"
                                        "R x\n"));
    EXPECT_EQ(PARSE_MISSING_TELEPORTER, parse("*  \n"
                                              "RT \n"));
    EXPECT_EQ(PARSE_EXTRA_TELEPORTER, parse("*    \n"
                                            "RTTT \n"));
    EXPECT_EQ(PARSE_RAGGED_ROWS, parse("*  \n"
                                       "R  \n"
                                       "  \n"));
    EXPECT_EQ(PARSE_EXIT_OUTSIDE_GRID, parse("   *\n"
                                             "R  \n"));

    std::string wide = "*\nR";
    wide += std::string(kMaxDimension, ' ');
    EXPECT_EQ(PARSE_BOARD_TOO_LARGE, parse(wide.c_str()));

    // Windows line endings, trailing blank lines and text next to
    // the exit marker are fine.
    {
        Board board;
        Position start;
        EXPECT_EQ(PARSE_OK, parse_board("# *\r\n"
                                        "R  \r\n"
                                        "\n\n",
                                        &board, &start));
        EXPECT_EQ(3, board.width());
        EXPECT_EQ(1, board.height());
        EXPECT_EQ(2, board.exit_column());
    }

    // A failed parse leaves the output alone.
    {
        Board board;
        Position start(7, 7);
        EXPECT_EQ(PARSE_UNKNOWN_TILE, parse_board("*  \n"
                                                  "R?\n",
                                                  &board, &start));
        EXPECT_EQ(0, board.width());
        EXPECT_TRUE(start == Position(7, 7));
    }

    {
        Puzzle puzzle;
        EXPECT_EQ(PARSE_OK, puzzle.add_board("*\nR\n"));
        EXPECT_EQ(PARSE_MISSING_START, puzzle.add_board("*\n \n"));
        EXPECT_EQ(1, puzzle.token_count());
        EXPECT_EQ(PARSE_OK, puzzle.add_board("*\nR\n"));
        EXPECT_EQ(PARSE_TOO_MANY_BOARDS, puzzle.add_board("*\nR\n"));
        EXPECT_EQ(2, puzzle.token_count());
    }

    {
        std::vector<Direction> path;
        SearchOutcome outcome = SEARCH_FOUND;
        EXPECT_EQ(PARSE_DUPLICATE_START,
                  solve_text("*\nR\n", "* \nRR\n", &path, &outcome));
        EXPECT_EQ(SEARCH_FOUND, outcome);
    }

    EXPECT_TRUE(strcmp(parse_error_string(PARSE_RAGGED_ROWS),
                       parse_error_string(PARSE_UNKNOWN_TILE)) != 0);

    return test_result();
}
