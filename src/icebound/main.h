// -*- mode: c++ -*-

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "icebound/icebound.h"

static int expect_failures = 0;

#define EXPECT_EQ(wanted, actual)                                       \
    do {                                                                \
        printf("Running %s\n", #actual);                                \
        auto tmp = actual;                                              \
        if (tmp != wanted) {                                            \
            fprintf(stderr, "Error: expected %s => %ld, got %ld\n",     \
                    #actual, (long) (wanted), (long) tmp);              \
            ++expect_failures;                                          \
        }                                                               \
    } while (0)

#define EXPECT_STREQ(wanted, actual)                                    \
    do {                                                                \
        printf("Running %s\n", #actual);                                \
        std::string tmp = actual;                                       \
        if (tmp != wanted) {                                            \
            fprintf(stderr, "Error: expected %s => \"%s\", got \"%s\"\n", \
                    #actual, wanted, tmp.c_str());                      \
            ++expect_failures;                                          \
        }                                                               \
    } while (0)

#define EXPECT_TRUE(actual)                                             \
    do {                                                                \
        printf("Running %s\n", #actual);                                \
        if (!(actual)) {                                                \
            fprintf(stderr, "Error: expected %s to hold\n", #actual);   \
            ++expect_failures;                                          \
        }                                                               \
    } while (0)

// The exit status of a test binary.
inline int test_result() {
    if (expect_failures) {
        fprintf(stderr, "%d expectations failed\n", expect_failures);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

// Records what the search did at each depth.
class TestPolicy : public BFSPolicy<Turn, Puzzle> {
public:
    void start_iteration(int depth) {
        printf("depth: %d\n", depth);
    }

    void end_iteration(int depth, size_t generated, size_t kept,
                       size_t stored_bytes) {
        printf("  new states: %ld\n", (long) generated);
        printf("  kept: %ld\n", (long) kept);
        kept_.push_back(kept);
    }

    void trace(const Puzzle& puzzle, const Turn& turn, int depth) {
        printf("Move %d\n", depth);
        turn.print(puzzle);
        ++traced_;
    }

    // The number of states kept for depth 1, 2, ...
    std::vector<size_t> kept_;
    // The number of states on the solution, including the start
    // state.
    int traced_ = 0;
};

// Solves the puzzle, printing the progress and the solution. Returns
// the moves as a string of initials, or "" if there is no solution.
inline std::string search(const Puzzle& puzzle, int max_depth = 0) {
    TestPolicy policy;
    std::vector<Direction> path;
    SearchOutcome outcome = solve_puzzle(puzzle, &policy, &path, max_depth);
    printf("%s\n", outcome == SEARCH_FOUND ? "Win" : "No solution");
    return path_string(path);
}

// Builds a puzzle from one or two boards, recording a failure if
// either is malformed.
inline Puzzle make_puzzle(const char* board_a, const char* board_b = NULL) {
    Puzzle puzzle;
    EXPECT_EQ(PARSE_OK, puzzle.add_board(board_a));
    if (board_b) {
        EXPECT_EQ(PARSE_OK, puzzle.add_board(board_b));
    }
    return puzzle;
}
