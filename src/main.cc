#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>
#include <unordered_set>
#include <vector>

#include "icebound/icebound.h"

enum ExitCode {
    EXIT_SOLVED = 0,
    EXIT_NO_SOLUTION = 1,
    EXIT_USAGE = 2,
};

// Prints the progress of the search to stdout.
class SolvePolicy : public BFSPolicy<Turn, Puzzle> {
public:
    SolvePolicy(bool quiet, bool verbose)
        : quiet_(quiet),
          verbose_(verbose) {
    }

    void start_iteration(int depth) {
        if (!quiet_) {
            printf("depth: %d\n", depth);
        }
    }

    void new_state(const Puzzle& puzzle, const Turn& turn, int depth) {
        if (quiet_) {
            return;
        }
        ++stored_;
        joints_.insert(turn.joint());
    }

    void end_iteration(int depth, size_t generated, size_t kept,
                       size_t stored_bytes) {
        if (quiet_) {
            return;
        }
        printf("  new states: %ld, kept: %ld (total: %ld, distinct "
               "positions: %ld), bytes: %ld\n",
               (long) generated, (long) kept, (long) stored_,
               (long) joints_.size(), (long) stored_bytes);
    }

    void trace(const Puzzle& puzzle, const Turn& turn, int depth) {
        if (!verbose_) {
            return;
        }
        if (depth) {
            printf("Move %d: %s\n", depth, direction_name(turn.move()));
        } else {
            printf("Start\n");
        }
        turn.print(puzzle);
    }

private:
    bool quiet_;
    bool verbose_;
    size_t stored_ = 0;
    std::unordered_set<Joint, JointHash> joints_;
};

static void usage(const char* argv0) {
    fprintf(stderr,
            "usage: %s [-v] [-q] [-d depth] board [board2]\n"
            "  -v        print the boards after each move of the solution\n"
            "  -q        don't print progress for each depth\n"
            "  -d depth  give up after this many moves\n"
            "  -h        show this message\n",
            argv0);
}

// Reads the whole file into contents. Returns false (with errno set)
// if the file can't be read.
static bool read_file(const char* fname, std::string* contents) {
    FILE* fp = fopen(fname, "rb");
    if (!fp) {
        return false;
    }
    char buf[4096];
    size_t len;
    while ((len = fread(buf, 1, sizeof(buf), fp)) > 0) {
        contents->append(buf, len);
    }
    bool ok = !ferror(fp);
    fclose(fp);
    return ok;
}

int main(int argc, char** argv) {
    bool quiet = false;
    bool verbose = false;
    int max_depth = 0;

    int opt;
    while ((opt = getopt(argc, argv, "vqd:h")) != -1) {
        switch (opt) {
        case 'v':
            verbose = true;
            break;
        case 'q':
            quiet = true;
            break;
        case 'd': {
            char* end;
            long depth = strtol(optarg, &end, 10);
            if (*end || depth <= 0 || depth > INT32_MAX) {
                fprintf(stderr, "invalid depth: %s\n", optarg);
                return EXIT_USAGE;
            }
            max_depth = depth;
            break;
        }
        case 'h':
            usage(argv[0]);
            return EXIT_SOLVED;
        default:
            usage(argv[0]);
            return EXIT_USAGE;
        }
    }

    int board_count = argc - optind;
    if (board_count < 1 || board_count > kMaxTokens) {
        usage(argv[0]);
        return EXIT_USAGE;
    }

    Puzzle puzzle;
    for (int i = optind; i < argc; ++i) {
        std::string text;
        if (!read_file(argv[i], &text)) {
            perror(argv[i]);
            return EXIT_USAGE;
        }
        ParseError err = puzzle.add_board(text.c_str());
        if (err != PARSE_OK) {
            fprintf(stderr, "%s: %s\n", argv[i], parse_error_string(err));
            return EXIT_USAGE;
        }
    }

    if (verbose) {
        Turn(puzzle).print(puzzle);
    }

    SolvePolicy policy(quiet, verbose);
    std::vector<Direction> path;
    switch (solve_puzzle(puzzle, &policy, &path, max_depth)) {
    case SEARCH_FOUND:
        printf("Win\n");
        printf("%s\n", path_string(path).c_str());
        printf("%ld moves\n", (long) path.size());
        return EXIT_SOLVED;
    case SEARCH_EXHAUSTED:
        printf("No solution\n");
        return EXIT_NO_SOLUTION;
    case SEARCH_DEPTH_LIMIT:
        printf("Depth limit reached\n");
        return EXIT_NO_SOLUTION;
    }
    return EXIT_NO_SOLUTION;
}
