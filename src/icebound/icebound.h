// -*- mode: c++ -*-

#ifndef ICEBOUND_H
#define ICEBOUND_H

#include <city.h>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

#include "bit-packer.h"
#include "icebound/board.h"
#include "search.h"

// The number of boards (and so tokens) that can be solved in lockstep.
static const int kMaxTokens = 2;

// What happens to a single token when it's moved.
struct MoveOutcome {
    enum Kind {
        // The token is at at_. Might be where it started from.
        ARRIVED,
        // The token fell into a pit.
        DEAD,
        // The token left the board through the exit.
        EXITED,
    };

    static MoveOutcome arrived(Position at) {
        MoveOutcome outcome;
        outcome.kind_ = ARRIVED;
        outcome.at_ = at;
        return outcome;
    }

    static MoveOutcome dead() {
        MoveOutcome outcome;
        outcome.kind_ = DEAD;
        return outcome;
    }

    static MoveOutcome exited() {
        MoveOutcome outcome;
        outcome.kind_ = EXITED;
        return outcome;
    }

    Kind kind_ = ARRIVED;
    Position at_;
};

// Moves a token at position from one step in direction dir on the
// given board, and works out where it ends up.
//
// - Walls block the move; the token stays where it was.
// - Stepping on a teleporter moves the token to the other teleporter.
// - Stepping on ice keeps the token moving in the same direction,
//   until it reaches some other tile. A wall stops the token on the
//   last ice tile.
//
// The sliding always ends: the token advances by one cell in the
// same direction on every iteration, and the grid is finite and
// walled off everywhere but the exit.
inline MoveOutcome resolve_move(Direction dir, const Board& board,
                                Position from) {
    Position at = from;
    while (1) {
        Position to = at.step(dir);
        switch (board.tile_at(to)) {
        case OPEN:
            return MoveOutcome::arrived(to);
        case WALL:
            return MoveOutcome::arrived(at);
        case PIT:
            return MoveOutcome::dead();
        case EXIT:
            return MoveOutcome::exited();
        case TELEPORT:
            return MoveOutcome::arrived(board.teleport_partner(to));
        case ICE:
            at = to;
            break;
        }
    }
}

// A puzzle: one or two boards, each with one token, that all move
// in the same direction on every move.
class Puzzle {
public:
    Puzzle() : token_count_(0) {
    }

    // Parses a board and adds it to the puzzle.
    ParseError add_board(const char* text) {
        if (token_count_ == kMaxTokens) {
            return PARSE_TOO_MANY_BOARDS;
        }
        ParseError err = parse_board(text,
                                     &boards_[token_count_],
                                     &starts_[token_count_]);
        if (err == PARSE_OK) {
            ++token_count_;
        }
        return err;
    }

    int token_count() const { return token_count_; }
    const Board& board(int ti) const { return boards_[ti]; }
    Position start(int ti) const { return starts_[ti]; }

private:
    Board boards_[kMaxTokens];
    Position starts_[kMaxTokens];
    int token_count_;
};

// The positions of all tokens at one instant. Slots past the
// puzzle's token count are always (0, 0).
struct Joint {
    bool operator==(const Joint& other) const {
        for (int ti = 0; ti < kMaxTokens; ++ti) {
            if (tokens_[ti] != other.tokens_[ti]) {
                return false;
            }
        }
        return true;
    }

    bool operator!=(const Joint& other) const {
        return !(*this == other);
    }

    uint64_t hash() const {
        int32_t coords[kMaxTokens * 2];
        for (int ti = 0; ti < kMaxTokens; ++ti) {
            coords[ti * 2] = tokens_[ti].x_;
            coords[ti * 2 + 1] = tokens_[ti].y_;
        }
        return CityHash64((const char*) coords, sizeof(coords));
    }

    Position tokens_[kMaxTokens];
};

struct JointHash {
    size_t operator()(const Joint& joint) const {
        return joint.hash();
    }
};

// The serialization of a Turn object into a bitstream of kWidthBits
// bits (rounded up to the next byte).
template<class State, size_t kWidthBits>
struct PackedState {
    using P = Packer<kWidthBits>;

    PackedState() {}
    PackedState(const State& st) {
        typename P::Context pc;
        st.pack(&p_, &pc);
    }

    // The size of the serialized output in bytes.
    static constexpr int width_bytes() { return P::Bytes; }

    // Returns the full serialized state.
    uint8_t* bytes() { return p_.bytes_; }
    const uint8_t* bytes() const { return p_.bytes_; }

    P p_;
};

enum TurnStatus {
    ONGOING, FAILED, SUCCEEDED,
};

// A node of the search: the positions of the tokens after some
// sequence of moves, and whether the puzzle has been solved or lost.
//
// The move history and the positions visited along the way are not
// stored in the Turn. Each stored Turn knows the last move and the
// index of its parent in the previous depth of the search; the
// search follows those indices to recover the rest (see search.h).
class Turn {
public:
    // The widths of the fields of a serialized Turn.
    static const int kCoordBits = 16;
    static const int kMoveBits = 2;
    static const int kParentBits = 38;
    static const size_t kPackedBits =
        kMaxTokens * 2 * kCoordBits + kMoveBits + kParentBits;

    using Move = Direction;
    using Packed = PackedState<Turn, kPackedBits>;

    // The null state.
    Turn() : status_(ONGOING), move_(UP), parent_(0) {
    }

    // The initial state.
    explicit Turn(const Puzzle& puzzle) : Turn() {
        for (int ti = 0; ti < puzzle.token_count(); ++ti) {
            joint_.tokens_[ti] = puzzle.start(ti);
        }
    }

    // De-serializes a state from bytes.
    explicit Turn(const Packed& p) : Turn() {
        Packed::P::Context pc;
        unpack(&p.p_, &pc);
    }

    // Returns the Turn that results from moving all tokens in
    // direction dir.
    //
    // - If every token exits, the puzzle is solved.
    // - If any token dies, or some but not all tokens exit, the
    //   puzzle is lost.
    // - If no token changes position, this is a revisit of this
    //   Turn, and is also lost. (Revisits of earlier positions on the
    //   lineage are detected by the search.)
    Turn expand(const Puzzle& puzzle, Direction dir) const {
        Turn child(*this);
        child.move_ = dir;
        if (status_ != ONGOING) {
            child.status_ = FAILED;
            return child;
        }

        int exited = 0;
        int dead = 0;
        for (int ti = 0; ti < puzzle.token_count(); ++ti) {
            MoveOutcome outcome = resolve_move(dir, puzzle.board(ti),
                                               joint_.tokens_[ti]);
            switch (outcome.kind_) {
            case MoveOutcome::ARRIVED:
                child.joint_.tokens_[ti] = outcome.at_;
                break;
            case MoveOutcome::DEAD:
                ++dead;
                break;
            case MoveOutcome::EXITED:
                ++exited;
                break;
            }
        }

        if (dead || (exited && exited != puzzle.token_count())) {
            child.status_ = FAILED;
        } else if (exited) {
            child.status_ = SUCCEEDED;
        } else if (child.joint_ == joint_) {
            child.status_ = FAILED;
        }
        return child;
    }

    // Calls fun on the Turns that can be directly reached from this
    // one and that haven't failed, in the order UP, DOWN, RIGHT,
    // LEFT. Returns true immediately if fun returns true. Otherwise
    // returns false.
    bool do_valid_moves(const Puzzle& puzzle,
                        std::function<bool(Turn)> fun) const {
        for (int d = 0; d < kDirectionCount; ++d) {
            Turn child = expand(puzzle, Direction(d));
            if (child.status_ != FAILED && fun(child)) {
                return true;
            }
        }
        return false;
    }

    bool win() const { return status_ == SUCCEEDED; }

    bool same_position(const Turn& other) const {
        return joint_ == other.joint_;
    }

    TurnStatus status() const { return status_; }
    const Joint& joint() const { return joint_; }
    Direction move() const { return move_; }
    uint64_t parent() const { return parent_; }
    void set_parent(uint64_t parent) { parent_ = parent; }

    // Prints the boards with the tokens on them to stdout.
    void print(const Puzzle& puzzle) const {
        for (int ti = 0; ti < puzzle.token_count(); ++ti) {
            puzzle.board(ti).print(status_ == SUCCEEDED ?
                                   NULL : &joint_.tokens_[ti]);
            printf("\n");
        }
    }

private:
    friend Packed;

    // De-serialize the state.
    template<class P>
    void unpack(const P* packer, typename P::Context* pc) {
        for (int ti = 0; ti < kMaxTokens; ++ti) {
            uint32_t x, y;
            packer->extract(x, kCoordBits, pc);
            packer->extract(y, kCoordBits, pc);
            joint_.tokens_[ti] = Position(x, y);
        }
        uint32_t move;
        packer->extract(move, kMoveBits, pc);
        move_ = Direction(move);
        packer->extract(parent_, kParentBits, pc);
    }

    // Serialize the state.
    template<class P>
    void pack(P* packer, typename P::Context* pc) const {
        for (int ti = 0; ti < kMaxTokens; ++ti) {
            packer->deposit(joint_.tokens_[ti].x_, kCoordBits, pc);
            packer->deposit(joint_.tokens_[ti].y_, kCoordBits, pc);
        }
        packer->deposit(move_, kMoveBits, pc);
        packer->deposit(parent_, kParentBits, pc);
    }

    Joint joint_;
    TurnStatus status_;
    // The move that produced this Turn.
    Direction move_;
    // The index of the Turn this one was produced from, in the run
    // of the previous depth.
    uint64_t parent_;
};

// Searches for a sequence of moves that gets all tokens of the
// puzzle to their exits on the same move. The moves are stored in
// path if one is found. A max_depth of 0 means no limit.
template<class Policy>
SearchOutcome solve_puzzle(const Puzzle& puzzle, Policy* policy,
                           std::vector<Direction>* path,
                           int max_depth = 0) {
    BreadthFirstSearch<Turn, Puzzle, Policy> bfs(policy, max_depth);
    return bfs.search(Turn(puzzle), puzzle, path);
}

inline SearchOutcome solve_puzzle(const Puzzle& puzzle,
                                  std::vector<Direction>* path) {
    BFSPolicy<Turn, Puzzle> policy;
    return solve_puzzle(puzzle, &policy, path);
}

// Parses one or two boards (board_b may be null) and solves them.
// Returns the parse error if either board is malformed; the search
// is not run in that case. Otherwise returns PARSE_OK and stores the
// result of the search in outcome and path.
inline ParseError solve_text(const char* board_a, const char* board_b,
                             std::vector<Direction>* path,
                             SearchOutcome* outcome) {
    Puzzle puzzle;
    ParseError err = puzzle.add_board(board_a);
    if (err == PARSE_OK && board_b) {
        err = puzzle.add_board(board_b);
    }
    if (err != PARSE_OK) {
        return err;
    }
    *outcome = solve_puzzle(puzzle, path);
    return PARSE_OK;
}

// Applies the moves to the initial state of the puzzle, and returns
// the status after the last move. Stops early if the puzzle is
// solved or lost before the moves run out, in which case the
// remaining moves count as a loss. A move that returns all tokens to
// positions they've already been in is a loss too.
inline TurnStatus replay(const Puzzle& puzzle,
                         const std::vector<Direction>& path) {
    Turn turn(puzzle);
    std::unordered_set<Joint, JointHash> visited;
    visited.insert(turn.joint());

    for (size_t i = 0; i < path.size(); ++i) {
        if (turn.status() != ONGOING) {
            return FAILED;
        }
        turn = turn.expand(puzzle, path[i]);
        if (turn.status() == ONGOING &&
            !visited.insert(turn.joint()).second) {
            return FAILED;
        }
    }

    return turn.status();
}

// Formats a move sequence as one letter per move, e.g. "UULR".
inline std::string path_string(const std::vector<Direction>& path) {
    std::string ret;
    for (auto dir : path) {
        ret += direction_char(dir);
    }
    return ret;
}

#endif // ICEBOUND_H
