// -*- mode: c++ -*-
//
// A breadth-first search over lineages, optimized for secondary
// storage.
//
// Unlike a textbook BFS, states are not deduplicated globally.
// A state is only pruned if the same position already appears on
// its own lineage (the chain of states from the start state to
// it). Two different lineages are free to pass through the same
// position. That makes the number of states per depth grow much
// faster than with global deduplication, so the states are never
// held in memory for longer than one depth.
//
// Each depth of the search is stored as one run of fixed width
// records. A record is the state itself, the move that produced it
// and the index of its parent in the previous run. The runs are
// written in generation order and delta + zstd compressed (see
// compress.h), and the array holding them moves to disk once it
// grows large (see file-backed-array.h). The chain of parent indices
// gives every state its move history and the set of positions its
// lineage has visited, without copying either of them per state.
//
// All data processing happens in a streaming manner:
//
// - For each state of the latest run, generate all outputs. Collect
//   the ones that are still in play as candidates, in order.
// - Stop as soon as an output is a win; trace it back through the
//   runs to produce the move sequence.
// - Otherwise walk the runs backwards from the latest one, with each
//   candidate holding a cursor into the run being walked (starting
//   at its parent). A candidate whose position matches the record
//   under its cursor is dropped; the others move their cursor to
//   that record's parent. Since the records of a run are written in
//   order of their parents, the cursors remain sorted from run to
//   run, and each run is read sequentially exactly once.
// - The surviving candidates become the next run.

#ifndef SEARCH_H
#define SEARCH_H

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <vector>

#include "compress.h"
#include "file-backed-array.h"
#include "util.h"

enum SearchOutcome {
    // A win state was found.
    SEARCH_FOUND,
    // There are no states left to expand.
    SEARCH_EXHAUSTED,
    // The maximum depth was reached without finding a win state.
    SEARCH_DEPTH_LIMIT,
};

// A default policy class, with hook implementations that do nothing.
template<class State, class FixedState>
struct BFSPolicy {
    // Called at the start of each new depth of the breadth-first
    // search, before the states at that depth get expanded.
    void start_iteration(int depth) {
    }

    // Called for each state that gets stored for the given depth.
    void new_state(const FixedState& setup, const State& state,
                   int depth) {
    }

    // Called once the states for the given depth have been stored.
    // generated is the number of states that were still in play
    // after the move, kept the number that survived the lineage
    // check. stored_bytes is the size of all runs so far.
    void end_iteration(int depth, size_t generated, size_t kept,
                       size_t stored_bytes) {
    }

    // Called for every state on the solution that was found, from
    // the win state back to the start state.
    void trace(const FixedState& setup, const State& state, int depth) {
    }
};

// A breadth first search driven by the template parameters.
//
// Template parameters.
//
// State: A node in the state graph. Must implement:
// - do_valid_moves(const FixedState& setup,
//                  std::function<bool(State)> fun) const
//   Calls fun with all states that can be reached from this
//   state and that are still in play, in a fixed order. Returns
//   true as soon as fun does.
// - win(): Returns true if the state is in a win condition.
// - same_position(const State& other): Returns true if the two
//   states would be the same node of the state graph.
// - move(), parent(), set_parent(uint64_t): The move that produced
//   the state, and the index of its parent in the previous run.
// - kParentBits: The number of bits a stored parent index has. A
//   run may hold at most 2^kParentBits states with children.
// - Must have a default constructor.
//
// FixedState: An opaque scenario description, containing data that's
// needed for interpreting the State objects but that's identical
// between all states. A single FixedState object will be passed to
// the main entry point, and threaded through all computations.
//
// Policy: Hook functions called at various point of the search
// process. See BFSPolicy for the set of hooks that should be
// defined.
//
// PackedState: A byte serialization of State, including the move
// and the parent index.
// - width_bytes(): Returns the width of the serialization.
// - bytes(): Returns a mutable array of width_bytes() bytes.
// - There must be mutual constructors from PackedState to State
//   and vice versa.
template<class State, class FixedState,
         class Policy = BFSPolicy<State, FixedState>,
         class PackedState = typename State::Packed,
         bool Compress = true>
class BreadthFirstSearch {
public:
    // The serialized states are the records stored for each depth.
    using Key = PackedState;
    using Move = typename State::Move;

    // A sequence of serialized states. (Note that each state is
    // likely to serialize to multiple bytes, so a single element of
    // this array represents just a part of the state).
    using Keys = file_backed_mmap_array<uint8_t>;
    // A byte range pointing into a Keys array, indicating the
    // start/end of the records of one depth.
    using KeyRun = Keys::Run;

    using KeyStream = RecordStream<Key, Compress>;
    using KeyCompressor = RecordCompressor<Key::width_bytes(),
                                           Compress,
                                           Keys>;

    // Does not take ownership of the policy. A max_depth of 0 means
    // no limit.
    explicit BreadthFirstSearch(Policy* policy, int max_depth = 0)
        : policy_(policy),
          max_depth_(max_depth) {
    }

    // Execute a search from start_state to any win state. If one is
    // found, the moves leading to it are stored in path.
    SearchOutcome search(const State& start_state, const FixedState& setup,
                         std::vector<Move>* path) {
        path->clear();

        // The records of the states generated at each depth, one run
        // per depth. The start state is the only record at depth 0.
        Keys keys_by_depth;
        {
            Keys::WriteRun key_writer { &keys_by_depth };
            KeyCompressor compress { &keys_by_depth };
            compress.pack(Key(start_state).bytes());
        }
        policy_->new_state(setup, start_state, 0);

        for (int depth = 0; ; ++depth) {
            if (max_depth_ && depth >= max_depth_) {
                return SEARCH_DEPTH_LIMIT;
            }
            policy_->start_iteration(depth);

            keys_by_depth.freeze();

            // The states generated on this iteration that are still
            // in play, in generation order.
            std::vector<Candidate> candidates;
            State win_state;
            if (visit_states(setup, keys_by_depth.run(depth),
                             &candidates, &win_state)) {
                trace_solution_path(setup, keys_by_depth, win_state,
                                    depth, path);
                return SEARCH_FOUND;
            }

            size_t generated = candidates.size();
            drop_revisits(keys_by_depth, depth, &candidates);

            keys_by_depth.thaw();
            if (candidates.empty()) {
                policy_->end_iteration(depth + 1, generated, 0,
                                       keys_by_depth.size());
                return SEARCH_EXHAUSTED;
            }

            {
                Keys::WriteRun key_writer { &keys_by_depth };
                KeyCompressor compress { &keys_by_depth };
                for (const auto& candidate : candidates) {
                    compress.pack(Key(candidate.state_).bytes());
                    policy_->new_state(setup, candidate.state_, depth + 1);
                }
            }
            policy_->end_iteration(depth + 1, generated, candidates.size(),
                                   keys_by_depth.size());
        }
    }

private:
    // A newly generated state, and the index of the record in the
    // run currently being walked that it still needs to be compared
    // against.
    struct Candidate {
        explicit Candidate(const State& state)
            : state_(state),
              cursor_(state.parent()) {
        }

        State state_;
        uint64_t cursor_;
    };

    // Visits all states in run, in order. Appends the generated
    // states that are still in play to candidates. If a winning
    // state is found, sets it to win_state and returns true.
    bool visit_states(const FixedState& setup, const KeyRun& run,
                      std::vector<Candidate>* candidates,
                      State* win_state) {
        uint64_t index = 0;
        for (KeyStream todo(run.first, run.second); todo.next(); ++index) {
            if (index > mask_n_bits(State::kParentBits)) {
                die("too many states in one generation");
            }
            State st(todo.value());

            bool win = st.do_valid_moves(setup,
                                         [candidates, win_state, index]
                                         (State new_state) {
                                             new_state.set_parent(index);
                                             if (new_state.win()) {
                                                 *win_state = new_state;
                                                 return true;
                                             }
                                             candidates->push_back(
                                                 Candidate(new_state));
                                             return false;
                                         });
            if (win) {
                return true;
            }
        }

        return false;
    }

    // Removes the candidates whose position already appears on their
    // lineage. The parents of the candidates are at the given depth.
    void drop_revisits(const Keys& keys_by_depth, int depth,
                       std::vector<Candidate>* candidates) {
        for (int i = depth; i >= 0 && !candidates->empty(); --i) {
            auto runinfo = keys_by_depth.run(i);
            KeyStream stream(runinfo.first, runinfo.second);
            bool have = stream.next();
            uint64_t index = 0;
            State ancestor(stream.value());

            size_t kept = 0;
            // The cursor of the previous candidate, before it was moved
            // on to the next run.
            uint64_t prev_cursor = 0;
            for (size_t j = 0; j < candidates->size(); ++j) {
                Candidate candidate = (*candidates)[j];
                assert(prev_cursor <= candidate.cursor_);
                prev_cursor = candidate.cursor_;
                if (index < candidate.cursor_) {
                    while (have && index < candidate.cursor_) {
                        have = stream.next();
                        ++index;
                    }
                    assert(have);
                    ancestor = State(stream.value());
                }
                if (candidate.state_.same_position(ancestor)) {
                    continue;
                }
                candidate.cursor_ = ancestor.parent();
                (*candidates)[kept++] = candidate;
            }
            candidates->erase(candidates->begin() + kept, candidates->end());
        }
    }

    // Returns the state stored at the given index of the run for the
    // given depth.
    State fetch(const Keys& keys_by_depth, int depth, uint64_t index) {
        auto runinfo = keys_by_depth.run(depth);
        KeyStream stream(runinfo.first, runinfo.second);
        for (uint64_t i = 0; i <= index; ++i) {
            bool have = stream.next();
            assert(have);
            (void) have;
        }
        return State(stream.value());
    }

    // Works backwards from the winning state (generated from a state
    // at the given depth) to the start state, following the parent
    // indices and calling Policy::trace on each state. Stores the
    // moves from the start state to the winning state in path.
    void trace_solution_path(const FixedState& setup,
                             const Keys& keys_by_depth,
                             const State& win_state,
                             int depth,
                             std::vector<Move>* path) {
        policy_->trace(setup, win_state, depth + 1);
        path->push_back(win_state.move());

        uint64_t parent = win_state.parent();
        for (int i = depth; i > 0; --i) {
            State st = fetch(keys_by_depth, i, parent);
            policy_->trace(setup, st, i);
            path->push_back(st.move());
            parent = st.parent();
        }
        policy_->trace(setup, fetch(keys_by_depth, 0, parent), 0);

        std::reverse(path->begin(), path->end());
    }

    Policy* policy_;
    int max_depth_;
};

#endif
