#include <functional>

#include "main.h"

// A state that branches four ways on every move and never wins, with
// room for just four parent indices in its records. The second run
// has 16 states with children, so the search has to give up when it
// gets to expanding it.
class Branching {
public:
    static const int kValueBits = 32;
    static const int kMoveBits = 2;
    static const int kParentBits = 2;

    using Move = Direction;
    using Packed = PackedState<Branching,
                               kValueBits + kMoveBits + kParentBits>;

    Branching() : value_(0), move_(UP), parent_(0) {
    }

    explicit Branching(const Packed& p) : Branching() {
        Packed::P::Context pc;
        unpack(&p.p_, &pc);
    }

    bool do_valid_moves(const int& setup,
                        std::function<bool(Branching)> fun) const {
        for (int d = 0; d < kDirectionCount; ++d) {
            Branching child(*this);
            child.value_ = value_ * 4 + d + 1;
            child.move_ = Direction(d);
            if (fun(child)) {
                return true;
            }
        }
        return false;
    }

    bool win() const { return false; }

    bool same_position(const Branching& other) const {
        return value_ == other.value_;
    }

    Direction move() const { return move_; }
    uint64_t parent() const { return parent_; }
    void set_parent(uint64_t parent) { parent_ = parent; }

    template<class P>
    void pack(P* packer, typename P::Context* pc) const {
        packer->deposit(value_, kValueBits, pc);
        packer->deposit(move_, kMoveBits, pc);
        packer->deposit(parent_, kParentBits, pc);
    }

    template<class P>
    void unpack(const P* packer, typename P::Context* pc) {
        uint32_t move;
        packer->extract(value_, kValueBits, pc);
        packer->extract(move, kMoveBits, pc);
        move_ = Direction(move);
        packer->extract(parent_, kParentBits, pc);
    }

private:
    uint32_t value_;
    Direction move_;
    uint64_t parent_;
};

// Expected to abort.
int main() {
    BFSPolicy<Branching, int> policy;
    BreadthFirstSearch<Branching, int> bfs(&policy, 4);
    std::vector<Direction> path;
    int setup = 0;
    SearchOutcome outcome = bfs.search(Branching(), setup, &path);
    fprintf(stderr, "search finished with outcome %d\n", outcome);
    return EXIT_SUCCESS;
}
