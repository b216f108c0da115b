#include <unordered_set>

#include "main.h"

int main() {
    Position p(3, 4);
    EXPECT_TRUE(p.step(UP) == Position(3, 3));
    EXPECT_TRUE(p.step(DOWN) == Position(3, 5));
    EXPECT_TRUE(p.step(RIGHT) == Position(4, 4));
    EXPECT_TRUE(p.step(LEFT) == Position(2, 4));
    EXPECT_TRUE(Position(0, 0).step(UP) == Position(0, -1));

    EXPECT_TRUE(Position(1, 2) == Position(1, 2));
    EXPECT_TRUE(Position(1, 2) != Position(2, 1));

    Joint a;
    a.tokens_[0] = Position(1, 2);
    a.tokens_[1] = Position(3, 4);
    Joint b = a;
    EXPECT_TRUE(a == b);
    EXPECT_EQ(a.hash(), b.hash());
    b.tokens_[1] = Position(4, 3);
    EXPECT_TRUE(a != b);

    std::unordered_set<Joint, JointHash> joints;
    joints.insert(a);
    joints.insert(b);
    joints.insert(a);
    EXPECT_EQ(2, joints.size());

    EXPECT_STREQ("UDRL", path_string({ UP, DOWN, RIGHT, LEFT }));
    EXPECT_STREQ("left", direction_name(LEFT));

    // A stored Turn keeps its positions, move and parent.
    Puzzle puzzle = make_puzzle(
        "*    \n"
        "     \n"
        "   R \n",
        "    *\n"
        "R    \n");
    Turn turn = Turn(puzzle).expand(puzzle, UP);
    EXPECT_EQ(ONGOING, turn.status());
    turn.set_parent(UINT64_C(123456789012));
    Turn copy = Turn(Turn::Packed(turn));
    EXPECT_TRUE(copy.same_position(turn));
    EXPECT_TRUE(copy.joint().tokens_[0] == Position(3, 0));
    EXPECT_TRUE(copy.joint().tokens_[1] == Position(0, 0));
    EXPECT_EQ(UP, copy.move());
    EXPECT_EQ(UINT64_C(123456789012), copy.parent());

    return test_result();
}
