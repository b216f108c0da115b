#include "main.h"

// Writes two depths worth of records into an array small enough to
// move to disk, and reads them back.
int main() {
    using Keys = file_backed_mmap_array<uint8_t, 64>;
    using KeyStream = RecordStream<Turn::Packed, true>;
    using KeyCompressor = RecordCompressor<
        Turn::Packed::width_bytes(), true, Keys>;

    const int kRecords = 5000;
    const int kRuns = 2;

    Keys keys;
    for (int r = 0; r < kRuns; ++r) {
        Keys::WriteRun writer { &keys };
        KeyCompressor compress { &keys };
        for (int i = 0; i < kRecords; ++i) {
            Turn turn;
            turn.set_parent(UINT64_C(7919) * i + r);
            compress.pack(Turn::Packed(turn).bytes());
        }
    }
    EXPECT_EQ(kRuns, keys.run_count());
    EXPECT_TRUE(keys.size() > 64);

    keys.freeze();
    for (int r = 0; r < kRuns; ++r) {
        auto run = keys.run(r);
        KeyStream stream(run.first, run.second);
        int count = 0;
        bool match = true;
        while (stream.next()) {
            Turn turn(stream.value());
            if (turn.parent() != UINT64_C(7919) * count + r) {
                match = false;
            }
            ++count;
        }
        EXPECT_EQ(kRecords, count);
        EXPECT_TRUE(match);
        EXPECT_TRUE(stream.empty());
    }
    keys.thaw();

    return test_result();
}
