// -*- mode: c++ -*-

#ifndef UTIL_H
#define UTIL_H

#include <cstdint>
#include <cstdio>
#include <cstdlib>

// Returns a bitmask with the lowest n bits set to 1, all other bits
// set to 0. n must be less than 64.
constexpr uint64_t mask_n_bits(uint64_t n) {
    return (UINT64_C(1) << n) - 1;
}

// Reports an error in the storage layer that there is no way to
// recover from (out of disk, corrupted compressed data), and exits.
inline void die(const char* what) __attribute__((noreturn));
inline void die(const char* what) {
    fprintf(stderr, "fatal: %s\n", what);
    abort();
}

// Like die(), but with the errno description appended.
inline void die_errno(const char* what) __attribute__((noreturn));
inline void die_errno(const char* what) {
    perror(what);
    abort();
}

// Streams:
//
// Streams are a lazily computed sequence of records of a given
// type. Streams have the following interface:
//
// - empty() - Returns true if the sequence has been exhausted;
//   no operations other than calls to empty() or deallocation
//   should be done on an empty stream.
// - next() - Fetches the next record. Returns true if a record
//   was fetched, false otherwise. In the latter case, the stream
//   will be considered empty (with all the previously stated
//   restrictions).
// - value() - Returns a reference to the latest decoded record (may not be
//   called if no records have been read yet). Valid only until next
//   call to next().
//
// The generation runs of the search are read through streams; see
// RecordStream in compress.h.

#endif
