// -*- mode: c++ -*-

#ifndef COMPRESS_H
#define COMPRESS_H

#include <cassert>
#include <cstdint>
#include <vector>

#include <zstd.h>

#include "util.h"

// Encoding of the runs the search stores, one run per generation.
//
// A run is a sequence of fixed-size records of _Length_ bytes, in the
// order they were generated. Each record is stored relative to the
// one before it (the first one relative to all zero bytes):
//
//   <change mask> <the changed bytes, in order>
//
// where bit X of the change mask is set iff byte X differs from the
// previous record. Siblings are written next to each other and share
// the parent index and the position of any token that didn't move,
// so most records shrink to a few bytes.
//
// The delta coded bytes are then optionally cut into blocks of about
// 1MB that are zstd compressed one by one. A compressed block is
// preceded by its compressed size as a 4 byte little-endian integer.
// Records never straddle two blocks.

// The change mask of a record of _Length_ bytes. Masks of up to 7
// bits take one byte; wider masks spill the bits above 7 into a
// second byte, flagged by the top bit of the first.
template<int Length>
struct ChangeMask {
    static_assert(Length <= 15, "records are at most 15 bytes");

    static const uint8_t kMore = 0x80;

    static uint64_t decode(const uint8_t*& it) {
        uint64_t mask = *it++;
        if (Length > 7 && (mask & kMore)) {
            mask = (mask & ~kMore) | (uint64_t) *it++ << 7;
        }
        return mask;
    }

    template<class Emit>
    static void encode(uint64_t mask, Emit emit) {
        assert(mask <= mask_n_bits(Length));
        if (Length <= 7 || mask <= mask_n_bits(7)) {
            emit(mask);
            return;
        }
        emit((mask & mask_n_bits(7)) | kMore);
        emit(mask >> 7);
    }
};

static const int kBlockHeaderBytes = 4;

// Reads records of _Length_ bytes back from a run written by
// RecordCompressor with the same parameters.
template<int Length, bool Compress>
class RecordDecompressor {
public:
    // Does not take ownership of the range.
    RecordDecompressor(const uint8_t* begin, const uint8_t* end)
        : it_(begin),
          end_(Compress ? begin : end),
          raw_it_(begin),
          raw_end_(end) {
    }

    // Reads a record into _value_, which must still hold the
    // previous record (if any). Returns false at the end of the run.
    bool unpack(uint8_t value[Length]) {
        while (it_ == end_) {
            if (!Compress || !next_block()) {
                return false;
            }
        }
        for (uint64_t mask = ChangeMask<Length>::decode(it_); mask;
             mask &= mask - 1) {
            value[__builtin_ctzl(mask)] = *it_++;
        }
        return true;
    }

private:
    RecordDecompressor(const RecordDecompressor& other) = delete;
    RecordDecompressor& operator=(const RecordDecompressor& other) = delete;

    // Decompresses the next zstd block into block_.
    bool next_block() {
        if (raw_it_ == raw_end_) {
            return false;
        }
        if (raw_end_ - raw_it_ < kBlockHeaderBytes) {
            die("truncated block header");
        }
        uint64_t len = 0;
        for (int i = 0; i < kBlockHeaderBytes; ++i) {
            len |= (uint64_t) *raw_it_++ << (8 * i);
        }
        if (len > (uint64_t) (raw_end_ - raw_it_)) {
            die("truncated compressed block");
        }
        unsigned long long size = ZSTD_getFrameContentSize(raw_it_, len);
        if (size == ZSTD_CONTENTSIZE_ERROR ||
            size == ZSTD_CONTENTSIZE_UNKNOWN) {
            die("corrupted compressed block");
        }
        block_.resize(size);
        size_t res = ZSTD_decompress(block_.data(), size, raw_it_, len);
        if (ZSTD_isError(res)) {
            die(ZSTD_getErrorName(res));
        }
        raw_it_ += len;
        it_ = block_.data();
        end_ = it_ + res;
        return true;
    }

    // The delta coded bytes not yet read.
    const uint8_t* it_;
    const uint8_t* end_;
    // The compressed blocks not yet read.
    const uint8_t* raw_it_;
    const uint8_t* raw_end_;
    std::vector<uint8_t> block_;
};

// Appends records of _Length_ bytes to _output_ (anything with
// push_back and insert_back), delta coded and, if _Compress_ is set,
// zstd compressed. Anything still buffered is written out when the
// compressor is destroyed.
template<int Length, bool Compress, class Output>
class RecordCompressor {
public:
    explicit RecordCompressor(Output* output) : output_(output) {
    }

    ~RecordCompressor() {
        flush();
    }

    void pack(const uint8_t value[Length]) {
        uint64_t mask = 0;
        for (int j = 0; j < Length; ++j) {
            if (prev_[j] != value[j]) {
                mask |= UINT64_C(1) << j;
            }
        }
        ChangeMask<Length>::encode(mask, [this] (uint8_t byte) {
                pending_.push_back(byte);
            });
        for (int j = 0; j < Length; ++j) {
            if (prev_[j] != value[j]) {
                pending_.push_back(value[j]);
                prev_[j] = value[j];
            }
        }

        if (pending_.size() > kBlockSize) {
            flush();
        }
    }

    // Writes out the buffered records, as a block of their own if
    // compressing.
    void flush() {
        if (pending_.empty()) {
            return;
        }
        if (Compress) {
            write_block();
        } else {
            output_->insert_back(pending_.begin(), pending_.end());
        }
        pending_.clear();
    }

private:
    RecordCompressor(const RecordCompressor& other) = delete;
    RecordCompressor& operator=(const RecordCompressor& other) = delete;

    static const size_t kBlockSize = 1 << 20;

    void write_block() {
        compressed_.resize(ZSTD_compressBound(pending_.size()));
        size_t len = ZSTD_compress(compressed_.data(), compressed_.size(),
                                   pending_.data(), pending_.size(),
                                   1);
        if (ZSTD_isError(len)) {
            die(ZSTD_getErrorName(len));
        }
        for (int i = 0; i < kBlockHeaderBytes; ++i) {
            output_->push_back((len >> (8 * i)) & 0xff);
        }
        output_->insert_back(compressed_.begin(), compressed_.begin() + len);
    }

    uint8_t prev_[Length] = { 0 };
    // Delta coded records not yet written to output_.
    std::vector<uint8_t> pending_;
    std::vector<uint8_t> compressed_;
    Output* output_;
};

// A stream (see util.h) of the records of type T in a run. T must
// provide width_bytes() and bytes().
template<class T, bool Compress>
class RecordStream {
public:
    // Does not take ownership of the range.
    RecordStream(const uint8_t* begin, const uint8_t* end)
        : records_(begin, end) {
    }

    // The latest record read. Only valid after next() has returned
    // true.
    const T& value() const {
        return value_;
    }

    bool empty() const {
        return empty_;
    }

    bool next() {
        if (!records_.unpack(value_.bytes())) {
            empty_ = true;
        }
        return !empty_;
    }

private:
    RecordStream(const RecordStream& other) = delete;
    RecordStream& operator=(const RecordStream& other) = delete;

    T value_;
    bool empty_ = false;
    RecordDecompressor<T::width_bytes(), Compress> records_;
};

#endif // COMPRESS_H
