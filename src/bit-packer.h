// -*- mode: c++ -*-

#ifndef BIT_PACKER_H
#define BIT_PACKER_H

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>

#include "util.h"

// A fixed length byte buffer of (at least) _Bits_ bits, that fields
// of arbitrary width are written to / read from in sequence. Used
// for the records that the search stores for every generation.
//
//   Packer<32> data;
//   Packer<32>::Context pack;
//   data.deposit(x, 16, &pack);
//   data.deposit(y, 16, &pack);
//
//   Packer<32>::Context unpack;
//   data.extract(x, 16, &unpack);
//   data.extract(y, 16, &unpack);
//
// Fields are stored least significant bit first, and may straddle
// byte boundaries. Unused bits at the end are always 0, so two
// buffers holding the same fields compare equal byte by byte.
template<size_t Bits>
struct Packer {
    // Size of the serialized data.
    static const int Bytes = (Bits + 7) / 8;

    uint8_t bytes_[Bytes] = { 0 };

    // The position of the next field, in bits from the start of
    // bytes_.
    struct Context {
        size_t at_ = 0;
    };

    // Stores the lowest _width_ bits of _data_ as the next field.
    // The buffer must not have been written to past the current
    // position.
    template<typename T>
    void deposit(T data, size_t width, Context* context) {
        assert(width < 64);
        assert(context->at_ + width <= Bits);
        uint64_t value = (uint64_t) data & mask_n_bits(width);
        size_t at = context->at_;
        for (size_t left = width; left; ) {
            size_t offset = at % 8;
            size_t n = std::min(left, 8 - offset);
            bytes_[at / 8] |= (value & mask_n_bits(n)) << offset;
            value >>= n;
            at += n;
            left -= n;
        }
        context->at_ = at;
    }

    // Reads the next field of _width_ bits into _data_.
    template<typename T>
    void extract(T& data, size_t width, Context* context) const {
        assert(width < 64);
        assert(context->at_ + width <= Bits);
        uint64_t value = 0;
        size_t at = context->at_;
        for (size_t done = 0; done < width; ) {
            size_t offset = at % 8;
            size_t n = std::min(width - done, 8 - offset);
            value |= ((uint64_t) (bytes_[at / 8] >> offset) &
                      mask_n_bits(n)) << done;
            at += n;
            done += n;
        }
        context->at_ = at;
        data = value;
    }
};

#endif // BIT_PACKER_H
