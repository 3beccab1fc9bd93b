#pragma once
/**
 * @file smp_sequence.hpp
 * @brief Sequence number allocation
 *
 * Each request carries an 8-bit sequence number that the device echoes in
 * its response. Numbers are handed out in increasing order and wrap from
 * 255 to 0. The first number is random so that a restarted client does not
 * collide with requests the device may still remember.
 *
 * Not thread-safe; the owner serializes access.
 */

#include "smp.hpp"

namespace smp {

class SequenceNumberAllocator {
public:
    /// Start at @p first
    explicit SequenceNumberAllocator(SequenceNumber first) : next_(first) {}

    /// Start at a random value
    static SequenceNumberAllocator random();

    /// Return the current value and advance, wrapping 255 -> 0
    SequenceNumber next() {
        const SequenceNumber seq = next_;
        next_ = static_cast<SequenceNumber>(next_ + 1);
        return seq;
    }

    /// Value the next call to next() will return
    SequenceNumber peek() const { return next_; }

private:
    SequenceNumber next_;
};

} // namespace smp
