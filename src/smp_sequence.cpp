#include "smp_sequence.hpp"
#include <random>

namespace smp {

SequenceNumberAllocator SequenceNumberAllocator::random() {
    std::random_device rd;
    std::uniform_int_distribution<int> dist(0, 255);
    return SequenceNumberAllocator(static_cast<SequenceNumber>(dist(rd)));
}

} // namespace smp
