#include "smp_rob.hpp"

namespace smp {

Result<void> ReorderBuffer::enqueue_expectation(SequenceNumber seq) {
    if (slots_.count(seq) > 0) {
        return Result<void>::failure(Error::make(ErrorKind::SequenceNumberInUse, seq));
    }
    queue_.push_back(seq);
    slots_.emplace(seq, std::nullopt);
    return Result<void>::success();
}

Result<bool> ReorderBuffer::received(Outcome outcome, SequenceNumber seq) {
    auto it = slots_.find(seq);
    if (it == slots_.end()) {
        return Result<bool>::failure(Error::make(ErrorKind::UnexpectedSequenceNumber, seq));
    }
    if (it->second.has_value()) {
        return Result<bool>::failure(Error::make(ErrorKind::DuplicateResponse, seq));
    }
    it->second = std::move(outcome);
    return Result<bool>::success(reachable(seq));
}

size_t ReorderBuffer::deliver(const DeliverFn& fn) {
    size_t delivered = 0;
    while (head_ready()) {
        const SequenceNumber seq = queue_.front();
        auto it = slots_.find(seq);
        Outcome outcome = std::move(*it->second);
        queue_.pop_front();
        slots_.erase(it);
        ++delivered;
        if (fn) {
            fn(seq, std::move(outcome));
        }
    }
    return delivered;
}

std::vector<std::pair<SequenceNumber, Outcome>> ReorderBuffer::take_completed() {
    std::vector<std::pair<SequenceNumber, Outcome>> taken;
    std::deque<SequenceNumber> waiting;
    for (SequenceNumber seq : queue_) {
        auto it = slots_.find(seq);
        if (it->second.has_value()) {
            taken.emplace_back(seq, std::move(*it->second));
            slots_.erase(it);
        } else {
            waiting.push_back(seq);
        }
    }
    queue_.swap(waiting);
    return taken;
}

// Every entry from the head up to and including seq has an outcome.
bool ReorderBuffer::reachable(SequenceNumber seq) const {
    for (SequenceNumber queued : queue_) {
        auto it = slots_.find(queued);
        if (it == slots_.end() || !it->second.has_value()) {
            return false;
        }
        if (queued == seq) {
            return true;
        }
    }
    return false;
}

bool ReorderBuffer::head_ready() const {
    if (queue_.empty()) {
        return false;
    }
    auto it = slots_.find(queue_.front());
    return it != slots_.end() && it->second.has_value();
}

} // namespace smp
