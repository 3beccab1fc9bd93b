#pragma once
/**
 * @file smp_rob.hpp
 * @brief Reorder buffer for pipelined SMP requests
 *
 * With several requests in flight, a transport may report completions in
 * any order. The reorder buffer holds early completions back until every
 * older request has completed, so callers observe results strictly in the
 * order the requests were issued.
 *
 *   enqueue_expectation(7), enqueue_expectation(8), enqueue_expectation(9)
 *   received(9)  -> false   (7 still empty, 9 buffered)
 *   received(7)  -> true    deliver() hands out 7, stops at 8
 *   received(8)  -> true    deliver() hands out 8, then the buffered 9
 *
 * received() answers for the number just filled: with 1 filled and 2
 * empty, received(3) is false even though 1 could be delivered.
 *
 * Ordering uses queue position only, never the numeric value, so
 * wraparound (..., 254, 255, 0, 1, ...) needs no special handling.
 *
 * Not thread-safe; the owning TransactionManager serializes every call.
 */

#include "smp.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace smp {

class ReorderBuffer {
public:
    using DeliverFn = std::function<void(SequenceNumber, Outcome&&)>;

    ReorderBuffer() = default;

    /**
     * @brief Append @p seq to the tail with an empty outcome slot
     *
     * Fails with ErrorKind::SequenceNumberInUse if @p seq is already queued.
     * The buffer is left unchanged on failure.
     */
    Result<void> enqueue_expectation(SequenceNumber seq);

    /**
     * @brief Fill the outcome slot of @p seq
     *
     * @return true when @p seq can now be delivered, i.e. every entry from
     *         the head up to and including @p seq has an outcome.
     *         Fails with ErrorKind::UnexpectedSequenceNumber if @p seq is not
     *         queued, or ErrorKind::DuplicateResponse if its slot is already
     *         filled. The buffer is left unchanged on failure.
     */
    Result<bool> received(Outcome outcome, SequenceNumber seq);

    /**
     * @brief Hand out every filled entry at the head, oldest first
     *
     * Stops at the first entry still waiting for its outcome. Each entry is
     * handed out once and then forgotten.
     *
     * @return Number of entries delivered
     */
    size_t deliver(const DeliverFn& fn);

    /**
     * @brief Remove every entry that has an outcome, wherever it sits
     *
     * Used when the owner shuts down and ordering no longer matters.
     * Entries still waiting stay queued in their original order.
     *
     * @return Removed entries in issuance order
     */
    std::vector<std::pair<SequenceNumber, Outcome>> take_completed();

    bool contains(SequenceNumber seq) const { return slots_.count(seq) > 0; }
    size_t pending_count() const { return queue_.size(); }
    bool empty() const { return queue_.empty(); }

    /// Sequence numbers in issuance order
    const std::deque<SequenceNumber>& queue() const { return queue_; }

private:
    std::deque<SequenceNumber> queue_;
    std::unordered_map<SequenceNumber, std::optional<Outcome>> slots_;

    bool head_ready() const;
    bool reachable(SequenceNumber seq) const;
};

} // namespace smp
