#pragma once
/**
 * @file smp_manager.hpp
 * @brief Pipelined SMP transaction manager
 *
 * The manager turns (group, operation, command id, payload) into a request
 * packet, hands it to the transport and routes the eventual completion back
 * to the caller. Any number of requests (up to 256) may be in flight; their
 * callbacks fire exactly once each, in the order the requests were sent,
 * whatever order the transport completes them in.
 *
 * Flow per request:
 *   1. allocate sequence number            (SequenceNumberAllocator)
 *   2. build packet with current version   (build_packet)
 *   3. register expectation                (ReorderBuffer::enqueue_expectation)
 *   4. Transport::send
 *   5. on completion: ReorderBuffer::received, then deliver every entry
 *      that is now in order; a delivered response updates the protocol
 *      version and has its return code resolved before the callback runs
 *
 * Correlation faults (a completion for a sequence number the buffer does not
 * know, or a second completion for the same request) are handed straight to
 * that request's callback with the fault as error, outside the normal order.
 * A late completion from an earlier request whose sequence number has since
 * been reissued counts as a duplicate and leaves the new request untouched.
 *
 * Destroying the manager delivers every outcome already buffered behind an
 * unanswered request, out of order. Requests still unanswered complete
 * later through the transport, straight to their callbacks.
 *
 * Thread model: send() and transport completions may run on any threads.
 * Callbacks are never invoked with the internal lock held, so a callback may
 * call send() again.
 */

#include "smp.hpp"
#include "smp_rob.hpp"
#include "smp_sequence.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace smp {

class TransactionManager {
public:
    /**
     * @brief Construct a manager for one device connection
     * @param transport Transport used for every request; must outlive the manager
     * @param config Timeouts, MTU override, logging
     */
    explicit TransactionManager(Transport& transport, ManagerConfig config = ManagerConfig());

    ~TransactionManager();

    // Non-copyable
    TransactionManager(const TransactionManager&) = delete;
    TransactionManager& operator=(const TransactionManager&) = delete;

    // ========================================================================
    // Requests
    // ========================================================================

    /**
     * @brief Send a request
     * @param group Command group
     * @param op Read or Write
     * @param flags Header flags
     * @param command_id Command id within the group
     * @param payload CBOR payload map; "_h" is reserved
     * @param timeout Passed through to the transport
     * @param on_complete Invoked exactly once with the outcome
     */
    void send(Group group, Operation op, uint8_t flags, uint8_t command_id,
              const cbor::Map& payload, std::chrono::seconds timeout,
              ResponseCallback on_complete);

    /**
     * @brief Send a request with flags 0 and the configured default timeout
     */
    void send(Group group, Operation op, uint8_t command_id,
              const cbor::Map& payload, ResponseCallback on_complete);

    // ========================================================================
    // State
    // ========================================================================

    /**
     * @brief Change the MTU
     *
     * Fails with ErrorKind::MtuOutOfRange outside kMinMtu..kMaxMtu and with
     * ErrorKind::MtuUnchanged if @p mtu is the current value.
     */
    Result<void> set_mtu(int mtu);

    int mtu() const;

    /// Protocol version used for the next request
    Version version() const;

    Scheme scheme() const { return transport_.scheme(); }

    /// Requests sent whose callback has not run yet
    size_t pending_count() const;

    /// Sequence number the next request will use
    SequenceNumber next_sequence_number() const;

    const ManagerConfig& config() const;

    Transport& transport() { return transport_; }

private:
    struct PendingRequest {
        ResponseCallback callback;
        Group group;
        Operation op{Operation::Read};
        uint8_t command_id{0};
        // Distinguishes reuses of the same sequence number after wraparound
        uint64_t generation{0};
    };

    struct ReadyEntry {
        SequenceNumber sequence{0};
        PendingRequest request;
        Outcome outcome;
    };

    // Everything completions need; shared with in-flight completion
    // handlers through weak references.
    struct State {
        State(ManagerConfig cfg, Scheme scheme);

        const ManagerConfig config;

        mutable std::mutex mutex;
        SequenceNumberAllocator sequence;
        ReorderBuffer rob;
        std::unordered_map<SequenceNumber, PendingRequest> requests;
        std::deque<ReadyEntry> ready;
        bool draining{false};
        uint64_t issued{0};
        Version version;
        int mtu;

        bool should_log(LogLevel level) const;
        void log(LogLevel level, const std::string& message) const;

        void complete(SequenceNumber seq, uint64_t generation, Outcome outcome,
                      const ResponseCallback& fallback);
        void drain(std::unique_lock<std::mutex>& lock);
    };

    Transport& transport_;
    std::shared_ptr<State> state_;
};

} // namespace smp
