#include "smp_manager.hpp"
#include "smp_packet.hpp"
#include "smp_rc.hpp"
#include <sstream>
#include <vector>

namespace smp {

namespace {

// "(Version: SMPv2, Group: OS, seq: 7, ID: 0)"
std::string request_tag(Version version, const Group& group, SequenceNumber seq, uint8_t command_id) {
    std::ostringstream oss;
    oss << "(Version: " << version_name(version)
        << ", Group: " << group.name()
        << ", seq: " << static_cast<int>(seq)
        << ", ID: " << static_cast<int>(command_id) << ")";
    return oss.str();
}

// Unknown wire values fall back to SMPv1, which every device understands.
Version version_from_wire(uint8_t raw) {
    return raw == static_cast<uint8_t>(Version::V2) ? Version::V2 : Version::V1;
}

bool mtu_in_range(int mtu) {
    return mtu >= kMinMtu && mtu <= kMaxMtu;
}

} // namespace

// ============================================================================
// State
// ============================================================================

TransactionManager::State::State(ManagerConfig cfg, Scheme scheme)
    : config(std::move(cfg)),
      sequence(config.initial_sequence ? SequenceNumberAllocator(*config.initial_sequence)
                                       : SequenceNumberAllocator::random()),
      version(config.initial_version),
      mtu(config.mtu && mtu_in_range(*config.mtu) ? *config.mtu : default_mtu(scheme)) {
}

bool TransactionManager::State::should_log(LogLevel level) const {
    return config.log_callback && level >= config.min_log_level;
}

void TransactionManager::State::log(LogLevel level, const std::string& message) const {
    if (should_log(level)) {
        config.log_callback(level, message);
    }
}

void TransactionManager::State::complete(SequenceNumber seq, uint64_t generation,
                                         Outcome outcome, const ResponseCallback& fallback) {
    std::unique_lock<std::mutex> lock(mutex);

    Result<bool> accepted;
    auto current = requests.find(seq);
    if (current != requests.end() && current->second.generation != generation) {
        // Sequence number reissued since this request was sent
        accepted = Result<bool>::failure(Error::make(ErrorKind::DuplicateResponse, seq));
    } else {
        accepted = rob.received(outcome, seq);
    }
    if (!accepted.ok) {
        lock.unlock();
        log(LogLevel::Error, accepted.error.description());
        // Not part of the ordered stream; report straight to the request.
        outcome.error = accepted.error;
        if (fallback) {
            fallback(outcome);
        }
        return;
    }

    if (!accepted.value) {
        // Buffered behind an older request
        return;
    }

    rob.deliver([this](SequenceNumber s, Outcome&& o) {
        ReadyEntry entry;
        entry.sequence = s;
        entry.outcome = std::move(o);
        auto it = requests.find(s);
        if (it != requests.end()) {
            entry.request = std::move(it->second);
            requests.erase(it);
        }
        ready.push_back(std::move(entry));
    });

    drain(lock);
}

// Only one thread drains at a time so callbacks keep issuance order even
// when completions race. Callbacks run with the lock released.
void TransactionManager::State::drain(std::unique_lock<std::mutex>& lock) {
    if (draining) {
        return;
    }
    draining = true;

    while (!ready.empty()) {
        ReadyEntry entry = std::move(ready.front());
        ready.pop_front();

        LogLevel level = LogLevel::Verbose;
        std::string message;

        if (entry.outcome.response) {
            const Response& response = *entry.outcome.response;
            version = version_from_wire(response.header.version);
            if (entry.outcome.error.ok()) {
                entry.outcome.error = response.error();
            }
            if (entry.outcome.error) {
                level = LogLevel::Warning;
            }
            if (should_log(level)) {
                message = "Response " +
                          request_tag(version_from_wire(response.header.version), entry.request.group,
                                      entry.sequence, entry.request.command_id) +
                          ": " + cbor::diagnostic(response.payload);
                if (entry.outcome.error) {
                    message += " -> " + entry.outcome.error.description();
                }
            }
        } else {
            level = LogLevel::Error;
            if (should_log(level)) {
                message = std::string(operation_name(entry.request.op)) + " request " +
                          request_tag(version, entry.request.group, entry.sequence,
                                      entry.request.command_id) +
                          " failed: " + entry.outcome.error.description();
            }
        }

        lock.unlock();
        try {
            if (!message.empty()) {
                log(level, message);
            }
            if (entry.request.callback) {
                entry.request.callback(entry.outcome);
            }
        } catch (...) {
            lock.lock();
            draining = false;
            throw;
        }
        lock.lock();
    }

    draining = false;
}

// ============================================================================
// TransactionManager
// ============================================================================

TransactionManager::TransactionManager(Transport& transport, ManagerConfig config)
    : transport_(transport),
      state_(std::make_shared<State>(std::move(config), transport.scheme())) {
    if (state_->config.mtu && !mtu_in_range(*state_->config.mtu)) {
        state_->log(LogLevel::Warning,
                    Error::make(ErrorKind::MtuOutOfRange,
                                static_cast<uint64_t>(static_cast<int64_t>(*state_->config.mtu)))
                        .description() +
                    "; using " + std::to_string(state_->mtu));
    }
}

// Outcomes already buffered are handed out now. Requests still waiting are
// not cancelled; their completions invoke the caller's callback directly
// once the state is gone.
TransactionManager::~TransactionManager() {
    std::vector<ReadyEntry> orphaned;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        for (auto& done : state_->rob.take_completed()) {
            ReadyEntry entry;
            entry.sequence = done.first;
            entry.outcome = std::move(done.second);
            auto it = state_->requests.find(done.first);
            if (it != state_->requests.end()) {
                entry.request = std::move(it->second);
                state_->requests.erase(it);
            }
            orphaned.push_back(std::move(entry));
        }
    }

    for (auto& entry : orphaned) {
        if (entry.outcome.response && entry.outcome.error.ok()) {
            entry.outcome.error = entry.outcome.response->error();
        }
        if (entry.request.callback) {
            entry.request.callback(entry.outcome);
        }
    }
}

void TransactionManager::send(Group group, Operation op, uint8_t flags, uint8_t command_id,
                              const cbor::Map& payload, std::chrono::seconds timeout,
                              ResponseCallback on_complete) {
    std::shared_ptr<State> state = state_;
    const Scheme scheme = transport_.scheme();

    SequenceNumber seq = 0;
    uint64_t generation = 0;
    Version version = Version::V1;
    Error failure;
    std::vector<uint8_t> packet;

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        seq = state->sequence.next();
        version = state->version;

        auto built = build_packet(framing_for(scheme), version, op, flags, group.raw(),
                                  seq, command_id, payload);
        if (!built.ok) {
            failure = built.error;
        } else {
            auto expected = state->rob.enqueue_expectation(seq);
            if (!expected.ok) {
                failure = expected.error;
            } else {
                PendingRequest request;
                request.callback = on_complete;
                request.group = group;
                request.op = op;
                request.command_id = command_id;
                request.generation = generation = ++state->issued;
                state->requests[seq] = std::move(request);
                packet = std::move(built.value);
            }
        }
    }

    if (failure) {
        state->log(LogLevel::Error, std::string("Unable to send ") + operation_name(op) +
                                        " command " + request_tag(version, group, seq, command_id) +
                                        ": " + failure.description());
        if (on_complete) {
            on_complete(Outcome::failure(failure));
        }
        return;
    }

    if (state->should_log(LogLevel::Verbose)) {
        state->log(LogLevel::Verbose, std::string("Sending ") + operation_name(op) + " command " +
                                          request_tag(version, group, seq, command_id) + ": " +
                                          cbor::diagnostic(payload));
    }

    std::weak_ptr<State> weak = state_;
    transport_.send(packet, timeout, [weak, seq, generation, on_complete](Outcome outcome) {
        if (auto live = weak.lock()) {
            live->complete(seq, generation, std::move(outcome), on_complete);
        } else if (on_complete) {
            on_complete(outcome);
        }
    });
}

void TransactionManager::send(Group group, Operation op, uint8_t command_id,
                              const cbor::Map& payload, ResponseCallback on_complete) {
    send(group, op, 0, command_id, payload, state_->config.default_timeout, std::move(on_complete));
}

Result<void> TransactionManager::set_mtu(int mtu) {
    int previous = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!mtu_in_range(mtu)) {
            return Result<void>::failure(Error::make(
                ErrorKind::MtuOutOfRange, static_cast<uint64_t>(static_cast<int64_t>(mtu))));
        }
        if (mtu == state_->mtu) {
            return Result<void>::failure(
                Error::make(ErrorKind::MtuUnchanged, static_cast<uint64_t>(mtu)));
        }
        previous = state_->mtu;
        state_->mtu = mtu;
    }
    state_->log(LogLevel::Info, "MTU set to " + std::to_string(mtu) +
                                    " (was " + std::to_string(previous) + ")");
    return Result<void>::success();
}

int TransactionManager::mtu() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->mtu;
}

Version TransactionManager::version() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->version;
}

size_t TransactionManager::pending_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->rob.pending_count() + state_->ready.size();
}

SequenceNumber TransactionManager::next_sequence_number() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->sequence.peek();
}

const ManagerConfig& TransactionManager::config() const {
    return state_->config;
}

} // namespace smp
