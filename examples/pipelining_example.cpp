/*
  Example: Pipelined SMP requests against a simulated device

  This demonstrates how to use the transaction manager for:
  - Keeping several requests in flight at once
  - Receiving callbacks in request order even when the device answers
    out of order
  - Reading protocol errors ("rc" and SMPv2 "err") from responses

  The simulated device runs every request on its own thread and answers
  after a random delay, so completions arrive in arbitrary order.
*/

#include "smp_manager.hpp"
#include "smp_packet.hpp"
#include "smp_rc.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

// Simulated MCUmgr device behind a UDP-style datagram transport
class SimulatedDevice : public smp::Transport {
public:
  ~SimulatedDevice() override {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    for (auto& t : threads_) {
      if (t.joinable()) t.join();
    }
  }

  smp::Scheme scheme() const override { return smp::Scheme::Udp; }

  void send(const std::vector<uint8_t>& data, std::chrono::seconds timeout,
            smp::TransportCompletion completion) override {
    (void)timeout;
    int delay_ms = 0;
    {
      std::lock_guard<std::mutex> lock(rng_mutex_);
      delay_ms = std::uniform_int_distribution<int>(1, 40)(rng_);
    }

    std::lock_guard<std::mutex> lock(threads_mutex_);
    threads_.emplace_back([this, data, delay_ms, completion]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
      completion(handle(data));
    });
  }

private:
  smp::Outcome handle(const std::vector<uint8_t>& data) {
    auto request = smp::decode_packet(smp::Framing::Datagram, data);
    if (!request.ok) {
      return smp::Outcome::failure(
          smp::Error::make(smp::ErrorKind::SendFailed, 0, "device rejected packet"));
    }
    const smp::Header& h = request.value.header;

    smp::cbor::Map reply;
    if (h.group == smp::Group::kOs && h.command_id == 0) {
      // Echo
      auto d = request.value.payload.find("d");
      reply["r"] = d != request.value.payload.end() ? d->second : smp::cbor::Value("");
    } else if (h.group == smp::Group::kImage && h.command_id == 0) {
      reply["images"] = smp::cbor::Array{
        smp::cbor::Map{{"slot", 0}, {"version", "1.2.0"}, {"active", true}},
        smp::cbor::Map{{"slot", 1}, {"version", "1.3.0"}, {"pending", true}}
      };
    } else if (h.group == smp::Group::kFileSystem) {
      reply["err"] = smp::cbor::Map{{"group", smp::Group::kFileSystem}, {"rc", 3}};
    } else {
      reply["rc"] = static_cast<int>(smp::rc::Code::Unsupported);
    }

    const smp::Operation op = h.op == smp::Operation::Read ? smp::Operation::ReadResponse
                                                           : smp::Operation::WriteResponse;
    auto packet = smp::build_packet(smp::Framing::Datagram, smp::Version::V2, op, 0,
                                    h.group, h.sequence, h.command_id, reply);
    if (!packet.ok) {
      return smp::Outcome::failure(packet.error);
    }

    // What a real transport does with the bytes it receives
    auto response = smp::decode_response(scheme(), packet.value);
    if (!response.ok) {
      return smp::Outcome::failure(response.error);
    }
    return smp::Outcome::success(std::move(response.value));
  }

  std::mutex rng_mutex_;
  std::mt19937 rng_{std::random_device{}()};
  std::mutex threads_mutex_;
  std::vector<std::thread> threads_;
};

int main() {
  std::cout << "=== SMP Pipelining Example ===\n\n";

  SimulatedDevice device;

  std::mutex out_mutex;
  auto config = smp::ManagerConfig::with_logging(
      [&out_mutex](smp::LogLevel level, const std::string& msg) {
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << "  [" << smp::log_level_name(level) << "] " << msg << "\n";
      },
      smp::LogLevel::Info);

  std::atomic<int> completed{0};
  {
    smp::TransactionManager manager(device, config);

    std::cout << "Scheme: " << smp::scheme_name(manager.scheme())
              << ", MTU: " << manager.mtu()
              << ", version: " << smp::version_name(manager.version()) << "\n\n";

    auto print = [&out_mutex, &completed](const char* what) {
      return [&out_mutex, &completed, what](const smp::Outcome& outcome) {
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << what << " (seq "
                  << (outcome.response ? static_cast<int>(outcome.response->header.sequence) : -1)
                  << "): ";
        if (outcome.ok()) {
          std::cout << smp::cbor::diagnostic(outcome.response->payload) << "\n";
        } else {
          std::cout << "error: " << outcome.error.description() << "\n";
        }
        ++completed;
      };
    };

    // 1. Several requests in flight at once
    std::cout << "1. Sending 6 requests without waiting...\n";
    manager.send(smp::Group::os(), smp::Operation::Write, 0,
                 smp::cbor::Map{{"d", "hello"}}, print("Echo #1"));
    manager.send(smp::Group::image(), smp::Operation::Read, 0, {}, print("Image state"));
    manager.send(smp::Group::os(), smp::Operation::Write, 0,
                 smp::cbor::Map{{"d", "world"}}, print("Echo #2"));
    manager.send(smp::Group::filesystem(), smp::Operation::Read, 0,
                 smp::cbor::Map{{"name", "/lfs/missing.txt"}, {"off", 0}}, print("File read"));
    manager.send(smp::Group::shell(), smp::Operation::Write, 0,
                 smp::cbor::Map{{"argv", smp::cbor::Array{"kernel", "uptime"}}}, print("Shell"));
    manager.send(smp::Group::os(), smp::Operation::Write, 0,
                 smp::cbor::Map{{"d", "!"}}, print("Echo #3"));

    // 2. MTU negotiation
    std::cout << "\n2. MTU\n";
    auto same = manager.set_mtu(manager.mtu());
    if (!same.ok) {
      std::lock_guard<std::mutex> lock(out_mutex);
      std::cout << "  rejected: " << same.error.description() << "\n";
    }
    auto lowered = manager.set_mtu(512);
    {
      std::lock_guard<std::mutex> lock(out_mutex);
      std::cout << "  set_mtu(512): " << (lowered.ok ? "ok" : lowered.error.description()) << "\n\n";
    }

    std::cout << "3. Waiting for responses (callbacks arrive in request order)...\n";
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (completed < 6 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  std::cout << "\nCompleted " << completed.load() << " of 6 requests\n";
  return completed.load() == 6 ? 0 : 1;
}
