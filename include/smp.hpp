#ifndef SMP_HPP
#define SMP_HPP

/**
 * @file smp.hpp
 * @brief Simple Management Protocol (SMP) client core types
 *
 * SMP is the request/response protocol spoken by MCUmgr-capable firmware
 * for image management, file system access, statistics, settings, shell
 * and OS commands. Every exchange is one request packet and one response
 * packet, correlated by an 8-bit sequence number.
 *
 * PACKET FORMAT (both framings):
 *   Byte 0     : protocol version (0 = SMPv1, 1 = SMPv2)
 *   Byte 1     : operation (0 read, 1 read rsp, 2 write, 3 write rsp)
 *   Byte 2     : flags
 *   Bytes 3-4  : payload length, big-endian
 *   Bytes 5-6  : command group, big-endian
 *   Byte 7     : sequence number
 *   Byte 8     : command id
 *
 * FRAMING:
 * - Datagram (BLE, UDP): [header][CBOR payload map]
 * - CoAP (CoAP over BLE/UDP): CBOR payload map with the header stored as a
 *   byte string under the reserved key "_h"
 *
 * RESPONSES:
 * - SMPv1 responses report failure with "rc": <code>
 * - SMPv2 responses report group errors with "err": {"group": g, "rc": r}
 *
 * High-level layout:
 * 1) Constants, versions, operations, schemes
 * 2) Command groups
 * 3) Errors and results
 * 4) Header, response and outcome models
 * 5) Logging and configuration
 * 6) Transport abstraction
 */

#include "smp_cbor.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace smp {

// ============================================================================
// 1) Constants, versions, operations, schemes
// ============================================================================

/// Valid values are 0..255; every request gets the next one, wrapping around.
using SequenceNumber = uint8_t;

/// Header size on the wire
constexpr size_t kHeaderSize = 9;

/// Reserved payload key carrying the header in CoAP framing
constexpr const char* kHeaderKey = "_h";

/// CoAP resource the management endpoint is served on
constexpr const char* kCoapPath = "/omgr";

/// Time allowed for a send to complete when no timeout is given
constexpr std::chrono::seconds kDefaultSendTimeout{40};

/// Time to wait for a command that the firmware answers immediately
constexpr std::chrono::seconds kFastTimeout{5};

/// Accepted MTU range (inclusive)
constexpr int kMinMtu = 73;
constexpr int kMaxMtu = 1024;

/// The payload length field is 16 bits wide
constexpr size_t kMaxPayloadLength = 0xFFFF;

enum class Version : uint8_t {
  V1 = 0,  ///< SMPv1, "rc"-only error reporting
  V2 = 1   ///< SMPv2, adds group-scoped "err" maps
};

/// Newest revision; used until a response says otherwise
constexpr Version kLatestVersion = Version::V2;

enum class Operation : uint8_t {
  Read          = 0,
  ReadResponse  = 1,
  Write         = 2,
  WriteResponse = 3
};

inline bool is_response(Operation op) {
  return op == Operation::ReadResponse || op == Operation::WriteResponse;
}

/// Transport families; the scheme selects framing and default MTU
enum class Scheme : uint8_t {
  Ble,
  Udp,
  CoapBle,
  CoapUdp
};

enum class Framing : uint8_t {
  Datagram,  ///< header followed by the payload
  Coap       ///< header embedded in the payload under kHeaderKey
};

inline bool is_coap(Scheme s) {
  return s == Scheme::CoapBle || s == Scheme::CoapUdp;
}

inline Framing framing_for(Scheme s) {
  return is_coap(s) ? Framing::Coap : Framing::Datagram;
}

const char* version_name(Version v);
const char* operation_name(Operation op);
const char* scheme_name(Scheme s);

// ============================================================================
// 2) Command groups
// ============================================================================

/**
 * @brief Command group identifier
 *
 * Well-known groups get their own kind; every other 16-bit value is kept
 * as Kind::Custom with the raw number. Group(raw).raw() == raw for all
 * 65536 values.
 */
class Group {
public:
  enum class Kind : uint8_t {
    Os,          ///< 0  - default/OS management
    Image,       ///< 1  - image management
    Statistics,  ///< 2  - statistics
    Settings,    ///< 3  - settings (config)
    Logs,        ///< 4  - log management
    Crash,       ///< 5  - crash test
    Split,       ///< 6  - split image
    Run,         ///< 7  - run test
    FileSystem,  ///< 8  - file system
    Shell,       ///< 9  - shell
    Basic,       ///< 63 - Zephyr basic (storage erase)
    PerUser,     ///< 64 - first user-defined group
    Suit,        ///< 66 - SUIT manifests
    Custom       ///< anything else
  };

  static constexpr uint16_t kOs = 0;
  static constexpr uint16_t kImage = 1;
  static constexpr uint16_t kStatistics = 2;
  static constexpr uint16_t kSettings = 3;
  static constexpr uint16_t kLogs = 4;
  static constexpr uint16_t kCrash = 5;
  static constexpr uint16_t kSplit = 6;
  static constexpr uint16_t kRun = 7;
  static constexpr uint16_t kFileSystem = 8;
  static constexpr uint16_t kShell = 9;
  static constexpr uint16_t kBasic = 63;
  static constexpr uint16_t kPerUser = 64;
  static constexpr uint16_t kSuit = 66;

  explicit Group(uint16_t raw = kOs);

  static Group os() { return Group(kOs); }
  static Group image() { return Group(kImage); }
  static Group statistics() { return Group(kStatistics); }
  static Group settings() { return Group(kSettings); }
  static Group logs() { return Group(kLogs); }
  static Group crash() { return Group(kCrash); }
  static Group split() { return Group(kSplit); }
  static Group run() { return Group(kRun); }
  static Group filesystem() { return Group(kFileSystem); }
  static Group shell() { return Group(kShell); }
  static Group basic() { return Group(kBasic); }
  static Group per_user() { return Group(kPerUser); }
  static Group suit() { return Group(kSuit); }
  static Group custom(uint16_t raw) { return Group(raw); }

  Kind kind() const { return kind_; }
  uint16_t raw() const { return raw_; }
  bool is_custom() const { return kind_ == Kind::Custom; }

  /// "Image", "FileSystem", ... or "Custom(70)"
  std::string name() const;

  bool operator==(const Group& o) const { return raw_ == o.raw_; }
  bool operator!=(const Group& o) const { return raw_ != o.raw_; }

private:
  Kind kind_;
  uint16_t raw_;
};

// ============================================================================
// 3) Errors and results
// ============================================================================

enum class ErrorKind : uint8_t {
  None,
  // Configuration
  MtuOutOfRange,
  MtuUnchanged,
  // Protocol
  ReturnCode,
  GroupReturnCode,
  PayloadTooLarge,
  // Correlation
  SequenceNumberInUse,
  UnexpectedSequenceNumber,
  DuplicateResponse,
  // Transport
  Timeout,
  Disconnected,
  SendFailed,
  MalformedResponse
};

enum class ErrorCategory : uint8_t {
  None,
  Configuration,  ///< rejected synchronously, never reaches the transport
  Protocol,       ///< decoded from an otherwise successful exchange
  Correlation,    ///< sequence number bookkeeping fault
  Transport       ///< reported by the transport
};

/**
 * @brief Error value carried by results and outcomes
 *
 * @c code holds the numeric value relevant to the kind: the return code for
 * protocol errors, the MTU for configuration errors, the sequence number for
 * correlation errors.
 */
struct Error {
  ErrorKind kind{ErrorKind::None};
  uint64_t code{0};
  std::optional<uint16_t> group;
  std::string detail;

  static Error none() { return Error{}; }
  static Error make(ErrorKind kind, uint64_t code = 0, std::string detail = {}) {
    Error e;
    e.kind = kind;
    e.code = code;
    e.detail = std::move(detail);
    return e;
  }

  bool ok() const { return kind == ErrorKind::None; }
  explicit operator bool() const { return kind != ErrorKind::None; }

  ErrorCategory category() const;

  /// Human-readable text, e.g. "No memory" or "MTU Value already set to 524"
  std::string description() const;
};

const char* error_kind_name(ErrorKind kind);

template<typename T>
struct Result {
  bool ok{false};
  T value{};
  Error error{};

  static Result success(T v) {
    Result r; r.ok = true; r.value = std::move(v); return r;
  }

  static Result failure(Error e) {
    Result r; r.ok = false; r.error = std::move(e); return r;
  }
};

template<>
struct Result<void> {
  bool ok{false};
  Error error{};

  static Result success() {
    Result r; r.ok = true; return r;
  }

  static Result failure(Error e) {
    Result r; r.ok = false; r.error = std::move(e); return r;
  }
};

// ============================================================================
// 4) Header, response and outcome models
// ============================================================================

struct Header {
  uint8_t version{static_cast<uint8_t>(kLatestVersion)};
  Operation op{Operation::Read};
  uint8_t flags{0};
  uint16_t length{0};
  uint16_t group{0};
  SequenceNumber sequence{0};
  uint8_t command_id{0};

  bool operator==(const Header& o) const {
    return version == o.version && op == o.op && flags == o.flags &&
           length == o.length && group == o.group &&
           sequence == o.sequence && command_id == o.command_id;
  }
  bool operator!=(const Header& o) const { return !(*this == o); }
};

/// Decoded response: header plus payload map (without the "_h" key)
struct Response {
  Header header{};
  cbor::Map payload;

  /// Value of "rc" if present and an unsigned integer
  std::optional<uint64_t> return_code() const;

  /// Group and code of an SMPv2 "err" map, if present
  std::optional<std::pair<uint16_t, uint64_t>> group_return_code() const;

  /// Resolved protocol error; Error::none() if the device reported success
  Error error() const;

  bool is_success() const { return error().ok(); }
};

/**
 * @brief Result of one request as seen by the caller
 *
 * A transport failure has no response. A protocol error keeps the decoded
 * response next to the resolved error.
 */
struct Outcome {
  std::optional<Response> response;
  Error error{};

  static Outcome success(Response r) {
    Outcome o; o.response = std::move(r); return o;
  }

  static Outcome failure(Error e) {
    Outcome o; o.error = std::move(e); return o;
  }

  bool ok() const { return response.has_value() && error.ok(); }
};

/// Invoked exactly once per request
using ResponseCallback = std::function<void(const Outcome&)>;

// ============================================================================
// 5) Logging and configuration
// ============================================================================

enum class LogLevel : uint8_t {
  Debug = 0,
  Verbose,
  Info,
  Application,
  Warning,
  Error
};

const char* log_level_name(LogLevel level);

using LogCallback = std::function<void(LogLevel, const std::string&)>;

struct ManagerConfig {
  std::chrono::seconds default_timeout{kDefaultSendTimeout};
  std::optional<int> mtu;                       ///< scheme default when empty
  Version initial_version{kLatestVersion};
  std::optional<SequenceNumber> initial_sequence; ///< random when empty

  LogCallback log_callback;
  LogLevel min_log_level{LogLevel::Info};

  ManagerConfig() = default;

  /**
   * @brief Config with a fixed first sequence number
   */
  static ManagerConfig deterministic(SequenceNumber first) {
    ManagerConfig cfg;
    cfg.initial_sequence = first;
    return cfg;
  }

  /**
   * @brief Config forwarding everything down to @p level to @p cb
   */
  static ManagerConfig with_logging(LogCallback cb, LogLevel level = LogLevel::Verbose) {
    ManagerConfig cfg;
    cfg.log_callback = std::move(cb);
    cfg.min_log_level = level;
    return cfg;
  }
};

// ============================================================================
// 6) Transport abstraction
// ============================================================================

/// Completion handed to Transport::send; must be invoked exactly once
using TransportCompletion = std::function<void(Outcome)>;

// The transport owns link setup, chunking and timeouts. send() must not
// block waiting for the response; the completion may run on any thread.
class Transport {
public:
  virtual ~Transport() = default;

  virtual Scheme scheme() const = 0;

  // Deliver @p data to the device. Later, invoke @p completion once with
  // the decoded response (see decode_response) or with a transport error.
  virtual void send(const std::vector<uint8_t>& data,
                    std::chrono::seconds timeout,
                    TransportCompletion completion) = 0;
};

/// Default MTU for a transport scheme
int default_mtu(Scheme scheme);

// Byte helpers shared by the packet codec
namespace codec {
  // Header length and group fields are big-endian
  inline void put_be16(uint8_t* p, uint16_t x) {
    p[0] = static_cast<uint8_t>(x >> 8);
    p[1] = static_cast<uint8_t>(x & 0xFF);
  }
  inline uint16_t rd_be16(const uint8_t* p){ return static_cast<uint16_t>((p[0] << 8) | p[1]); }
}

} // namespace smp

#endif // SMP_HPP
