#include "smp.hpp"
#include "smp_rc.hpp"
#include <sstream>

namespace smp {

// ============================================================================
// Names
// ============================================================================

const char* version_name(Version v) {
  switch (v) {
    case Version::V1: return "SMPv1";
    case Version::V2: return "SMPv2";
    default: return "Unknown";
  }
}

const char* operation_name(Operation op) {
  switch (op) {
    case Operation::Read: return "Read";
    case Operation::ReadResponse: return "ReadResponse";
    case Operation::Write: return "Write";
    case Operation::WriteResponse: return "WriteResponse";
    default: return "Unknown";
  }
}

const char* scheme_name(Scheme s) {
  switch (s) {
    case Scheme::Ble: return "BLE";
    case Scheme::Udp: return "UDP";
    case Scheme::CoapBle: return "CoAP/BLE";
    case Scheme::CoapUdp: return "CoAP/UDP";
    default: return "Unknown";
  }
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Verbose: return "verbose";
    case LogLevel::Info: return "info";
    case LogLevel::Application: return "application";
    case LogLevel::Warning: return "warning";
    case LogLevel::Error: return "error";
    default: return "unknown";
  }
}

// BLE: 527-byte ATT MTU minus the 3-byte ATT header.
int default_mtu(Scheme scheme) {
  switch (scheme) {
    case Scheme::Ble: return 524;
    case Scheme::Udp:
    case Scheme::CoapBle:
    case Scheme::CoapUdp:
    default:
      return 1024;
  }
}

// ============================================================================
// Group
// ============================================================================

Group::Group(uint16_t raw) : kind_(Kind::Custom), raw_(raw) {
  switch (raw) {
    case kOs:         kind_ = Kind::Os; break;
    case kImage:      kind_ = Kind::Image; break;
    case kStatistics: kind_ = Kind::Statistics; break;
    case kSettings:   kind_ = Kind::Settings; break;
    case kLogs:       kind_ = Kind::Logs; break;
    case kCrash:      kind_ = Kind::Crash; break;
    case kSplit:      kind_ = Kind::Split; break;
    case kRun:        kind_ = Kind::Run; break;
    case kFileSystem: kind_ = Kind::FileSystem; break;
    case kShell:      kind_ = Kind::Shell; break;
    case kBasic:      kind_ = Kind::Basic; break;
    case kPerUser:    kind_ = Kind::PerUser; break;
    case kSuit:       kind_ = Kind::Suit; break;
    default: break;
  }
}

std::string Group::name() const {
  switch (kind_) {
    case Kind::Os: return "OS";
    case Kind::Image: return "Image";
    case Kind::Statistics: return "Statistics";
    case Kind::Settings: return "Settings";
    case Kind::Logs: return "Logs";
    case Kind::Crash: return "Crash";
    case Kind::Split: return "Split";
    case Kind::Run: return "Run";
    case Kind::FileSystem: return "FileSystem";
    case Kind::Shell: return "Shell";
    case Kind::Basic: return "Basic";
    case Kind::PerUser: return "PerUser";
    case Kind::Suit: return "SUIT";
    case Kind::Custom: break;
  }
  return "Custom(" + std::to_string(raw_) + ")";
}

// ============================================================================
// Error
// ============================================================================

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "None";
    case ErrorKind::MtuOutOfRange: return "MtuOutOfRange";
    case ErrorKind::MtuUnchanged: return "MtuUnchanged";
    case ErrorKind::ReturnCode: return "ReturnCode";
    case ErrorKind::GroupReturnCode: return "GroupReturnCode";
    case ErrorKind::PayloadTooLarge: return "PayloadTooLarge";
    case ErrorKind::SequenceNumberInUse: return "SequenceNumberInUse";
    case ErrorKind::UnexpectedSequenceNumber: return "UnexpectedSequenceNumber";
    case ErrorKind::DuplicateResponse: return "DuplicateResponse";
    case ErrorKind::Timeout: return "Timeout";
    case ErrorKind::Disconnected: return "Disconnected";
    case ErrorKind::SendFailed: return "SendFailed";
    case ErrorKind::MalformedResponse: return "MalformedResponse";
    default: return "Unknown";
  }
}

ErrorCategory Error::category() const {
  switch (kind) {
    case ErrorKind::None:
      return ErrorCategory::None;
    case ErrorKind::MtuOutOfRange:
    case ErrorKind::MtuUnchanged:
      return ErrorCategory::Configuration;
    case ErrorKind::ReturnCode:
    case ErrorKind::GroupReturnCode:
    case ErrorKind::PayloadTooLarge:
      return ErrorCategory::Protocol;
    case ErrorKind::SequenceNumberInUse:
    case ErrorKind::UnexpectedSequenceNumber:
    case ErrorKind::DuplicateResponse:
      return ErrorCategory::Correlation;
    case ErrorKind::Timeout:
    case ErrorKind::Disconnected:
    case ErrorKind::SendFailed:
    case ErrorKind::MalformedResponse:
    default:
      return ErrorCategory::Transport;
  }
}

std::string Error::description() const {
  std::ostringstream oss;
  switch (kind) {
    case ErrorKind::None:
      return "No error";

    case ErrorKind::MtuOutOfRange:
      oss << "New MTU Value " << static_cast<int64_t>(code) << " is outside valid range of "
          << kMinMtu << "..." << kMaxMtu;
      return oss.str();

    case ErrorKind::MtuUnchanged:
      oss << "MTU Value already set to " << static_cast<int64_t>(code);
      return oss.str();

    case ErrorKind::ReturnCode:
      return rc::description(code);

    case ErrorKind::GroupReturnCode:
      oss << (detail.empty() ? rc::description(code) : detail)
          << " (Group: " << Group(group.value_or(0)).name() << ", RC: " << code << ")";
      return oss.str();

    case ErrorKind::PayloadTooLarge:
      oss << "Encoded payload of " << code << " bytes exceeds the "
          << kMaxPayloadLength << " byte length field";
      return oss.str();

    case ErrorKind::SequenceNumberInUse:
      oss << "Sequence number " << code << " is already awaiting a response";
      return oss.str();

    case ErrorKind::UnexpectedSequenceNumber:
      oss << "No request is waiting for sequence number " << code;
      return oss.str();

    case ErrorKind::DuplicateResponse:
      oss << "Sequence number " << code << " already has a response";
      return oss.str();

    case ErrorKind::Timeout:
      oss << "Request timed out";
      break;
    case ErrorKind::Disconnected:
      oss << "Transport disconnected";
      break;
    case ErrorKind::SendFailed:
      oss << "Send failed";
      break;
    case ErrorKind::MalformedResponse:
      oss << "Malformed response";
      break;
    default:
      oss << "Unknown error";
      break;
  }
  if (!detail.empty()) {
    oss << ": " << detail;
  }
  return oss.str();
}

// ============================================================================
// Response
// ============================================================================

std::optional<uint64_t> Response::return_code() const {
  auto it = payload.find("rc");
  if (it == payload.end() || !it->second.is_unsigned()) {
    return std::nullopt;
  }
  return it->second.as_unsigned();
}

std::optional<std::pair<uint16_t, uint64_t>> Response::group_return_code() const {
  auto it = payload.find("err");
  if (it == payload.end() || !it->second.is_map()) {
    return std::nullopt;
  }
  const cbor::Value* group = it->second.find("group");
  const cbor::Value* code = it->second.find("rc");
  if (group == nullptr || code == nullptr ||
      !group->is_unsigned() || !code->is_unsigned() ||
      group->as_unsigned() > 0xFFFF) {
    return std::nullopt;
  }
  return std::make_pair(static_cast<uint16_t>(group->as_unsigned()), code->as_unsigned());
}

Error Response::error() const {
  if (auto err = group_return_code()) {
    return rc::resolve(err->first, err->second);
  }
  if (auto code = return_code()) {
    return rc::resolve(*code);
  }
  return Error::none();
}

} // namespace smp
