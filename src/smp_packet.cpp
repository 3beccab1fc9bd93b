#include "smp_packet.hpp"

namespace smp {

// ============================================================================
// Header
// ============================================================================

std::array<uint8_t, kHeaderSize> encode_header(const Header& header) {
  std::array<uint8_t, kHeaderSize> out{};
  out[0] = header.version;
  out[1] = static_cast<uint8_t>(header.op);
  out[2] = header.flags;
  codec::put_be16(&out[3], header.length);
  codec::put_be16(&out[5], header.group);
  out[7] = header.sequence;
  out[8] = header.command_id;
  return out;
}

std::optional<Header> parse_header(const uint8_t* data, size_t len) {
  if (data == nullptr || len < kHeaderSize) {
    return std::nullopt;
  }
  if (data[1] > static_cast<uint8_t>(Operation::WriteResponse)) {
    return std::nullopt;
  }

  Header h;
  h.version = data[0];
  h.op = static_cast<Operation>(data[1]);
  h.flags = data[2];
  h.length = codec::rd_be16(data + 3);
  h.group = codec::rd_be16(data + 5);
  h.sequence = data[7];
  h.command_id = data[8];
  return h;
}

cbor::Map strip_header_key(const cbor::Map& payload) {
  cbor::Map copy = payload;
  copy.erase(kHeaderKey);
  return copy;
}

// ============================================================================
// Build
// ============================================================================

Result<std::vector<uint8_t>> build_packet(Framing framing,
                                          Version version,
                                          Operation op,
                                          uint8_t flags,
                                          uint16_t group,
                                          SequenceNumber sequence,
                                          uint8_t command_id,
                                          const cbor::Map& payload) {
  // The length never accounts for the embedded header.
  const cbor::Map stripped = strip_header_key(payload);
  const std::vector<uint8_t> encoded = cbor::encode(stripped);
  if (encoded.size() > kMaxPayloadLength) {
    return Result<std::vector<uint8_t>>::failure(
        Error::make(ErrorKind::PayloadTooLarge, encoded.size()));
  }

  Header header;
  header.version = static_cast<uint8_t>(version);
  header.op = op;
  header.flags = flags;
  header.length = static_cast<uint16_t>(encoded.size());
  header.group = group;
  header.sequence = sequence;
  header.command_id = command_id;
  const auto header_bytes = encode_header(header);

  if (framing == Framing::Coap) {
    // The header rides inside the payload map. A caller-supplied "_h" wins.
    cbor::Map with_header = payload;
    if (with_header.find(kHeaderKey) == with_header.end()) {
      with_header.emplace(kHeaderKey,
                          cbor::Bytes(header_bytes.begin(), header_bytes.end()));
    }
    return Result<std::vector<uint8_t>>::success(cbor::encode(with_header));
  }

  std::vector<uint8_t> packet;
  packet.reserve(kHeaderSize + encoded.size());
  packet.insert(packet.end(), header_bytes.begin(), header_bytes.end());
  packet.insert(packet.end(), encoded.begin(), encoded.end());
  return Result<std::vector<uint8_t>>::success(std::move(packet));
}

// ============================================================================
// Decode
// ============================================================================

static Result<Response> malformed(const char* why) {
  return Result<Response>::failure(Error::make(ErrorKind::MalformedResponse, 0, why));
}

Result<Response> decode_packet(Framing framing, const std::vector<uint8_t>& data) {
  Response out;

  if (framing == Framing::Coap) {
    auto value = cbor::decode(data);
    if (!value || !value->is_map()) {
      return malformed("payload is not a CBOR map");
    }
    const cbor::Value* embedded = value->find(kHeaderKey);
    if (embedded == nullptr || !embedded->is_bytes()) {
      return malformed("missing header key");
    }
    auto header = parse_header(embedded->as_bytes());
    if (!header) {
      return malformed("invalid header");
    }
    out.header = *header;
    out.payload = std::move(value->as_map());
    out.payload.erase(kHeaderKey);
    return Result<Response>::success(std::move(out));
  }

  auto header = parse_header(data);
  if (!header) {
    return malformed("invalid header");
  }
  const size_t available = data.size() - kHeaderSize;
  if (available != header->length) {
    return malformed("payload length does not match header");
  }
  out.header = *header;
  if (available > 0) {
    auto value = cbor::decode(data.data() + kHeaderSize, available);
    if (!value || !value->is_map()) {
      return malformed("payload is not a CBOR map");
    }
    out.payload = std::move(value->as_map());
    out.payload.erase(kHeaderKey);
  }
  return Result<Response>::success(std::move(out));
}

Result<Response> decode_response(Framing framing, const std::vector<uint8_t>& data) {
  auto decoded = decode_packet(framing, data);
  if (decoded.ok && !is_response(decoded.value.header.op)) {
    return malformed("not a response operation");
  }
  return decoded;
}

} // namespace smp
