#ifndef SMP_PACKET_HPP
#define SMP_PACKET_HPP

/*
  SMP packet construction and parsing

  Header layout (9 bytes, big-endian multi-byte fields):

    +---------+----+-------+--------+--------+-----+----+
    | version | op | flags | len(2) | grp(2) | seq | id |
    +---------+----+-------+--------+--------+-----+----+

  "len" is the length of the CBOR-encoded payload map *without* the
  reserved "_h" key.

  Datagram framing (BLE, UDP):
    [header][cbor(payload)]

  CoAP framing (CoAP over BLE / UDP):
    cbor(payload + {"_h": h'<header>'})

  Building is pure: the same arguments always yield the same bytes, so a
  request can be re-sent byte-for-byte with the same sequence number.

  Usage Example:
    cbor::Map payload{{"d", "hello"}};
    auto pkt = smp::build_packet(smp::Framing::Datagram, smp::Version::V2,
                                 smp::Operation::Write, 0, smp::Group::kOs,
                                 seq, 0, payload);
    if (pkt.ok) transport.send(pkt.value, timeout, completion);
*/

#include "smp.hpp"

#include <array>
#include <optional>
#include <vector>

namespace smp {

/// Serialize a header into its 9 wire bytes
std::array<uint8_t, kHeaderSize> encode_header(const Header& header);

/// Parse the first 9 bytes of @p data; empty if too short or op is invalid
std::optional<Header> parse_header(const uint8_t* data, size_t len);

inline std::optional<Header> parse_header(const std::vector<uint8_t>& data) {
  return parse_header(data.data(), data.size());
}

/// Remove the reserved header key, if present
cbor::Map strip_header_key(const cbor::Map& payload);

/**
 * Build a packet for the given framing.
 *
 * @return Packet bytes, or ErrorKind::PayloadTooLarge if the encoded payload
 *         cannot be described by the 16-bit length field
 */
Result<std::vector<uint8_t>> build_packet(Framing framing,
                                          Version version,
                                          Operation op,
                                          uint8_t flags,
                                          uint16_t group,
                                          SequenceNumber sequence,
                                          uint8_t command_id,
                                          const cbor::Map& payload = {});

/// Convenience overload selecting the framing from the transport scheme
inline Result<std::vector<uint8_t>> build_packet(Scheme scheme,
                                                 Version version,
                                                 Operation op,
                                                 uint8_t flags,
                                                 uint16_t group,
                                                 SequenceNumber sequence,
                                                 uint8_t command_id,
                                                 const cbor::Map& payload = {}) {
  return build_packet(framing_for(scheme), version, op, flags, group,
                      sequence, command_id, payload);
}

/**
 * Decode any packet (request or response) into header + payload.
 *
 * The returned payload never contains the "_h" key. Errors are
 * ErrorKind::MalformedResponse.
 */
Result<Response> decode_packet(Framing framing, const std::vector<uint8_t>& data);

/**
 * Decode a response packet. Like decode_packet, but the operation must be
 * ReadResponse or WriteResponse.
 */
Result<Response> decode_response(Framing framing, const std::vector<uint8_t>& data);

inline Result<Response> decode_response(Scheme scheme, const std::vector<uint8_t>& data) {
  return decode_response(framing_for(scheme), data);
}

} // namespace smp

#endif // SMP_PACKET_HPP
