/**
 * @file packet_test.cpp
 * @brief Tests for header layout, packet building and response decoding (smp_packet.cpp)
 */

#include <gtest/gtest.h>
#include "smp_packet.hpp"
#include <algorithm>

using namespace smp;

namespace {

std::vector<uint8_t> response_bytes(uint8_t version, Operation op, uint16_t group,
                                    SequenceNumber seq, uint8_t cmd, const cbor::Map& payload) {
  const auto body = cbor::encode(payload);
  Header h;
  h.version = version;
  h.op = op;
  h.length = static_cast<uint16_t>(body.size());
  h.group = group;
  h.sequence = seq;
  h.command_id = cmd;
  const auto head = encode_header(h);
  std::vector<uint8_t> out(head.begin(), head.end());
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

} // namespace

// ============================================================================
// Header
// ============================================================================

TEST(HeaderTest, LayoutIsBigEndian) {
  Header h;
  h.version = 1;
  h.op = Operation::Write;
  h.flags = 0x5A;
  h.length = 0x0102;
  h.group = 0x0304;
  h.sequence = 0xFE;
  h.command_id = 0x09;
  const auto bytes = encode_header(h);
  const std::array<uint8_t, kHeaderSize> expected{0x01, 0x02, 0x5A, 0x01, 0x02, 0x03, 0x04, 0xFE, 0x09};
  EXPECT_EQ(bytes, expected);

  auto back = parse_header(bytes.data(), bytes.size());
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, h);
}

TEST(HeaderTest, SixteenBitFieldsUseFullRange) {
  Header h;
  h.length = 0xFFFF;
  h.group = 0x8001;
  const auto bytes = encode_header(h);
  EXPECT_EQ(bytes[3], 0xFF);
  EXPECT_EQ(bytes[4], 0xFF);
  EXPECT_EQ(bytes[5], 0x80);
  EXPECT_EQ(bytes[6], 0x01);
  EXPECT_EQ(codec::rd_be16(&bytes[3]), 0xFFFF);
  EXPECT_EQ(codec::rd_be16(&bytes[5]), 0x8001);
}

TEST(HeaderTest, ParseRejectsShortInput) {
  const std::vector<uint8_t> eight(8, 0x00);
  EXPECT_FALSE(parse_header(eight).has_value());
  EXPECT_FALSE(parse_header(nullptr, 9).has_value());
}

TEST(HeaderTest, ParseRejectsUnknownOperation) {
  std::vector<uint8_t> bytes{0x01, 0x04, 0, 0, 0, 0, 0, 0, 0};
  EXPECT_FALSE(parse_header(bytes).has_value());
}

// ============================================================================
// Build
// ============================================================================

TEST(BuildPacketTest, DatagramEmptyPayload) {
  auto built = build_packet(Framing::Datagram, Version::V2, Operation::Write, 0,
                            Group::kImage, 7, 1);
  ASSERT_TRUE(built.ok);
  const std::vector<uint8_t> expected{0x01, 0x02, 0x00, 0x00, 0x01, 0x00, 0x01, 0x07, 0x01, 0xA0};
  EXPECT_EQ(built.value, expected);
}

TEST(BuildPacketTest, DatagramHeaderAndPayload) {
  cbor::Map payload{{"off", 0}};
  auto built = build_packet(Framing::Datagram, Version::V1, Operation::Read, 0,
                            Group::kOs, 0x80, 0, payload);
  ASSERT_TRUE(built.ok);
  const auto body = cbor::encode(payload);
  ASSERT_EQ(built.value.size(), kHeaderSize + body.size());

  auto header = parse_header(built.value);
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->version, 0);
  EXPECT_EQ(header->op, Operation::Read);
  EXPECT_EQ(header->length, body.size());
  EXPECT_EQ(header->group, 0);
  EXPECT_EQ(header->sequence, 0x80);
  EXPECT_TRUE(std::equal(body.begin(), body.end(), built.value.begin() + kHeaderSize));
}

TEST(BuildPacketTest, IsDeterministic) {
  cbor::Map payload{{"name", "fw"}, {"len", 4096}, {"data", cbor::Bytes{1, 2, 3}}};
  auto a = build_packet(Scheme::Ble, Version::V2, Operation::Write, 0, Group::kFileSystem, 3, 0, payload);
  auto b = build_packet(Scheme::Ble, Version::V2, Operation::Write, 0, Group::kFileSystem, 3, 0, payload);
  ASSERT_TRUE(a.ok);
  ASSERT_TRUE(b.ok);
  EXPECT_EQ(a.value, b.value);
}

TEST(BuildPacketTest, DatagramStripsReservedKey) {
  cbor::Map plain{{"off", 16}};
  cbor::Map with_key = plain;
  with_key["_h"] = cbor::Bytes{0xDE, 0xAD};

  auto a = build_packet(Framing::Datagram, Version::V2, Operation::Write, 0, 1, 9, 1, plain);
  auto b = build_packet(Framing::Datagram, Version::V2, Operation::Write, 0, 1, 9, 1, with_key);
  ASSERT_TRUE(a.ok);
  ASSERT_TRUE(b.ok);
  EXPECT_EQ(a.value, b.value);
}

TEST(BuildPacketTest, CoapEmbedsHeader) {
  cbor::Map payload{{"off", 0}, {"len", 100}};
  auto built = build_packet(Framing::Coap, Version::V2, Operation::Write, 0,
                            Group::kImage, 42, 1, payload);
  ASSERT_TRUE(built.ok);

  auto decoded = cbor::decode(built.value);
  ASSERT_TRUE(decoded.has_value());
  ASSERT_TRUE(decoded->is_map());
  const cbor::Value* embedded = decoded->find(kHeaderKey);
  ASSERT_NE(embedded, nullptr);
  ASSERT_TRUE(embedded->is_bytes());
  ASSERT_EQ(embedded->as_bytes().size(), kHeaderSize);

  auto header = parse_header(embedded->as_bytes());
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->version, 1);
  EXPECT_EQ(header->op, Operation::Write);
  EXPECT_EQ(header->group, Group::kImage);
  EXPECT_EQ(header->sequence, 42);
  EXPECT_EQ(header->command_id, 1);
  // Length covers the payload without the embedded header
  EXPECT_EQ(header->length, cbor::encode(payload).size());

  EXPECT_EQ(*decoded->find("off"), cbor::Value(0));
  EXPECT_EQ(*decoded->find("len"), cbor::Value(100));
}

TEST(BuildPacketTest, SchemeOverloadSelectsFraming) {
  auto ble = build_packet(Scheme::Ble, Version::V2, Operation::Read, 0, 0, 1, 0);
  auto coap = build_packet(Scheme::CoapUdp, Version::V2, Operation::Read, 0, 0, 1, 0);
  ASSERT_TRUE(ble.ok);
  ASSERT_TRUE(coap.ok);
  EXPECT_EQ(ble.value.size(), kHeaderSize + 1);
  EXPECT_EQ(coap.value[0], 0xA1);  // single-entry map holding "_h"
}

TEST(BuildPacketTest, OversizedPayloadRejected) {
  cbor::Map payload{{"data", cbor::Bytes(70000, 0x55)}};
  auto built = build_packet(Framing::Datagram, Version::V2, Operation::Write, 0, 1, 0, 1, payload);
  EXPECT_FALSE(built.ok);
  EXPECT_EQ(built.error.kind, ErrorKind::PayloadTooLarge);
  EXPECT_GT(built.error.code, kMaxPayloadLength);
}

// ============================================================================
// Decode
// ============================================================================

TEST(DecodePacketTest, DatagramResponse) {
  auto bytes = response_bytes(1, Operation::WriteResponse, Group::kImage, 5, 1,
                              cbor::Map{{"off", 512}, {"rc", 0}});
  auto decoded = decode_response(Framing::Datagram, bytes);
  ASSERT_TRUE(decoded.ok);
  EXPECT_EQ(decoded.value.header.sequence, 5);
  EXPECT_EQ(decoded.value.header.group, Group::kImage);
  EXPECT_EQ(decoded.value.payload.at("off"), cbor::Value(512));
  EXPECT_TRUE(decoded.value.is_success());
}

TEST(DecodePacketTest, EmptyDatagramPayload) {
  Header h;
  h.op = Operation::ReadResponse;
  const auto head = encode_header(h);
  auto decoded = decode_response(Framing::Datagram, std::vector<uint8_t>(head.begin(), head.end()));
  ASSERT_TRUE(decoded.ok);
  EXPECT_TRUE(decoded.value.payload.empty());
}

TEST(DecodePacketTest, LengthMismatchIsMalformed) {
  auto bytes = response_bytes(1, Operation::ReadResponse, 0, 1, 0, cbor::Map{{"rc", 0}});
  bytes.push_back(0x00);
  auto decoded = decode_response(Framing::Datagram, bytes);
  EXPECT_FALSE(decoded.ok);
  EXPECT_EQ(decoded.error.kind, ErrorKind::MalformedResponse);
}

TEST(DecodePacketTest, RequestOperationIsNotAResponse) {
  auto bytes = response_bytes(1, Operation::Read, 0, 1, 0, cbor::Map{});
  EXPECT_TRUE(decode_packet(Framing::Datagram, bytes).ok);
  auto decoded = decode_response(Framing::Datagram, bytes);
  EXPECT_FALSE(decoded.ok);
  EXPECT_EQ(decoded.error.kind, ErrorKind::MalformedResponse);
}

TEST(DecodePacketTest, CoapResponse) {
  Header h;
  h.op = Operation::ReadResponse;
  h.group = Group::kStatistics;
  h.sequence = 200;
  const auto head = encode_header(h);
  cbor::Map payload{{"_h", cbor::Bytes(head.begin(), head.end())}, {"rc", 0}};

  auto decoded = decode_response(Scheme::CoapBle, cbor::encode(payload));
  ASSERT_TRUE(decoded.ok);
  EXPECT_EQ(decoded.value.header.sequence, 200);
  EXPECT_EQ(decoded.value.header.group, Group::kStatistics);
  EXPECT_EQ(decoded.value.payload.count(kHeaderKey), 0u);
  EXPECT_EQ(decoded.value.payload.count("rc"), 1u);
}

TEST(DecodePacketTest, CoapWithoutHeaderIsMalformed) {
  auto decoded = decode_response(Framing::Coap, cbor::encode(cbor::Map{{"rc", 0}}));
  EXPECT_FALSE(decoded.ok);
  EXPECT_EQ(decoded.error.kind, ErrorKind::MalformedResponse);
}

TEST(DecodePacketTest, BuiltRequestDecodesBack) {
  cbor::Map payload{{"name", "/lfs/log.txt"}, {"off", 0}};
  auto built = build_packet(Framing::Datagram, Version::V2, Operation::Read, 0,
                            Group::kFileSystem, 11, 0, payload);
  ASSERT_TRUE(built.ok);
  auto decoded = decode_packet(Framing::Datagram, built.value);
  ASSERT_TRUE(decoded.ok);
  EXPECT_EQ(decoded.value.header.sequence, 11);
  EXPECT_EQ(decoded.value.payload, payload);
}
