#pragma once
/**
 * @file smp_cbor.hpp
 * @brief Compact binary (CBOR, RFC 8949) codec for SMP payloads
 *
 * SMP request and response payloads are CBOR maps keyed by text strings.
 * This module provides just enough CBOR for that:
 *
 * Major types (RFC 8949 Section 3.1):
 *   0: unsigned integer     4: array
 *   1: negative integer     5: map (text keys only)
 *   2: byte string          6: tag (skipped on decode)
 *   3: text string          7: simple values / floats
 *
 * Encoding is deterministic: heads use the shortest form, lengths are always
 * definite and map keys are emitted in canonical order (shorter keys first,
 * then bytewise). Decoding also accepts indefinite-length items and
 * half/single/double precision floats.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace smp {
namespace cbor {

class Value;

using Bytes = std::vector<uint8_t>;
using Array = std::vector<Value>;
using Map = std::map<std::string, Value>;

/// Maximum nesting accepted by decode()
constexpr size_t kMaxDepth = 32;

/**
 * @brief A single CBOR data item
 */
class Value {
public:
  enum class Type : uint8_t {
    Null,
    Bool,
    Unsigned,   ///< major type 0
    Negative,   ///< major type 1, value is -1 - n
    Bytes,
    Text,
    Array,
    Map,
    Float
  };

  Value() = default;
  Value(const Value& other);
  Value(Value&& other) noexcept;
  Value& operator=(const Value& other);
  Value& operator=(Value&& other) noexcept;
  ~Value();

  Value(bool b) : type_(Type::Bool), bool_(b) {}
  Value(int v);
  Value(int64_t v);
  Value(uint64_t v) : type_(Type::Unsigned), uint_(v) {}
  Value(uint32_t v) : type_(Type::Unsigned), uint_(v) {}
  Value(double v) : type_(Type::Float), float_(v) {}
  Value(const char* s) : type_(Type::Text), text_(s) {}
  Value(std::string s) : type_(Type::Text), text_(std::move(s)) {}
  Value(Bytes b) : type_(Type::Bytes), bytes_(std::move(b)) {}
  Value(Array a) : type_(Type::Array), array_(std::move(a)) {}
  Value(Map m);

  static Value null() { return Value(); }

  Type type() const { return type_; }
  bool is_null() const { return type_ == Type::Null; }
  bool is_bool() const { return type_ == Type::Bool; }
  bool is_unsigned() const { return type_ == Type::Unsigned; }
  bool is_integer() const { return type_ == Type::Unsigned || type_ == Type::Negative; }
  bool is_bytes() const { return type_ == Type::Bytes; }
  bool is_text() const { return type_ == Type::Text; }
  bool is_array() const { return type_ == Type::Array; }
  bool is_map() const { return type_ == Type::Map; }
  bool is_float() const { return type_ == Type::Float; }

  bool as_bool() const { return bool_; }
  /// Raw argument: the value for Unsigned, n for Negative (-1 - n)
  uint64_t as_unsigned() const { return uint_; }
  /// Signed view; empty if the value does not fit in int64_t
  std::optional<int64_t> as_int() const;
  double as_float() const { return float_; }
  const Bytes& as_bytes() const { return bytes_; }
  const std::string& as_text() const { return text_; }
  const Array& as_array() const { return array_; }
  /// Empty map unless this is a map
  const Map& as_map() const;
  Array& as_array() { return array_; }
  Map& as_map();

  /// Map lookup; nullptr if this is not a map or the key is absent
  const Value* find(const std::string& key) const;

  static Value negative(uint64_t n) {
    Value v;
    v.type_ = Type::Negative;
    v.uint_ = n;
    return v;
  }

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

private:
  Type type_{Type::Null};
  bool bool_{false};
  uint64_t uint_{0};
  double float_{0.0};
  Bytes bytes_;
  std::string text_;
  Array array_;
  // Held by pointer: std::map may not be instantiated with Value incomplete
  std::unique_ptr<Map> map_;
};

// ============================================================================
// Encoding / decoding
// ============================================================================

/// Encode a single item
Bytes encode(const Value& value);

/// Encode a map (the shape of every SMP payload)
Bytes encode(const Map& map);

/// Append the encoding of @p value to @p out
void encode_into(Bytes& out, const Value& value);

/**
 * @brief Decode exactly one item spanning the whole buffer
 * @return The item, or std::nullopt on malformed, truncated or trailing input
 */
std::optional<Value> decode(const uint8_t* data, size_t len);

inline std::optional<Value> decode(const Bytes& data) {
  return decode(data.data(), data.size());
}

/**
 * @brief Decode one item starting at @p offset and advance it
 *
 * Trailing bytes after the item are left untouched.
 */
std::optional<Value> decode_prefix(const uint8_t* data, size_t len, size_t& offset);

/// Render a value in CBOR diagnostic notation, e.g. {"off": 0, "data": h'0a0b'}
std::string diagnostic(const Value& value);
std::string diagnostic(const Map& map);

} // namespace cbor
} // namespace smp
