#include "smp_cbor.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace smp {
namespace cbor {

namespace {

constexpr uint8_t kMajorUnsigned = 0;
constexpr uint8_t kMajorNegative = 1;
constexpr uint8_t kMajorBytes = 2;
constexpr uint8_t kMajorText = 3;
constexpr uint8_t kMajorArray = 4;
constexpr uint8_t kMajorMap = 5;
constexpr uint8_t kMajorTag = 6;
constexpr uint8_t kMajorSimple = 7;

constexpr uint8_t kSimpleFalse = 20;
constexpr uint8_t kSimpleTrue = 21;
constexpr uint8_t kSimpleNull = 22;
constexpr uint8_t kSimpleUndefined = 23;

constexpr uint8_t kAdditionalIndefinite = 31;
constexpr uint8_t kBreak = 0xFF;

void write_head(Bytes& out, uint8_t major, uint64_t arg) {
  const uint8_t mt = static_cast<uint8_t>(major << 5);
  if (arg < 24) {
    out.push_back(static_cast<uint8_t>(mt | arg));
  } else if (arg <= 0xFF) {
    out.push_back(mt | 24);
    out.push_back(static_cast<uint8_t>(arg));
  } else if (arg <= 0xFFFF) {
    out.push_back(mt | 25);
    out.push_back(static_cast<uint8_t>(arg >> 8));
    out.push_back(static_cast<uint8_t>(arg));
  } else if (arg <= 0xFFFFFFFFull) {
    out.push_back(mt | 26);
    for (int shift = 24; shift >= 0; shift -= 8) {
      out.push_back(static_cast<uint8_t>(arg >> shift));
    }
  } else {
    out.push_back(mt | 27);
    for (int shift = 56; shift >= 0; shift -= 8) {
      out.push_back(static_cast<uint8_t>(arg >> shift));
    }
  }
}

// Canonical key order: shorter encodings first, then bytewise.
bool canonical_less(const std::string* a, const std::string* b) {
  if (a->size() != b->size()) return a->size() < b->size();
  return *a < *b;
}

void encode_map(Bytes& out, const Map& map) {
  std::vector<const std::string*> keys;
  keys.reserve(map.size());
  for (const auto& kv : map) keys.push_back(&kv.first);
  std::sort(keys.begin(), keys.end(), canonical_less);

  write_head(out, kMajorMap, map.size());
  for (const std::string* key : keys) {
    write_head(out, kMajorText, key->size());
    out.insert(out.end(), key->begin(), key->end());
    encode_into(out, map.at(*key));
  }
}

double half_to_double(uint16_t half) {
  const int exp = (half >> 10) & 0x1F;
  const int mant = half & 0x3FF;
  double val;
  if (exp == 0) {
    val = std::ldexp(mant, -24);
  } else if (exp != 31) {
    val = std::ldexp(mant + 1024, exp - 25);
  } else {
    val = mant == 0 ? INFINITY : NAN;
  }
  return (half & 0x8000) ? -val : val;
}

class Reader {
public:
  Reader(const uint8_t* data, size_t len, size_t offset)
    : data_(data), len_(len), idx_(offset) {}

  size_t offset() const { return idx_; }

  std::optional<Value> read_item(size_t depth) {
    if (depth > kMaxDepth) return std::nullopt;
    uint8_t major = 0, additional = 0;
    uint64_t arg = 0;
    if (!read_head(major, additional, arg)) return std::nullopt;

    switch (major) {
      case kMajorUnsigned:
        if (additional == kAdditionalIndefinite) return std::nullopt;
        return Value(arg);
      case kMajorNegative:
        if (additional == kAdditionalIndefinite) return std::nullopt;
        return Value::negative(arg);
      case kMajorBytes: {
        Bytes b;
        if (!read_string(major, additional, arg, b)) return std::nullopt;
        return Value(std::move(b));
      }
      case kMajorText: {
        Bytes b;
        if (!read_string(major, additional, arg, b)) return std::nullopt;
        return Value(std::string(b.begin(), b.end()));
      }
      case kMajorArray: {
        Array items;
        if (additional == kAdditionalIndefinite) {
          while (!at_break()) {
            auto item = read_item(depth + 1);
            if (!item) return std::nullopt;
            items.push_back(std::move(*item));
          }
          ++idx_; // break
        } else {
          if (arg > len_ - idx_) return std::nullopt; // each item takes >= 1 byte
          items.reserve(static_cast<size_t>(arg));
          for (uint64_t i = 0; i < arg; ++i) {
            auto item = read_item(depth + 1);
            if (!item) return std::nullopt;
            items.push_back(std::move(*item));
          }
        }
        return Value(std::move(items));
      }
      case kMajorMap: {
        Map entries;
        const bool indefinite = additional == kAdditionalIndefinite;
        if (!indefinite && arg > len_ - idx_) return std::nullopt;
        for (uint64_t i = 0; indefinite || i < arg; ++i) {
          if (indefinite && at_break()) {
            ++idx_;
            break;
          }
          auto key = read_item(depth + 1);
          if (!key || !key->is_text()) return std::nullopt;
          auto val = read_item(depth + 1);
          if (!val) return std::nullopt;
          entries[key->as_text()] = std::move(*val);
        }
        return Value(std::move(entries));
      }
      case kMajorTag:
        if (additional == kAdditionalIndefinite) return std::nullopt;
        return read_item(depth + 1);
      case kMajorSimple:
        return read_simple(additional, arg);
      default:
        return std::nullopt;
    }
  }

private:
  const uint8_t* data_;
  size_t len_;
  size_t idx_;

  bool at_break() {
    return idx_ < len_ && data_[idx_] == kBreak;
  }

  bool read_head(uint8_t& major, uint8_t& additional, uint64_t& arg) {
    if (idx_ >= len_) return false;
    const uint8_t ib = data_[idx_++];
    major = ib >> 5;
    additional = ib & 0x1F;
    if (additional < 24) {
      arg = additional;
      return true;
    }
    if (additional == kAdditionalIndefinite) {
      arg = 0;
      return true;
    }
    size_t width;
    switch (additional) {
      case 24: width = 1; break;
      case 25: width = 2; break;
      case 26: width = 4; break;
      case 27: width = 8; break;
      default: return false; // 28-30 reserved
    }
    if (len_ - idx_ < width) return false;
    arg = 0;
    for (size_t i = 0; i < width; ++i) {
      arg = (arg << 8) | data_[idx_++];
    }
    return true;
  }

  bool read_string(uint8_t major, uint8_t additional, uint64_t arg, Bytes& out) {
    if (additional != kAdditionalIndefinite) {
      if (arg > len_ - idx_) return false;
      out.insert(out.end(), data_ + idx_, data_ + idx_ + arg);
      idx_ += static_cast<size_t>(arg);
      return true;
    }
    // Indefinite: a sequence of definite chunks of the same major type.
    while (!at_break()) {
      uint8_t chunk_major = 0, chunk_additional = 0;
      uint64_t chunk_len = 0;
      if (!read_head(chunk_major, chunk_additional, chunk_len)) return false;
      if (chunk_major != major || chunk_additional == kAdditionalIndefinite) return false;
      if (chunk_len > len_ - idx_) return false;
      out.insert(out.end(), data_ + idx_, data_ + idx_ + chunk_len);
      idx_ += static_cast<size_t>(chunk_len);
    }
    if (idx_ >= len_) return false;
    ++idx_; // break
    return true;
  }

  std::optional<Value> read_simple(uint8_t additional, uint64_t arg) {
    switch (additional) {
      case kSimpleFalse: return Value(false);
      case kSimpleTrue: return Value(true);
      case kSimpleNull:
      case kSimpleUndefined:
        return Value::null();
      case 25:
        return Value(half_to_double(static_cast<uint16_t>(arg)));
      case 26: {
        const uint32_t bits = static_cast<uint32_t>(arg);
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        return Value(static_cast<double>(f));
      }
      case 27: {
        double d;
        std::memcpy(&d, &arg, sizeof(d));
        return Value(d);
      }
      default:
        return std::nullopt;
    }
  }
};

void append_escaped(std::ostringstream& oss, const std::string& text) {
  oss << '"';
  for (char c : text) {
    if (c == '"' || c == '\\') oss << '\\';
    oss << c;
  }
  oss << '"';
}

void write_diagnostic(std::ostringstream& oss, const Value& value) {
  switch (value.type()) {
    case Value::Type::Null:
      oss << "null";
      break;
    case Value::Type::Bool:
      oss << (value.as_bool() ? "true" : "false");
      break;
    case Value::Type::Unsigned:
      oss << value.as_unsigned();
      break;
    case Value::Type::Negative:
      if (value.as_unsigned() == UINT64_MAX) {
        oss << "-18446744073709551616";
      } else {
        oss << '-' << (value.as_unsigned() + 1);
      }
      break;
    case Value::Type::Float:
      oss << value.as_float();
      break;
    case Value::Type::Bytes: {
      oss << "h'" << std::hex << std::setfill('0');
      for (uint8_t b : value.as_bytes()) oss << std::setw(2) << static_cast<int>(b);
      oss << std::dec << '\'';
      break;
    }
    case Value::Type::Text:
      append_escaped(oss, value.as_text());
      break;
    case Value::Type::Array: {
      oss << '[';
      bool first = true;
      for (const auto& item : value.as_array()) {
        if (!first) oss << ", ";
        first = false;
        write_diagnostic(oss, item);
      }
      oss << ']';
      break;
    }
    case Value::Type::Map: {
      oss << '{';
      bool first = true;
      for (const auto& kv : value.as_map()) {
        if (!first) oss << ", ";
        first = false;
        append_escaped(oss, kv.first);
        oss << ": ";
        write_diagnostic(oss, kv.second);
      }
      oss << '}';
      break;
    }
  }
}

} // namespace

// ============================================================================
// Value
// ============================================================================

Value::Value(const Value& other)
    : type_(other.type_),
      bool_(other.bool_),
      uint_(other.uint_),
      float_(other.float_),
      bytes_(other.bytes_),
      text_(other.text_),
      array_(other.array_),
      map_(other.map_ ? std::make_unique<Map>(*other.map_) : nullptr) {}

Value::Value(Value&& other) noexcept = default;

Value& Value::operator=(const Value& other) {
  if (this != &other) {
    Value copy(other);
    *this = std::move(copy);
  }
  return *this;
}

Value& Value::operator=(Value&& other) noexcept = default;

Value::~Value() = default;

Value::Value(Map m) : type_(Type::Map), map_(std::make_unique<Map>(std::move(m))) {}

Value::Value(int v) : Value(static_cast<int64_t>(v)) {}

Value::Value(int64_t v) {
  if (v >= 0) {
    type_ = Type::Unsigned;
    uint_ = static_cast<uint64_t>(v);
  } else {
    type_ = Type::Negative;
    uint_ = static_cast<uint64_t>(-1 - v);
  }
}

std::optional<int64_t> Value::as_int() const {
  if (type_ == Type::Unsigned) {
    if (uint_ > static_cast<uint64_t>(INT64_MAX)) return std::nullopt;
    return static_cast<int64_t>(uint_);
  }
  if (type_ == Type::Negative) {
    if (uint_ > static_cast<uint64_t>(INT64_MAX)) return std::nullopt;
    return -1 - static_cast<int64_t>(uint_);
  }
  return std::nullopt;
}

const Map& Value::as_map() const {
  static const Map empty;
  return map_ ? *map_ : empty;
}

Map& Value::as_map() {
  if (!map_) {
    map_ = std::make_unique<Map>();
  }
  return *map_;
}

const Value* Value::find(const std::string& key) const {
  if (type_ != Type::Map) return nullptr;
  const Map& map = as_map();
  auto it = map.find(key);
  return it == map.end() ? nullptr : &it->second;
}

bool Value::operator==(const Value& other) const {
  if (type_ != other.type_) return false;
  switch (type_) {
    case Type::Null: return true;
    case Type::Bool: return bool_ == other.bool_;
    case Type::Unsigned:
    case Type::Negative:
      return uint_ == other.uint_;
    case Type::Float: return float_ == other.float_;
    case Type::Bytes: return bytes_ == other.bytes_;
    case Type::Text: return text_ == other.text_;
    case Type::Array: return array_ == other.array_;
    case Type::Map: return as_map() == other.as_map();
  }
  return false;
}

// ============================================================================
// Encoding
// ============================================================================

void encode_into(Bytes& out, const Value& value) {
  switch (value.type()) {
    case Value::Type::Null:
      out.push_back(static_cast<uint8_t>((kMajorSimple << 5) | kSimpleNull));
      break;
    case Value::Type::Bool:
      out.push_back(static_cast<uint8_t>((kMajorSimple << 5) |
                                         (value.as_bool() ? kSimpleTrue : kSimpleFalse)));
      break;
    case Value::Type::Unsigned:
      write_head(out, kMajorUnsigned, value.as_unsigned());
      break;
    case Value::Type::Negative:
      write_head(out, kMajorNegative, value.as_unsigned());
      break;
    case Value::Type::Float: {
      const double d = value.as_float();
      uint64_t bits;
      std::memcpy(&bits, &d, sizeof(bits));
      out.push_back(static_cast<uint8_t>((kMajorSimple << 5) | 27));
      for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(bits >> shift));
      }
      break;
    }
    case Value::Type::Bytes: {
      const auto& b = value.as_bytes();
      write_head(out, kMajorBytes, b.size());
      out.insert(out.end(), b.begin(), b.end());
      break;
    }
    case Value::Type::Text: {
      const auto& t = value.as_text();
      write_head(out, kMajorText, t.size());
      out.insert(out.end(), t.begin(), t.end());
      break;
    }
    case Value::Type::Array:
      write_head(out, kMajorArray, value.as_array().size());
      for (const auto& item : value.as_array()) encode_into(out, item);
      break;
    case Value::Type::Map:
      encode_map(out, value.as_map());
      break;
  }
}

Bytes encode(const Value& value) {
  Bytes out;
  encode_into(out, value);
  return out;
}

Bytes encode(const Map& map) {
  Bytes out;
  encode_map(out, map);
  return out;
}

// ============================================================================
// Decoding
// ============================================================================

std::optional<Value> decode_prefix(const uint8_t* data, size_t len, size_t& offset) {
  if (data == nullptr || offset >= len) return std::nullopt;
  Reader reader(data, len, offset);
  auto value = reader.read_item(0);
  if (value) offset = reader.offset();
  return value;
}

std::optional<Value> decode(const uint8_t* data, size_t len) {
  size_t offset = 0;
  auto value = decode_prefix(data, len, offset);
  if (!value || offset != len) return std::nullopt;
  return value;
}

// ============================================================================
// Diagnostic notation
// ============================================================================

std::string diagnostic(const Value& value) {
  std::ostringstream oss;
  write_diagnostic(oss, value);
  return oss.str();
}

std::string diagnostic(const Map& map) {
  return diagnostic(Value(map));
}

} // namespace cbor
} // namespace smp
