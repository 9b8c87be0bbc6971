#include "stun.hpp"
#include "log.hpp"

#include <algorithm>
#include <format>
#include <ostream>
#include <random>
#include <tuple>

LOG_MODULE_NAME("STUN");

namespace {
constexpr uint8_t Family_IPv4 = 0x01;
constexpr uint8_t Family_IPv6 = 0x02;

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
  put_u16(out, static_cast<uint16_t>(v >> 16));
  put_u16(out, static_cast<uint16_t>(v & 0xFFFF));
}

uint16_t get_u16(std::span<const uint8_t> data, size_t offset) {
  return static_cast<uint16_t>(static_cast<uint16_t>(data[offset]) << 8 |
                               static_cast<uint16_t>(data[offset + 1]));
}

uint32_t get_u32(std::span<const uint8_t> data, size_t offset) {
  return static_cast<uint32_t>(get_u16(data, offset)) << 16 |
         static_cast<uint32_t>(get_u16(data, offset + 2));
}

size_t padded(size_t n) {
  return (n + 3) & ~size_t{3};
}

// Bit layout: M11..M7 C1 M6..M4 C0 M3..M0 (top two bits always zero).
uint16_t encode_message_type(StunMethod method, StunClass c) {
  const auto m = static_cast<uint16_t>(method);
  const auto cls = static_cast<uint16_t>(c);
  return static_cast<uint16_t>((m & 0x000F) | ((m & 0x0070) << 1) |
                               ((m & 0x0F80) << 2) | ((cls & 0x1) << 4) |
                               ((cls & 0x2) << 7));
}

void decode_message_type(uint16_t t, StunMethod& method, StunClass& c) {
  method = static_cast<StunMethod>((t & 0x000F) | ((t & 0x00E0) >> 1) |
                                   ((t & 0x3E00) >> 2));
  c = static_cast<StunClass>(((t & 0x0010) >> 4) | ((t & 0x0100) >> 7));
}

// Mask for the address part of XOR-MAPPED-ADDRESS: the magic cookie,
// followed by the transaction ID for IPv6.
std::array<uint8_t, 16> xor_mask(const TransactionId& id) {
  std::array<uint8_t, 16> mask{};
  mask[0] = static_cast<uint8_t>(STUN_MagicCookie >> 24);
  mask[1] = static_cast<uint8_t>((STUN_MagicCookie >> 16) & 0xFF);
  mask[2] = static_cast<uint8_t>((STUN_MagicCookie >> 8) & 0xFF);
  mask[3] = static_cast<uint8_t>(STUN_MagicCookie & 0xFF);
  std::copy(id.begin(), id.end(), mask.begin() + 4);
  return mask;
}
}  // namespace

std::string to_string(StunClass v) {
  switch (v) {
    case StunClass::request:
      return "request";
    case StunClass::indication:
      return "indication";
    case StunClass::success_response:
      return "success_response";
    case StunClass::error_response:
      return "error_response";
    default:
      return "unknown";
  }
}

std::ostream& operator<<(std::ostream& os, StunClass v) {
  os << to_string(v);
  return os;
}

TransactionId make_transaction_id() {
  std::random_device rd;
  std::uniform_int_distribution<unsigned> byte_dist{0, 255};
  TransactionId id;
  for (auto& b : id) {
    b = static_cast<uint8_t>(byte_dist(rd));
  }
  return id;
}

std::string to_hex(const TransactionId& id) {
  std::string out;
  out.reserve(id.size() * 2);
  for (uint8_t b : id) {
    out += std::format("{:02x}", b);
  }
  return out;
}

const StunAttribute* StunMessage::find_attribute(uint16_t type) const {
  for (const auto& a : attributes) {
    if (a.type == type)
      return &a;
  }
  return nullptr;
}

bool operator==(const StunAttribute& lhs, const StunAttribute& rhs) {
  return std::tie(lhs.type, lhs.value) == std::tie(rhs.type, rhs.value);
}

namespace {
auto make_tie(const StunMessage& m) {
  return std::tie(m.method, m.msg_class, m.transaction_id, m.attributes);
}
}  // namespace

bool operator==(const StunMessage& lhs, const StunMessage& rhs) {
  return make_tie(lhs) == make_tie(rhs);
}

std::ostream& operator<<(std::ostream& os, const StunMessage& m) {
  os << "StunMessage{method: " << static_cast<unsigned>(m.method)
     << ", class: " << m.msg_class
     << ", transaction_id: " << to_hex(m.transaction_id)
     << ", attributes: " << m.attributes.size() << "}";
  return os;
}

StunMessage make_binding_request() {
  StunMessage m;
  m.method = StunMethod::binding;
  m.msg_class = StunClass::request;
  m.transaction_id = make_transaction_id();
  return m;
}

expected<std::vector<uint8_t>> serialize_stun_message(const StunMessage& m) {
  if (static_cast<uint16_t>(m.method) > 0x0FFF) {
    LOG_ERROR("STUN method cannot exceed 12 bits: {}",
              static_cast<unsigned>(m.method));
    return unexpected(make_error_code(std::errc::invalid_argument));
  }

  size_t body_size = 0;
  for (const auto& a : m.attributes) {
    if (a.value.size() > 0xFFFF) {
      LOG_ERROR("attribute {:#06x} is too long: {}", a.type, a.value.size());
      return unexpected(make_error_code(std::errc::invalid_argument));
    }
    body_size += 4 + padded(a.value.size());
  }
  if (body_size > 0xFFFF) {
    LOG_ERROR("STUN message body is too long: {}", body_size);
    return unexpected(make_error_code(std::errc::message_size));
  }

  std::vector<uint8_t> out;
  out.reserve(STUN_HeaderSize + body_size);
  put_u16(out, encode_message_type(m.method, m.msg_class));
  put_u16(out, static_cast<uint16_t>(body_size));
  put_u32(out, STUN_MagicCookie);
  out.insert(out.end(), m.transaction_id.begin(), m.transaction_id.end());

  for (const auto& a : m.attributes) {
    put_u16(out, a.type);
    put_u16(out, static_cast<uint16_t>(a.value.size()));
    out.insert(out.end(), a.value.begin(), a.value.end());
    out.resize(out.size() + padded(a.value.size()) - a.value.size(), 0);
  }

  return out;
}

expected<StunMessage> deserialize_stun_message_from(
    std::span<const uint8_t> data) {
  if (data.size() < STUN_HeaderSize) {
    LOG_DEBUG("STUN message cannot be smaller than {} bytes, there is {}",
              STUN_HeaderSize, data.size());
    return unexpected(make_error_code(std::errc::bad_message));
  }

  const uint16_t type = get_u16(data, 0);
  if (type & 0xC000) {
    LOG_DEBUG("top two bits of STUN message type are not zero: {:#06x}",
              type);
    return unexpected(make_error_code(std::errc::bad_message));
  }

  const uint32_t cookie = get_u32(data, 4);
  if (cookie != STUN_MagicCookie) {
    LOG_DEBUG("invalid magic cookie: {:#010x}", cookie);
    return unexpected(make_error_code(std::errc::bad_message));
  }

  const size_t length = get_u16(data, 2);
  if (length % 4 != 0) {
    LOG_DEBUG("STUN message length is not a multiple of 4: {}", length);
    return unexpected(make_error_code(std::errc::bad_message));
  }
  if (STUN_HeaderSize + length > data.size()) {
    LOG_DEBUG("STUN message declares {} bytes of attributes, there is {}",
              length, data.size() - STUN_HeaderSize);
    return unexpected(make_error_code(std::errc::bad_message));
  }

  StunMessage m;
  decode_message_type(type, m.method, m.msg_class);
  std::copy(data.begin() + 8, data.begin() + STUN_HeaderSize,
            m.transaction_id.begin());

  const auto body = data.subspan(STUN_HeaderSize, length);
  size_t offset = 0;
  while (offset < body.size()) {
    if (body.size() - offset < 4) {
      LOG_DEBUG("truncated attribute header at offset {}", offset);
      return unexpected(make_error_code(std::errc::bad_message));
    }
    StunAttribute a;
    a.type = get_u16(body, offset);
    const size_t value_size = get_u16(body, offset + 2);
    offset += 4;
    if (value_size > body.size() - offset) {
      LOG_DEBUG("attribute {:#06x} value of {} bytes exceeds message",
                a.type, value_size);
      return unexpected(make_error_code(std::errc::bad_message));
    }
    a.value.assign(body.begin() + offset, body.begin() + offset + value_size);
    offset += padded(value_size);
    m.attributes.push_back(std::move(a));
  }

  return m;
}

std::string MappedAddress::to_string() const {
  if (address.is_v6()) {
    return std::format("[{}]:{}", address.to_string(), port);
  }
  return std::format("{}:{}", address.to_string(), port);
}

bool operator==(const MappedAddress& lhs, const MappedAddress& rhs) {
  return std::tie(lhs.address, lhs.port) == std::tie(rhs.address, rhs.port);
}

expected<MappedAddress> extract_xor_mapped_address(const StunMessage& m) {
  const StunAttribute* attr = m.find_attribute(stun_attr::xor_mapped_address);
  if (!attr) {
    return unexpected(make_error_code(std::errc::no_message));
  }

  const std::span<const uint8_t> value{attr->value};
  if (value.size() < 4) {
    LOG_DEBUG("XOR-MAPPED-ADDRESS too short: {}", value.size());
    return unexpected(make_error_code(std::errc::bad_message));
  }

  const uint8_t family = value[1];
  const auto mask = xor_mask(m.transaction_id);

  MappedAddress result;
  result.port =
      static_cast<uint16_t>(get_u16(value, 2) ^ (STUN_MagicCookie >> 16));

  if (family == Family_IPv4) {
    if (value.size() != 4 + 4) {
      LOG_DEBUG("IPv4 XOR-MAPPED-ADDRESS has wrong size: {}", value.size());
      return unexpected(make_error_code(std::errc::bad_message));
    }
    asio::ip::address_v4::bytes_type bytes;
    for (size_t i = 0; i < bytes.size(); ++i) {
      bytes[i] = value[4 + i] ^ mask[i];
    }
    result.address = asio::ip::address_v4{bytes};
  } else if (family == Family_IPv6) {
    if (value.size() != 4 + 16) {
      LOG_DEBUG("IPv6 XOR-MAPPED-ADDRESS has wrong size: {}", value.size());
      return unexpected(make_error_code(std::errc::bad_message));
    }
    asio::ip::address_v6::bytes_type bytes;
    for (size_t i = 0; i < bytes.size(); ++i) {
      bytes[i] = value[4 + i] ^ mask[i];
    }
    result.address = asio::ip::address_v6{bytes};
  } else {
    LOG_DEBUG("unknown address family in XOR-MAPPED-ADDRESS: {}", family);
    return unexpected(make_error_code(std::errc::address_family_not_supported));
  }

  return result;
}

void add_xor_mapped_address(StunMessage& m, const MappedAddress& address) {
  const auto mask = xor_mask(m.transaction_id);

  StunAttribute a;
  a.type = stun_attr::xor_mapped_address;
  a.value.push_back(0);
  a.value.push_back(address.address.is_v6() ? Family_IPv6 : Family_IPv4);
  put_u16(a.value,
          static_cast<uint16_t>(address.port ^ (STUN_MagicCookie >> 16)));

  if (address.address.is_v6()) {
    const auto bytes = address.address.to_v6().to_bytes();
    for (size_t i = 0; i < bytes.size(); ++i) {
      a.value.push_back(bytes[i] ^ mask[i]);
    }
  } else {
    const auto bytes = address.address.to_v4().to_bytes();
    for (size_t i = 0; i < bytes.size(); ++i) {
      a.value.push_back(bytes[i] ^ mask[i]);
    }
  }

  m.attributes.push_back(std::move(a));
}
