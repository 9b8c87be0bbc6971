////////////////////////////////////////////////////////////
// STUN message types and routines.
////////////////////////////////////////////////////////////
#pragma once
#include <array>
#include <asio/ip/address.hpp>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <vector>
#include "defs.hpp"

// https://datatracker.ietf.org/doc/html/rfc5389#section-6

constexpr size_t STUN_HeaderSize = 20;
constexpr uint32_t STUN_MagicCookie = 0x2112A442;

// Two bits spread over the message type (C1 at bit 8, C0 at bit 4).
enum class StunClass : uint8_t {
  request = 0,
  indication = 1,
  success_response = 2,
  error_response = 3
};

std::string to_string(StunClass v);
std::ostream& operator<<(std::ostream& os, StunClass v);

// 12 bits interleaved with the class bits. Only binding is used here.
enum class StunMethod : uint16_t { binding = 0x001 };

namespace stun_attr {
constexpr uint16_t xor_mapped_address = 0x0020;
constexpr uint16_t software = 0x8022;
}  // namespace stun_attr

using TransactionId = std::array<uint8_t, 12>;

// Draws 96 random bits from std::random_device.
TransactionId make_transaction_id();

std::string to_hex(const TransactionId& id);

struct StunAttribute {
  uint16_t type{};
  // Unpadded value. Padding to 4 bytes is added/stripped by the codec.
  std::vector<uint8_t> value;
};

struct StunMessage {
  StunMethod method = StunMethod::binding;
  StunClass msg_class = StunClass::request;
  TransactionId transaction_id{};
  std::vector<StunAttribute> attributes;

  const StunAttribute* find_attribute(uint16_t type) const;
};

bool operator==(const StunAttribute& lhs, const StunAttribute& rhs);
bool operator==(const StunMessage& lhs, const StunMessage& rhs);

std::ostream& operator<<(std::ostream& os, const StunMessage& m);

// Binding request with a fresh transaction ID and no attributes.
StunMessage make_binding_request();

expected<std::vector<uint8_t>> serialize_stun_message(const StunMessage& m);

// Validates header (zero top bits, magic cookie, 4-byte aligned length that
// fits into data) and walks attributes. Bytes after the declared message
// length are ignored, so a whole receive buffer may be passed in.
expected<StunMessage> deserialize_stun_message_from(
    std::span<const uint8_t> data);

struct MappedAddress {
  asio::ip::address address;
  uint16_t port{};

  // 203.0.113.5:54321 or [2001:db8::1]:54321
  std::string to_string() const;
};

bool operator==(const MappedAddress& lhs, const MappedAddress& rhs);

// Decodes XOR-MAPPED-ADDRESS. Errors: std::errc::no_message when the
// attribute is absent, std::errc::bad_message when it is malformed,
// std::errc::address_family_not_supported for unknown families.
expected<MappedAddress> extract_xor_mapped_address(const StunMessage& m);

void add_xor_mapped_address(StunMessage& m, const MappedAddress& address);
