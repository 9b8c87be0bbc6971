#include "defs.hpp"

#include <string>

namespace {
class ProbeCategory : public std::error_category {
 public:
  const char* name() const noexcept override { return "nat_probe"; }

  std::string message(int ev) const override {
    switch (static_cast<probe_errc>(ev)) {
      case probe_errc::transport_unavailable:
        return "transport unavailable";
      case probe_errc::deadline_setup_failed:
        return "failed to set deadline";
      case probe_errc::resolution_failed:
        return "failed to resolve server address";
      case probe_errc::connect_failed:
        return "failed to connect to server";
      case probe_errc::write_failed:
        return "failed to write request";
      case probe_errc::short_write:
        return "request was only partially written";
      case probe_errc::read_failed:
        return "failed to read response";
      case probe_errc::deadline_exceeded:
        return "deadline exceeded";
      case probe_errc::decode_failed:
        return "response is not a valid STUN message";
      case probe_errc::unexpected_response_class:
        return "unexpected STUN response class";
      case probe_errc::address_extraction_failed:
        return "no usable mapped address in response";
      case probe_errc::transaction_mismatch:
        return "transaction ID mismatch";
      default:
        return "unknown probe error";
    }
  }
};
}  // namespace

const std::error_category& probe_category() noexcept {
  static const ProbeCategory category;
  return category;
}

std::error_code make_error_code(probe_errc e) noexcept {
  return {static_cast<int>(e), probe_category()};
}
