#pragma once

#include <system_error>
#include <tl/expected.hpp>

template <class T>
using expected = tl::expected<T, std::error_code>;
using tl::unexpected;

// Failures of a probe run. Everything except transport_unavailable and
// deadline_setup_failed (for UDP) terminates only the current server's probe.
enum class probe_errc {
  transport_unavailable = 1,
  deadline_setup_failed,
  resolution_failed,
  connect_failed,
  write_failed,
  short_write,
  read_failed,
  deadline_exceeded,
  decode_failed,
  unexpected_response_class,
  address_extraction_failed,
  transaction_mismatch,
};

const std::error_category& probe_category() noexcept;

std::error_code make_error_code(probe_errc e) noexcept;

template <>
struct std::is_error_code_enum<probe_errc> : std::true_type {};
