#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling by the outer request layer.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace docqa::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  config_invalid = 2001,
  data_integrity = 3001,
  precondition_failed = 4001,
  not_found = 6001,
  unavailable = 7001,
  internal = 9001,
  invalid_argument = 9002,
  not_initialized = 9003,
  extraction_failed = 10001,
  embedding_failed = 10002,
  generation_failed = 10003,
  dimension_mismatch = 10004,
  empty_document = 10005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "storage.store" */
};

/** \brief Stable lowercase name of a code, used in logs and the admin tool. */
constexpr std::string_view to_string(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::unavailable: return "unavailable";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::not_initialized: return "not_initialized";
    case error_code::extraction_failed: return "extraction_failed";
    case error_code::embedding_failed: return "embedding_failed";
    case error_code::generation_failed: return "generation_failed";
    case error_code::dimension_mismatch: return "dimension_mismatch";
    case error_code::empty_document: return "empty_document";
  }
  return "internal";
}

} // namespace docqa::core
