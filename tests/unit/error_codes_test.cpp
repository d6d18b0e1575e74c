#include <docqa/error.hpp>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using docqa::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::config_invalid) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::data_integrity) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
  REQUIRE(static_cast<unsigned>(error_code::unavailable) == 7001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::invalid_argument) == 9002u);
  REQUIRE(static_cast<unsigned>(error_code::not_initialized) == 9003u);
  REQUIRE(static_cast<unsigned>(error_code::extraction_failed) == 10001u);
  REQUIRE(static_cast<unsigned>(error_code::empty_document) == 10005u);
}

TEST_CASE("error codes have names", "[errors]") {
  using docqa::core::error_code;
  using docqa::core::to_string;
  REQUIRE(to_string(error_code::not_found) == "not_found");
  REQUIRE(to_string(error_code::dimension_mismatch) == "dimension_mismatch");
}
