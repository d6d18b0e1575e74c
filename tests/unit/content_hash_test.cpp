#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "docqa/hash/content_hash.hpp"

using docqa::hash::content_hash;
using docqa::hash::is_hex_digest;

TEST_CASE("content_hash: known SHA-256 vectors", "[hash]") {
  auto empty = content_hash(std::string_view{});
  REQUIRE(empty.has_value());
  REQUIRE(*empty == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

  auto abc = content_hash(std::string_view{"abc"});
  REQUIRE(abc.has_value());
  REQUIRE(*abc == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("content_hash: idempotent and byte-sensitive", "[hash]") {
  std::vector<std::uint8_t> bytes{'%', 'P', 'D', 'F', '-', '1', '.', '4', 0x00, 0xFF};
  auto a = content_hash(bytes);
  auto b = content_hash(bytes);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(*a == *b);
  REQUIRE(a->size() == docqa::hash::kHexDigestLength);
  REQUIRE(is_hex_digest(*a));

  bytes.back() = 0xFE;
  auto c = content_hash(bytes);
  REQUIRE(c.has_value());
  REQUIRE(*c != *a);
}

TEST_CASE("content_hash: span and string overloads agree", "[hash]") {
  const std::string s = "same bytes";
  const std::vector<std::uint8_t> v(s.begin(), s.end());
  REQUIRE(content_hash(s).value() == content_hash(v).value());
}

TEST_CASE("is_hex_digest rejects malformed digests", "[hash]") {
  REQUIRE_FALSE(is_hex_digest(""));
  REQUIRE_FALSE(is_hex_digest(std::string(63, 'a')));
  REQUIRE_FALSE(is_hex_digest(std::string(64, 'g')));
  REQUIRE_FALSE(is_hex_digest(std::string(64, 'A')));
  REQUIRE(is_hex_digest(std::string(64, 'f')));
}
