#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "docqa/hash/content_hash.hpp"
#include "docqa/registry/document_registry.hpp"

using docqa::core::error_code;
using docqa::registry::Document;
using docqa::registry::DocumentRegistry;

static std::string hash_of(const std::string& s) { return docqa::hash::content_hash(s).value(); }

TEST_CASE("registry: register assigns unique ids in order", "[registry]") {
  DocumentRegistry reg;
  auto a = reg.register_document("a.pdf", hash_of("a"), 3, 1);
  auto b = reg.register_document("b.pdf", hash_of("b"), 5, 2);
  REQUIRE(a.doc_id != b.doc_id);
  REQUIRE(a.doc_id.rfind("doc_1_", 0) == 0);
  REQUIRE(b.doc_id.rfind("doc_2_", 0) == 0);
  REQUIRE(reg.size() == 2);
  REQUIRE(reg.documents()[0] == a);
  REQUIRE(reg.documents()[1] == b);
  REQUIRE(a.num_chunks == 3);
  REQUIRE(b.num_pages == 2);
}

TEST_CASE("registry: timestamps are ISO-8601 UTC", "[registry]") {
  DocumentRegistry reg;
  auto d = reg.register_document("a.pdf", hash_of("a"), 1, 1);
  const auto& ts = d.upload_timestamp;
  REQUIRE(ts.size() == 27);
  REQUIRE(ts[4] == '-');
  REQUIRE(ts[10] == 'T');
  REQUIRE(ts[19] == '.');
  REQUIRE(ts.back() == 'Z');
}

TEST_CASE("registry: lookups by id, hash and filename", "[registry]") {
  DocumentRegistry reg;
  auto a = reg.register_document("a.pdf", hash_of("a"), 1, 1);
  reg.register_document("b.pdf", hash_of("b"), 1, 1);

  REQUIRE(reg.find(a.doc_id).value().filename == "a.pdf");
  REQUIRE(reg.find_by_hash(hash_of("b")).value().filename == "b.pdf");
  REQUIRE(reg.find_by_filename("a.pdf").value().doc_id == a.doc_id);
  REQUIRE_FALSE(reg.find("doc_99_0").has_value());
  REQUIRE_FALSE(reg.find_by_hash(hash_of("c")).has_value());
}

TEST_CASE("registry: remove unknown id is not_found", "[registry]") {
  DocumentRegistry reg;
  auto a = reg.register_document("a.pdf", hash_of("a"), 1, 1);
  auto missing = reg.remove("doc_42_0");
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().code == error_code::not_found);
  REQUIRE(missing.error().message == "Document doc_42_0 not found");

  REQUIRE(reg.remove(a.doc_id).has_value());
  REQUIRE(reg.empty());
}

TEST_CASE("registry: restore never reuses a stored sequence number", "[registry]") {
  DocumentRegistry reg;
  reg.register_document("a.pdf", hash_of("a"), 1, 1);
  auto b = reg.register_document("b.pdf", hash_of("b"), 1, 1);
  REQUIRE(reg.remove(b.doc_id).has_value());

  // A stale next_seq on disk is floored by the ids it holds.
  std::vector<Document> docs = reg.documents();
  docs.push_back(b);
  auto restored = DocumentRegistry::restore(docs, 1);
  REQUIRE(restored.has_value());
  REQUIRE(restored->next_sequence() == 3);
  auto c = restored->register_document("c.pdf", hash_of("c"), 1, 1);
  REQUIRE(c.doc_id.rfind("doc_3_", 0) == 0);
}

TEST_CASE("registry: restore rejects duplicate ids", "[registry]") {
  DocumentRegistry reg;
  auto a = reg.register_document("a.pdf", hash_of("a"), 1, 1);
  auto restored = DocumentRegistry::restore({a, a}, 2);
  REQUIRE_FALSE(restored.has_value());
  REQUIRE(restored.error().code == error_code::data_integrity);
}
