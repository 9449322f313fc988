#include "hierarchy/normalizer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using packforge::core::json::Value;
using packforge::hierarchy::DocumentFields;
using packforge::hierarchy::SchemaRegistry;

namespace {

Value ParseOrFail(std::string_view text) {
  Value value;
  std::string error;
  REQUIRE(packforge::core::json::Parse(text, value, error));
  return value;
}

std::string Normalize(std::string_view document, std::string_view collection,
                      const DocumentFields& fields = DocumentFields{}) {
  Value normalized;
  std::string error;
  REQUIRE(packforge::hierarchy::NormalizeEntry(ParseOrFail(document), collection,
                                               SchemaRegistry::Default(), fields, normalized,
                                               error));
  return packforge::core::json::Serialize(normalized);
}

} // namespace

TEST_CASE("NormalizeEntry replaces embedded children with their ids", "[hierarchy][normalize]") {
  const std::string normalized = Normalize(
      R"({"key":"w!actors!A1","id":"A1","name":"Hero",
          "items":[{"key":"w!actors.items!I1","id":"I1","name":"Sword"}]})",
      "actors");
  REQUIRE(normalized == R"({"effects":[],"id":"A1","items":["I1"],"name":"Hero"})");

  REQUIRE(Normalize(R"({"key":"w!actors.items!I1","id":"I1","name":"Sword"})", "items") ==
          R"({"effects":[],"id":"I1","name":"Sword"})");
}

TEST_CASE("NormalizeEntry defaults sequences to empty arrays", "[hierarchy][normalize]") {
  REQUIRE(Normalize(R"({"key":"w!journal!J1","id":"J1","pages":null})", "journal") ==
          R"({"id":"J1","pages":[]})");
  REQUIRE(Normalize(R"({"key":"w!journal!J1","id":"J1","pages":"oops"})", "journal") ==
          R"({"id":"J1","pages":[]})");
}

TEST_CASE("NormalizeEntry keeps child order and nulls missing ids", "[hierarchy][normalize]") {
  REQUIRE(Normalize(R"({"key":"w!tables!T1","results":[{"id":"R2"},{"name":"no id"},{"id":"R1"}]})",
                    "tables") == R"({"results":["R2",null,"R1"]})");
}

TEST_CASE("NormalizeEntry resolves singleton fields", "[hierarchy][normalize]") {
  REQUIRE(Normalize(R"({"key":"w!tokens!T1","id":"T1","delta":{"key":"w!delta!D1","id":"D1"}})",
                    "tokens") == R"({"delta":"D1","id":"T1"})");
  REQUIRE(Normalize(R"({"key":"w!tokens!T1","id":"T1"})", "tokens") ==
          R"({"delta":null,"id":"T1"})");
  REQUIRE(Normalize(R"({"key":"w!tokens!T1","id":"T1","delta":null})", "tokens") ==
          R"({"delta":null,"id":"T1"})");
}

TEST_CASE("NormalizeEntry leaves unknown collections untouched apart from the key",
          "[hierarchy][normalize]") {
  REQUIRE(Normalize(R"({"key":"w!effects!E1","id":"E1","items":[{"id":"X"}]})", "effects") ==
          R"({"id":"E1","items":[{"id":"X"}]})");
}

TEST_CASE("NormalizeEntry honors custom key and id fields", "[hierarchy][normalize]") {
  DocumentFields fields;
  fields.key_field = "_key";
  fields.id_field = "_id";
  REQUIRE(Normalize(R"({"_key":"!items!I1","_id":"I1","key":"kept","effects":[{"_id":"E1"}]})",
                    "items", fields) == R"({"_id":"I1","effects":["E1"],"key":"kept"})");
}

TEST_CASE("NormalizeEntry rejects non-object nodes", "[hierarchy][normalize]") {
  Value normalized;
  std::string error;
  REQUIRE_FALSE(packforge::hierarchy::NormalizeEntry(ParseOrFail(R"("text")"), "actors",
                                                     SchemaRegistry::Default(), DocumentFields{},
                                                     normalized, error));
  REQUIRE(error.find("actors") != std::string::npos);
}
