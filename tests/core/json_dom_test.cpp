#include "core/json_dom.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using packforge::core::json::Value;

TEST_CASE("Parse builds objects, arrays and scalars", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(packforge::core::json::Parse(
      R"({"name":"Hero","level":3,"tags":["a","b"],"alive":true,"owner":null})", root, error));
  REQUIRE(root.IsObject());

  const Value* name = packforge::core::json::FindMember(root, "name");
  REQUIRE(name != nullptr);
  REQUIRE(name->string_value == "Hero");

  const Value* level = packforge::core::json::FindMember(root, "level");
  REQUIRE(level != nullptr);
  REQUIRE(level->number_value == 3.0);

  const Value* tags = packforge::core::json::FindMember(root, "tags");
  REQUIRE(tags != nullptr);
  REQUIRE(tags->IsArray());
  REQUIRE(tags->array_value.size() == 2U);

  const Value* owner = packforge::core::json::FindMember(root, "owner");
  REQUIRE(owner != nullptr);
  REQUIRE(owner->IsNull());

  REQUIRE(packforge::core::json::FindMember(root, "missing") == nullptr);
}

TEST_CASE("Parse decodes unicode escapes including surrogate pairs", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(packforge::core::json::Parse(R"({"text":"caf\u00e9 \ud83d\ude00"})", root, error));

  const Value* text = packforge::core::json::FindMember(root, "text");
  REQUIRE(text != nullptr);
  REQUIRE(text->string_value == "caf\xC3\xA9 \xF0\x9F\x98\x80");
}

TEST_CASE("Parse rejects malformed input with a message", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(packforge::core::json::Parse(R"({"name": "Hero",})", root, error));
  REQUIRE_FALSE(error.empty());

  error.clear();
  REQUIRE_FALSE(packforge::core::json::Parse(R"({"a":1} trailing)", root, error));
  REQUIRE_FALSE(error.empty());
}

TEST_CASE("Serialize is compact and orders members by key", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(packforge::core::json::Parse(
      R"({ "name" : "Hero", "id" : "A1", "items" : [ "I1", 2, 2.5, false, null ] })", root,
      error));

  REQUIRE(packforge::core::json::Serialize(root) ==
          R"({"id":"A1","items":["I1",2,2.5,false,null],"name":"Hero"})");
}

TEST_CASE("Serialize escapes control characters and quotes", "[core][json]") {
  Value root = packforge::core::json::MakeObject();
  root.object_value["text"] = packforge::core::json::MakeString("say \"hi\"\n\x01");

  REQUIRE(packforge::core::json::Serialize(root) == R"({"text":"say \"hi\"\n\u0001"})");
}

TEST_CASE("Serialize writes integral numbers without a fraction", "[core][json]") {
  REQUIRE(packforge::core::json::Serialize(packforge::core::json::MakeNumber(42.0)) == "42");
  REQUIRE(packforge::core::json::Serialize(packforge::core::json::MakeNumber(-7.0)) == "-7");
  REQUIRE(packforge::core::json::Serialize(packforge::core::json::MakeNumber(0.25)) == "0.25");
}
