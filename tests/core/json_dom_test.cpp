#include "core/json_dom.hpp"

#include <catch2/catch.hpp>

#include <cstdint>
#include <string>

namespace json = coresidency::core::json;

TEST_CASE("JSON DOM parses nested documented leaves", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(R"({"Performance": {"MaxSamples": {"Value": 5, "Description": "window"}}})",
                      root, error));
  REQUIRE(error.empty());

  const json::Value* performance = json::FindMember(root, "Performance");
  REQUIRE(performance != nullptr);
  const json::Value* max_samples_node = json::FindMember(*performance, "MaxSamples");
  REQUIRE(max_samples_node != nullptr);
  const json::Value* leaf = json::FindMember(*max_samples_node, "Value");
  REQUIRE(leaf != nullptr);
  REQUIRE(leaf->is_number());

  std::int64_t max_samples = 0;
  REQUIRE(json::TryGetInteger(*leaf, max_samples));
  REQUIRE(max_samples == 5);

  REQUIRE(json::FindMember(*performance, "Missing") == nullptr);
  REQUIRE(json::FindMember(*leaf, "Value") == nullptr);
}

TEST_CASE("JSON DOM rejects duplicate keys", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE_FALSE(json::Parse(R"({"CpuUsage": 1, "CpuUsage": 2})", root, error));
  REQUIRE(error.find("duplicate object key 'CpuUsage'") != std::string::npos);
}

TEST_CASE("JSON DOM reports line and column of syntax errors", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE_FALSE(json::Parse("{\n  \"a\": 1,\n  \"b\" 2\n}", root, error));
  REQUIRE(error.find("line 3") != std::string::npos);
  REQUIRE(error.find("expected ':'") != std::string::npos);
}

TEST_CASE("JSON DOM rejects trailing content", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE_FALSE(json::Parse("{} {}", root, error));
  REQUIRE(error.find("trailing content") != std::string::npos);
}

TEST_CASE("JSON DOM decodes unicode escapes to UTF-8", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(R"({"host": "n\u00e9ud-\ud83d\ude00"})", root, error));
  const json::Value* host = json::FindMember(root, "host");
  REQUIRE(host != nullptr);
  REQUIRE(host->string_value == "n\xc3\xa9ud-\xf0\x9f\x98\x80");
}

TEST_CASE("JSON DOM integer extraction refuses fractions", "[core][json]") {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(R"({"a": 2.5, "b": -3, "c": true})", root, error));

  std::int64_t out = 0;
  REQUIRE_FALSE(json::TryGetInteger(*json::FindMember(root, "a"), out));
  REQUIRE(json::TryGetInteger(*json::FindMember(root, "b"), out));
  REQUIRE(out == -3);
  REQUIRE_FALSE(json::TryGetInteger(*json::FindMember(root, "c"), out));
}
