#include "stdinc.hpp"

#include "letterbox/rpc/entry-codec.hpp"
#include "letterbox/rpc/router.hpp"

#include <catch2/catch.hpp>

namespace letterbox::rpc::test {

static Json::Value parse(std::string_view text) {
  auto value = parse_json_text(text);
  CATCH_REQUIRE(value.has_value());
  return *value;
}

static schema::Schema user_create_schema() {
  return schema::object(
      {{"name", schema::string()}, {"optionalDelay", schema::number().optional()}});
}

CATCH_TEST_CASE("Schema", "[schema]") {
  CATCH_SECTION("scalars") {
    CATCH_REQUIRE(schema::string().parse(Json::Value{"x"}).has_value());
    CATCH_REQUIRE(!schema::string().parse(Json::Value{1}).has_value());
    CATCH_REQUIRE(schema::number().parse(Json::Value{1.5}).has_value());
    CATCH_REQUIRE(schema::number().parse(Json::Value{3}).has_value());
    CATCH_REQUIRE(!schema::number().parse(Json::Value{true}).has_value());
    CATCH_REQUIRE(schema::integer().parse(Json::Value{3}).has_value());
    CATCH_REQUIRE(!schema::integer().parse(Json::Value{3.5}).has_value());
    CATCH_REQUIRE(schema::boolean().parse(Json::Value{false}).has_value());
    CATCH_REQUIRE(schema::any().parse(parse(R"({"a":[1]})")).has_value());
    CATCH_REQUIRE(!schema::string().parse(Json::Value{}).has_value());
    CATCH_REQUIRE(schema::string().optional().parse(Json::Value{}).has_value());
  }

  CATCH_SECTION("object-strips-unknown-keys") {
    auto result = user_create_schema().parse(parse(R"({"name":"foo","callId":"testing"})"));
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE(*result == parse(R"({"name":"foo"})"));
  }

  CATCH_SECTION("invalid-type") {
    auto result = user_create_schema().parse(parse(R"({"name":1})"));
    CATCH_REQUIRE(!result.has_value());
    const auto& issues = result.error().issues;
    CATCH_REQUIRE(issues.size() == 1);
    CATCH_REQUIRE(issues[0].code == "invalid_type");
    CATCH_REQUIRE(issues[0].expected == "string");
    CATCH_REQUIRE(issues[0].received == "number");
    CATCH_REQUIRE(issues[0].path == std::vector<std::string>{"name"});
    CATCH_REQUIRE(issues[0].message == "Expected string, received number");

    const auto message = result.error().message();
    CATCH_REQUIRE(message.find("invalid_type") != std::string::npos);
    auto rendered = parse(message);
    CATCH_REQUIRE(rendered.isArray());
    CATCH_REQUIRE(rendered[0]["path"][0].asString() == "name");
  }

  CATCH_SECTION("missing-field") {
    auto result = user_create_schema().parse(parse(R"({"optionalDelay":5})"));
    CATCH_REQUIRE(!result.has_value());
    const auto& issue = result.error().issues.at(0);
    CATCH_REQUIRE(issue.received == "undefined");
    CATCH_REQUIRE(issue.message == "Required");
  }

  CATCH_SECTION("nested") {
    auto tags = schema::object({{"tags", schema::array(schema::string())}});
    auto result = tags.parse(parse(R"({"tags":["a",2,"c",false]})"));
    CATCH_REQUIRE(!result.has_value());
    const auto& issues = result.error().issues;
    CATCH_REQUIRE(issues.size() == 2);
    CATCH_REQUIRE(issues[0].path == std::vector<std::string>{"tags", "1"});
    CATCH_REQUIRE(issues[1].path == std::vector<std::string>{"tags", "3"});
    CATCH_REQUIRE(issues[1].received == "boolean");

    CATCH_REQUIRE(!tags.parse(Json::Value{"tags"}).has_value());
  }
}

CATCH_TEST_CASE("Router", "[router]") {
  Router router;
  router.add("echo", schema::any(),
             [](const Json::Value& input, CallContext&) -> Json::Value { return input; });

  CATCH_SECTION("resolve") {
    CATCH_REQUIRE(router.size() == 1);
    CATCH_REQUIRE(router.resolve("echo") != nullptr);
    CATCH_REQUIRE(router.resolve("echo")->name == "echo");
    CATCH_REQUIRE(router.resolve("missing") == nullptr);
  }

  CATCH_SECTION("duplicate-name") {
    CATCH_REQUIRE_THROWS_AS(
        router.add("echo", schema::any(),
                   [](const Json::Value&, CallContext&) { return Json::Value{}; }),
        std::logic_error);
  }

  CATCH_SECTION("validate") {
    router.add("named", schema::object({{"name", schema::string()}}),
               [](const Json::Value&, CallContext&) { return Json::Value{}; });
    CATCH_REQUIRE(router.validate("named", parse(R"({"name":"x"})")).has_value());
    CATCH_REQUIRE(!router.validate("named", parse(R"({"name":2})")).has_value());

    auto missing = router.validate("missing", Json::Value{});
    CATCH_REQUIRE(!missing.has_value());
    CATCH_REQUIRE(missing.error().issues.at(0).code == "unrecognized_procedure");
  }
}

} // namespace letterbox::rpc::test
