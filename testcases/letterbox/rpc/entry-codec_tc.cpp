#include "stdinc.hpp"

#include "letterbox/rpc/entry-codec.hpp"

#include <catch2/catch.hpp>

namespace letterbox::rpc::test {

static Json::Value parse(std::string_view text) {
  auto value = parse_json_text(text);
  CATCH_REQUIRE(value.has_value());
  return *value;
}

CATCH_TEST_CASE("EntryCodec", "[entry-codec]") {
  CATCH_SECTION("call-entry") {
    Json::Value input{Json::objectValue};
    input["name"] = "foo";

    auto call = make_call("userCreate", input);
    CATCH_REQUIRE(call.id.size() == 36); // a uuid
    CATCH_REQUIRE(make_call("userCreate", input).id != call.id);
    CATCH_REQUIRE(make_call("userCreate", input, "testing").id == "testing");

    call.batch_id = "batch-1";
    const auto raw = encode(call);
    CATCH_REQUIRE(raw["kind"].asString() == "call");
    CATCH_REQUIRE(raw["batchId"].asString() == "batch-1");

    auto decoded = decode(raw);
    CATCH_REQUIRE(decoded.has_value());
    const auto* entry = std::get_if<CallEntry>(&*decoded);
    CATCH_REQUIRE(entry != nullptr);
    CATCH_REQUIRE(entry->id == call.id);
    CATCH_REQUIRE(entry->procedure == "userCreate");
    CATCH_REQUIRE(entry->input == input);
    CATCH_REQUIRE(entry->batch_id == "batch-1");
  }

  CATCH_SECTION("call-entry-without-batch") {
    const auto raw = encode(make_call("ping", Json::Value{}, "id-1"));
    CATCH_REQUIRE(!raw.isMember("batchId"));
    CATCH_REQUIRE(to_json_text(raw) ==
                  R"({"id":"id-1","input":null,"kind":"call","procedure":"ping"})");
  }

  CATCH_SECTION("success-response") {
    auto decoded = decode(parse(
        R"({"kind":"response","callId":"c1","outcome":{"status":"success","result":{"n":1}}})"));
    CATCH_REQUIRE(decoded.has_value());
    const auto* response = std::get_if<ResponseEntry>(&*decoded);
    CATCH_REQUIRE(response != nullptr);
    CATCH_REQUIRE(response->call_id == "c1");
    CATCH_REQUIRE(response->is_success());
    CATCH_REQUIRE(response->result["n"].asInt() == 1);
  }

  CATCH_SECTION("failure-response") {
    const auto raw =
        encode(make_response("c2", Status{StatusCode::APPLICATION_ERROR, "nope", "CONFLICT"}));
    CATCH_REQUIRE(raw["outcome"]["status"].asString() == "failure");
    CATCH_REQUIRE(raw["outcome"]["code"].asString() == "APPLICATION_ERROR");
    CATCH_REQUIRE(raw["outcome"]["details"].asString() == "CONFLICT");

    auto decoded = decode(raw);
    CATCH_REQUIRE(decoded.has_value());
    const auto& response = std::get<ResponseEntry>(*decoded);
    CATCH_REQUIRE(!response.is_success());
    CATCH_REQUIRE(response.status ==
                  Status(StatusCode::APPLICATION_ERROR, "nope", "CONFLICT"));
  }

  CATCH_SECTION("unknown-failure-code") {
    auto decoded = decode(parse(R"({"kind":"response","callId":"c3",
        "outcome":{"status":"failure","code":"TEAPOT","message":"short and stout"}})"));
    CATCH_REQUIRE(decoded.has_value());
    const auto& response = std::get<ResponseEntry>(*decoded);
    CATCH_REQUIRE(response.status.error_code() == StatusCode::UNKNOWN);
    CATCH_REQUIRE(response.status.error_message() == "short and stout");
    CATCH_REQUIRE(response.status.error_details() == "TEAPOT");
  }

  CATCH_SECTION("forward-compatible") {
    auto decoded = decode(parse(R"({"kind":"call","id":"x","procedure":"p","extra":[1,2]})"));
    CATCH_REQUIRE(decoded.has_value());
    CATCH_REQUIRE(std::get<CallEntry>(*decoded).input.isNull());

    auto other = decode(parse(R"({"kind":"presence","peer":"p1"})"));
    CATCH_REQUIRE(other.has_value());
    CATCH_REQUIRE(std::get<UnknownEntry>(*other).kind == "presence");
  }

  CATCH_SECTION("malformed") {
    auto error_of = [](std::string_view text) { return decode(parse(text)).error(); };

    CATCH_REQUIRE(error_of("[1,2,3]") == make_error_code(ecode::not_an_object));
    CATCH_REQUIRE(error_of("42") == make_error_code(ecode::not_an_object));
    CATCH_REQUIRE(error_of(R"({"id":"x"})") == make_error_code(ecode::missing_field));
    CATCH_REQUIRE(error_of(R"({"kind":7})") == make_error_code(ecode::type_error));
    CATCH_REQUIRE(error_of(R"({"kind":"call","procedure":"p"})") ==
                  make_error_code(ecode::missing_field));
    CATCH_REQUIRE(error_of(R"({"kind":"call","id":"","procedure":"p"})") ==
                  make_error_code(ecode::invalid_data));
    CATCH_REQUIRE(error_of(R"({"kind":"call","id":1,"procedure":"p"})") ==
                  make_error_code(ecode::type_error));
    CATCH_REQUIRE(error_of(R"({"kind":"response","callId":"c"})") ==
                  make_error_code(ecode::missing_field));
    CATCH_REQUIRE(error_of(R"({"kind":"response","callId":"c","outcome":{"status":"maybe"}})") ==
                  make_error_code(ecode::invalid_data));
    const auto ok_failure =
        R"({"kind":"response","callId":"c","outcome":{"status":"failure","code":"OK"}})";
    CATCH_REQUIRE(error_of(ok_failure) == make_error_code(ecode::invalid_data));
  }

  CATCH_SECTION("json-text") {
    CATCH_REQUIRE(!parse_json_text("{not json").has_value());
    CATCH_REQUIRE(parse_json_text("{not json").error() == make_error_code(ecode::invalid_data));
  }
}

} // namespace letterbox::rpc::test
