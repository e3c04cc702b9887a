#include "stdinc.hpp"

#include "entry-codec.hpp"

#include "letterbox/utils/uuid.hpp"

#include <json/reader.h>
#include <json/writer.h>

#include <memory>

namespace letterbox::rpc {

namespace {
constexpr const char* k_kind = "kind";
constexpr const char* k_kind_call = "call";
constexpr const char* k_kind_response = "response";
constexpr const char* k_id = "id";
constexpr const char* k_procedure = "procedure";
constexpr const char* k_input = "input";
constexpr const char* k_batch_id = "batchId";
constexpr const char* k_call_id = "callId";
constexpr const char* k_outcome = "outcome";
constexpr const char* k_status = "status";
constexpr const char* k_success = "success";
constexpr const char* k_failure = "failure";
constexpr const char* k_result = "result";
constexpr const char* k_code = "code";
constexpr const char* k_message = "message";
constexpr const char* k_details = "details";

std::error_code error(ecode e) { return make_error_code(e); }

// Reads a required string field
std::error_code read_string(const Json::Value& object, const char* key, std::string& out) {
  if (!object.isMember(key))
    return error(ecode::missing_field);
  const auto& value = object[key];
  if (!value.isString())
    return error(ecode::type_error);
  out = value.asString();
  return {};
}

// Reads an optional string field
std::error_code read_optional_string(const Json::Value& object, const char* key,
                                     std::string& out) {
  if (!object.isMember(key) || object[key].isNull())
    return {};
  return read_string(object, key, out);
}

tl::expected<Entry, std::error_code> decode_call(const Json::Value& raw) {
  CallEntry entry;
  if (auto ec = read_string(raw, k_id, entry.id))
    return tl::make_unexpected(ec);
  if (entry.id.empty())
    return tl::make_unexpected(error(ecode::invalid_data));
  if (auto ec = read_string(raw, k_procedure, entry.procedure))
    return tl::make_unexpected(ec);
  if (auto ec = read_optional_string(raw, k_batch_id, entry.batch_id))
    return tl::make_unexpected(ec);
  entry.input = raw.get(k_input, Json::Value{});
  return entry;
}

tl::expected<Entry, std::error_code> decode_response(const Json::Value& raw) {
  ResponseEntry entry;
  if (auto ec = read_string(raw, k_call_id, entry.call_id))
    return tl::make_unexpected(ec);
  if (!raw.isMember(k_outcome))
    return tl::make_unexpected(error(ecode::missing_field));

  const auto& outcome = raw[k_outcome];
  if (!outcome.isObject())
    return tl::make_unexpected(error(ecode::type_error));

  std::string status;
  if (auto ec = read_string(outcome, k_status, status))
    return tl::make_unexpected(ec);

  if (status == k_success) {
    entry.result = outcome.get(k_result, Json::Value{});
    return entry;
  }

  if (status != k_failure)
    return tl::make_unexpected(error(ecode::invalid_data));

  std::string code, message, details;
  if (auto ec = read_string(outcome, k_code, code))
    return tl::make_unexpected(ec);
  if (auto ec = read_optional_string(outcome, k_message, message))
    return tl::make_unexpected(ec);
  if (auto ec = read_optional_string(outcome, k_details, details))
    return tl::make_unexpected(ec);

  const auto status_code = status_code_from_name(code);
  if (!status_code) { // forward compatible: keep the code we don't know about
    entry.status = Status{StatusCode::UNKNOWN, std::move(message), std::move(code)};
  } else if (*status_code == StatusCode::OK) {
    return tl::make_unexpected(error(ecode::invalid_data)); // a failure must fail
  } else {
    entry.status = Status{*status_code, std::move(message), std::move(details)};
  }
  return entry;
}

} // namespace

// ------------------------------------------------------------------------------------------ makers

CallEntry make_call(std::string procedure, Json::Value input, std::string id) {
  CallEntry entry;
  entry.id = id.empty() ? make_uuid() : std::move(id);
  entry.procedure = std::move(procedure);
  entry.input = std::move(input);
  return entry;
}

ResponseEntry make_response(std::string call_id, Status status, Json::Value result) {
  return ResponseEntry{std::move(call_id), std::move(status), std::move(result)};
}

// ------------------------------------------------------------------------------------------ encode

Json::Value encode(const CallEntry& entry) {
  Json::Value raw{Json::objectValue};
  raw[k_kind] = k_kind_call;
  raw[k_id] = entry.id;
  raw[k_procedure] = entry.procedure;
  raw[k_input] = entry.input;
  if (!entry.batch_id.empty())
    raw[k_batch_id] = entry.batch_id;
  return raw;
}

Json::Value encode(const ResponseEntry& entry) {
  Json::Value outcome{Json::objectValue};
  if (entry.status.ok()) {
    outcome[k_status] = k_success;
    outcome[k_result] = entry.result;
  } else {
    outcome[k_status] = k_failure;
    outcome[k_code] = std::string{status_code_name(entry.status.error_code())};
    outcome[k_message] = std::string{entry.status.error_message()};
    if (!entry.status.error_details().empty())
      outcome[k_details] = std::string{entry.status.error_details()};
  }

  Json::Value raw{Json::objectValue};
  raw[k_kind] = k_kind_response;
  raw[k_call_id] = entry.call_id;
  raw[k_outcome] = std::move(outcome);
  return raw;
}

// ------------------------------------------------------------------------------------------ decode

tl::expected<Entry, std::error_code> decode(const Json::Value& raw) {
  if (!raw.isObject())
    return tl::make_unexpected(error(ecode::not_an_object));

  std::string kind;
  if (auto ec = read_string(raw, k_kind, kind))
    return tl::make_unexpected(ec);

  if (kind == k_kind_call)
    return decode_call(raw);
  if (kind == k_kind_response)
    return decode_response(raw);
  return UnknownEntry{std::move(kind)};
}

// --------------------------------------------------------------------------------------- json text

std::string to_json_text(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

tl::expected<Json::Value, std::error_code> parse_json_text(std::string_view text) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  const std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

  Json::Value value;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors)) {
    TRACE("failed to parse json text: {}", errors);
    return tl::make_unexpected(error(ecode::invalid_data));
  }
  return value;
}

} // namespace letterbox::rpc
