#pragma once

#include "status.hpp"

#include "letterbox/utils/error-codes.hpp"

#include <json/value.h>
#include <tl/expected.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace letterbox::rpc {

/**
 * @brief A request to run `procedure` with `input`. Immutable once appended.
 */
struct CallEntry {
  std::string id;        //!< Correlation id, unique per call
  std::string procedure; //!< The procedure to run
  Json::Value input;     //!< Validated by the router, on the dispatcher side
  std::string batch_id;  //!< Shared by calls committed in one batch; empty if none
};

/**
 * @brief The outcome of exactly one CallEntry: `status.ok()` and a `result`, or a failed status.
 */
struct ResponseEntry {
  std::string call_id; //!< The `id` of the CallEntry this answers
  Status status;       //!< OK, or the failure code and message
  Json::Value result;  //!< Only meaningful on success

  bool is_success() const { return status.ok(); }
};

/**
 * @brief An entry of some other kind, written by a newer peer, or another protocol sharing the
 *        document. Ignored by the dispatcher and correlator.
 */
struct UnknownEntry {
  std::string kind;
};

using Entry = std::variant<CallEntry, ResponseEntry, UnknownEntry>;

/**
 * @brief Create a call entry; a random uuid is used if `id` is empty.
 */
CallEntry make_call(std::string procedure, Json::Value input, std::string id = {});

/**
 * @brief Create the response entry answering `call_id`.
 */
ResponseEntry make_response(std::string call_id, Status status, Json::Value result = {});

///@{ @name to and from the document's representation
Json::Value encode(const CallEntry& entry);
Json::Value encode(const ResponseEntry& entry);

/**
 * @brief Decode a document entry. Never throws on bad data.
 *
 * Unknown fields are ignored, and an unknown `kind` decodes as `UnknownEntry`. Anything that
 * claims to be a call or response but is malformed is an error: `not_an_object`, `missing_field`
 * or `type_error`.
 */
tl::expected<Entry, std::error_code> decode(const Json::Value& raw);
///@}

///@{ @name to and from json text
std::string to_json_text(const Json::Value& value);
tl::expected<Json::Value, std::error_code> parse_json_text(std::string_view text);
///@}

} // namespace letterbox::rpc
