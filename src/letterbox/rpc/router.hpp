#pragma once

#include "call-context.hpp"
#include "schema.hpp"

#include <json/value.h>
#include <tl/expected.hpp>

#include <functional>
#include <string>
#include <unordered_map>

namespace letterbox::rpc {

/**
 * @brief Application logic for one procedure. The return value (merged with anything written
 *        to `context.response()`) becomes the success result. Throw `ProcedureError` (or any
 *        `std::exception`) to fail the call with `APPLICATION_ERROR`.
 *
 * A handler that can't answer straight away calls `context.defer()`, and finishes the call
 * through the returned pointer; the return value is then ignored.
 */
using Handler = std::function<Json::Value(const Json::Value& input, CallContext& context)>;

struct Procedure {
  std::string name;
  schema::Schema input;
  Handler handler;
};

/**
 * @brief Maps procedure names to their input schema and handler.
 *
 * Populate the router before handing it to a dispatcher; lookups are not synchronized with
 * `add`.
 */
class Router {
private:
  std::unordered_map<std::string, Procedure> procedures_;

public:
  /**
   * @brief Register a procedure.
   * @exception std::logic_error if `name` is already registered.
   */
  Router& add(std::string name, schema::Schema input, Handler handler);

  /** @brief The procedure called `name`, or nullptr if there is none */
  const Procedure* resolve(std::string_view name) const;

  /**
   * @brief Validate `input` against the schema of procedure `name`
   * @return The validated input, with unknown object keys stripped.
   */
  tl::expected<Json::Value, schema::ValidationError> validate(std::string_view name,
                                                              const Json::Value& input) const;

  std::size_t size() const { return procedures_.size(); }
};

} // namespace letterbox::rpc
