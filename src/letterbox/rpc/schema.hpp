#pragma once

#include <json/value.h>
#include <tl/expected.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace letterbox::rpc::schema {

/**
 * @brief One problem found while validating an input.
 */
struct Issue {
  std::string code;              //!< Machine readable kind, e.g., "invalid_type"
  std::string expected;          //!< The type the schema wanted
  std::string received;          //!< The type found ("undefined" for a missing field)
  std::vector<std::string> path; //!< Field names/array indices leading to the problem
  std::string message;           //!< Human readable
};

/**
 * @brief Why an input failed validation.
 */
struct ValidationError {
  std::vector<Issue> issues;

  /** @brief The issues, rendered as a json array */
  std::string message() const;
};

/**
 * @brief Describes the shape of a procedure input, and validates json against it.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto user_create = schema::object({{"name", schema::string()},
 *                                    {"optionalDelay", schema::number().optional()}});
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * Objects strip keys that are not in the schema.
 */
class Schema {
public:
  enum class Kind : int { ANY, STRING, NUMBER, INTEGER, BOOLEAN, ARRAY, OBJECT };
  using Field = std::pair<std::string, Schema>;
  struct Node;

private:
  std::shared_ptr<const Node> node_;

  explicit Schema(std::shared_ptr<const Node> node) : node_{std::move(node)} {}

  void validate_(const Json::Value& value, std::vector<std::string>& path, Json::Value& out,
                 std::vector<Issue>& issues) const;

  friend Schema any();
  friend Schema string();
  friend Schema number();
  friend Schema integer();
  friend Schema boolean();
  friend Schema array(Schema element);
  friend Schema object(std::vector<Field> fields);

public:
  Kind kind() const;
  bool is_optional() const;

  /** @brief The same schema, but `null` or a missing field is accepted */
  Schema optional() const;

  /**
   * @brief Validate `value`, returning the cleaned value (unknown object keys stripped).
   */
  tl::expected<Json::Value, ValidationError> parse(const Json::Value& value) const;
};

Schema any();
Schema string();
Schema number();
Schema integer();
Schema boolean();
Schema array(Schema element);
Schema object(std::vector<Schema::Field> fields);

} // namespace letterbox::rpc::schema
