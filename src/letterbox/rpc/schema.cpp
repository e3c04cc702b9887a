#include "stdinc.hpp"

#include "schema.hpp"

#include "entry-codec.hpp"

namespace letterbox::rpc::schema {

// -------------------------------------------------------------------------------------------- Node

struct Schema::Node {
  Kind kind{Kind::ANY};
  bool optional{false};
  std::vector<Field> fields;      // OBJECT
  std::shared_ptr<const Node> element; // ARRAY
};

namespace {

std::string_view kind_name(Schema::Kind kind) {
  switch (kind) {
  case Schema::Kind::ANY: return "any";
  case Schema::Kind::STRING: return "string";
  case Schema::Kind::NUMBER: return "number";
  case Schema::Kind::INTEGER: return "integer";
  case Schema::Kind::BOOLEAN: return "boolean";
  case Schema::Kind::ARRAY: return "array";
  case Schema::Kind::OBJECT: return "object";
  }
  return "unknown";
}

std::string_view value_type_name(const Json::Value& value) {
  switch (value.type()) {
  case Json::nullValue: return "null";
  case Json::intValue:
  case Json::uintValue:
  case Json::realValue: return "number";
  case Json::stringValue: return "string";
  case Json::booleanValue: return "boolean";
  case Json::arrayValue: return "array";
  case Json::objectValue: return "object";
  }
  return "unknown";
}

bool matches(Schema::Kind kind, const Json::Value& value) {
  switch (kind) {
  case Schema::Kind::ANY: return true;
  case Schema::Kind::STRING: return value.isString();
  case Schema::Kind::NUMBER: return value.isNumeric() && !value.isBool();
  case Schema::Kind::INTEGER: return value.isIntegral() && !value.isBool();
  case Schema::Kind::BOOLEAN: return value.isBool();
  case Schema::Kind::ARRAY: return value.isArray();
  case Schema::Kind::OBJECT: return value.isObject();
  }
  return false;
}

Issue invalid_type(Schema::Kind expected, std::string received, std::vector<std::string> path) {
  Issue issue;
  issue.code = "invalid_type";
  issue.expected = std::string{kind_name(expected)};
  issue.received = std::move(received);
  issue.path = std::move(path);
  issue.message = (issue.received == "undefined")
                      ? std::string{"Required"}
                      : format("Expected {}, received {}", issue.expected, issue.received);
  return issue;
}

} // namespace

// ------------------------------------------------------------------------------------ construction

static Schema::Node make_node(Schema::Kind kind) {
  Schema::Node node;
  node.kind = kind;
  return node;
}

Schema any() { return Schema{std::make_shared<const Schema::Node>(make_node(Schema::Kind::ANY))}; }
Schema string() {
  return Schema{std::make_shared<const Schema::Node>(make_node(Schema::Kind::STRING))};
}
Schema number() {
  return Schema{std::make_shared<const Schema::Node>(make_node(Schema::Kind::NUMBER))};
}
Schema integer() {
  return Schema{std::make_shared<const Schema::Node>(make_node(Schema::Kind::INTEGER))};
}
Schema boolean() {
  return Schema{std::make_shared<const Schema::Node>(make_node(Schema::Kind::BOOLEAN))};
}

Schema array(Schema element) {
  auto node = make_node(Schema::Kind::ARRAY);
  node.element = std::move(element.node_);
  return Schema{std::make_shared<const Schema::Node>(std::move(node))};
}

Schema object(std::vector<Schema::Field> fields) {
  auto node = make_node(Schema::Kind::OBJECT);
  node.fields = std::move(fields);
  return Schema{std::make_shared<const Schema::Node>(std::move(node))};
}

Schema::Kind Schema::kind() const { return node_->kind; }

bool Schema::is_optional() const { return node_->optional; }

Schema Schema::optional() const {
  auto node = *node_;
  node.optional = true;
  return Schema{std::make_shared<const Node>(std::move(node))};
}

// ------------------------------------------------------------------------------------------- parse

tl::expected<Json::Value, ValidationError> Schema::parse(const Json::Value& value) const {
  std::vector<std::string> path;
  std::vector<Issue> issues;
  Json::Value out;
  validate_(value, path, out, issues);
  if (!issues.empty())
    return tl::make_unexpected(ValidationError{std::move(issues)});
  return out;
}

void Schema::validate_(const Json::Value& value, std::vector<std::string>& path, Json::Value& out,
                       std::vector<Issue>& issues) const {
  if (value.isNull() && node_->optional) {
    out = Json::Value{};
    return;
  }

  if (!matches(node_->kind, value)) {
    issues.push_back(invalid_type(node_->kind, std::string{value_type_name(value)}, path));
    return;
  }

  switch (node_->kind) {
  case Kind::ARRAY: {
    out = Json::Value{Json::arrayValue};
    const Schema element{node_->element};
    for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
      path.push_back(std::to_string(i));
      Json::Value item;
      element.validate_(value[i], path, item, issues);
      out.append(std::move(item));
      path.pop_back();
    }
  } break;

  case Kind::OBJECT: {
    out = Json::Value{Json::objectValue};
    for (const auto& [name, field] : node_->fields) {
      path.push_back(name);
      if (!value.isMember(name)) {
        if (!field.is_optional())
          issues.push_back(invalid_type(field.kind(), "undefined", path));
      } else {
        Json::Value item;
        field.validate_(value[name], path, item, issues);
        if (!item.isNull())
          out[name] = std::move(item);
      }
      path.pop_back();
    }
  } break;

  default:
    out = value;
  }
}

// --------------------------------------------------------------------------------- ValidationError

std::string ValidationError::message() const {
  Json::Value list{Json::arrayValue};
  for (const auto& issue : issues) {
    Json::Value item{Json::objectValue};
    item["code"] = issue.code;
    item["expected"] = issue.expected;
    item["received"] = issue.received;
    item["path"] = Json::Value{Json::arrayValue};
    for (const auto& segment : issue.path)
      item["path"].append(segment);
    item["message"] = issue.message;
    list.append(std::move(item));
  }
  return to_json_text(list);
}

} // namespace letterbox::rpc::schema
