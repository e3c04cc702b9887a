#include "stdinc.hpp"

#include "router.hpp"

namespace letterbox::rpc {

Router& Router::add(std::string name, schema::Schema input, Handler handler) {
  Expects(handler != nullptr);
  if (procedures_.count(name) > 0)
    throw std::logic_error{format("procedure '{}' is already registered", name)};
  auto key = name;
  procedures_.emplace(std::move(key), Procedure{std::move(name), std::move(input),
                                                std::move(handler)});
  return *this;
}

const Procedure* Router::resolve(std::string_view name) const {
  auto ii = procedures_.find(std::string{name});
  return (ii == cend(procedures_)) ? nullptr : &ii->second;
}

tl::expected<Json::Value, schema::ValidationError>
Router::validate(std::string_view name, const Json::Value& input) const {
  const auto* procedure = resolve(name);
  if (procedure == nullptr) {
    schema::Issue issue;
    issue.code = "unrecognized_procedure";
    issue.received = std::string{name};
    issue.message = format("No procedure found on path \"{}\"", name);
    return tl::make_unexpected(schema::ValidationError{{std::move(issue)}});
  }
  return procedure->input.parse(input);
}

} // namespace letterbox::rpc
