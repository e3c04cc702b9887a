#include "stdinc.hpp"

#include "status.hpp"

namespace letterbox::rpc {

static constexpr std::array<std::pair<StatusCode, std::string_view>, 10> k_status_names = {{
    {StatusCode::OK, "OK"},
    {StatusCode::CANCELLED, "CANCELLED"},
    {StatusCode::UNKNOWN, "UNKNOWN"},
    {StatusCode::BAD_INPUT, "BAD_INPUT"},
    {StatusCode::DEADLINE_EXCEEDED, "DEADLINE_EXCEEDED"},
    {StatusCode::NOT_FOUND, "NOT_FOUND"},
    {StatusCode::ALREADY_EXISTS, "ALREADY_EXISTS"},
    {StatusCode::APPLICATION_ERROR, "APPLICATION_ERROR"},
    {StatusCode::INTERNAL, "INTERNAL"},
    {StatusCode::UNAVAILABLE, "UNAVAILABLE"},
}};

std::string_view status_code_name(StatusCode code) {
  for (const auto& [value, name] : k_status_names)
    if (value == code)
      return name;
  return "UNKNOWN";
}

std::optional<StatusCode> status_code_from_name(std::string_view name) {
  for (const auto& [value, value_name] : k_status_names)
    if (value_name == name)
      return value;
  return std::nullopt;
}

std::string Status::to_string() const {
  if (error_details_.empty())
    return format("Status({}, '{}')", status_code_name(status_code_), error_message_);
  return format("Status({}, '{}', '{}')", status_code_name(status_code_), error_message_,
                error_details_);
}

} // namespace letterbox::rpc
