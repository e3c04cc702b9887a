#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace letterbox::rpc {

/**
 * @brief Outcome codes. `OK` is success; everything else travels back to the caller as a failed
 *        Response Entry, or is produced locally by the client (CANCELLED, DEADLINE_EXCEEDED).
 *        On the wire the code is its name, e.g., "NOT_FOUND".
 */
enum class StatusCode : int8_t {
  OK = 0,
  CANCELLED,         //!< Local only: the caller abandoned the call
  UNKNOWN,           //!< A code this build does not know; the raw name is in `details`
  BAD_INPUT,         //!< The input failed validation
  DEADLINE_EXCEEDED, //!< Local only: no response arrived in time
  NOT_FOUND,         //!< No such procedure
  ALREADY_EXISTS,    //!< Local only: the call id is already pending
  APPLICATION_ERROR, //!< The procedure handler threw
  INTERNAL,          //!< The dispatcher failed to produce a result
  UNAVAILABLE        //!< The client is not running
};

/** @brief Wire name of `code` */
std::string_view status_code_name(StatusCode code);

/** @brief Inverse of `status_code_name`; nothing if `name` isn't a known code */
std::optional<StatusCode> status_code_from_name(std::string_view name);

class Status {
private:
  std::string error_message_{};
  std::string error_details_{};
  StatusCode status_code_{StatusCode::OK};

public:
  Status(StatusCode status_code = StatusCode::OK, std::string error_message = "",
         std::string error_details = "")
      : error_message_{std::move(error_message)}, error_details_{std::move(error_details)},
        status_code_{status_code} {}

  StatusCode error_code() const { return status_code_; }
  std::string_view error_message() const { return error_message_; }
  std::string_view error_details() const { return error_details_; }
  bool ok() const { return status_code_ == StatusCode::OK; }

  std::string to_string() const;

  bool operator==(const Status& o) const {
    return (status_code_ == o.status_code_) && (error_message_ == o.error_message_) &&
           (error_details_ == o.error_details_);
  }
  bool operator!=(const Status& o) const { return !(*this == o); }
};

/**
 * @brief The exception a client future is rejected with. `what()` is the status message.
 */
class CallError : public std::runtime_error {
private:
  Status status_;

public:
  explicit CallError(Status status)
      : std::runtime_error{std::string{status.error_message()}}, status_{std::move(status)} {}

  const Status& status() const noexcept { return status_; }
  StatusCode code() const noexcept { return status_.error_code(); }
};

/**
 * @brief Thrown by procedure handlers to fail a call with their own code (e.g., "CONFLICT").
 *        The response is an `APPLICATION_ERROR` carrying `what()` as the message, and the
 *        handler's code in the details.
 */
class ProcedureError : public std::runtime_error {
private:
  std::string code_;

public:
  ProcedureError(std::string code, const std::string& message)
      : std::runtime_error{message}, code_{std::move(code)} {}

  const std::string& code() const noexcept { return code_; }
};

} // namespace letterbox::rpc
