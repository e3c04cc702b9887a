#pragma once

#include "letterbox/document/replicated-document.hpp"
#include "letterbox/portable/asio/asio-execution-context.hpp"
#include "letterbox/rpc/router.hpp"

#include <json/value.h>

#include <memory>
#include <mutex>

namespace letterbox::demo {

/**
 * @brief A toy user store, served over rpc.
 *
 * Users live in an append-only data document as version records:
 * `{"kind":"user","id":"1","name":"foo"}`. Renaming a user appends a new version; the current
 * state of a user is its latest record.
 *
 * Procedures:
 * + `userCreate {name, optionalDelay?}` -> `{"user":{...}}`; the name "BAD_NAME" fails with
 *   a CONFLICT application error. A delay (in millis, at most `k_max_delay_millis`) waits on a
 *   timer, without holding an executor thread.
 * + `userUpdateName {id, name}` -> `{"user":{...}}`
 */
class UsersApp : public std::enable_shared_from_this<UsersApp> {
public:
  using ExecutorType = AsioExecutionContext::ExecutorType;
  using SteadyTimerType = AsioExecutionContext::SteadyTimerType;

  static constexpr const char* k_rejected_name = "BAD_NAME";
  static constexpr const char* k_rejected_message = "This name isn't one I like to allow";
  static constexpr double k_max_delay_millis = 60000.0;

private:
  ExecutorType executor_;
  std::mutex padlock_; // serializes id allocation

  Json::Value insert_user_(const std::string& name, rpc::CallContext& context);

public:
  /** @param executor Runs the timers of delayed calls */
  explicit UsersApp(ExecutorType executor) : executor_{executor} {}

  /** @brief A router serving this app; keeps the app alive */
  rpc::Router make_router();

  /**
   * @brief The current version of each user in `users`, in order of creation.
   */
  static Json::Value current_users(const document::ReplicatedDocument& users);

private:
  Json::Value create_user_(const Json::Value& input, rpc::CallContext& context);
  Json::Value update_name_(const Json::Value& input, rpc::CallContext& context);
};

} // namespace letterbox::demo
