#pragma once

#include "entry-codec.hpp"
#include "status.hpp"

#include "letterbox/document/replicated-document.hpp"

#include <json/value.h>

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace letterbox::rpc {

/**
 * @brief Extra fields a handler attaches to its result, before the dispatcher writes the
 *        Response Entry.
 */
class ResponseSink {
private:
  mutable std::mutex padlock_;
  Json::Value fields_{Json::objectValue};

public:
  /** @brief Set `key` in the result; overwrites the handler's return value on conflict */
  void set(const std::string& key, Json::Value value);

  /** @brief A copy of the fields set so far (always an object) */
  Json::Value get() const;

  bool empty() const;

  /** @brief Replace all the fields; used to roll back a failed transaction */
  void restore(Json::Value fields);
};

namespace detail {
/**
 * @private
 * The success result: the handler's return value, with the response sink's fields merged in.
 */
Json::Value merge_result(Json::Value result, const Json::Value& sink);
} // namespace detail

/**
 * @brief Context for a single call, while its handler runs on the dispatcher side.
 *
 * There is no client side equivalent.
 *
 * A handler that finishes later (after a timer, or another rpc) calls `defer()`, keeps the
 * returned pointer, and eventually calls `finish_call` or `complete`. Its return value is
 * ignored. Only the first `finish_call` writes a Response Entry.
 */
class CallContext : public std::enable_shared_from_this<CallContext> {
public:
  using Completion = std::function<void(ResponseEntry response)>;

private:
  std::string call_id_;
  std::string procedure_;
  std::string batch_id_;
  document::ReplicatedDocument* data_{nullptr};
  ResponseSink response_;

  mutable std::mutex padlock_;
  Completion completion_{};
  bool is_deferred_{false};
  bool has_finished_{false};

public:
  CallContext(std::string call_id, std::string procedure, std::string batch_id,
              document::ReplicatedDocument* data)
      : call_id_{std::move(call_id)}, procedure_{std::move(procedure)},
        batch_id_{std::move(batch_id)}, data_{data} {}

  CallContext(const CallContext&) = delete;
  CallContext& operator=(const CallContext&) = delete;

  /** @brief The correlation id of the call being served */
  const std::string& call_id() const { return call_id_; }

  /** @brief The procedure being served */
  const std::string& procedure() const { return procedure_; }

  /** @brief The batch the call was committed in; empty if none */
  const std::string& batch_id() const { return batch_id_; }

  /** @brief true iff an application data document was configured */
  bool has_data() const { return data_ != nullptr; }

  /**
   * @brief The application data document handed to handlers.
   * @exception std::logic_error if the dispatcher wasn't configured with one.
   */
  document::ReplicatedDocument& data() const;

  ResponseSink& response() { return response_; }
  const ResponseSink& response() const { return response_; }

  /**
   * @brief Run `fn` as one atomic change to `data()`; without a data document, `fn` is just
   *        called. If `fn` throws, its appends are discarded, the response sink is restored to
   *        what it was before, and the exception propagates.
   */
  void transact(const std::function<void()>& fn);

  ///@{ @name completion
  /**
   * @brief Called once, with the Response Entry, when the call finishes. Set by the dispatcher.
   */
  void set_completion(Completion thunk);

  /**
   * @brief The handler will finish the call later, through the returned pointer.
   * @exception std::bad_weak_ptr if this context isn't owned by a `std::shared_ptr`.
   */
  std::shared_ptr<CallContext> defer();

  bool is_deferred() const;

  /** @brief true iff a response has been produced for this call */
  bool has_finished() const;

  /**
   * @brief Finish the call. On success, `result` is merged with the response sink.
   *        Does nothing if the call has already finished.
   */
  void finish_call(Status status, Json::Value result = {});

  /**
   * @brief Finish the call with an `APPLICATION_ERROR` describing `error`. A `ProcedureError`
   *        puts its code in the details.
   */
  void finish_call(std::exception_ptr error);

  /** @brief Finish the call with the value returned by `fn`, or the exception it throws */
  void complete(const std::function<Json::Value()>& fn);
  ///@}
};

} // namespace letterbox::rpc
