#pragma once

#include "entry-codec.hpp"
#include "status.hpp"
#include "transaction-grouper.hpp"

#include "letterbox/async/extended-futures.hpp"
#include "letterbox/document/replicated-document.hpp"

#include <json/value.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace letterbox::rpc {

/**
 * @brief Per-call options
 */
struct CallOptions {
  std::string id{};             //!< Correlation id, never reused; a random uuid if empty
  uint32_t deadline_millis{0};  //!< Overrides `Config::default_deadline_millis` if non-zero
};

/**
 * @brief The client side of the protocol: appends Call Entries, and settles the matching future
 *        when the Response Entry shows up in the queue document.
 *
 * Pending calls live in a table keyed by call id. Responses with no pending call (already
 * settled, cancelled, or issued by another client sharing the document) are ignored.
 *
 * Must be owned by a `std::shared_ptr`.
 */
template <typename SteadyTimerType>
class Correlator : public std::enable_shared_from_this<Correlator<SteadyTimerType>> {
public:
  using SteadyTimerFactory = std::function<SteadyTimerType()>;
  using FutureType = async::Future<Json::Value>;

  struct Config {
    std::string name{"correlator"};       //!< Used in log messages
    uint32_t default_deadline_millis{0};  //!< Zero means wait forever
  };

private:
  struct PendingCall {
    async::Promise<Json::Value> promise;
    std::unique_ptr<SteadyTimerType> timeout;
  };

  document::ReplicatedDocument& queue_;
  SteadyTimerFactory timer_factory_;
  Config config_;

  TransactionGrouper grouper_;
  document::Subscription subscription_;
  std::atomic<bool> is_running_{false};

  mutable std::mutex padlock_;
  std::unordered_map<std::string, PendingCall> pending_;

  void on_change_();
  bool is_used_(const std::string& call_id) const;
  bool settle_(const std::string& call_id, Status status, Json::Value result = {});
  void reject_all_(const std::vector<std::string>& call_ids, const Status& status);
  void append_(std::vector<Json::Value> entries, const std::vector<std::string>& call_ids);

public:
  /**
   * @param queue The mailbox document, shared (via replication) with a dispatcher.
   * @param timer_factory Creates timers for call deadlines.
   */
  Correlator(document::ReplicatedDocument& queue, SteadyTimerFactory timer_factory,
             Config config = {})
      : queue_{queue}, timer_factory_{std::move(timer_factory)}, config_{std::move(config)} {}

  Correlator(const Correlator&) = delete;
  Correlator& operator=(const Correlator&) = delete;

  ~Correlator() { stop(); }

  /** @brief Subscribe to the queue; calls fail with UNAVAILABLE until this is done */
  void start();

  /** @brief Stop observing the queue, and reject every pending call with CANCELLED */
  void stop();

  bool is_running() const { return is_running_.load(std::memory_order_acquire); }

  const Config& config() const { return config_; }

  /**
   * @brief Call `procedure` with `input`.
   *
   * The returned future holds the success result, or a `CallError` with the failure status.
   * An explicit `options.id` that is pending, or already in the queue, fails with
   * ALREADY_EXISTS.
   * Inside `with_batch` the Call Entry is held back until the batch closes.
   */
  FutureType call(std::string procedure, Json::Value input, CallOptions options = {});

  /**
   * @brief Run `fn`, and append every call it issues (on this thread) as one atomic change,
   *        sharing one batch id. Nested batches flatten into the outermost.
   *
   * If `fn` throws, nothing is appended, every call of the batch is rejected with CANCELLED,
   * and the exception propagates.
   */
  void with_batch(const std::function<void()>& fn);

  /**
   * @brief Drop interest in a pending call, rejecting it with CANCELLED. The Call Entry stays in
   *        the queue, and a late response is ignored.
   * @return true iff the call was pending.
   */
  bool cancel(const std::string& call_id);

  /** @brief Number of calls waiting for a response */
  std::size_t pending_count() const;

  bool is_pending(const std::string& call_id) const;
};

} // namespace letterbox::rpc

#include "impl/correlator_impl.hpp"
