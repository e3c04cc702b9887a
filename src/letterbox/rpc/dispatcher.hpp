#pragma once

#include "call-context.hpp"
#include "entry-codec.hpp"
#include "processing-cursor.hpp"
#include "router.hpp"

#include "letterbox/document/replicated-document.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace letterbox::rpc {

/**
 * @brief The server side of the protocol: turns Call Entries into Response Entries, exactly
 *        once each.
 *
 * Every change to the queue document triggers a scan. Each call id that has not been seen
 * before is claimed in the `ProcessingCursor`, and its handler is posted to the executor, so a
 * slow handler never holds up the calls behind it. Call ids that already have a Response Entry
 * are claimed without being dispatched.
 *
 * Must be owned by a `std::shared_ptr`.
 */
template <typename Executor>
class Dispatcher : public std::enable_shared_from_this<Dispatcher<Executor>> {
public:
  struct Config {
    document::ReplicatedDocument* data{nullptr}; //!< Handed to handlers as `context.data()`
    std::string name{"dispatcher"};              //!< Used in log messages
  };

private:
  Executor executor_;
  document::ReplicatedDocument& queue_;
  Router router_;
  Config config_;

  ProcessingCursor cursor_;
  document::Subscription subscription_;

  std::atomic<bool> is_running_{false};
  std::atomic<uint64_t> dispatched_count_{0};
  std::atomic<uint64_t> in_flight_{0};

  void on_change_();
  void dispatch_(CallEntry call);
  void execute_(const CallEntry& call);
  void respond_(const std::string& procedure, ResponseEntry response);

public:
  /**
   * @param executor Where procedure handlers run.
   * @param queue The mailbox document with the Call Entries.
   * @param router Maps procedure names to schema and handler.
   */
  Dispatcher(Executor executor, document::ReplicatedDocument& queue, Router router,
             Config config = {})
      : executor_{executor}, queue_{queue}, router_{std::move(router)}, config_{
                                                                            std::move(config)} {}

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  ~Dispatcher() { subscription_.reset(); }

  /** @brief Subscribe to the queue, and dispatch any unanswered calls already in it */
  void start();

  /** @brief Stop observing the queue; handlers already dispatched run to completion */
  void stop();

  bool is_running() const { return is_running_.load(std::memory_order_acquire); }

  const Config& config() const { return config_; }

  /** @brief Number of calls handed to a handler (or answered NOT_FOUND/BAD_INPUT) */
  uint64_t dispatched_count() const { return dispatched_count_.load(std::memory_order_acquire); }

  /**
   * @brief Number of dispatched calls whose Response Entry hasn't been appended yet, including
   *        calls deferred by their handler.
   */
  uint64_t in_flight() const { return in_flight_.load(std::memory_order_acquire); }

  /** @brief true iff `call_id` has been claimed, i.e., dispatched, or found already answered */
  bool has_seen(const std::string& call_id) const { return cursor_.contains(call_id); }
};

} // namespace letterbox::rpc

#include "impl/dispatcher_impl.hpp"
