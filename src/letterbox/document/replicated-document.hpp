#pragma once

#include <json/value.h>

#include <functional>
#include <vector>

namespace letterbox::document {

/**
 * @brief RAII handle for a listener registered with a document. Destroying (or resetting) the
 *        handle removes the listener. Safe to outlive the document it came from.
 */
class Subscription {
private:
  std::function<void()> unsubscribe_{};

public:
  Subscription() = default;
  explicit Subscription(std::function<void()> unsubscribe) : unsubscribe_{std::move(unsubscribe)} {}
  Subscription(const Subscription&) = delete;
  Subscription(Subscription&& o) noexcept : unsubscribe_{std::move(o.unsubscribe_)} {
    o.unsubscribe_ = nullptr;
  }
  ~Subscription() { reset(); }

  Subscription& operator=(const Subscription&) = delete;
  Subscription& operator=(Subscription&& o) noexcept {
    if (this != &o) {
      reset();
      unsubscribe_ = std::move(o.unsubscribe_);
      o.unsubscribe_ = nullptr;
    }
    return *this;
  }

  /** @brief true iff the listener is still registered through this handle */
  bool active() const noexcept { return unsubscribe_ != nullptr; }

  /** @brief Remove the listener now */
  void reset() {
    if (unsubscribe_) {
      auto thunk = std::move(unsubscribe_);
      unsubscribe_ = nullptr;
      thunk();
    }
  }
};

/**
 * @brief An ordered, append-only sequence of json entries, replicated between peers.
 *
 * The merge algorithm is up to the implementation. What callers may rely on:
 * + `append` of several entries is atomic: observers see all of them, or none.
 * + Listeners registered with `on_change` run after every applied change, local or remote,
 *   outside of any lock held by the document. They may run concurrently on different threads.
 * + `read_all` returns a consistent snapshot. Remote changes may be merged in front of entries
 *   that were already observed, so positions are not stable between snapshots.
 */
class ReplicatedDocument {
public:
  using Listener = std::function<void()>;

  virtual ~ReplicatedDocument() = default;

  /**
   * @brief Append `entries` as one atomic change. A no-op when `entries` is empty.
   *        Inside `transact`, the entries are held back until the transaction commits.
   */
  virtual void append(std::vector<Json::Value> entries) = 0;

  /**
   * @brief Register `listener` to be called after every change.
   */
  virtual Subscription on_change(Listener listener) = 0;

  /**
   * @brief A consistent snapshot of every entry, in document order.
   */
  virtual std::vector<Json::Value> read_all() const = 0;

  /**
   * @brief Run `fn`, committing every `append` made by this thread inside `fn` as one change.
   *        Nested calls join the outermost transaction. If `fn` throws, the appends it made are
   *        discarded and the exception propagates.
   */
  virtual void transact(const std::function<void()>& fn) = 0;
};

} // namespace letterbox::document
