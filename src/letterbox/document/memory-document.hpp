#pragma once

#include "replicated-document.hpp"

#include <json/value.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace letterbox::document {

/**
 * @brief One atomic unit of replication: the entries of a single commit, plus what's needed to
 *        merge them in the same place on every replica.
 */
struct Change {
  std::string actor;                   //!< The replica that committed the change
  uint64_t seq{0};                     //!< Per-actor sequence number, starting at 1
  uint64_t lamport{0};                 //!< Lamport timestamp; orders entries across actors
  std::map<std::string, uint64_t> deps; //!< actor -> seq the committer had applied (causal deps)
  std::vector<Json::Value> entries;    //!< The entries, in append order

  std::string id() const;
};

namespace detail {
template <typename Fn> class ListenerRegistry;
}

/**
 * @brief An in-process replica of a `ReplicatedDocument`.
 *
 * Entries are ordered by `(lamport, actor, index-in-change)`, so replicas that applied the same
 * changes read the same sequence, whatever order the changes arrived in. Remote changes are
 * merged with `apply`, which holds back any change whose causal dependencies have not been
 * applied yet. Changes are exported for replication with `on_commit` and `changes`; see
 * `DocumentLink`.
 */
class MemoryDocument final : public ReplicatedDocument {
public:
  using ChangeListener = std::function<void(const Change&)>;

private:
  struct Record {
    uint64_t lamport{0};
    std::string actor;
    std::size_t index{0};
    Json::Value value;
  };

  struct OpenTransaction {
    std::size_t depth{0};
    std::vector<Json::Value> entries;
  };

  std::string actor_id_;

  mutable std::mutex padlock_;
  std::vector<Record> records_;                           // document order
  std::vector<Change> history_;                           // apply order
  std::vector<Change> held_;                              // waiting on causal dependencies
  std::unordered_map<std::string, uint64_t> applied_;     // actor -> last applied seq
  std::unordered_map<std::thread::id, OpenTransaction> transactions_;
  uint64_t lamport_{0};
  uint64_t seq_{0};

  std::shared_ptr<detail::ListenerRegistry<Listener>> change_listeners_;
  std::shared_ptr<detail::ListenerRegistry<ChangeListener>> commit_listeners_;

  void commit_local_(std::vector<Json::Value> entries);
  void integrate_locked_(Change change);
  bool is_known_locked_(const Change& change) const;
  bool is_ready_locked_(const Change& change) const;
  void notify_(const std::vector<Change>& changes);

public:
  /**
   * @param actor_id Unique name of this replica; a random uuid if empty.
   */
  explicit MemoryDocument(std::string actor_id = {});
  MemoryDocument(const MemoryDocument&) = delete;
  MemoryDocument& operator=(const MemoryDocument&) = delete;
  ~MemoryDocument() override;

  const std::string& actor_id() const noexcept { return actor_id_; }

  ///@{ ReplicatedDocument
  void append(std::vector<Json::Value> entries) override;
  Subscription on_change(Listener listener) override;
  std::vector<Json::Value> read_all() const override;
  void transact(const std::function<void()>& fn) override;
  ///@}

  /** @brief Number of entries */
  std::size_t size() const;

  ///@{ replication
  /**
   * @brief Merge a change committed on another replica.
   * @return true iff the change was new to this replica (applied now, or held for its deps).
   */
  bool apply(const Change& change);

  /** @brief Called with every change this replica applies, local or remote */
  Subscription on_commit(ChangeListener listener);

  /** @brief Every applied change, in the order this replica applied them */
  std::vector<Change> changes() const;

  /** @brief Number of remote changes held back, waiting for their causal dependencies */
  std::size_t pending_changes() const;
  ///@}
};

} // namespace letterbox::document
