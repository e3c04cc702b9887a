#include "stdinc.hpp"

#include "memory-document.hpp"

#include "letterbox/utils/uuid.hpp"

#include <tuple>

namespace letterbox::document {

// ------------------------------------------------------------------------------- ListenerRegistry

namespace detail {

/**
 * @private
 * Listeners live in a registry that is shared with the `Subscription`s handed out, so that a
 * subscription can be released after the document is gone.
 */
template <typename Fn> class ListenerRegistry {
private:
  mutable std::mutex padlock_;
  uint64_t next_id_{1};
  std::map<uint64_t, Fn> listeners_;

public:
  uint64_t add(Fn listener) {
    std::lock_guard lock{padlock_};
    const auto id = next_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
  }

  void remove(uint64_t id) {
    std::lock_guard lock{padlock_};
    listeners_.erase(id);
  }

  std::vector<Fn> snapshot() const {
    std::lock_guard lock{padlock_};
    std::vector<Fn> out;
    out.reserve(listeners_.size());
    for (const auto& [id, listener] : listeners_)
      out.push_back(listener);
    return out;
  }
};

template <typename Fn>
static Subscription subscribe(const std::shared_ptr<ListenerRegistry<Fn>>& registry, Fn listener) {
  const auto id = registry->add(std::move(listener));
  return Subscription{[weak = std::weak_ptr<ListenerRegistry<Fn>>{registry}, id]() {
    if (auto registry = weak.lock())
      registry->remove(id);
  }};
}

} // namespace detail

// ------------------------------------------------------------------------------------------ Change

std::string Change::id() const { return format("{}:{}", actor, seq); }

// ---------------------------------------------------------------------------------- MemoryDocument

MemoryDocument::MemoryDocument(std::string actor_id)
    : actor_id_{actor_id.empty() ? make_uuid() : std::move(actor_id)},
      change_listeners_{std::make_shared<detail::ListenerRegistry<Listener>>()},
      commit_listeners_{std::make_shared<detail::ListenerRegistry<ChangeListener>>()} {}

MemoryDocument::~MemoryDocument() = default;

// ------------------------------------------------------------------------------------------ append

void MemoryDocument::append(std::vector<Json::Value> entries) {
  if (entries.empty())
    return;

  { // Inside a transaction, hold the entries back until it commits
    std::lock_guard lock{padlock_};
    auto ii = transactions_.find(std::this_thread::get_id());
    if (ii != end(transactions_)) {
      auto& buffer = ii->second.entries;
      buffer.insert(end(buffer), std::make_move_iterator(begin(entries)),
                    std::make_move_iterator(end(entries)));
      return;
    }
  }

  commit_local_(std::move(entries));
}

// --------------------------------------------------------------------------------------- on_change

Subscription MemoryDocument::on_change(Listener listener) {
  return detail::subscribe(change_listeners_, std::move(listener));
}

Subscription MemoryDocument::on_commit(ChangeListener listener) {
  return detail::subscribe(commit_listeners_, std::move(listener));
}

// ---------------------------------------------------------------------------------------- read_all

std::vector<Json::Value> MemoryDocument::read_all() const {
  std::lock_guard lock{padlock_};
  std::vector<Json::Value> out;
  out.reserve(records_.size());
  for (const auto& record : records_)
    out.push_back(record.value);
  return out;
}

std::size_t MemoryDocument::size() const {
  std::lock_guard lock{padlock_};
  return records_.size();
}

std::vector<Change> MemoryDocument::changes() const {
  std::lock_guard lock{padlock_};
  return history_;
}

std::size_t MemoryDocument::pending_changes() const {
  std::lock_guard lock{padlock_};
  return held_.size();
}

// ---------------------------------------------------------------------------------------- transact

void MemoryDocument::transact(const std::function<void()>& fn) {
  const auto thread_id = std::this_thread::get_id();

  std::size_t mark = 0; // Where this (possibly nested) transaction starts in the buffer
  {
    std::lock_guard lock{padlock_};
    auto& transaction = transactions_[thread_id];
    ++transaction.depth;
    mark = transaction.entries.size();
  }

  // Leaves the transaction, returning the entries to commit iff it was the outermost one
  auto leave = [this, thread_id, &mark](bool rollback) -> std::vector<Json::Value> {
    std::lock_guard lock{padlock_};
    auto ii = transactions_.find(thread_id);
    Ensures(ii != end(transactions_));
    auto& transaction = ii->second;
    if (rollback)
      transaction.entries.resize(mark);
    if (--transaction.depth > 0)
      return {};
    auto entries = std::move(transaction.entries);
    transactions_.erase(ii);
    return entries;
  };

  try {
    fn();
  } catch (...) {
    leave(true); // nothing this transaction appended becomes visible
    throw;
  }

  auto entries = leave(false);
  if (!entries.empty())
    commit_local_(std::move(entries));
}

// ------------------------------------------------------------------------------------------- apply

bool MemoryDocument::apply(const Change& change) {
  std::vector<Change> applied;
  {
    std::lock_guard lock{padlock_};
    if (is_known_locked_(change))
      return false;
    held_.push_back(change);

    // Integrate everything whose dependencies are now satisfied
    bool progress = true;
    while (progress) {
      progress = false;
      for (auto ii = begin(held_); ii != end(held_); ++ii) {
        if (is_ready_locked_(*ii)) {
          Change ready = std::move(*ii);
          held_.erase(ii);
          lamport_ = std::max(lamport_, ready.lamport);
          applied.push_back(ready);
          integrate_locked_(std::move(ready));
          progress = true;
          break;
        }
      }
    }
  }

  if (!applied.empty()) {
    TRACE("replica {} applied {} remote change(s)", actor_id_, applied.size());
    notify_(applied);
  }
  return true;
}

// ----------------------------------------------------------------------------------- commit_local_

void MemoryDocument::commit_local_(std::vector<Json::Value> entries) {
  Change change;
  {
    std::lock_guard lock{padlock_};
    change.actor = actor_id_;
    change.seq = ++seq_;
    change.lamport = ++lamport_;
    for (const auto& [actor, seq] : applied_)
      if (actor != actor_id_)
        change.deps.emplace(actor, seq);
    change.entries = std::move(entries);
    integrate_locked_(change);
  }
  notify_({change});
}

// ------------------------------------------------------------------------------- integrate_locked_

void MemoryDocument::integrate_locked_(Change change) {
  auto key = [](const Record& r) { return std::tie(r.lamport, r.actor, r.index); };
  auto less = [&key](const Record& a, const Record& b) { return key(a) < key(b); };

  for (std::size_t i = 0; i < change.entries.size(); ++i) {
    Record record{change.lamport, change.actor, i, change.entries[i]};
    auto pos = std::upper_bound(begin(records_), end(records_), record, less);
    records_.insert(pos, std::move(record));
  }

  applied_[change.actor] = change.seq;
  history_.push_back(std::move(change)); // kept whole, so it can be replayed to a new peer
}

// ----------------------------------------------------------------------------- is_known / is_ready

bool MemoryDocument::is_known_locked_(const Change& change) const {
  auto ii = applied_.find(change.actor);
  if (ii != cend(applied_) && ii->second >= change.seq)
    return true;
  return std::any_of(cbegin(held_), cend(held_), [&change](const Change& held) {
    return held.actor == change.actor && held.seq == change.seq;
  });
}

bool MemoryDocument::is_ready_locked_(const Change& change) const {
  auto last_applied = [this](const std::string& actor) -> uint64_t {
    auto ii = applied_.find(actor);
    return (ii == cend(applied_)) ? 0 : ii->second;
  };
  if (last_applied(change.actor) + 1 != change.seq)
    return false;
  return std::all_of(cbegin(change.deps), cend(change.deps), [&](const auto& dep) {
    return last_applied(dep.first) >= dep.second;
  });
}

// ----------------------------------------------------------------------------------------- notify_

void MemoryDocument::notify_(const std::vector<Change>& changes) {
  for (const auto& change : changes)
    for (const auto& listener : commit_listeners_->snapshot())
      listener(change);

  for (const auto& listener : change_listeners_->snapshot()) {
    try {
      listener();
    } catch (const std::exception& e) {
      LOG_ERR("change listener on replica {} threw: {}", actor_id_, e.what());
    }
  }
}

} // namespace letterbox::document
