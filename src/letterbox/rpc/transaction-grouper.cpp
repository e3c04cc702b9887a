#include "stdinc.hpp"

#include "transaction-grouper.hpp"

#include "letterbox/utils/uuid.hpp"

namespace letterbox::rpc {

std::string TransactionGrouper::open() {
  std::lock_guard lock{padlock_};
  auto& open_batch = open_[std::this_thread::get_id()];
  if (open_batch.depth++ == 0)
    open_batch.batch.batch_id = make_uuid();
  return open_batch.batch.batch_id;
}

TransactionGrouper::StageResult TransactionGrouper::stage(CallEntry& entry) {
  std::lock_guard lock{padlock_};
  auto ii = open_.find(std::this_thread::get_id());
  if (ii == end(open_))
    return StageResult::NO_BATCH;

  auto& open_batch = ii->second;
  if (open_batch.aborted)
    return StageResult::ABORTED;

  entry.batch_id = open_batch.batch.batch_id;
  open_batch.batch.entries.push_back(encode(entry));
  open_batch.batch.call_ids.push_back(entry.id);
  return StageResult::STAGED;
}

std::optional<TransactionGrouper::Batch> TransactionGrouper::close() {
  std::lock_guard lock{padlock_};
  auto ii = open_.find(std::this_thread::get_id());
  Expects(ii != end(open_));

  auto& open_batch = ii->second;
  if (--open_batch.depth > 0)
    return std::nullopt;

  const bool aborted = open_batch.aborted;
  auto batch = std::move(open_batch.batch);
  open_.erase(ii);
  if (aborted)
    return std::nullopt;
  return batch;
}

std::vector<std::string> TransactionGrouper::abort() {
  std::lock_guard lock{padlock_};
  auto ii = open_.find(std::this_thread::get_id());
  Expects(ii != end(open_));

  auto& open_batch = ii->second;
  open_batch.aborted = true;
  auto call_ids = std::move(open_batch.batch.call_ids);
  open_batch.batch.call_ids.clear();
  open_batch.batch.entries.clear();

  if (--open_batch.depth == 0)
    open_.erase(ii);
  return call_ids;
}

bool TransactionGrouper::in_batch() const { return depth() > 0; }

std::size_t TransactionGrouper::depth() const {
  std::lock_guard lock{padlock_};
  auto ii = open_.find(std::this_thread::get_id());
  return (ii == cend(open_)) ? 0 : ii->second.depth;
}

} // namespace letterbox::rpc
