#include "stdinc.hpp"

#include "processing-cursor.hpp"

namespace letterbox::rpc {

bool ProcessingCursor::claim(const std::string& call_id) {
  std::lock_guard lock{padlock_};
  return seen_.insert(call_id).second;
}

bool ProcessingCursor::contains(const std::string& call_id) const {
  std::lock_guard lock{padlock_};
  return seen_.count(call_id) > 0;
}

std::size_t ProcessingCursor::count() const {
  std::lock_guard lock{padlock_};
  return seen_.size();
}

bool ProcessingCursor::advance(std::size_t snapshot_size) {
  std::lock_guard lock{padlock_};
  if (snapshot_size == last_snapshot_size_)
    return false; // the document is append-only, so same size means same content
  last_snapshot_size_ = snapshot_size;
  return true;
}

} // namespace letterbox::rpc
