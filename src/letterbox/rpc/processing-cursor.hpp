#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>

namespace letterbox::rpc {

/**
 * @brief Dispatcher-local record of the call ids already dispatched (or already answered).
 *
 * A replicated document delivers state, not discrete events: the same snapshot may be observed
 * many times, and remote entries may be merged in front of entries already seen. So the cursor
 * is a seen-set keyed by call id, rather than an offset into the sequence.
 */
class ProcessingCursor {
private:
  mutable std::mutex padlock_;
  std::unordered_set<std::string> seen_;
  std::size_t last_snapshot_size_{0};

public:
  /**
   * @brief Mark `call_id` as seen.
   * @return true iff this is the first claim, and the caller must dispatch the call.
   */
  bool claim(const std::string& call_id);

  /** @brief true iff `call_id` has been claimed */
  bool contains(const std::string& call_id) const;

  /** @brief Number of claimed call ids */
  std::size_t count() const;

  /**
   * @brief Record the size of the snapshot about to be scanned.
   * @return false if it's the same as the last one, and there's nothing new to scan.
   */
  bool advance(std::size_t snapshot_size);
};

} // namespace letterbox::rpc
