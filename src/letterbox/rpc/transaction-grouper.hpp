#pragma once

#include "entry-codec.hpp"

#include <json/value.h>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace letterbox::rpc {

/**
 * @brief Collects the Call Entries issued inside a batch, so they can be appended to the queue
 *        as one atomic change.
 *
 * Batches belong to the thread that opened them. Nested batches flatten into the outermost:
 * they share its batch id, and their entries are appended when the outermost batch closes. If
 * any level aborts, the whole batch is aborted, and nothing is appended.
 */
class TransactionGrouper {
public:
  enum class StageResult : int8_t {
    NO_BATCH, //!< This thread has no open batch; append the call directly
    STAGED,   //!< The call joined the open batch
    ABORTED   //!< The open batch has been aborted; reject the call
  };

  /** @brief A closed batch, ready to be appended */
  struct Batch {
    std::string batch_id;
    std::vector<Json::Value> entries;
    std::vector<std::string> call_ids;
  };

private:
  struct OpenBatch {
    Batch batch;
    std::size_t depth{0};
    bool aborted{false};
  };

  mutable std::mutex padlock_;
  std::unordered_map<std::thread::id, OpenBatch> open_;

public:
  /**
   * @brief Open a batch on this thread, or join the one already open.
   * @return The batch id.
   */
  std::string open();

  /**
   * @brief Stage `entry` in this thread's open batch, setting its `batch_id`.
   */
  StageResult stage(CallEntry& entry);

  /**
   * @brief Leave the batch normally.
   * @return The batch to append, iff this closed the outermost level, and nothing aborted it.
   */
  std::optional<Batch> close();

  /**
   * @brief Leave the batch because it threw. The whole batch is aborted.
   * @return The ids of the calls staged so far, which must be rejected.
   */
  std::vector<std::string> abort();

  /** @brief true iff the calling thread is inside a batch */
  bool in_batch() const;

  /** @brief Depth of the calling thread's batch; zero if none */
  std::size_t depth() const;
};

} // namespace letterbox::rpc
