#pragma once

#include "memory-document.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <memory>

namespace letterbox::document {

/**
 * @brief Replicates changes between two `MemoryDocument` replicas, asynchronously.
 *
 * Every change applied on one side (local, or merged from elsewhere) is forwarded to the other
 * side on the `io_context`, optionally after a delay. `start()` also sends each side's history to
 * the other. Replicas ignore changes they have already applied, so links may be chained into any
 * topology.
 *
 * Both documents must outlive the link, and the `io_context` must be stopped (or the link
 * stopped) before the documents are destroyed.
 */
class DocumentLink {
public:
  struct Config {
    std::chrono::milliseconds latency{0}; //!< Delay before a change is applied on the other side
  };

private:
  struct Channel;

  std::shared_ptr<Channel> a_to_b_;
  std::shared_ptr<Channel> b_to_a_;
  MemoryDocument& a_;
  MemoryDocument& b_;
  Subscription a_subscription_;
  Subscription b_subscription_;

public:
  DocumentLink(boost::asio::io_context& io_context, MemoryDocument& a, MemoryDocument& b,
               Config config = Config{std::chrono::milliseconds{0}});
  DocumentLink(const DocumentLink&) = delete;
  DocumentLink& operator=(const DocumentLink&) = delete;
  ~DocumentLink();

  /** @brief Exchange histories, and start forwarding changes */
  void start();

  /** @brief Stop forwarding. Changes already in flight are dropped. */
  void stop();

  /** @brief Number of changes delivered, in both directions, that were new to the receiver */
  std::size_t delivered_count() const;
};

} // namespace letterbox::document
