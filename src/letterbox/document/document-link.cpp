#include "stdinc.hpp"

#include "document-link.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace letterbox::document {

// ----------------------------------------------------------------------------------------- Channel
/**
 * @private
 * One direction of the link. Deliveries go through a strand, so that a channel applies changes
 * in the order they were forwarded.
 */
struct DocumentLink::Channel : public std::enable_shared_from_this<DocumentLink::Channel> {
  boost::asio::strand<boost::asio::io_context::executor_type> strand;
  MemoryDocument& target;
  std::chrono::milliseconds latency;
  std::atomic<bool> running{false};
  std::atomic<std::size_t> delivered{0};

  Channel(boost::asio::io_context& io_context, MemoryDocument& target_,
          std::chrono::milliseconds latency_)
      : strand{boost::asio::make_strand(io_context)}, target{target_}, latency{latency_} {}

  void deliver(const Change& change) {
    if (!running.load(std::memory_order_acquire))
      return;
    if (target.apply(change)) {
      TRACE("delivered change {} to replica {}", change.id(), target.actor_id());
      delivered.fetch_add(1, std::memory_order_relaxed);
    }
  }

  void forward(const Change& change) {
    if (!running.load(std::memory_order_acquire) || change.actor == target.actor_id())
      return; // never echo a change back to its author

    auto self = shared_from_this();
    if (latency.count() == 0) {
      boost::asio::post(strand, [self, change]() { self->deliver(change); });
      return;
    }

    auto timer = std::make_shared<boost::asio::steady_timer>(strand, latency);
    timer->async_wait([self, timer, change](const boost::system::error_code& ec) {
      if (!ec)
        self->deliver(change);
    });
  }
};

// ------------------------------------------------------------------------------------ DocumentLink

DocumentLink::DocumentLink(boost::asio::io_context& io_context, MemoryDocument& a,
                           MemoryDocument& b, Config config)
    : a_to_b_{std::make_shared<Channel>(io_context, b, config.latency)},
      b_to_a_{std::make_shared<Channel>(io_context, a, config.latency)}, a_{a}, b_{b} {}

DocumentLink::~DocumentLink() { stop(); }

void DocumentLink::start() {
  a_to_b_->running.store(true, std::memory_order_release);
  b_to_a_->running.store(true, std::memory_order_release);

  a_subscription_ =
      a_.on_commit([channel = a_to_b_](const Change& change) { channel->forward(change); });
  b_subscription_ =
      b_.on_commit([channel = b_to_a_](const Change& change) { channel->forward(change); });

  // Anything committed between subscribing and here is sent twice, which is harmless
  for (const auto& change : a_.changes())
    a_to_b_->forward(change);
  for (const auto& change : b_.changes())
    b_to_a_->forward(change);

  TRACE("link started between replicas {} and {}", a_.actor_id(), b_.actor_id());
}

void DocumentLink::stop() {
  a_subscription_.reset();
  b_subscription_.reset();
  a_to_b_->running.store(false, std::memory_order_release);
  b_to_a_->running.store(false, std::memory_order_release);
}

std::size_t DocumentLink::delivered_count() const {
  return a_to_b_->delivered.load(std::memory_order_relaxed) +
         b_to_a_->delivered.load(std::memory_order_relaxed);
}

} // namespace letterbox::document
