#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cassert>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace letterbox {

/**
 * @defgroup letterbox-asio Letterbox Asio
 *
 * We use Asio for two things: an execution context for dispatching procedure handlers and
 * replicating document changes, and managing timers for call deadlines and link latency.
 */

/**
 * @brief Type erase the underlying boost::asio::io_context, and run it on a pool of threads
 */
class AsioExecutionContext {
private:
  boost::asio::io_context& io_context_;
  std::size_t size_;
  std::vector<std::thread> pool_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> guard_;

public:
  using ExecutorType = boost::asio::io_context::executor_type;
  using SteadyTimerType = boost::asio::steady_timer;

  AsioExecutionContext(boost::asio::io_context& io_context, std::size_t thread_pool_size = 0)
      : io_context_{io_context}, size_{thread_pool_size == 0 ? std::thread::hardware_concurrency()
                                                             : thread_pool_size} {
    if (size_ == 0)
      size_ = 1;
    pool_.reserve(size_);
  }

  AsioExecutionContext(const AsioExecutionContext&) = delete;
  AsioExecutionContext& operator=(const AsioExecutionContext&) = delete;

  ~AsioExecutionContext() { stop(); }

  /** @brief Run the pool; threads keep running until `stop()`, even when there's no work */
  void run() {
    assert(!is_running());
    if (io_context_.stopped())
      io_context_.restart();
    guard_.emplace(boost::asio::make_work_guard(io_context_));
    for (std::size_t i = 0; i < size_; ++i)
      pool_.emplace_back([this]() { io_context_.run(); });
  }

  /** @brief Stop the io_context, and join the pool */
  void stop() {
    guard_.reset();
    io_context_.stop();
    for (auto& thread : pool_)
      if (thread.joinable())
        thread.join();
    pool_.clear();
  }

  /** @brief true iff the execution context is running */
  bool is_running() const noexcept { return pool_.size() > 0; }

  /** @brief Number of threads executing io requests in parallel */
  std::size_t size() const noexcept { return size_; }

  /** @brief Return the executor for running jobs on the pool */
  ExecutorType get_executor() const { return io_context_.get_executor(); }

  /** @brief Create a new steady timer bound to this execution context */
  SteadyTimerType make_steady_timer() const { return SteadyTimerType{io_context_}; }

  /** @brief Direct access to the underlying io_context */
  boost::asio::io_context& io_context() { return io_context_; }
};

} // namespace letterbox
