#pragma once

#include "letterbox/rpc/status.hpp"

#include <boost/asio/post.hpp>

namespace letterbox::rpc {

// ------------------------------------------------------------------------------------- start/stop

template <typename Executor> void Dispatcher<Executor>::start() {
  if (is_running_.exchange(true, std::memory_order_acq_rel))
    return;
  subscription_ = queue_.on_change([weak = this->weak_from_this()]() {
    if (auto self = weak.lock(); self != nullptr && self->is_running())
      self->on_change_();
  });
  on_change_(); // the queue may already hold calls
}

template <typename Executor> void Dispatcher<Executor>::stop() {
  is_running_.store(false, std::memory_order_release);
  subscription_.reset();
}

// -------------------------------------------------------------------------------------- on_change_

template <typename Executor> void Dispatcher<Executor>::on_change_() {
  const auto snapshot = queue_.read_all();
  if (!cursor_.advance(snapshot.size()))
    return; // nothing new

  std::vector<CallEntry> calls;
  std::size_t malformed = 0;

  for (const auto& raw : snapshot) {
    auto entry = decode(raw);
    if (!entry) {
      ++malformed;
      continue;
    }
    if (auto* call = std::get_if<CallEntry>(&*entry)) {
      calls.push_back(std::move(*call));
    } else if (auto* response = std::get_if<ResponseEntry>(&*entry)) {
      cursor_.claim(response->call_id); // already answered, maybe by an earlier run
    }
  }

  if (malformed > 0)
    WARN("{}: skipped {} malformed entries in the queue", config_.name, malformed);

  for (auto& call : calls)
    if (cursor_.claim(call.id))
      dispatch_(std::move(call));
}

// --------------------------------------------------------------------------------------- dispatch_

template <typename Executor> void Dispatcher<Executor>::dispatch_(CallEntry call) {
  TRACE("{}: dispatching call {} to '{}'", config_.name, call.id, call.procedure);
  dispatched_count_.fetch_add(1, std::memory_order_acq_rel);
  in_flight_.fetch_add(1, std::memory_order_acq_rel);

  // `post` never runs the handler inline, so the scan is never blocked on it
  boost::asio::post(executor_, [self = this->shared_from_this(), call = std::move(call)]() {
    self->execute_(call);
  });
}

// ---------------------------------------------------------------------------------------- execute_

template <typename Executor> void Dispatcher<Executor>::execute_(const CallEntry& call) {
  auto context =
      std::make_shared<CallContext>(call.id, call.procedure, call.batch_id, config_.data);
  context->set_completion(
      [self = this->shared_from_this(), procedure = call.procedure](ResponseEntry response) {
        self->respond_(procedure, std::move(response));
      });

  const auto* procedure = router_.resolve(call.procedure);
  if (procedure == nullptr) {
    context->finish_call(Status{StatusCode::NOT_FOUND,
                                format("No procedure found on path \"{}\"", call.procedure)});
    return;
  }

  auto input = router_.validate(call.procedure, call.input);
  if (!input) {
    context->finish_call(Status{StatusCode::BAD_INPUT, input.error().message()});
    return;
  }

  Json::Value result;
  try {
    result = procedure->handler(*input, *context);
  } catch (...) {
    context->finish_call(std::current_exception());
    return;
  }

  // A deferred handler finishes the call itself, later
  if (!context->is_deferred())
    context->finish_call(Status{}, std::move(result));
}

// ---------------------------------------------------------------------------------------- respond_

template <typename Executor>
void Dispatcher<Executor>::respond_(const std::string& procedure, ResponseEntry response) {
  if (!response.is_success()) {
    LOG_DEBUG("{}: call {} to '{}' failed: {}", config_.name, response.call_id, procedure,
              response.status.to_string());
  }

  try {
    queue_.append({encode(response)});
  } catch (const std::exception& e) {
    LOG_ERR("{}: failed to append the response to call {}: {}", config_.name, response.call_id,
            e.what());
  }

  in_flight_.fetch_sub(1, std::memory_order_acq_rel);
  TRACE("{}: finished call {}", config_.name, response.call_id);
}

} // namespace letterbox::rpc
