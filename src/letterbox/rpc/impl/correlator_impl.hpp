#pragma once

#include "letterbox/utils/error-codes.hpp"

#include <boost/system/error_code.hpp>

#include <chrono>
#include <exception>
#include <variant>

namespace letterbox::rpc {

// ------------------------------------------------------------------------------------- start/stop

template <typename SteadyTimerType> void Correlator<SteadyTimerType>::start() {
  if (is_running_.exchange(true, std::memory_order_acq_rel))
    return;
  subscription_ = queue_.on_change([weak = this->weak_from_this()]() {
    if (auto self = weak.lock(); self != nullptr)
      self->on_change_();
  });
}

template <typename SteadyTimerType> void Correlator<SteadyTimerType>::stop() {
  is_running_.store(false, std::memory_order_release);
  subscription_.reset();

  std::vector<std::string> call_ids;
  {
    std::lock_guard lock{padlock_};
    call_ids = pending_ | views::keys | ranges::to<std::vector<std::string>>();
  }
  reject_all_(call_ids, Status{StatusCode::CANCELLED, format("{} stopped", config_.name)});
}

// -------------------------------------------------------------------------------------------- call

template <typename SteadyTimerType>
typename Correlator<SteadyTimerType>::FutureType
Correlator<SteadyTimerType>::call(std::string procedure, Json::Value input, CallOptions options) {
  auto reject = [](Status status) {
    return async::make_exceptional_future<Json::Value>(
        std::make_exception_ptr(CallError{std::move(status)}));
  };

  if (!is_running())
    return reject(Status{StatusCode::UNAVAILABLE, format("{} is not running", config_.name)});

  const bool has_explicit_id = !options.id.empty();
  auto entry = make_call(std::move(procedure), std::move(input), std::move(options.id));

  // An id already in the queue would be answered by the old Response Entry
  if (has_explicit_id && is_used_(entry.id))
    return reject(Status{StatusCode::ALREADY_EXISTS,
                         format("call id '{}' has already been used", entry.id),
                         make_error_code(ecode::duplicate_call_id).message()});

  PendingCall pending;
  auto future = pending.promise.get_future();

  const auto deadline_millis = (options.deadline_millis > 0) ? options.deadline_millis
                                                             : config_.default_deadline_millis;
  if (deadline_millis > 0)
    pending.timeout = std::make_unique<SteadyTimerType>(timer_factory_());

  { // Register before appending: the response may be observed before `append` returns
    std::lock_guard lock{padlock_};
    if (pending_.count(entry.id) > 0)
      return reject(Status{StatusCode::ALREADY_EXISTS,
                           format("call id '{}' is already pending", entry.id),
                           make_error_code(ecode::duplicate_call_id).message()});

    if (pending.timeout) { // Setup the timeout
      pending.timeout->expires_after(std::chrono::milliseconds{deadline_millis});
      pending.timeout->async_wait([weak = this->weak_from_this(), call_id = entry.id,
                                   deadline_millis](const boost::system::error_code& ec) {
        if (!ec) {
          if (auto self = weak.lock(); self != nullptr)
            self->settle_(call_id,
                          Status{StatusCode::DEADLINE_EXCEEDED,
                                 format("no response to call {} within {}ms", call_id,
                                        deadline_millis)});
        }
      });
    }
    pending_.emplace(entry.id, std::move(pending));
  }

  switch (grouper_.stage(entry)) {
  case TransactionGrouper::StageResult::STAGED:
    break;
  case TransactionGrouper::StageResult::ABORTED:
    settle_(entry.id,
            Status{StatusCode::CANCELLED, make_error_code(ecode::batch_aborted).message()});
    break;
  case TransactionGrouper::StageResult::NO_BATCH:
    append_({encode(entry)}, {entry.id});
    break;
  }

  return future;
}

// -------------------------------------------------------------------------------------- with_batch

template <typename SteadyTimerType>
void Correlator<SteadyTimerType>::with_batch(const std::function<void()>& fn) {
  grouper_.open();

  try {
    fn();
  } catch (...) {
    const auto call_ids = grouper_.abort();
    LOG_DEBUG("{}: batch aborted, rejecting {} call(s)", config_.name, call_ids.size());
    reject_all_(call_ids,
                Status{StatusCode::CANCELLED, make_error_code(ecode::batch_aborted).message()});
    throw;
  }

  if (auto batch = grouper_.close()) {
    TRACE("{}: committing batch {} with {} call(s)", config_.name, batch->batch_id,
          batch->call_ids.size());
    append_(std::move(batch->entries), batch->call_ids);
  }
}

// ------------------------------------------------------------------------------------------ cancel

template <typename SteadyTimerType>
bool Correlator<SteadyTimerType>::cancel(const std::string& call_id) {
  return settle_(call_id, Status{StatusCode::CANCELLED, format("call {} cancelled", call_id)});
}

template <typename SteadyTimerType> std::size_t Correlator<SteadyTimerType>::pending_count() const {
  std::lock_guard lock{padlock_};
  return pending_.size();
}

template <typename SteadyTimerType>
bool Correlator<SteadyTimerType>::is_pending(const std::string& call_id) const {
  std::lock_guard lock{padlock_};
  return pending_.count(call_id) > 0;
}

// -------------------------------------------------------------------------------------- on_change_

template <typename SteadyTimerType> void Correlator<SteadyTimerType>::on_change_() {
  if (pending_count() == 0)
    return;

  std::size_t ignored = 0;
  for (const auto& raw : queue_.read_all()) {
    auto entry = decode(raw);
    if (!entry)
      continue; // malformed, the dispatcher side reports these
    if (auto* response = std::get_if<ResponseEntry>(&*entry)) {
      if (!settle_(response->call_id, std::move(response->status), std::move(response->result)))
        ++ignored;
    }
  }

  if (ignored > 0) {
    TRACE("{}: ignored {} response(s) with no pending call", config_.name, ignored);
  }
}

// ---------------------------------------------------------------------------------------- is_used_

template <typename SteadyTimerType>
bool Correlator<SteadyTimerType>::is_used_(const std::string& call_id) const {
  for (const auto& raw : queue_.read_all()) {
    auto entry = decode(raw);
    if (!entry)
      continue;
    if (auto* call = std::get_if<CallEntry>(&*entry); call != nullptr && call->id == call_id)
      return true;
    if (auto* response = std::get_if<ResponseEntry>(&*entry);
        response != nullptr && response->call_id == call_id)
      return true;
  }
  return false;
}

// ----------------------------------------------------------------------------------------- settle_

template <typename SteadyTimerType>
bool Correlator<SteadyTimerType>::settle_(const std::string& call_id, Status status,
                                          Json::Value result) {
  PendingCall pending;
  { // Grab the pending call, if it still exists
    std::lock_guard lock{padlock_};
    auto ii = pending_.find(call_id);
    if (ii == end(pending_))
      return false;
    pending = std::move(ii->second);
    pending_.erase(ii);
  }

  if (pending.timeout)
    pending.timeout->cancel();

  if (status.ok()) {
    pending.promise.set_value(std::move(result));
  } else {
    if (status.error_code() == StatusCode::CANCELLED ||
        status.error_code() == StatusCode::DEADLINE_EXCEEDED) {
      LOG_DEBUG("{}: {}", config_.name, status.to_string());
    }
    pending.promise.set_exception(std::make_exception_ptr(CallError{std::move(status)}));
  }
  return true;
}

template <typename SteadyTimerType>
void Correlator<SteadyTimerType>::reject_all_(const std::vector<std::string>& call_ids,
                                              const Status& status) {
  for (const auto& call_id : call_ids)
    settle_(call_id, status);
}

template <typename SteadyTimerType>
void Correlator<SteadyTimerType>::append_(std::vector<Json::Value> entries,
                                          const std::vector<std::string>& call_ids) {
  try {
    queue_.append(std::move(entries));
  } catch (const std::exception& e) {
    LOG_ERR("{}: failed to append {} call(s): {}", config_.name, call_ids.size(), e.what());
    reject_all_(call_ids, Status{StatusCode::INTERNAL, e.what()});
  }
}

} // namespace letterbox::rpc
