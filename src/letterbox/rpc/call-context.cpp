#include "stdinc.hpp"

#include "call-context.hpp"

#include "letterbox/utils/error-codes.hpp"

namespace letterbox::rpc {

// ------------------------------------------------------------------------------------ merge_result

namespace detail {

Json::Value merge_result(Json::Value result, const Json::Value& sink) {
  if (sink.empty())
    return result;

  if (result.isNull() || result.isObject()) {
    if (result.isNull())
      result = Json::Value{Json::objectValue};
    for (const auto& key : sink.getMemberNames())
      result[key] = sink[key]; // the sink wins
    return result;
  }

  // Scalar or array results can't take fields, so they go under "result"
  Json::Value out = sink;
  out["result"] = std::move(result);
  return out;
}

} // namespace detail

// ------------------------------------------------------------------------------------ ResponseSink

void ResponseSink::set(const std::string& key, Json::Value value) {
  std::lock_guard lock{padlock_};
  fields_[key] = std::move(value);
}

Json::Value ResponseSink::get() const {
  std::lock_guard lock{padlock_};
  return fields_;
}

bool ResponseSink::empty() const {
  std::lock_guard lock{padlock_};
  return fields_.empty();
}

void ResponseSink::restore(Json::Value fields) {
  Expects(fields.isObject());
  std::lock_guard lock{padlock_};
  fields_ = std::move(fields);
}

// ------------------------------------------------------------------------------------- CallContext

document::ReplicatedDocument& CallContext::data() const {
  if (data_ == nullptr)
    throw std::logic_error{format("{}: procedure '{}'",
                                  make_error_code(ecode::no_data_document).message(), procedure_)};
  return *data_;
}

void CallContext::transact(const std::function<void()>& fn) {
  auto saved = response_.get();
  try {
    if (data_ != nullptr)
      data_->transact(fn);
    else
      fn();
  } catch (...) {
    response_.restore(std::move(saved));
    throw;
  }
}

// -------------------------------------------------------------------------------------- completion

void CallContext::set_completion(Completion thunk) {
  std::lock_guard lock{padlock_};
  completion_ = std::move(thunk);
}

std::shared_ptr<CallContext> CallContext::defer() {
  auto self = shared_from_this();
  std::lock_guard lock{padlock_};
  is_deferred_ = true;
  return self;
}

bool CallContext::is_deferred() const {
  std::lock_guard lock{padlock_};
  return is_deferred_;
}

bool CallContext::has_finished() const {
  std::lock_guard lock{padlock_};
  return has_finished_;
}

void CallContext::finish_call(Status status, Json::Value result) {
  Completion completion;
  { // Check if this has already been done
    std::lock_guard lock{padlock_};
    if (has_finished_)
      return;
    has_finished_ = true;
    completion = std::move(completion_);
  }

  auto response = status.ok() ? make_response(call_id_, Status{},
                                              detail::merge_result(std::move(result),
                                                                   response_.get()))
                              : make_response(call_id_, std::move(status));

  if (completion) {
    completion(std::move(response));
  } else {
    WARN("call {} to '{}' finished, but there's no completion to write the response",
         call_id_, procedure_);
  }
}

void CallContext::finish_call(std::exception_ptr error) {
  Expects(error != nullptr);
  try {
    std::rethrow_exception(error);
  } catch (const ProcedureError& e) {
    finish_call(Status{StatusCode::APPLICATION_ERROR, e.what(), e.code()});
  } catch (const std::exception& e) {
    finish_call(Status{StatusCode::APPLICATION_ERROR, e.what()});
  } catch (...) {
    LOG_ERR("handler for '{}' threw a non-standard exception", procedure_);
    finish_call(Status{StatusCode::APPLICATION_ERROR, "unknown exception"});
  }
}

void CallContext::complete(const std::function<Json::Value()>& fn) {
  Json::Value result;
  try {
    result = fn();
  } catch (...) {
    finish_call(std::current_exception());
    return;
  }
  finish_call(Status{}, std::move(result));
}

} // namespace letterbox::rpc
