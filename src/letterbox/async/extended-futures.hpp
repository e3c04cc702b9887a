/**
 * Copyright 2022 Aaron Michaux
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and
 * associated documentation files (the "Software"), to deal in the Software without restriction,
 * including without limitation the rights to use, copy, modify, merge, publish, distribute,
 * sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all copies or
 * substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT
 * NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM,
 * DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 * @license MIT
 */

#pragma once

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace letterbox::async
{
template<typename R> class Promise;
template<typename R> class Future;

namespace detail
{
   template<typename R>
   class PromiseFutureSharedState : public std::enable_shared_from_this<PromiseFutureSharedState<R>>
   {
    public:
      enum class Status : int8_t { UNSET, SET, CANCELLED };
      static constexpr bool is_void_result = std::is_same_v<R, void>;

    private:
      using ResultType = std::conditional_t<is_void_result, int8_t, R>;

      mutable std::mutex padlock_       = {};
      std::condition_variable cv_       = {};
      std::exception_ptr exception_ptr_ = {};
      std::optional<ResultType> value_  = {};
      std::atomic<Status> status_       = Status::UNSET;
      bool future_is_retreived_         = false;
      std::function<void()> then_       = {};

      Status load_status_() const { return status_.load(std::memory_order_acquire); }

      template<typename WaitFunc> Status wait_with_thunk_(WaitFunc&& thunk)
      {
         if(promise_is_unset()) {
            std::unique_lock<std::mutex> lock{padlock_};
            while(promise_is_unset()) {
               if(!thunk(lock)) break; // timed out
            }
         }
         return load_status_();
      }

      // Returns the continuation, which must be run after `padlock_` is released
      std::function<void()> notify_locked_(Status new_status)
      {
         status_.store(new_status, std::memory_order_release);
         cv_.notify_all();
         return std::move(then_);
      }

      static void run_continuation_(std::function<void()> thunk)
      {
         if(thunk) thunk();
      }

    public:
      virtual ~PromiseFutureSharedState() = default;

      ///@{ getters
      bool promise_is_unset() const { return load_status_() == Status::UNSET; }
      bool promise_is_set() const { return load_status_() == Status::SET; }
      bool is_cancelled() const { return load_status_() == Status::CANCELLED; }
      ///@}

      void flag_future_has_been_retreived()
      {
         std::lock_guard lock{padlock_};
         if(future_is_retreived_)
            throw std::future_error{std::future_errc::future_already_retrieved};
         future_is_retreived_ = true;
      }

      void cancel()
      {
         std::function<void()> thunk;
         {
            std::lock_guard lock{padlock_};
            if(!promise_is_unset()) return;
            thunk = notify_locked_(Status::CANCELLED);
         }
         run_continuation_(std::move(thunk));
      }

      ///@{ the exception ptr
      bool has_exception_ptr() const
      {
         std::lock_guard lock{padlock_};
         return exception_ptr_ != nullptr;
      }

      void set_exception_ptr(std::exception_ptr ex_ptr)
      {
         std::function<void()> thunk;
         {
            std::lock_guard lock{padlock_};
            const auto status = load_status_();
            if(status == Status::SET)
               throw std::future_error{std::future_errc::promise_already_satisfied};
            if(status == Status::CANCELLED) return; // do nothing
            exception_ptr_ = ex_ptr;
            thunk          = notify_locked_(Status::SET);
         }
         run_continuation_(std::move(thunk));
      }
      ///@}

      ///@{ wait
      Status wait()
      {
         return wait_with_thunk_([this](std::unique_lock<std::mutex>& lock) {
            cv_.wait(lock);
            return true;
         });
      }

      template<typename Rep, typename Period>
      std::future_status wait_for(const std::chrono::duration<Rep, Period>& duration)
      {
         return wait_until(std::chrono::steady_clock::now() + duration);
      }

      template<typename Clock, typename Duration>
      std::future_status wait_until(const std::chrono::time_point<Clock, Duration>& deadline)
      {
         auto status = wait_with_thunk_([this, &deadline](std::unique_lock<std::mutex>& lock) {
            return cv_.wait_until(lock, deadline) == std::cv_status::no_timeout;
         });
         return (status == Status::UNSET) ? std::future_status::timeout : std::future_status::ready;
      }
      ///@}

      ///@{ get/set value
      R get()
      {
         auto status = wait(); // noop if `is_set`
         if(status == Status::CANCELLED) throw std::future_error{std::future_errc::broken_promise};
         if(exception_ptr_ != nullptr) std::rethrow_exception(exception_ptr_);
         if constexpr(!is_void_result) {
            assert(value_.has_value());
            return std::move(*value_);
         }
      }

      template<typename T = R>
      std::enable_if_t<!std::is_same_v<T, void>, void> set_value(T&& new_value)
      {
         std::function<void()> thunk;
         {
            std::lock_guard lock{padlock_};
            const auto status = load_status_();
            if(status == Status::SET)
               throw std::future_error{std::future_errc::promise_already_satisfied};
            if(status == Status::CANCELLED) return; // do nothing
            value_ = std::forward<T>(new_value);
            thunk  = notify_locked_(Status::SET);
         }
         run_continuation_(std::move(thunk));
      }

      template<typename T = R> std::enable_if_t<std::is_same_v<T, void>, void> set_value()
      {
         std::function<void()> thunk;
         {
            std::lock_guard lock{padlock_};
            const auto status = load_status_();
            if(status == Status::SET)
               throw std::future_error{std::future_errc::promise_already_satisfied};
            if(status == Status::CANCELLED) return; // do nothing
            thunk = notify_locked_(Status::SET);
         }
         run_continuation_(std::move(thunk));
      }
      ///@}

      ///@{ then
      template<typename Executor, typename F> Future<std::invoke_result_t<F, R>>
      then(const Executor& executor, F&& f);
      ///@}
   };

} // namespace detail

// ------------------------------------------------------------------------------------------ Future

/**
 * @ingroup async
 * @brief Provides a way to access the result of an asynchronous operation.
 *
 * It is possible to _blocking wait_ on the result, or alternatively set a `then` function
 * which will non-blocking execute when the value of the Future is set.
 */
template<typename R> class Future final
{
 private:
   using shared_state_type = detail::PromiseFutureSharedState<R>;
   std::shared_ptr<shared_state_type> shared_state_{};

   friend class Promise<R>;

   // throws std::future_error
   // no_state/future_already_retrieved
   explicit Future(std::shared_ptr<shared_state_type> shared_state)
       : shared_state_{std::move(shared_state)}
   {
      shared_state_->flag_future_has_been_retreived();
   }

 public:
   ///@{ @name construction/assignment/swap
   Future() noexcept                      = default;
   Future(const Future& o)                = delete;
   Future(Future&& o) noexcept            = default;
   ~Future()                              = default;
   Future& operator=(const Future& o)     = delete;
   Future& operator=(Future&& o) noexcept = default;

   void swap(Future& o) noexcept
   {
      using std::swap;
      swap(shared_state_, o.shared_state_);
   }
   friend void swap(Future& a, Future& b) noexcept { a.swap(b); }
   ///@}

   ///@{ @name getters
   /** @brief True iff the Future is still associated with some Promise. */
   bool valid() const noexcept { return shared_state_ != nullptr; }

   /** @brief True iff the Future's value (or exception) is set and get() will not block. */
   bool is_ready() const noexcept { return valid() && shared_state_->promise_is_set(); }

   /** @brief True iff the Future has been cancelled. */
   bool is_cancelled() const noexcept { return valid() && shared_state_->is_cancelled(); }

   /** @brief True iff the Future contains an exception which will be thrown when calling get(). */
   bool has_exception() const
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      return shared_state_->has_exception_ptr();
   }
   ///@}

   ///@{ @name operations
   /**
    * @brief Release the shared state, making `valid() == false`.
    */
   void reset() noexcept { shared_state_.reset(); }

   /**
    * @brief Cancel the operation. A later attempt to set the value is silently ignored, and
    * cancellation propagates to any `then` clause.
    */
   void cancel()
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      shared_state_->cancel();
   }

   /**
    * @brief Gets the result of the Future, performing a blocking wait if not yet set.
    *
    * Only one thread should call `get()` on any given Future, and the shared state is released
    * afterwards.
    *
    * @exception std::future_error `no_state` if the shared state has been released, or
    * `broken_promise` if the Future was cancelled.
    * @exception ... Rethrows any exception set on the associated Promise.
    */
   R get()
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      std::shared_ptr<shared_state_type> shared_state{nullptr};
      using std::swap;
      swap(shared_state_, shared_state); // release shared state
      return shared_state->get();
   }
   ///@}

   ///@{ @name wait
   void wait() const
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      shared_state_->wait();
   }

   template<typename Rep, typename Period>
   std::future_status wait_for(const std::chrono::duration<Rep, Period>& duration) const
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      return shared_state_->wait_for(duration);
   }

   template<typename Clock, typename Duration>
   std::future_status wait_until(const std::chrono::time_point<Clock, Duration>& deadline) const
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      return shared_state_->wait_until(deadline);
   }
   ///@}

   /**
    * @brief Execute `f` on `executor` when the associated Promise sets the value.
    *
    * If the value is already set, then `f` is posted immediately. The `Executor` must have
    * an `execute(thunk)` member. The returned Future receives the result of `f`, or the
    * exception of either this Future or of `f`. Cancellation propagates.
    */
   template<typename Executor, typename F>
   Future<std::invoke_result_t<F, R>> then(const Executor& executor, F&& f)
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      std::shared_ptr<shared_state_type> shared_state{nullptr};
      using std::swap;
      swap(shared_state_, shared_state); // the continuation now owns the value
      return shared_state->then(executor, std::forward<F>(f));
   }
};

// ----------------------------------------------------------------------------------------- Promise

/**
 * @ingroup async
 * @brief Stores a value or exception for later asychronous retrieval.
 */
template<typename R> class Promise final
{
 private:
   using shared_state_type = detail::PromiseFutureSharedState<R>;
   std::shared_ptr<shared_state_type> shared_state_{};

   template<typename> friend class detail::PromiseFutureSharedState;

 public:
   Promise()
       : shared_state_{std::make_shared<shared_state_type>()}
   {}
   Promise(Promise&& o) noexcept = default;
   Promise(const Promise&)       = delete;
   ~Promise()                    = default;
   Promise& operator=(Promise&& o) noexcept = default;
   Promise& operator=(const Promise&)       = delete;

   void swap(Promise& o) noexcept
   {
      using std::swap;
      swap(shared_state_, o.shared_state_);
   }
   friend void swap(Promise& a, Promise& b) noexcept { a.swap(b); }

   bool valid() const noexcept { return shared_state_ != nullptr; }

   /** @brief True iff the associated Future has been cancelled */
   bool is_cancelled() const noexcept { return valid() && shared_state_->is_cancelled(); }

   void cancel()
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      std::shared_ptr<shared_state_type> shared_state{nullptr};
      using std::swap;
      swap(shared_state_, shared_state); // release shared state
      shared_state->cancel();
   }

   Future<R> get_future()
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      return Future<R>{shared_state_};
   }

   template<typename T = R> std::enable_if_t<!std::is_same_v<T, void>, void> set_value(T&& value)
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      shared_state_->set_value(std::forward<T>(value));
   }

   template<typename T = R> std::enable_if_t<std::is_same_v<T, void>, void> set_value()
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      shared_state_->set_value();
   }

   void set_exception(std::exception_ptr ex)
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
      shared_state_->set_exception_ptr(ex);
   }
};

// ------------------------------------------------------------------------------ then (definition)

template<typename R>
template<typename Executor, typename F>
Future<std::invoke_result_t<F, R>>
detail::PromiseFutureSharedState<R>::then(const Executor& executor, F&& f)
{
   using T = std::invoke_result_t<F, R>;
   Promise<T> promise;
   auto continuation_future = promise.get_future();

   auto thunk = [shared_state = this->shared_from_this(),
                 next_state   = promise.shared_state_,
                 f            = std::forward<F>(f)]() mutable {
      if(shared_state->is_cancelled()) {
         next_state->cancel(); // propogate cancellation
         return;
      }
      try {
         if constexpr(is_void_result) {
            shared_state->get(); // rethrows
            if constexpr(std::is_same_v<T, void>) {
               std::invoke(f);
               next_state->set_value();
            } else {
               next_state->set_value(std::invoke(f));
            }
         } else {
            if constexpr(std::is_same_v<T, void>) {
               std::invoke(f, shared_state->get());
               next_state->set_value();
            } else {
               next_state->set_value(std::invoke(f, shared_state->get()));
            }
         }
      } catch(...) {
         // propogate the exception
         next_state->set_exception_ptr(std::current_exception());
      }
   };

   bool schedule_immediately = false;
   { // Safely test if we should execute immediately, or wait
      std::lock_guard lock{padlock_};
      assert(!then_);
      schedule_immediately = !promise_is_unset();
      if(!schedule_immediately) {
         then_ = [executor, thunk = std::move(thunk)]() mutable {
            executor.execute(std::move(thunk));
         };
      }
   }

   if(schedule_immediately) executor.execute(std::move(thunk));

   return continuation_future;
}

// ------------------------------------------------------------------------------------ make futures

/**
 * @ingroup async
 * @brief A Future that is already satisfied with `value`.
 */
template<typename R> Future<std::decay_t<R>> make_ready_future(R&& value)
{
   Promise<std::decay_t<R>> promise;
   auto future = promise.get_future();
   promise.set_value(std::forward<R>(value));
   return future;
}

/**
 * @ingroup async
 * @brief A Future that is already satisfied with the exception `ex`.
 */
template<typename R> Future<R> make_exceptional_future(std::exception_ptr ex)
{
   Promise<R> promise;
   auto future = promise.get_future();
   promise.set_exception(ex);
   return future;
}

} // namespace letterbox::async
