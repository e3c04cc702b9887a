#include "letterbox/async.hpp"

#include "stdinc.hpp"

#include <catch2/catch.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <json/value.h>

#include <memory>
#include <thread>
#include <vector>

namespace letterbox::async
{

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("FutureVoid", "[future-void]")
{
   CATCH_SECTION("future-void-ex")
   {
      Promise<void> promise;
      auto future = promise.get_future();
      CATCH_REQUIRE(future.valid());
      CATCH_REQUIRE(future.is_ready() == false);
      try {
         throw std::runtime_error{"foo"};
      } catch(...) {
         promise.set_exception(std::current_exception());
      }
      CATCH_REQUIRE(future.is_ready());
      CATCH_REQUIRE(future.has_exception());
      try {
         future.get();
         CATCH_REQUIRE(false); // we should throw
      } catch(std::runtime_error& e) {
         CATCH_REQUIRE(e.what() == std::string_view{"foo"});
      }
   }

   CATCH_SECTION("future-void-set")
   {
      Promise<void> promise;
      auto future = promise.get_future();
      promise.set_value();
      CATCH_REQUIRE(future.is_ready());
      CATCH_REQUIRE(!future.has_exception());
      future.get();
   }

   CATCH_SECTION("future-already-retrieved")
   {
      Promise<void> promise;
      auto future = promise.get_future();
      try {
         auto again = promise.get_future();
         CATCH_REQUIRE(false);
      } catch(std::future_error& e) {
         CATCH_REQUIRE(e.code() == std::future_errc::future_already_retrieved);
      }
   }
}

CATCH_TEST_CASE("FutureValue", "[future-value]")
{
   CATCH_SECTION("future-json-set")
   {
      Promise<Json::Value> promise;
      auto future = promise.get_future();
      Json::Value value{Json::objectValue};
      value["name"] = "foo";
      promise.set_value(value);
      CATCH_REQUIRE(future.is_ready());
      try {
         promise.set_value(Json::Value{});
         CATCH_REQUIRE(false);
      } catch(std::future_error& e) {
         CATCH_REQUIRE(e.code() == std::future_errc::promise_already_satisfied);
      }
      CATCH_REQUIRE(future.get()["name"].asString() == "foo");
   }

   CATCH_SECTION("future-move-only-set")
   {
      Promise<std::unique_ptr<int>> promise;
      auto future = promise.get_future();
      promise.set_value(std::make_unique<int>(42));
      std::unique_ptr<int> value = future.get();
      CATCH_REQUIRE(value != nullptr);
      CATCH_REQUIRE(*value == 42);
   }

   CATCH_SECTION("future-cancel")
   {
      Promise<int> promise;
      auto future = promise.get_future();
      future.cancel();
      CATCH_REQUIRE(future.is_cancelled());
      CATCH_REQUIRE(promise.is_cancelled());
      promise.set_value(42); // silently ignored
      try {
         future.get();
         CATCH_REQUIRE(false);
      } catch(std::future_error& e) {
         CATCH_REQUIRE(e.code() == std::future_errc::broken_promise);
      }
   }

   CATCH_SECTION("future-wait-for")
   {
      Promise<int> promise;
      auto future = promise.get_future();
      CATCH_REQUIRE(future.wait_for(std::chrono::milliseconds{10})
                    == std::future_status::timeout);
      std::thread setter{[&promise]() { promise.set_value(7); }};
      CATCH_REQUIRE(future.wait_for(std::chrono::seconds{5}) == std::future_status::ready);
      setter.join();
      CATCH_REQUIRE(future.get() == 7);
   }

   CATCH_SECTION("ready-and-exceptional-futures")
   {
      auto ready = make_ready_future(std::string{"ready"});
      CATCH_REQUIRE(ready.is_ready());
      CATCH_REQUIRE(ready.get() == "ready");

      auto failed
          = make_exceptional_future<int>(std::make_exception_ptr(std::logic_error{"nope"}));
      CATCH_REQUIRE(failed.has_exception());
      CATCH_REQUIRE_THROWS_AS(failed.get(), std::logic_error);
   }
}

CATCH_TEST_CASE("FutureThen", "[future-then]")
{
   boost::asio::io_context io_context;
   AsioExecutionContext pool{io_context, 2};
   pool.run();
   auto executor = pool.get_executor();

   CATCH_SECTION("then-after-set")
   {
      Promise<int> promise;
      auto future = promise.get_future();
      promise.set_value(41);
      auto next = future.then(executor, [](int value) { return value + 1; });
      CATCH_REQUIRE(next.wait_for(std::chrono::seconds{5}) == std::future_status::ready);
      CATCH_REQUIRE(next.get() == 42);
   }

   CATCH_SECTION("then-before-set")
   {
      Promise<Json::Value> promise;
      auto future = promise.get_future();
      auto next = future.then(executor, [](Json::Value value) { return value["n"].asInt() * 2; });
      Json::Value value{Json::objectValue};
      value["n"] = 21;
      promise.set_value(std::move(value));
      CATCH_REQUIRE(next.get() == 42);
   }

   CATCH_SECTION("then-propagates-exceptions")
   {
      Promise<int> promise;
      auto future = promise.get_future();
      auto next = future.then(executor, [](int value) { return value; });
      promise.set_exception(std::make_exception_ptr(std::runtime_error{"boom"}));
      CATCH_REQUIRE_THROWS_WITH(next.get(), "boom");
   }

   CATCH_SECTION("then-propagates-cancellation")
   {
      Promise<int> promise;
      auto future = promise.get_future();
      auto next = future.then(executor, [](int value) { return value; });
      promise.cancel();
      next.wait();
      CATCH_REQUIRE(next.is_cancelled());
   }

   pool.stop();
}

} // namespace letterbox::async
