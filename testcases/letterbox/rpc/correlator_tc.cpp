#include "stdinc.hpp"

#include "letterbox/document/memory-document.hpp"
#include "letterbox/portable/asio/asio-execution-context.hpp"
#include "letterbox/rpc/correlator.hpp"

#include "../test-utils.hpp"

#include <catch2/catch.hpp>

namespace letterbox::rpc::test {

using letterbox::test::eventually;
using CorrelatorType = Correlator<AsioExecutionContext::SteadyTimerType>;

static Status failure_of(CorrelatorType::FutureType& future) {
  try {
    future.get();
  } catch (const CallError& e) {
    return e.status();
  }
  return Status{};
}

static std::vector<CallEntry> calls_in(const document::ReplicatedDocument& queue) {
  std::vector<CallEntry> out;
  for (const auto& raw : queue.read_all()) {
    auto entry = decode(raw);
    if (entry && std::holds_alternative<CallEntry>(*entry))
      out.push_back(std::get<CallEntry>(*entry));
  }
  return out;
}

static void respond(document::ReplicatedDocument& queue, const std::string& call_id,
                    Json::Value result) {
  queue.append({encode(make_response(call_id, Status{}, std::move(result)))});
}

CATCH_TEST_CASE("Correlator", "[correlator]") {
  boost::asio::io_context io_context;
  document::MemoryDocument queue{"queue"};

  auto correlator = std::make_shared<CorrelatorType>(
      queue, [&io_context]() { return AsioExecutionContext::SteadyTimerType{io_context}; },
      CorrelatorType::Config{.name = "test-correlator"});

  AsioExecutionContext pool{io_context, 2};
  pool.run();

  CATCH_SECTION("not-running") {
    auto future = correlator->call("ping", Json::Value{});
    CATCH_REQUIRE(future.is_ready());
    CATCH_REQUIRE(failure_of(future).error_code() == StatusCode::UNAVAILABLE);
    CATCH_REQUIRE(queue.size() == 0);
  }

  correlator->start();

  CATCH_SECTION("success") {
    auto future = correlator->call("ping", Json::Value{"hello"});
    CATCH_REQUIRE(correlator->pending_count() == 1);

    const auto calls = calls_in(queue);
    CATCH_REQUIRE(calls.size() == 1);
    CATCH_REQUIRE(calls[0].procedure == "ping");
    CATCH_REQUIRE(calls[0].input.asString() == "hello");
    CATCH_REQUIRE(calls[0].batch_id.empty());
    CATCH_REQUIRE(correlator->is_pending(calls[0].id));

    respond(queue, calls[0].id, Json::Value{"pong"});
    CATCH_REQUIRE(future.is_ready());
    CATCH_REQUIRE(future.get().asString() == "pong");
    CATCH_REQUIRE(correlator->pending_count() == 0);
  }

  CATCH_SECTION("explicit-id") {
    auto future = correlator->call("ping", Json::Value{}, {.id = "testing"});
    CATCH_REQUIRE(calls_in(queue).at(0).id == "testing");
    CATCH_REQUIRE(correlator->is_pending("testing"));

    auto duplicate = correlator->call("ping", Json::Value{}, {.id = "testing"});
    CATCH_REQUIRE(failure_of(duplicate).error_code() == StatusCode::ALREADY_EXISTS);
    CATCH_REQUIRE(calls_in(queue).size() == 1); // the duplicate was never appended

    respond(queue, "testing", Json::Value{1});
    CATCH_REQUIRE(future.get().asInt() == 1);
  }

  CATCH_SECTION("settled-id-is-not-reused") {
    auto first = correlator->call("create", Json::Value{"alice"}, {.id = "x"});
    respond(queue, "x", Json::Value{"alice"});
    CATCH_REQUIRE(first.get().asString() == "alice");
    CATCH_REQUIRE(!correlator->is_pending("x"));

    // Accepting "x" again would settle it with alice's response
    auto second = correlator->call("create", Json::Value{"bob"}, {.id = "x"});
    CATCH_REQUIRE(second.is_ready());
    const auto status = failure_of(second);
    CATCH_REQUIRE(status.error_code() == StatusCode::ALREADY_EXISTS);
    CATCH_REQUIRE(status.error_details() == make_error_code(ecode::duplicate_call_id).message());
    CATCH_REQUIRE(calls_in(queue).size() == 1);
    CATCH_REQUIRE(correlator->pending_count() == 0);
  }

  CATCH_SECTION("id-used-by-another-client") {
    queue.append({encode(make_call("create", Json::Value{"carol"}, "y"))});
    auto future = correlator->call("create", Json::Value{"dave"}, {.id = "y"});
    CATCH_REQUIRE(failure_of(future).error_code() == StatusCode::ALREADY_EXISTS);
    CATCH_REQUIRE(calls_in(queue).size() == 1);
  }

  CATCH_SECTION("failure") {
    auto future = correlator->call("conflict", Json::Value{}, {.id = "c1"});
    queue.append({encode(make_response(
        "c1", Status{StatusCode::APPLICATION_ERROR, "This name isn't one I like to allow",
                     "CONFLICT"}))});
    CATCH_REQUIRE_THROWS_WITH(future.get(), "This name isn't one I like to allow");

    auto other = correlator->call("missing", Json::Value{}, {.id = "c2"});
    queue.append({encode(make_response(
        "c2", Status{StatusCode::NOT_FOUND, R"(No procedure found on path "missing")"}))});
    const auto status = failure_of(other);
    CATCH_REQUIRE(status.error_code() == StatusCode::NOT_FOUND);
  }

  CATCH_SECTION("out-of-order-responses") {
    auto first = correlator->call("p", Json::Value{}, {.id = "first"});
    auto second = correlator->call("p", Json::Value{}, {.id = "second"});
    respond(queue, "second", Json::Value{2});
    CATCH_REQUIRE(second.is_ready());
    CATCH_REQUIRE(!first.is_ready());
    respond(queue, "first", Json::Value{1});
    CATCH_REQUIRE(first.get().asInt() == 1);
    CATCH_REQUIRE(second.get().asInt() == 2);
  }

  CATCH_SECTION("unmatched-responses-are-ignored") {
    auto future = correlator->call("p", Json::Value{}, {.id = "mine"});
    respond(queue, "someone-elses", Json::Value{0});
    queue.append({Json::Value{42}}); // malformed
    CATCH_REQUIRE(!future.is_ready());
    CATCH_REQUIRE(correlator->pending_count() == 1);
    respond(queue, "mine", Json::Value{1});
    CATCH_REQUIRE(future.get().asInt() == 1);
  }

  CATCH_SECTION("deadline") {
    auto future = correlator->call("p", Json::Value{}, {.id = "slow", .deadline_millis = 20});
    CATCH_REQUIRE(future.wait_for(std::chrono::seconds{5}) == std::future_status::ready);
    CATCH_REQUIRE(failure_of(future).error_code() == StatusCode::DEADLINE_EXCEEDED);
    CATCH_REQUIRE(correlator->pending_count() == 0);

    respond(queue, "slow", Json::Value{1}); // late, and ignored
    CATCH_REQUIRE(correlator->pending_count() == 0);
  }

  CATCH_SECTION("answered-before-deadline") {
    auto future = correlator->call("p", Json::Value{}, {.id = "quick", .deadline_millis = 50});
    respond(queue, "quick", Json::Value{1});
    CATCH_REQUIRE(future.get().asInt() == 1);
    std::this_thread::sleep_for(std::chrono::milliseconds{80}); // the timer must not fire
    CATCH_REQUIRE(correlator->pending_count() == 0);
  }

  CATCH_SECTION("cancel") {
    auto future = correlator->call("p", Json::Value{}, {.id = "c1"});
    CATCH_REQUIRE(correlator->cancel("c1"));
    CATCH_REQUIRE(!correlator->cancel("c1"));
    CATCH_REQUIRE(failure_of(future).error_code() == StatusCode::CANCELLED);
    CATCH_REQUIRE(calls_in(queue).size() == 1); // not retracted
    respond(queue, "c1", Json::Value{1});
    CATCH_REQUIRE(correlator->pending_count() == 0);
  }

  CATCH_SECTION("stop") {
    auto a = correlator->call("p", Json::Value{});
    auto b = correlator->call("p", Json::Value{});
    correlator->stop();
    CATCH_REQUIRE(correlator->pending_count() == 0);
    CATCH_REQUIRE(failure_of(a).error_code() == StatusCode::CANCELLED);
    CATCH_REQUIRE(failure_of(b).error_code() == StatusCode::CANCELLED);
    auto c = correlator->call("p", Json::Value{});
    CATCH_REQUIRE(failure_of(c).error_code() == StatusCode::UNAVAILABLE);
  }

  pool.stop();
}

} // namespace letterbox::rpc::test
