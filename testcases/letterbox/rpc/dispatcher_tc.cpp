#include "stdinc.hpp"

#include "letterbox/document/memory-document.hpp"
#include "letterbox/portable/asio/asio-execution-context.hpp"
#include "letterbox/rpc/dispatcher.hpp"

#include "../test-utils.hpp"

#include <catch2/catch.hpp>

#include <condition_variable>
#include <optional>

namespace letterbox::rpc::test {

using letterbox::test::eventually;
using DispatcherType = Dispatcher<AsioExecutionContext::ExecutorType>;

static std::vector<ResponseEntry> responses_to(const document::ReplicatedDocument& queue,
                                               const std::string& call_id) {
  std::vector<ResponseEntry> out;
  for (const auto& raw : queue.read_all()) {
    auto entry = decode(raw);
    if (!entry)
      continue;
    auto* response = std::get_if<ResponseEntry>(&*entry);
    if (response != nullptr && response->call_id == call_id)
      out.push_back(*response);
  }
  return out;
}

static std::optional<ResponseEntry> wait_for_response(const document::ReplicatedDocument& queue,
                                                      const std::string& call_id) {
  if (!eventually([&]() { return !responses_to(queue, call_id).empty(); }))
    return std::nullopt;
  return responses_to(queue, call_id).front();
}

static Json::Value call_entry(const std::string& id, const std::string& procedure,
                              Json::Value input = {}) {
  return encode(make_call(procedure, std::move(input), id));
}

static Router make_test_router() {
  Router router;
  router.add("add", schema::object({{"a", schema::number()}, {"b", schema::number()}}),
             [](const Json::Value& input, CallContext&) -> Json::Value {
               return input["a"].asDouble() + input["b"].asDouble();
             });
  router.add("annotate", schema::any(), [](const Json::Value&, CallContext& context) {
    context.response().set("callId", context.call_id());
    context.response().set("flag", true);
    Json::Value result{Json::objectValue};
    result["flag"] = false; // overwritten by the sink
    result["kept"] = 1;
    return result;
  });
  router.add("annotate-scalar", schema::any(), [](const Json::Value&, CallContext& context) {
    context.response().set("note", "scalar");
    return Json::Value{7};
  });
  router.add("conflict", schema::any(), [](const Json::Value&, CallContext&) -> Json::Value {
    throw ProcedureError{"CONFLICT", "This name isn't one I like to allow"};
  });
  router.add("throws", schema::any(), [](const Json::Value&, CallContext&) -> Json::Value {
    throw std::runtime_error{"something broke"};
  });
  router.add("write-data", schema::any(), [](const Json::Value& input, CallContext& context) {
    context.transact([&]() {
      context.data().append({input});
      context.response().set("written", true);
    });
    return Json::Value{};
  });
  router.add("write-data-then-fail", schema::any(),
             [](const Json::Value& input, CallContext& context) -> Json::Value {
               context.transact([&]() {
                 context.data().append({input});
                 context.response().set("written", true);
                 throw std::runtime_error{"rolled back"};
               });
               return Json::Value{};
             });
  return router;
}

CATCH_TEST_CASE("Dispatcher", "[dispatcher]") {
  boost::asio::io_context io_context;
  document::MemoryDocument queue{"queue"};
  document::MemoryDocument data{"data"};

  auto dispatcher = std::make_shared<DispatcherType>(
      io_context.get_executor(), queue, make_test_router(),
      DispatcherType::Config{.data = &data, .name = "test-dispatcher"});

  AsioExecutionContext pool{io_context, 4};
  pool.run();
  dispatcher->start();
  CATCH_REQUIRE(dispatcher->is_running());

  CATCH_SECTION("success") {
    queue.append({call_entry("c1", "add", parse_json_text(R"({"a":1,"b":2})").value())});
    auto response = wait_for_response(queue, "c1");
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->is_success());
    CATCH_REQUIRE(response->result.asDouble() == 3.0);
  }

  CATCH_SECTION("response-sink") {
    queue.append({call_entry("c1", "annotate"), call_entry("c2", "annotate-scalar")});
    auto annotated = wait_for_response(queue, "c1");
    CATCH_REQUIRE(annotated.has_value());
    CATCH_REQUIRE(annotated->result["flag"].asBool() == true);
    CATCH_REQUIRE(annotated->result["kept"].asInt() == 1);
    CATCH_REQUIRE(annotated->result["callId"].asString() == "c1");

    auto scalar = wait_for_response(queue, "c2");
    CATCH_REQUIRE(scalar.has_value());
    CATCH_REQUIRE(scalar->result["result"].asInt() == 7);
    CATCH_REQUIRE(scalar->result["note"].asString() == "scalar");
  }

  CATCH_SECTION("not-found") {
    queue.append({call_entry("c1", "nope")});
    auto response = wait_for_response(queue, "c1");
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->status.error_code() == StatusCode::NOT_FOUND);
    CATCH_REQUIRE(response->status.error_message() == R"(No procedure found on path "nope")");
  }

  CATCH_SECTION("bad-input") {
    queue.append({call_entry("c1", "add", parse_json_text(R"({"a":"1","b":2})").value())});
    auto response = wait_for_response(queue, "c1");
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->status.error_code() == StatusCode::BAD_INPUT);
    CATCH_REQUIRE(response->status.error_message().find("invalid_type") != std::string::npos);
  }

  CATCH_SECTION("application-errors") {
    queue.append({call_entry("c1", "conflict")});
    queue.append({call_entry("c2", "throws")});

    auto conflict = wait_for_response(queue, "c1");
    CATCH_REQUIRE(conflict.has_value());
    CATCH_REQUIRE(conflict->status == Status(StatusCode::APPLICATION_ERROR,
                                             "This name isn't one I like to allow", "CONFLICT"));

    auto thrown = wait_for_response(queue, "c2");
    CATCH_REQUIRE(thrown.has_value());
    CATCH_REQUIRE(thrown->status.error_code() == StatusCode::APPLICATION_ERROR);
    CATCH_REQUIRE(thrown->status.error_message() == "something broke");
  }

  CATCH_SECTION("handler-transactions") {
    queue.append({call_entry("c1", "write-data", parse_json_text(R"({"n":1})").value())});
    queue.append(
        {call_entry("c2", "write-data-then-fail", parse_json_text(R"({"n":2})").value())});

    auto written = wait_for_response(queue, "c1");
    auto failed = wait_for_response(queue, "c2");
    CATCH_REQUIRE(written.has_value());
    CATCH_REQUIRE(failed.has_value());
    CATCH_REQUIRE(written->result["written"].asBool());
    CATCH_REQUIRE(failed->status.error_message() == "rolled back");

    const auto records = data.read_all();
    CATCH_REQUIRE(records.size() == 1);
    CATCH_REQUIRE(records[0]["n"].asInt() == 1);
  }

  CATCH_SECTION("at-most-once") {
    queue.append({call_entry("c1", "add", parse_json_text(R"({"a":1,"b":1})").value())});
    CATCH_REQUIRE(wait_for_response(queue, "c1").has_value());

    // More changes, and the same call appended again, never dispatch it twice
    Json::Value noise{Json::objectValue};
    noise["kind"] = "presence";
    for (int i = 0; i < 5; ++i)
      queue.append({noise});
    queue.append({call_entry("c1", "add", parse_json_text(R"({"a":1,"b":1})").value())});

    CATCH_REQUIRE(eventually([&]() { return dispatcher->in_flight() == 0; }));
    CATCH_REQUIRE(dispatcher->dispatched_count() == 1);
    CATCH_REQUIRE(responses_to(queue, "c1").size() == 1);
  }

  CATCH_SECTION("malformed-entries-are-skipped") {
    queue.append({Json::Value{"not an object"}, parse_json_text(R"({"kind":"call"})").value(),
                  parse_json_text(R"({"kind":"call","id":1,"procedure":"add"})").value(),
                  call_entry("c1", "add", parse_json_text(R"({"a":2,"b":2})").value())});
    auto response = wait_for_response(queue, "c1");
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->result.asDouble() == 4.0);
    CATCH_REQUIRE(dispatcher->dispatched_count() == 1);
  }

  CATCH_SECTION("slow-handlers-do-not-block") {
    std::mutex padlock;
    std::condition_variable cv;
    bool release = false;

    Router router;
    router.add("slow", schema::any(), [&](const Json::Value&, CallContext&) {
      std::unique_lock lock{padlock};
      cv.wait(lock, [&release]() { return release; });
      return Json::Value{"slow"};
    });
    router.add("fast", schema::any(),
               [](const Json::Value&, CallContext&) { return Json::Value{"fast"}; });

    document::MemoryDocument other_queue{"other-queue"};
    auto other = std::make_shared<DispatcherType>(io_context.get_executor(), other_queue,
                                                  std::move(router));
    other->start();

    other_queue.append({call_entry("s", "slow")});
    other_queue.append({call_entry("f", "fast")});

    auto fast = wait_for_response(other_queue, "f");
    CATCH_REQUIRE(fast.has_value());
    CATCH_REQUIRE(responses_to(other_queue, "s").empty());
    CATCH_REQUIRE(other->in_flight() == 1);

    {
      std::lock_guard lock{padlock};
      release = true;
    }
    cv.notify_all();
    auto slow = wait_for_response(other_queue, "s");
    CATCH_REQUIRE(slow.has_value());
    CATCH_REQUIRE(slow->result.asString() == "slow");
    CATCH_REQUIRE(eventually([&]() { return other->in_flight() == 0; }));
    other->stop();
  }

  CATCH_SECTION("stop") {
    dispatcher->stop();
    CATCH_REQUIRE(!dispatcher->is_running());
    queue.append({call_entry("c1", "add", parse_json_text(R"({"a":1,"b":1})").value())});
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    CATCH_REQUIRE(responses_to(queue, "c1").empty());
    CATCH_REQUIRE(!dispatcher->has_seen("c1"));
  }

  pool.stop();
}

CATCH_TEST_CASE("DispatcherDeferredHandlers", "[dispatcher]") {
  boost::asio::io_context io_context;
  document::MemoryDocument queue{"queue"};

  std::mutex padlock;
  std::vector<std::shared_ptr<CallContext>> parked; // deferred calls, finished by the test

  Router router;
  router.add("park", schema::any(), [&](const Json::Value&, CallContext& context) {
    context.response().set("parked", true);
    std::lock_guard lock{padlock};
    parked.push_back(context.defer());
    return Json::Value{"ignored"};
  });
  router.add("fast", schema::any(),
             [](const Json::Value&, CallContext&) { return Json::Value{"fast"}; });

  auto dispatcher =
      std::make_shared<DispatcherType>(io_context.get_executor(), queue, std::move(router));

  // One thread: a parked call must not hold up the calls behind it
  AsioExecutionContext pool{io_context, 1};
  pool.run();
  dispatcher->start();

  auto parked_call = [&]() {
    std::lock_guard lock{padlock};
    return parked.empty() ? nullptr : parked.front();
  };

  queue.append({call_entry("p", "park")});
  queue.append({call_entry("f", "fast")});

  auto fast = wait_for_response(queue, "f");
  CATCH_REQUIRE(fast.has_value());
  CATCH_REQUIRE(fast->result.asString() == "fast");
  CATCH_REQUIRE(eventually([&]() { return parked_call() != nullptr; }));
  CATCH_REQUIRE(responses_to(queue, "p").empty());
  CATCH_REQUIRE(dispatcher->in_flight() == 1);

  auto context = parked_call();
  CATCH_REQUIRE(context->is_deferred());
  CATCH_REQUIRE(!context->has_finished());

  CATCH_SECTION("complete-with-result") {
    context->complete([]() {
      Json::Value result{Json::objectValue};
      result["done"] = true;
      return result;
    });
    context->finish_call(Status{StatusCode::CANCELLED}); // too late, ignored

    auto response = wait_for_response(queue, "p");
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->is_success());
    CATCH_REQUIRE(response->result["done"].asBool());
    CATCH_REQUIRE(response->result["parked"].asBool());
  }

  CATCH_SECTION("complete-with-exception") {
    context->complete([]() -> Json::Value { throw ProcedureError{"CONFLICT", "no thanks"}; });

    auto response = wait_for_response(queue, "p");
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->status.error_code() == StatusCode::APPLICATION_ERROR);
    CATCH_REQUIRE(response->status.error_message() == "no thanks");
    CATCH_REQUIRE(response->status.error_details() == "CONFLICT");
  }

  CATCH_REQUIRE(context->has_finished());
  CATCH_REQUIRE(eventually([&]() { return dispatcher->in_flight() == 0; }));
  CATCH_REQUIRE(responses_to(queue, "p").size() == 1);

  dispatcher->stop();
  pool.stop();
}

CATCH_TEST_CASE("DispatcherRestart", "[dispatcher]") {
  boost::asio::io_context io_context;
  document::MemoryDocument queue{"queue"};

  // An earlier run answered c1, but never got to c2
  queue.append({call_entry("c1", "add", parse_json_text(R"({"a":1,"b":1})").value()),
                call_entry("c2", "add", parse_json_text(R"({"a":2,"b":2})").value())});
  queue.append({encode(make_response("c1", Status{}, Json::Value{2.0}))});

  auto dispatcher = std::make_shared<DispatcherType>(io_context.get_executor(), queue,
                                                     make_test_router());
  AsioExecutionContext pool{io_context, 2};
  pool.run();
  dispatcher->start();

  auto response = wait_for_response(queue, "c2");
  CATCH_REQUIRE(response.has_value());
  CATCH_REQUIRE(response->result.asDouble() == 4.0);
  CATCH_REQUIRE(eventually([&]() { return dispatcher->in_flight() == 0; }));
  CATCH_REQUIRE(dispatcher->dispatched_count() == 1);
  CATCH_REQUIRE(dispatcher->has_seen("c1"));
  CATCH_REQUIRE(responses_to(queue, "c1").size() == 1);

  pool.stop();
}

} // namespace letterbox::rpc::test
