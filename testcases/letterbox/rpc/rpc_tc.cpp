#include "stdinc.hpp"

#include "letterbox/async.hpp"
#include "letterbox/demo/users-app.hpp"
#include "letterbox/document.hpp"
#include "letterbox/rpc.hpp"

#include "../test-utils.hpp"

#include <catch2/catch.hpp>

#include <map>
#include <mutex>
#include <set>

namespace letterbox::rpc::test {

using letterbox::test::eventually;
using ExecutorType = AsioExecutionContext::ExecutorType;
using SteadyTimerType = AsioExecutionContext::SteadyTimerType;

// ------------------------------------------------------------------------------------ UsersFixture
/**
 * A server and a client replica of the mailbox document, linked with some latency, and a users
 * data document on the server side.
 */
struct UsersFixture {
  boost::asio::io_context io_context;
  document::MemoryDocument server_queue{"server"};
  document::MemoryDocument client_queue{"client"};
  document::MemoryDocument users{"users"};
  document::DocumentLink link{io_context, server_queue, client_queue,
                              {.latency = std::chrono::milliseconds{2}}};
  std::shared_ptr<Dispatcher<ExecutorType>> dispatcher;
  std::shared_ptr<Correlator<SteadyTimerType>> correlator;
  AsioExecutionContext pool; // joined first on destruction

  explicit UsersFixture(std::size_t n_threads = 4) : pool{io_context, n_threads} {
    auto app = std::make_shared<demo::UsersApp>(io_context.get_executor());
    dispatcher = std::make_shared<Dispatcher<ExecutorType>>(
        io_context.get_executor(), server_queue, app->make_router(),
        Dispatcher<ExecutorType>::Config{.data = &users, .name = "server"});
    correlator = std::make_shared<Correlator<SteadyTimerType>>(
        client_queue, [this]() { return SteadyTimerType{io_context}; },
        Correlator<SteadyTimerType>::Config{.name = "client", .default_deadline_millis = 10000});

    pool.run();
    link.start();
    dispatcher->start();
    correlator->start();
  }

  ~UsersFixture() {
    correlator->stop();
    dispatcher->stop();
    link.stop();
    pool.stop();
  }

  Correlator<SteadyTimerType>::FutureType create(const std::string& name, int delay_millis = 0,
                                                 CallOptions options = {}) {
    Json::Value input{Json::objectValue};
    input["name"] = name;
    if (delay_millis != 0)
      input["optionalDelay"] = delay_millis;
    return correlator->call("userCreate", std::move(input), std::move(options));
  }

  Json::Value current_users() const { return demo::UsersApp::current_users(users); }

  // call-id -> number of Response Entries, as seen by the client
  std::map<std::string, int> response_counts() const {
    std::map<std::string, int> counts;
    for (const auto& raw : client_queue.read_all()) {
      auto entry = decode(raw);
      if (entry && std::holds_alternative<ResponseEntry>(*entry))
        ++counts[std::get<ResponseEntry>(*entry).call_id];
    }
    return counts;
  }
};

static Json::Value get(Correlator<SteadyTimerType>::FutureType& future) {
  CATCH_REQUIRE(future.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
  return future.get();
}

// --------------------------------------------------------------------------------------- TEST_CASE

CATCH_TEST_CASE("RpcBasicCalls", "[rpc]") {
  UsersFixture fixture;

  CATCH_SECTION("create-update-and-call-id") {
    auto created = fixture.create("foo");
    const auto result = get(created);
    CATCH_REQUIRE(result["user"]["name"].asString() == "foo");
    CATCH_REQUIRE(result["user"]["id"].asString() == "1");
    CATCH_REQUIRE(fixture.current_users().size() == 1);
    CATCH_REQUIRE(fixture.current_users()[0]["name"].asString() == "foo");

    Json::Value rename{Json::objectValue};
    rename["id"] = "1";
    rename["name"] = "foo2";
    auto renamed = fixture.correlator->call("userUpdateName", rename);
    CATCH_REQUIRE(get(renamed)["user"]["name"].asString() == "foo2");
    CATCH_REQUIRE(fixture.current_users().size() == 1);
    CATCH_REQUIRE(fixture.current_users()[0]["name"].asString() == "foo2");

    auto with_id = fixture.create("foo", 0, {.id = "testing"});
    CATCH_REQUIRE(get(with_id)["user"]["name"].asString() == "foo");

    const auto entries = fixture.client_queue.read_all();
    std::vector<CallEntry> calls;
    for (const auto& raw : entries) {
      auto entry = decode(raw);
      if (entry && std::holds_alternative<CallEntry>(*entry))
        calls.push_back(std::get<CallEntry>(*entry));
    }
    CATCH_REQUIRE(calls.size() == 3);
    CATCH_REQUIRE(calls.back().id == "testing");
    CATCH_REQUIRE(fixture.response_counts().at("testing") == 1);
  }

  CATCH_SECTION("rename-unknown-user") {
    Json::Value rename{Json::objectValue};
    rename["id"] = "99";
    rename["name"] = "nobody";
    auto renamed = fixture.correlator->call("userUpdateName", rename);
    CATCH_REQUIRE(renamed.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
    try {
      renamed.get();
      CATCH_REQUIRE(false);
    } catch (const CallError& e) {
      CATCH_REQUIRE(e.code() == StatusCode::APPLICATION_ERROR);
      CATCH_REQUIRE(e.status().error_details() == "NOT_FOUND");
    }
  }
}

CATCH_TEST_CASE("RpcBatchedCalls", "[rpc]") {
  UsersFixture fixture;

  // batch id -> the number of its calls the server replica held, at each change it applied
  std::mutex padlock;
  std::map<std::string, std::set<std::size_t>> server_observed;
  auto observer = fixture.server_queue.on_change([&]() {
    std::map<std::string, std::size_t> counts;
    for (const auto& raw : fixture.server_queue.read_all()) {
      auto entry = decode(raw);
      if (entry && std::holds_alternative<CallEntry>(*entry)) {
        const auto& call = std::get<CallEntry>(*entry);
        if (!call.batch_id.empty())
          ++counts[call.batch_id];
      }
    }
    std::lock_guard lock{padlock};
    for (const auto& [batch_id, count] : counts)
      server_observed[batch_id].insert(count);
  });

  std::vector<Correlator<SteadyTimerType>::FutureType> futures;
  fixture.correlator->with_batch([&]() {
    futures.push_back(fixture.create("foo1"));
    futures.push_back(fixture.create("foo2"));
  });
  get(futures[0]);
  get(futures[1]);

  fixture.correlator->with_batch([&]() {
    futures.push_back(fixture.create("foo3"));
    futures.push_back(fixture.create("foo4"));
  });
  get(futures[2]);
  get(futures[3]);

  futures.push_back(fixture.create("foo5"));
  get(futures[4]);

  const auto users = fixture.current_users();
  CATCH_REQUIRE(users.size() == 5);
  std::set<std::string> ids;
  std::set<std::string> names;
  for (const auto& user : users) {
    ids.insert(user["id"].asString());
    names.insert(user["name"].asString());
  }
  CATCH_REQUIRE(ids.size() == 5);
  CATCH_REQUIRE(names == std::set<std::string>{"foo1", "foo2", "foo3", "foo4", "foo5"});

  for (const auto& [call_id, count] : fixture.response_counts())
    CATCH_REQUIRE(count == 1);

  // Nothing touches the server replica once the pool is stopped
  fixture.pool.stop();
  observer.reset();

  // The server replica never held one call of a batch without the other
  std::lock_guard lock{padlock};
  CATCH_REQUIRE(server_observed.size() == 2);
  for (const auto& [batch_id, counts] : server_observed)
    CATCH_REQUIRE(counts == std::set<std::size_t>{2});
}

static void check_out_of_order(std::size_t n_threads) {
  UsersFixture fixture{n_threads};

  auto slow = fixture.create("foo1", 300);
  auto fast = fixture.create("foo2");

  CATCH_REQUIRE(get(fast)["user"]["name"].asString() == "foo2");
  CATCH_REQUIRE(!slow.is_ready());
  CATCH_REQUIRE(get(slow)["user"]["name"].asString() == "foo1");
  CATCH_REQUIRE(fixture.current_users().size() == 2);
}

CATCH_TEST_CASE("RpcOutOfOrderCalls", "[rpc]") {
  CATCH_SECTION("thread-pool") { check_out_of_order(4); }

  // A delayed call waits on a timer, so it never holds the only thread
  CATCH_SECTION("single-thread") { check_out_of_order(1); }
}

CATCH_TEST_CASE("RpcDelayBounds", "[rpc]") {
  UsersFixture fixture;

  CATCH_SECTION("negative-delay-is-no-delay") {
    auto future = fixture.create("foo", -5);
    CATCH_REQUIRE(get(future)["user"]["name"].asString() == "foo");
  }

  CATCH_SECTION("huge-delay-is-clamped") {
    Json::Value input{Json::objectValue};
    input["name"] = "foo";
    input["optionalDelay"] = 1e300;
    auto future = fixture.correlator->call("userCreate", input, {.deadline_millis = 50});
    CATCH_REQUIRE(future.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
    try {
      future.get();
      CATCH_REQUIRE(false);
    } catch (const CallError& e) {
      CATCH_REQUIRE(e.code() == StatusCode::DEADLINE_EXCEEDED);
    }
    CATCH_REQUIRE(fixture.current_users().size() == 0);
    CATCH_REQUIRE(eventually([&]() { return fixture.dispatcher->in_flight() == 1; }));
  }
}

CATCH_TEST_CASE("RpcManyConcurrentCalls", "[rpc]") {
  UsersFixture fixture;

  std::vector<Correlator<SteadyTimerType>::FutureType> futures;
  for (int i = 0; i < 20; ++i)
    futures.push_back(fixture.create(format("user-{}", i), (i % 3) * 5));

  for (int i = 0; i < 20; ++i)
    CATCH_REQUIRE(get(futures[std::size_t(i)])["user"]["name"].asString() ==
                  format("user-{}", i));

  CATCH_REQUIRE(fixture.current_users().size() == 20);
  CATCH_REQUIRE(eventually([&]() { return fixture.response_counts().size() == 20; }));
  for (const auto& [call_id, count] : fixture.response_counts())
    CATCH_REQUIRE(count == 1);
}

CATCH_TEST_CASE("RpcErrors", "[rpc]") {
  UsersFixture fixture;

  CATCH_SECTION("input-errors") {
    Json::Value input{Json::objectValue};
    input["name"] = 1;
    auto future = fixture.correlator->call("userCreate", input);
    CATCH_REQUIRE(future.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
    CATCH_REQUIRE_THROWS_WITH(future.get(), Catch::Contains("invalid_type"));
    CATCH_REQUIRE(fixture.current_users().size() == 0);
  }

  CATCH_SECTION("router-thrown-errors") {
    auto future = fixture.create(demo::UsersApp::k_rejected_name);
    CATCH_REQUIRE(future.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
    CATCH_REQUIRE_THROWS_WITH(future.get(), demo::UsersApp::k_rejected_message);
    CATCH_REQUIRE(fixture.current_users().size() == 0);
  }

  CATCH_SECTION("unknown-procedure") {
    auto future = fixture.correlator->call("userDelete", Json::Value{});
    CATCH_REQUIRE(future.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
    try {
      future.get();
      CATCH_REQUIRE(false);
    } catch (const CallError& e) {
      CATCH_REQUIRE(e.code() == StatusCode::NOT_FOUND);
      CATCH_REQUIRE(std::string{e.what()} == R"(No procedure found on path "userDelete")");
    }
  }
}

} // namespace letterbox::rpc::test
