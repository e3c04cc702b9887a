#include "stdinc.hpp"

#include "letterbox/document/memory-document.hpp"
#include "letterbox/portable/asio/asio-execution-context.hpp"
#include "letterbox/rpc/correlator.hpp"
#include "letterbox/rpc/transaction-grouper.hpp"

#include <catch2/catch.hpp>

#include <set>
#include <thread>

namespace letterbox::rpc::test {

using CorrelatorType = Correlator<AsioExecutionContext::SteadyTimerType>;

static std::vector<CallEntry> batch_calls_in(const document::ReplicatedDocument& queue) {
  std::vector<CallEntry> out;
  for (const auto& raw : queue.read_all()) {
    auto entry = decode(raw);
    if (entry && std::holds_alternative<CallEntry>(*entry))
      out.push_back(std::get<CallEntry>(*entry));
  }
  return out;
}

static StatusCode failure_code(CorrelatorType::FutureType& future) {
  try {
    future.get();
  } catch (const CallError& e) {
    return e.code();
  }
  return StatusCode::OK;
}

CATCH_TEST_CASE("TransactionGrouper", "[batch]") {
  TransactionGrouper grouper;

  CATCH_SECTION("no-batch") {
    auto call = make_call("p", Json::Value{});
    CATCH_REQUIRE(!grouper.in_batch());
    CATCH_REQUIRE(grouper.stage(call) == TransactionGrouper::StageResult::NO_BATCH);
    CATCH_REQUIRE(call.batch_id.empty());
  }

  CATCH_SECTION("flatten") {
    const auto outer_id = grouper.open();
    const auto inner_id = grouper.open();
    CATCH_REQUIRE(outer_id == inner_id);
    CATCH_REQUIRE(grouper.depth() == 2);

    auto a = make_call("p", Json::Value{});
    auto b = make_call("p", Json::Value{});
    CATCH_REQUIRE(grouper.stage(a) == TransactionGrouper::StageResult::STAGED);
    CATCH_REQUIRE(!grouper.close().has_value()); // inner
    CATCH_REQUIRE(grouper.stage(b) == TransactionGrouper::StageResult::STAGED);

    auto batch = grouper.close();
    CATCH_REQUIRE(batch.has_value());
    CATCH_REQUIRE(batch->batch_id == outer_id);
    CATCH_REQUIRE(batch->entries.size() == 2);
    CATCH_REQUIRE(batch->call_ids == std::vector<std::string>{a.id, b.id});
    CATCH_REQUIRE(batch->entries[1]["batchId"].asString() == outer_id);
    CATCH_REQUIRE(!grouper.in_batch());

    // A new batch gets a new id
    CATCH_REQUIRE(grouper.open() != outer_id);
    CATCH_REQUIRE(grouper.close().has_value());
  }

  CATCH_SECTION("abort") {
    grouper.open();
    grouper.open();
    auto a = make_call("p", Json::Value{});
    grouper.stage(a);
    CATCH_REQUIRE(grouper.abort() == std::vector<std::string>{a.id}); // inner
    auto b = make_call("p", Json::Value{});
    CATCH_REQUIRE(grouper.stage(b) == TransactionGrouper::StageResult::ABORTED);
    CATCH_REQUIRE(!grouper.close().has_value());
    CATCH_REQUIRE(!grouper.in_batch());
  }
}

CATCH_TEST_CASE("CorrelatorBatches", "[batch]") {
  boost::asio::io_context io_context;
  document::MemoryDocument queue{"queue"};

  // Observers must never see part of a batch
  std::set<std::size_t> observed_sizes;
  auto observer = queue.on_change(
      [&queue, &observed_sizes]() { observed_sizes.insert(batch_calls_in(queue).size()); });

  auto correlator = std::make_shared<CorrelatorType>(
      queue, [&io_context]() { return AsioExecutionContext::SteadyTimerType{io_context}; });
  correlator->start();

  CATCH_SECTION("atomic-batch") {
    std::vector<CorrelatorType::FutureType> futures;
    correlator->with_batch([&]() {
      futures.push_back(correlator->call("p", Json::Value{1}));
      futures.push_back(correlator->call("p", Json::Value{2}));
      CATCH_REQUIRE(queue.size() == 0);
    });

    CATCH_REQUIRE(queue.changes().size() == 1);
    const auto calls = batch_calls_in(queue);
    CATCH_REQUIRE(calls.size() == 2);
    CATCH_REQUIRE(!calls[0].batch_id.empty());
    CATCH_REQUIRE(calls[0].batch_id == calls[1].batch_id);
    CATCH_REQUIRE(observed_sizes == std::set<std::size_t>{2});
    CATCH_REQUIRE(correlator->pending_count() == 2);

    // A second batch has its own id
    correlator->with_batch([&]() { futures.push_back(correlator->call("p", Json::Value{3})); });
    const auto all_calls = batch_calls_in(queue);
    CATCH_REQUIRE(all_calls.size() == 3);
    CATCH_REQUIRE(all_calls[2].batch_id != calls[0].batch_id);
  }

  CATCH_SECTION("nested-batches-flatten") {
    correlator->with_batch([&]() {
      correlator->call("p", Json::Value{1});
      correlator->with_batch([&]() { correlator->call("p", Json::Value{2}); });
      CATCH_REQUIRE(queue.size() == 0); // the inner batch didn't commit
      correlator->call("p", Json::Value{3});
    });

    CATCH_REQUIRE(queue.changes().size() == 1);
    const auto calls = batch_calls_in(queue);
    CATCH_REQUIRE(calls.size() == 3);
    CATCH_REQUIRE(calls[0].batch_id == calls[1].batch_id);
    CATCH_REQUIRE(calls[1].batch_id == calls[2].batch_id);
  }

  CATCH_SECTION("aborted-batch") {
    std::vector<CorrelatorType::FutureType> futures;
    CATCH_REQUIRE_THROWS_WITH(correlator->with_batch([&]() {
      futures.push_back(correlator->call("p", Json::Value{1}));
      futures.push_back(correlator->call("p", Json::Value{2}));
      throw std::runtime_error{"changed my mind"};
    }),
                              "changed my mind");

    CATCH_REQUIRE(queue.size() == 0);
    CATCH_REQUIRE(correlator->pending_count() == 0);
    for (auto& future : futures)
      CATCH_REQUIRE(failure_code(future) == StatusCode::CANCELLED);
  }

  CATCH_SECTION("inner-abort-aborts-everything") {
    std::vector<CorrelatorType::FutureType> futures;
    correlator->with_batch([&]() {
      futures.push_back(correlator->call("p", Json::Value{1}));
      try {
        correlator->with_batch([&]() {
          futures.push_back(correlator->call("p", Json::Value{2}));
          throw std::runtime_error{"inner"};
        });
      } catch (const std::runtime_error&) {
      }
      futures.push_back(correlator->call("p", Json::Value{3})); // joins the aborted batch
    });

    CATCH_REQUIRE(queue.size() == 0);
    CATCH_REQUIRE(futures.size() == 3);
    for (auto& future : futures)
      CATCH_REQUIRE(failure_code(future) == StatusCode::CANCELLED);

    // The next batch is a fresh one
    auto future = correlator->call("p", Json::Value{4});
    CATCH_REQUIRE(batch_calls_in(queue).size() == 1);
    CATCH_REQUIRE(!future.is_ready());
  }

  CATCH_SECTION("batches-are-per-thread") {
    correlator->with_batch([&]() {
      correlator->call("p", Json::Value{1});
      std::thread other{[&]() { correlator->call("p", Json::Value{2}); }};
      other.join();
      CATCH_REQUIRE(batch_calls_in(queue).size() == 1); // the other thread's call
    });

    const auto calls = batch_calls_in(queue);
    CATCH_REQUIRE(calls.size() == 2);
    CATCH_REQUIRE(calls[0].batch_id.empty());
    CATCH_REQUIRE(!calls[1].batch_id.empty());
  }

  correlator->stop();
}

} // namespace letterbox::rpc::test
