#include "stdinc.hpp"

#include "letterbox/document/memory-document.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <thread>

namespace letterbox::document::test {

static Json::Value entry(int n) {
  Json::Value value{Json::objectValue};
  value["n"] = n;
  return value;
}

static std::vector<int> numbers(const ReplicatedDocument& document) {
  std::vector<int> out;
  for (const auto& value : document.read_all())
    out.push_back(value["n"].asInt());
  return out;
}

CATCH_TEST_CASE("MemoryDocument", "[memory-document]") {
  CATCH_SECTION("append-and-read") {
    MemoryDocument document{"a"};
    document.append({entry(1)});
    document.append({entry(2), entry(3)});
    document.append({});
    CATCH_REQUIRE(document.size() == 3);
    CATCH_REQUIRE(numbers(document) == std::vector<int>{1, 2, 3});
    CATCH_REQUIRE(document.changes().size() == 2);
    CATCH_REQUIRE(document.changes()[1].seq == 2);
    CATCH_REQUIRE(document.changes()[1].entries.size() == 2);
  }

  CATCH_SECTION("on-change") {
    MemoryDocument document;
    CATCH_REQUIRE(!document.actor_id().empty());

    std::atomic<int> counter{0};
    auto subscription = document.on_change([&counter]() { ++counter; });
    CATCH_REQUIRE(subscription.active());

    document.append({entry(1), entry(2)});
    CATCH_REQUIRE(counter.load() == 1); // one notification per change, not per entry

    subscription.reset();
    CATCH_REQUIRE(!subscription.active());
    document.append({entry(3)});
    CATCH_REQUIRE(counter.load() == 1);
  }

  CATCH_SECTION("subscription-outlives-document") {
    Subscription subscription;
    {
      MemoryDocument document;
      subscription = document.on_change([]() {});
    }
    subscription.reset(); // must not touch the destroyed document
  }

  CATCH_SECTION("transact") {
    MemoryDocument document;
    std::atomic<int> counter{0};
    auto subscription = document.on_change([&counter]() { ++counter; });

    document.transact([&]() {
      document.append({entry(1)});
      document.transact([&]() { document.append({entry(2)}); }); // joins the outer one
      CATCH_REQUIRE(document.size() == 0); // nothing is visible yet
    });
    CATCH_REQUIRE(counter.load() == 1);
    CATCH_REQUIRE(numbers(document) == std::vector<int>{1, 2});
    CATCH_REQUIRE(document.changes().size() == 1);
  }

  CATCH_SECTION("transact-rollback") {
    MemoryDocument document;
    CATCH_REQUIRE_THROWS_AS(document.transact([&]() {
      document.append({entry(1)});
      throw std::runtime_error{"fail"};
    }),
                            std::runtime_error);
    CATCH_REQUIRE(document.size() == 0);

    // A failed inner transaction discards only its own appends
    document.transact([&]() {
      document.append({entry(1)});
      try {
        document.transact([&]() {
          document.append({entry(2)});
          throw std::runtime_error{"inner"};
        });
      } catch (const std::runtime_error&) {
      }
      document.append({entry(3)});
    });
    CATCH_REQUIRE(numbers(document) == std::vector<int>{1, 3});
  }

  CATCH_SECTION("transact-is-per-thread") {
    MemoryDocument document;
    document.transact([&]() {
      document.append({entry(1)});
      std::thread other{[&document]() { document.append({entry(2)}); }};
      other.join();
      CATCH_REQUIRE(numbers(document) == std::vector<int>{2});
    });
    CATCH_REQUIRE(numbers(document) == std::vector<int>{2, 1});
  }
}

CATCH_TEST_CASE("MemoryDocumentReplication", "[memory-document]") {
  CATCH_SECTION("causal-delivery") {
    MemoryDocument a{"a"};
    MemoryDocument b{"b"};
    a.append({entry(1)});
    a.append({entry(2)});
    const auto changes = a.changes();

    // The second change arrives first, and is held
    CATCH_REQUIRE(b.apply(changes[1]));
    CATCH_REQUIRE(b.size() == 0);
    CATCH_REQUIRE(b.pending_changes() == 1);

    CATCH_REQUIRE(b.apply(changes[0]));
    CATCH_REQUIRE(b.pending_changes() == 0);
    CATCH_REQUIRE(numbers(b) == std::vector<int>{1, 2});

    // Duplicates are ignored
    CATCH_REQUIRE(!b.apply(changes[0]));
    CATCH_REQUIRE(!b.apply(changes[1]));
    CATCH_REQUIRE(b.size() == 2);
  }

  CATCH_SECTION("dependencies-on-other-actors") {
    MemoryDocument a{"a"};
    MemoryDocument b{"b"};
    MemoryDocument c{"c"};

    a.append({entry(1)});
    b.apply(a.changes()[0]);
    b.append({entry(2)}); // depends on a:1

    c.apply(b.changes()[1]); // b:1, held until a:1 arrives
    CATCH_REQUIRE(c.size() == 0);
    c.apply(a.changes()[0]);
    CATCH_REQUIRE(numbers(c) == std::vector<int>{1, 2});
  }

  CATCH_SECTION("convergence") {
    MemoryDocument a{"a"};
    MemoryDocument b{"b"};
    a.append({entry(1)});
    b.append({entry(2)});
    a.append({entry(3)});
    b.append({entry(4), entry(5)});

    MemoryDocument x{"x"};
    MemoryDocument y{"y"};
    for (const auto& change : a.changes())
      x.apply(change);
    for (const auto& change : b.changes())
      x.apply(change);

    for (const auto& change : b.changes())
      y.apply(change);
    for (const auto& change : a.changes())
      y.apply(change);

    CATCH_REQUIRE(x.size() == 5);
    CATCH_REQUIRE(numbers(x) == numbers(y));
  }

  CATCH_SECTION("on-commit-reports-remote-changes") {
    MemoryDocument a{"a"};
    MemoryDocument b{"b"};
    std::vector<std::string> seen;
    auto subscription =
        b.on_commit([&seen](const Change& change) { seen.push_back(change.id()); });
    a.append({entry(1)});
    b.apply(a.changes()[0]);
    b.append({entry(2)});
    CATCH_REQUIRE(seen == std::vector<std::string>{"a:1", "b:1"});
  }
}

} // namespace letterbox::document::test
