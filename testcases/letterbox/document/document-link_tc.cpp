#include "stdinc.hpp"

#include "letterbox/document/document-link.hpp"
#include "letterbox/portable/asio/asio-execution-context.hpp"

#include "../test-utils.hpp"

#include <catch2/catch.hpp>

namespace letterbox::document::test {

using letterbox::test::eventually;

static Json::Value entry(const std::string& text) {
  Json::Value value{Json::objectValue};
  value["text"] = text;
  return value;
}

CATCH_TEST_CASE("DocumentLink", "[document-link]") {
  boost::asio::io_context io_context;
  MemoryDocument a{"a"};
  MemoryDocument b{"b"};
  MemoryDocument c{"c"};

  CATCH_SECTION("replicates-both-ways") {
    a.append({entry("before start")}); // sent with the history
    DocumentLink link{io_context, a, b};
    AsioExecutionContext pool{io_context, 2};
    pool.run();
    link.start();

    a.append({entry("from a")});
    b.append({entry("from b")});

    CATCH_REQUIRE(eventually([&]() { return a.size() == 3 && b.size() == 3; }));
    CATCH_REQUIRE(a.read_all() == b.read_all());
    CATCH_REQUIRE(link.delivered_count() == 3);
    pool.stop();
  }

  CATCH_SECTION("latency") {
    DocumentLink link{io_context, a, b, {.latency = std::chrono::milliseconds{50}}};
    AsioExecutionContext pool{io_context, 2};
    pool.run();
    link.start();

    a.append({entry("slow")});
    CATCH_REQUIRE(b.size() == 0);
    CATCH_REQUIRE(eventually([&]() { return b.size() == 1; }));
    pool.stop();
  }

  CATCH_SECTION("chained-links-converge") {
    DocumentLink ab{io_context, a, b, {.latency = std::chrono::milliseconds{3}}};
    DocumentLink bc{io_context, b, c};
    AsioExecutionContext pool{io_context, 4};
    pool.run();
    ab.start();
    bc.start();

    for (int i = 0; i < 10; ++i) {
      a.append({entry(format("a{}", i))});
      c.append({entry(format("c{}", i))});
    }

    CATCH_REQUIRE(eventually([&]() {
      return a.size() == 20 && b.size() == 20 && c.size() == 20;
    }));
    CATCH_REQUIRE(a.read_all() == b.read_all());
    CATCH_REQUIRE(b.read_all() == c.read_all());
    pool.stop();
  }

  CATCH_SECTION("stop") {
    DocumentLink link{io_context, a, b};
    AsioExecutionContext pool{io_context, 1};
    pool.run();
    link.start();
    link.stop();
    a.append({entry("not sent")});
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    CATCH_REQUIRE(b.size() == 0);
    pool.stop();
  }
}

} // namespace letterbox::document::test
