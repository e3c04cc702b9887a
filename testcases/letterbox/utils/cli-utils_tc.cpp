#include "letterbox/utils/cli-utils.hpp"

#include "stdinc.hpp"

#include <catch2/catch.hpp>

namespace letterbox::cli::tests {

static std::vector<char*> make_argv(std::vector<std::string>& args) {
  std::vector<char*> argv;
  for (auto& arg : args)
    argv.push_back(arg.data());
  return argv;
}

CATCH_TEST_CASE("CliUtils", "[cli-utils]") {
  CATCH_SECTION("cli-utils") {
    std::vector<std::string> args{"letterbox-demo", "-n", "12", "--log-level", "info"};
    auto argv_s = make_argv(args);
    const int argc = int(args.size());
    char** argv = argv_s.data();

    int i = 1;
    CATCH_REQUIRE(safe_arg_int(argc, argv, i, 0, 100) == 12);
    CATCH_REQUIRE(i == 2);
    i = 3;
    CATCH_REQUIRE(safe_arg_str(argc, argv, i) == "info");
    CATCH_REQUIRE(i == 4);
  }

  CATCH_SECTION("cli-utils-errors") {
    std::vector<std::string> args{"letterbox-demo", "-n", "twelve", "-t", "1000", "-d"};
    auto argv_s = make_argv(args);
    const int argc = int(args.size());
    char** argv = argv_s.data();

    int i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(argc, argv, i, 0, 100), std::runtime_error);
    i = 3;
    CATCH_REQUIRE_THROWS_WITH(safe_arg_int(argc, argv, i, 1, 256),
                              Catch::Contains("must be in the range"));
    i = 5;
    CATCH_REQUIRE_THROWS_AS(safe_arg_str(argc, argv, i), std::runtime_error);
  }

  CATCH_SECTION("is-switch") {
    CATCH_REQUIRE(is_switch("-h", "-h", "--help"));
    CATCH_REQUIRE(is_switch("--help", "-h", "--help"));
    CATCH_REQUIRE(!is_switch("-x", "-h", "--help"));
    CATCH_REQUIRE(!is_switch("", "-h"));
  }
}

} // namespace letterbox::cli::tests
