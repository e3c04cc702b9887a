
// We know that `main.cpp` is going to be first in unity builds.
// Therefore, we include our precompiled header here, so that it
// is first in the unity (testcases) build.
#include "stdinc.hpp"

#include "letterbox/async.hpp"
#include "letterbox/demo/users-app.hpp"
#include "letterbox/document.hpp"
#include "letterbox/rpc.hpp"
#include "letterbox/utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <random>

namespace letterbox {

struct DemoConfig {
  bool show_help{false};
  int n_calls{10};
  int max_delay_millis{50};
  int latency_millis{5};
  int n_threads{4};
  string log_level{};
};

static void show_help(const char* exec) {
  std::cout << format(R"V0G0N(

   Usage: {} [OPTIONS...]

      Issues rpc calls from a client replica of a mailbox document to a server
      replica, and prints the results, and the resulting user store.

   Options:

      -n <integer>            Number of calls; default is 10
      -d <millis>             Maximum artificial handler delay; default is 50
      -l <millis>             Replication latency between replicas; default is 5
      -t <integer>            Number of threads; default is 4
      --log-level <level>     One of trace, debug, info, warn, error, critical, off

)V0G0N",
                      exec);
}

static DemoConfig parse_command_line(int argc, char** argv, bool& has_error) {
  DemoConfig config;
  for (int i = 1; i < argc; ++i) {
    const string arg = argv[i];
    try {
      if (cli::is_switch(arg, "-h", "--help")) {
        config.show_help = true;
      } else if (arg == "-n") {
        config.n_calls = cli::safe_arg_int(argc, argv, i, 0, 10000);
      } else if (arg == "-d") {
        config.max_delay_millis = cli::safe_arg_int(argc, argv, i, 0, 60000);
      } else if (arg == "-l") {
        config.latency_millis = cli::safe_arg_int(argc, argv, i, 0, 60000);
      } else if (arg == "-t") {
        config.n_threads = cli::safe_arg_int(argc, argv, i, 1, 256);
      } else if (arg == "--log-level") {
        config.log_level = cli::safe_arg_str(argc, argv, i);
      } else {
        std::cerr << format("unexpected argument: '{}'", arg) << std::endl;
        has_error = true;
      }
    } catch (std::runtime_error& e) {
      std::cerr << format("Error on command-line: {}", e.what()) << std::endl;
      has_error = true;
    }
  }
  return config;
}

int main(int argc, char** argv) {
  bool has_error = false;
  const auto config = parse_command_line(argc, argv, has_error);
  if (config.show_help) {
    show_help(argv[0]);
    return EXIT_SUCCESS;
  }
  if (!config.log_level.empty() && !logging::set_log_level(config.log_level)) {
    std::cerr << format("unknown log level: '{}'", config.log_level) << std::endl;
    has_error = true;
  }
  if (has_error) {
    std::cerr << "aborting..." << std::endl;
    return EXIT_FAILURE;
  }

  using ExecutorType = AsioExecutionContext::ExecutorType;
  using SteadyTimerType = AsioExecutionContext::SteadyTimerType;

  boost::asio::io_context io_context;

  document::MemoryDocument server_queue{"server-queue"};
  document::MemoryDocument client_queue{"client-queue"};
  document::MemoryDocument users{"users"};

  document::DocumentLink link{io_context, server_queue, client_queue,
                              {.latency = std::chrono::milliseconds{config.latency_millis}}};

  auto app = std::make_shared<demo::UsersApp>(io_context.get_executor());
  auto dispatcher = std::make_shared<rpc::Dispatcher<ExecutorType>>(
      io_context.get_executor(), server_queue, app->make_router(),
      rpc::Dispatcher<ExecutorType>::Config{.data = &users, .name = "server"});
  auto correlator = std::make_shared<rpc::Correlator<SteadyTimerType>>(
      client_queue, [&io_context]() { return SteadyTimerType{io_context}; },
      rpc::Correlator<SteadyTimerType>::Config{.name = "client", .default_deadline_millis = 10000});

  // Declared last, so that the pool is joined before anything above is destroyed
  AsioExecutionContext pool{io_context, std::size_t(config.n_threads)};
  pool.run();
  link.start();
  dispatcher->start();
  correlator->start();

  std::mt19937 generator{std::random_device{}()};
  std::uniform_int_distribution<int> delay{0, config.max_delay_millis};

  // Pairs of calls are issued in one batch
  vector<rpc::Correlator<SteadyTimerType>::FutureType> futures;
  futures.reserve(std::size_t(config.n_calls));
  for (int i = 0; i < config.n_calls; i += 2) {
    correlator->with_batch([&]() {
      for (int j = i; j < std::min(i + 2, config.n_calls); ++j) {
        Json::Value input{Json::objectValue};
        input["name"] = format("user-{}", j);
        input["optionalDelay"] = delay(generator);
        futures.push_back(correlator->call("userCreate", std::move(input)));
      }
    });
  }

  int n_failed = 0;
  for (std::size_t i = 0; i < futures.size(); ++i) {
    try {
      std::cout << format("call #{}: {}", i, rpc::to_json_text(futures[i].get())) << std::endl;
    } catch (const rpc::CallError& e) {
      std::cout << format("call #{} failed: {}", i, e.status().to_string()) << std::endl;
      ++n_failed;
    }
  }

  std::cout << format("users: {}", rpc::to_json_text(demo::UsersApp::current_users(users)))
            << std::endl;

  correlator->stop();
  dispatcher->stop();
  link.stop();
  pool.stop();

  return (n_failed == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace letterbox

// Don't compile in main(...) if we're doing a testcase build
#ifndef CATCH_BUILD

int main(int argc, char** argv) { return letterbox::main(argc, argv); }

#else

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#endif
