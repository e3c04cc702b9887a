#include "logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <cassert>
#include <cstdlib>
#include <mutex>
#include <string>

namespace letterbox::logging {
/// @private
static std::shared_ptr<spdlog::logger> instance;

/// @private
static std::once_flag flag;

/// @private
static void init_logger(std::shared_ptr<spdlog::logger> instance_) {
  assert(instance_);
  instance = instance_;
}

/// @private
static bool parse_level(std::string_view level_name, spdlog::level::level_enum& level) {
  level = spdlog::level::from_str(std::string{level_name});
  return !(level == spdlog::level::off && level_name != std::string_view{"off"});
}

/**
 * @ingroup logging
 * @brief lazily initializes and returns the logger instance.
 */
spdlog::logger& debug_logger() {
  std::call_once(flag, []() {
    init_logger(spdlog::stdout_color_mt("letterbox"));
    instance->set_pattern("[%Y-%m-%d %T] [%^%l%$] %v");

#ifdef LETTERBOX_DEBUG_BUILD
    instance->set_level(spdlog::level::trace);
#else
    instance->set_level(spdlog::level::warn);
#endif

    const char* env_variable = "LETTERBOX_LOG_LEVEL";
    const char* log_level = std::getenv(env_variable);
    if (log_level) {
      spdlog::level::level_enum level;
      if (!parse_level(log_level, level)) {
        instance->error("failed to set log level from environment variable {}={}", env_variable,
                        log_level);
      } else {
        instance->set_level(level);
      }
    }
  });

  assert(instance);
  return *instance;
}

/**
 * @ingroup logging
 * @brief Override the log level, e.g., from a command line switch.
 */
bool set_log_level(std::string_view level_name) {
  spdlog::level::level_enum level;
  if (!parse_level(level_name, level))
    return false;
  debug_logger().set_level(level);
  return true;
}

} // namespace letterbox::logging
