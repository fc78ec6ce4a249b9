#include "geovec-utils/src/Logging.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace geovec_utils
{

namespace
{

std::mutex& loggerMutex()
{
  static std::mutex mutex;
  return mutex;
}

}  // namespace

std::shared_ptr<spdlog::logger> getLogger()
{
  std::lock_guard<std::mutex> const lock{loggerMutex()};

  if (auto existing = spdlog::get(LOGGER_NAME))
  {
    return existing;
  }

  try
  {
    auto logger = spdlog::stdout_color_mt(LOGGER_NAME);
    logger->set_level(spdlog::level::warn);
    return logger;
  }
  catch (const spdlog::spdlog_ex& e)
  {
    std::cerr << "Logger initialization failed: " << e.what() << std::endl;
    return spdlog::default_logger();
  }
}

void configureLogging()
{
  // The logger must exist before load_env_levels() so that a
  // "geovec=<level>" entry has something to apply to.
  getLogger();
  spdlog::cfg::load_env_levels();
}

void setLogLevel(const std::string& level)
{
  auto const parsed = spdlog::level::from_str(level);

  // from_str() maps unknown names to off; only accept "off" when asked for it
  if (parsed == spdlog::level::off && level != "off")
  {
    throw std::invalid_argument("Unknown log level: " + level);
  }

  getLogger()->set_level(parsed);
}

}  // namespace geovec_utils
