#include "spa/logging.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace spa {
namespace logging {

  namespace {
    std::mutex logger_mutex;
    std::shared_ptr<spdlog::logger> g_logger;

    std::shared_ptr<spdlog::logger> make_default_logger()
    {
      auto logger = spdlog::get("spa");
      if (!logger) logger = spdlog::stdout_color_mt("spa");
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%n][%l] %v");
      return logger;
    }
  }  // namespace

  std::shared_ptr<spdlog::logger> get()
  {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!g_logger) g_logger = make_default_logger();
    return g_logger;
  }

  void set(std::shared_ptr<spdlog::logger> logger)
  {
    std::lock_guard<std::mutex> lock(logger_mutex);
    g_logger = std::move(logger);
  }

}  // namespace logging
}  // namespace spa
