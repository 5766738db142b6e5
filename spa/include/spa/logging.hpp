#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace spa {
namespace logging {
  /// the library logger ("spa"), writing to stdout unless replaced
  std::shared_ptr<spdlog::logger> get();

  /// route library messages to another logger
  void set(std::shared_ptr<spdlog::logger> logger);
}  // namespace logging
}  // namespace spa
