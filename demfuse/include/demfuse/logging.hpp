// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEMFUSE_LOGGING_HPP
#define DEMFUSE_LOGGING_HPP

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace demfuse {

/// Diagnostic sink threaded through every entry point.
/// nullptr selects a silent logger.
using Logger = std::shared_ptr<spdlog::logger>;

/// Shared logger that drops every message.
inline const Logger& nullLogger() {
  static const Logger logger = std::make_shared<spdlog::logger>(
      "demfuse_null", std::make_shared<spdlog::sinks::null_sink_mt>());
  return logger;
}

/// Resolve an optional logger to a usable one.
inline spdlog::logger& sink(const Logger& logger) {
  return logger ? *logger : *nullLogger();
}

}  // namespace demfuse

#endif  // DEMFUSE_LOGGING_HPP
