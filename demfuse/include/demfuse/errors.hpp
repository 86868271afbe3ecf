// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * errors.hpp
 *
 * Exception types raised by demfuse.
 */

#ifndef DEMFUSE_ERRORS_HPP
#define DEMFUSE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace demfuse {

/**
 * @brief Missing or inconsistent mandatory input.
 *
 * Not recoverable by the library: no elevation dataset, no river width or
 * mask, a base raster without finite nodata, a missing attribute column.
 */
class ConfigError : public std::invalid_argument {
 public:
  explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Source raster does not overlap the destination grid.
 *
 * Thrown by resamplers. The merge layer catches it, logs a warning and
 * skips the source.
 */
class CoverageError : public std::runtime_error {
 public:
  explicit CoverageError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace demfuse

#endif  // DEMFUSE_ERRORS_HPP
