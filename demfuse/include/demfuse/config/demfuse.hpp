// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef DEMFUSE_CONFIG_DEMFUSE_HPP
#define DEMFUSE_CONFIG_DEMFUSE_HPP

#include <string>
#include <vector>

namespace YAML {
class Node;
}

#include "demfuse/config/merge.hpp"
#include "demfuse/config/river_bathymetry.hpp"
#include "demfuse/config/roughness.hpp"
#include "demfuse/config/topobathy.hpp"

namespace demfuse {

/// Library configuration for model grid setup.
struct Config {
  bool strict = false;  ///< Unknown keys and enum names are errors
  config::Merge merge;
  std::vector<config::DepDataset> datasets_dep;
  config::Topobathy topobathy;
  config::RiverBathymetry river_bathymetry;
  config::Roughness roughness;
};

/**
 * @brief Parse and validate a configuration.
 *
 * Unknown keys and enum names are warned about and ignored, unless the
 * document sets `strict: true` (or `strict` is passed), which turns them
 * into a ConfigError.
 */
Config parseConfig(const YAML::Node& root, bool strict = false);
Config loadConfig(const std::string& path, bool strict = false);

}  // namespace demfuse

#endif  // DEMFUSE_CONFIG_DEMFUSE_HPP
