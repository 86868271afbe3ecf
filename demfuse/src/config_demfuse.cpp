// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_demfuse.cpp
 *
 * YAML configuration loading.
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <initializer_list>

#include "demfuse/config/demfuse.hpp"
#include "demfuse/errors.hpp"

namespace demfuse {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

template <typename T>
void load(const YAML::Node& node, const std::string& key,
          std::optional<T>& value) {
  if (node[key] && !node[key].IsNull()) {
    value = node[key].as<T>();
  }
}

/// Lenient or strict handling of names the parser does not know.
class Parser {
 public:
  explicit Parser(bool strict) : strict_(strict) {}

  void checkKeys(const YAML::Node& node, const std::string& section,
                 std::initializer_list<const char*> known) const {
    if (!node.IsMap()) return;
    for (const auto& kv : node) {
      const auto key = kv.first.as<std::string>();
      const bool found = std::any_of(known.begin(), known.end(),
                                     [&](const char* k) { return key == k; });
      if (found) continue;
      if (strict_) {
        throw ConfigError("Unknown config key '" + section + key + "'");
      }
      spdlog::warn("[Config] Unknown key '{}{}', ignoring", section, key);
    }
  }

  template <typename E>
  E unknown(const std::string& what, const std::string& name, E fallback,
            const std::string& fallback_name) const {
    if (strict_) {
      throw ConfigError("Unknown " + what + " '" + name + "'");
    }
    spdlog::warn("[Config] Unknown {} '{}', defaulting to {}", what, name,
                 fallback_name);
    return fallback;
  }

  MergeRule parseMergeRule(const std::string& name) const {
    if (name == "first") return MergeRule::First;
    if (name == "last") return MergeRule::Last;
    if (name == "min") return MergeRule::Min;
    if (name == "max") return MergeRule::Max;
    if (name == "mean") return MergeRule::Mean;
    return unknown("merge_method", name, MergeRule::First, "first");
  }

  ResampleMethod parseResampleMethod(const std::string& name) const {
    if (name == "nearest") return ResampleMethod::Nearest;
    if (name == "bilinear") return ResampleMethod::Bilinear;
    if (name == "cubic") return ResampleMethod::Cubic;
    if (name == "average") return ResampleMethod::Average;
    if (name == "min") return ResampleMethod::Min;
    if (name == "max") return ResampleMethod::Max;
    return unknown("reproj_method", name, ResampleMethod::Bilinear, "bilinear");
  }

  InterpMethod parseInterpMethod(const std::string& name) const {
    if (name == "linear") return InterpMethod::Linear;
    if (name == "nearest") return InterpMethod::Nearest;
    if (name == "idw") return InterpMethod::Idw;
    return unknown("interp_method", name, InterpMethod::Linear, "linear");
  }

  DepthMethod parseDepthMethod(const std::string& name) const {
    if (name == "gvf") return DepthMethod::Gvf;
    if (name == "manning") return DepthMethod::Manning;
    if (name == "powlaw") return DepthMethod::Powlaw;
    return unknown("rivdph_method", name, DepthMethod::Gvf, "gvf");
  }

 private:
  bool strict_;
};

config::DepDataset parseDepDataset(const Parser& p, const YAML::Node& n,
                                   size_t i) {
  config::DepDataset ds;
  if (n.IsScalar()) {
    ds.elevtn = n.as<std::string>();
    return ds;
  }
  p.checkKeys(n, "datasets_dep[" + std::to_string(i) + "].",
              {"elevtn", "offset", "zmin", "zmax", "mask", "gdf_valid",
               "merge_method", "reproj_method"});
  load(n, "elevtn", ds.elevtn);
  if (auto o = n["offset"]) {
    // A number is a constant offset, anything else names a raster
    if (!YAML::convert<double>::decode(o, ds.offset_value)) {
      ds.offset = o.as<std::string>();
    }
  }
  load(n, "zmin", ds.zmin);
  load(n, "zmax", ds.zmax);
  load(n, "mask", ds.gdf_valid);
  load(n, "gdf_valid", ds.gdf_valid);
  std::string str;
  load(n, "merge_method", str);
  if (!str.empty()) ds.merge_method = p.parseMergeRule(str);
  str.clear();
  load(n, "reproj_method", str);
  if (!str.empty()) ds.reproj_method = p.parseResampleMethod(str);
  return ds;
}

config::RoughnessDataset parseRoughnessDataset(const Parser& p,
                                               const YAML::Node& n, size_t i) {
  config::RoughnessDataset ds;
  p.checkKeys(n, "roughness.datasets[" + std::to_string(i) + "].",
              {"manning", "lulc", "reclass_table", "mask", "gdf_valid",
               "merge_method", "reproj_method"});
  load(n, "manning", ds.manning);
  load(n, "lulc", ds.lulc);
  load(n, "reclass_table", ds.reclass_table);
  load(n, "mask", ds.gdf_valid);
  load(n, "gdf_valid", ds.gdf_valid);
  std::string str;
  load(n, "merge_method", str);
  if (!str.empty()) ds.merge_method = p.parseMergeRule(str);
  str.clear();
  load(n, "reproj_method", str);
  if (!str.empty()) ds.reproj_method = p.parseResampleMethod(str);
  return ds;
}

Config parse(const YAML::Node& root, bool strict) {
  Config cfg;
  load(root, "strict", cfg.strict);
  cfg.strict = cfg.strict || strict;
  const Parser p(cfg.strict);

  p.checkKeys(root, "", {"strict", "merge", "datasets_dep", "topobathy",
                         "river_bathymetry", "roughness"});

  // Multi-source merge defaults
  if (auto n = root["merge"]) {
    p.checkKeys(n, "merge.", {"buffer_cells", "interp_method"});
    load(n, "buffer_cells", cfg.merge.buffer_cells);
    std::string str;
    load(n, "interp_method", str);
    if (!str.empty()) cfg.merge.interp_method = p.parseInterpMethod(str);
  }

  if (auto n = root["datasets_dep"]) {
    for (size_t i = 0; i < n.size(); ++i) {
      cfg.datasets_dep.push_back(parseDepDataset(p, n[i], i));
    }
  }

  if (auto n = root["topobathy"]) {
    auto& t = cfg.topobathy;
    p.checkKeys(n, "topobathy.", {"merge_method", "merge_buffer", "elv_min",
                                  "elv_max", "reproj_method"});
    std::string str;
    load(n, "merge_method", str);
    if (!str.empty()) t.merge_method = p.parseMergeRule(str);
    load(n, "merge_buffer", t.merge_buffer);
    load(n, "elv_min", t.elv_min);
    load(n, "elv_max", t.elv_max);
    str.clear();
    load(n, "reproj_method", str);
    if (!str.empty()) t.reproj_method = p.parseResampleMethod(str);
  }

  // River bathymetry
  if (auto n = root["river_bathymetry"]) {
    auto& r = cfg.river_bathymetry;
    p.checkKeys(n, "river_bathymetry.",
                {"river_upa", "segment_length", "smooth_length",
                 "min_convergence", "estuary_max_elevtn", "max_dist", "bankq",
                 "nmin", "adjust_estuary", "adjust_rivwth", "adjust_dem",
                 "hydraulics"});
    load(n, "river_upa", r.river_upa);
    load(n, "segment_length", r.segment_length);
    load(n, "smooth_length", r.smooth_length);
    load(n, "min_convergence", r.min_convergence);
    load(n, "estuary_max_elevtn", r.estuary_max_elevtn);
    load(n, "max_dist", r.max_dist);
    load(n, "bankq", r.bankq);
    load(n, "nmin", r.nmin);
    load(n, "adjust_estuary", r.adjust_estuary);
    load(n, "adjust_rivwth", r.adjust_rivwth);
    load(n, "adjust_dem", r.adjust_dem);
    if (auto h = n["hydraulics"]) {
      auto& hy = r.hydraulics;
      p.checkKeys(h, "river_bathymetry.hydraulics.",
                  {"method", "hc", "hp", "manning_n", "min_rivslp",
                   "min_rivdph", "gvf_iterations"});
      std::string str;
      load(h, "method", str);
      if (!str.empty()) hy.method = p.parseDepthMethod(str);
      load(h, "hc", hy.hc);
      load(h, "hp", hy.hp);
      load(h, "manning_n", hy.manning_n);
      load(h, "min_rivslp", hy.min_rivslp);
      load(h, "min_rivdph", hy.min_rivdph);
      load(h, "gvf_iterations", hy.gvf_iterations);
    }
  }

  // Roughness
  if (auto n = root["roughness"]) {
    auto& r = cfg.roughness;
    p.checkKeys(n, "roughness.",
                {"manning_land", "manning_sea", "rgh_lev_land", "datasets"});
    load(n, "manning_land", r.manning_land);
    load(n, "manning_sea", r.manning_sea);
    load(n, "rgh_lev_land", r.rgh_lev_land);
    if (auto d = n["datasets"]) {
      for (size_t i = 0; i < d.size(); ++i) {
        r.datasets.push_back(parseRoughnessDataset(p, d[i], i));
      }
    }
  }

  return cfg;
}

void validate(Config& cfg) {
  // --- Fatal: inputs the setup steps cannot run with ---
  for (size_t i = 0; i < cfg.datasets_dep.size(); ++i) {
    const auto& ds = cfg.datasets_dep[i];
    if (ds.elevtn.empty()) {
      throw ConfigError("datasets_dep[" + std::to_string(i) +
                        "]: 'elevtn' is required");
    }
    if (ds.zmin && ds.zmax && *ds.zmin > *ds.zmax) {
      throw ConfigError("datasets_dep[" + std::to_string(i) + "]: zmin (" +
                        std::to_string(*ds.zmin) + ") > zmax (" +
                        std::to_string(*ds.zmax) + ")");
    }
  }
  for (size_t i = 0; i < cfg.roughness.datasets.size(); ++i) {
    const auto& ds = cfg.roughness.datasets[i];
    if (ds.manning.empty() && ds.lulc.empty()) {
      throw ConfigError("roughness.datasets[" + std::to_string(i) +
                        "]: 'manning' or 'lulc' is required");
    }
    if (ds.manning.empty() && ds.reclass_table.empty()) {
      throw ConfigError("roughness.datasets[" + std::to_string(i) +
                        "]: 'lulc' requires a 'reclass_table'");
    }
  }
  if (cfg.topobathy.merge_method == MergeRule::Mean) {
    throw ConfigError("topobathy.merge_method 'mean' is not supported");
  }
  auto& rb = cfg.river_bathymetry;
  if (rb.segment_length <= 0.0) {
    throw ConfigError("river_bathymetry.segment_length (" +
                      std::to_string(rb.segment_length) + ") must be > 0");
  }
  if (rb.hydraulics.manning_n <= 0.0) {
    throw ConfigError("river_bathymetry.hydraulics.manning_n (" +
                      std::to_string(rb.hydraulics.manning_n) +
                      ") must be > 0");
  }

  // --- Non-fatal: warn and clamp ---
  auto warn_clamp = [](const std::string& name, auto& val, auto lo, auto hi) {
    if (val < lo || val > hi) {
      spdlog::warn("[Config] {} ({}) out of range [{}, {}], clamping", name, val,
                   lo, hi);
      val = std::clamp(val, static_cast<decltype(val)>(lo),
                       static_cast<decltype(val)>(hi));
    }
  };

  if (cfg.merge.buffer_cells < 0) {
    spdlog::warn("[Config] merge.buffer_cells ({}) must be >= 0, clamping to 0",
                 cfg.merge.buffer_cells);
    cfg.merge.buffer_cells = 0;
  }
  if (cfg.topobathy.merge_buffer < 0) {
    spdlog::warn(
        "[Config] topobathy.merge_buffer ({}) must be >= 0, clamping to 0",
        cfg.topobathy.merge_buffer);
    cfg.topobathy.merge_buffer = 0;
  }
  if (rb.smooth_length < 0.0) {
    spdlog::warn(
        "[Config] river_bathymetry.smooth_length ({}) must be >= 0, "
        "clamping to 0",
        rb.smooth_length);
    rb.smooth_length = 0.0;
  }
  warn_clamp("river_bathymetry.bankq", rb.bankq, 0.0, 100.0);
  if (rb.nmin < 1) {
    spdlog::warn("[Config] river_bathymetry.nmin ({}) must be >= 1, clamping to 1",
                 rb.nmin);
    rb.nmin = 1;
  }
  if (rb.max_dist < 0.0) {
    spdlog::warn(
        "[Config] river_bathymetry.max_dist ({}) must be >= 0, clamping to 0",
        rb.max_dist);
    rb.max_dist = 0.0;
  }

  auto& hy = rb.hydraulics;
  if (hy.min_rivslp <= 0.0) {
    spdlog::warn(
        "[Config] river_bathymetry.hydraulics.min_rivslp ({}) must be > 0, "
        "clamping to 1e-5",
        hy.min_rivslp);
    hy.min_rivslp = 1e-5;
  }
  if (hy.min_rivdph < 0.0) {
    spdlog::warn(
        "[Config] river_bathymetry.hydraulics.min_rivdph ({}) must be >= 0, "
        "clamping to 0",
        hy.min_rivdph);
    hy.min_rivdph = 0.0;
  }
  if (hy.gvf_iterations < 1) {
    spdlog::warn(
        "[Config] river_bathymetry.hydraulics.gvf_iterations ({}) must be "
        ">= 1, clamping to 1",
        hy.gvf_iterations);
    hy.gvf_iterations = 1;
  }

  if (cfg.roughness.manning_land <= 0.0 || cfg.roughness.manning_sea <= 0.0) {
    spdlog::warn("[Config] roughness: manning_land ({}) and manning_sea ({}) "
                 "should be > 0",
                 cfg.roughness.manning_land, cfg.roughness.manning_sea);
  }
}

}  // namespace detail

Config parseConfig(const YAML::Node& root, bool strict) {
  auto cfg = detail::parse(root, strict);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path, bool strict) {
  try {
    return parseConfig(YAML::LoadFile(path), strict);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace demfuse
