// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/bathymetry/river_zb.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <unordered_map>

#include "demfuse/errors.hpp"
#include "demfuse/hydro/hydraulics.hpp"
#include "demfuse/interpolate.hpp"
#include "demfuse/morphology.hpp"

namespace demfuse {

namespace {

constexpr double kNodata = -9999.0;

using Field = double RiverSegment::*;

Field fieldFor(const std::string& name) {
  if (name == "rivwth") return &RiverSegment::rivwth;
  if (name == "qbankfull") return &RiverSegment::qbankfull;
  if (name == "uparea") return &RiverSegment::uparea;
  if (name == "elevtn") return &RiverSegment::elevtn;
  if (name == "zb") return &RiverSegment::zb;
  throw ConfigError("joinRiverAttributes: unsupported column '" + name + "'");
}

void checkGrid(const FlowDirRaster& flwdir, const Raster& raster,
               const char* what) {
  if (raster.rows() != flwdir.rows() || raster.cols() != flwdir.cols()) {
    throw ConfigError(std::string("getRiverZb: ") + what +
                      " does not match the flow direction grid");
  }
}

void checkSegmentLength(const config::RiverBathymetry& cfg, const char* where) {
  if (!(cfg.segment_length > 0.0) || !std::isfinite(cfg.segment_length)) {
    throw ConfigError(std::string(where) + ": segment_length (" +
                      std::to_string(cfg.segment_length) + ") must be > 0");
  }
}

bool anyFinite(const std::vector<double>& values) {
  return std::any_of(values.begin(), values.end(),
                     [](double v) { return std::isfinite(v); });
}

// Fill gaps from upstream (max at confluences), clip at zero
std::vector<double> fillDown(const RiverNetwork& network,
                             std::vector<double> values) {
  for (auto& v : values) {
    if (!std::isfinite(v)) v = kNodata;
  }
  values = network.fillnodata(values, kNodata, FillDirection::Down, FillHow::Max);
  for (auto& v : values) v = std::max(0.0, v);
  return values;
}

// Percentile with linear interpolation between closest ranks
double percentile(std::vector<double> values, double q) {
  std::sort(values.begin(), values.end());
  const double pos = q / 100.0 * static_cast<double>(values.size() - 1);
  const auto lo = static_cast<size_t>(std::floor(pos));
  const size_t hi = std::min(lo + 1, values.size() - 1);
  const double frac = pos - static_cast<double>(lo);
  return values[lo] + frac * (values[hi] - values[lo]);
}

// Segment id (1-based) of the nearest segment line, NaN where unreached
Eigen::MatrixXd nearestSegment(const RiverSegmentTable& table, const Raster& like,
                               const Mask& within) {
  const Eigen::MatrixXi ids = rasterizeLines(like, segmentLines(table));
  Eigen::MatrixXd obs = Eigen::MatrixXd::Constant(ids.rows(), ids.cols(), NAN);
  for (Eigen::Index c = 0; c < ids.cols(); ++c) {
    for (Eigen::Index r = 0; r < ids.rows(); ++r) {
      if (ids(r, c) >= 0) obs(r, c) = table[ids(r, c)].segid;
    }
  }
  const auto& gt = like.transform();
  return spread2d(obs, &within, std::hypot(gt.dx, gt.ry), std::hypot(gt.rx, gt.dy))
      .values;
}

}  // namespace

// ─── Segments ───────────────────────────────────────────────────────────────

RiverSegmentTable extractSegments(const FlowDirRaster& flwdir,
                                  const Raster& elevtn, const Raster& uparea,
                                  const config::RiverBathymetry& cfg) {
  checkSegmentLength(cfg, "extractSegments");
  checkGrid(flwdir, elevtn, "elevation");
  checkGrid(flwdir, uparea, "upstream area");

  const double res = flwdir.grid().cellSizeMeters();
  const int max_len =
      std::max(1, static_cast<int>(std::lround(cfg.segment_length / res)));
  const Mask rivd8 = uparea.masked().array() > cfg.river_upa;

  const Raster distnc = flwdir.distanceToOutlet();
  const Raster strord = flwdir.streamOrder(&rivd8);
  const Eigen::MatrixXd z = elevtn.masked();
  const Eigen::MatrixXd upa = uparea.masked();
  const int n_cols = flwdir.cols();

  RiverSegmentTable table;
  const auto streams = flwdir.streams(rivd8, max_len);
  table.reserve(streams.size());
  std::unordered_map<int, size_t> by_head;
  for (const auto& stream : streams) {
    RiverSegment seg;
    seg.segid = static_cast<int>(table.size()) + 1;
    seg.idx = stream.idx;
    seg.idx_ds = stream.idx_ds;
    seg.cells = stream.cells;
    const auto line = flwdir.segmentLine(stream);
    seg.geometry.assign(line.begin(), line.end());

    const int r = stream.idx / n_cols;
    const int c = stream.idx % n_cols;
    seg.uparea = upa(r, c);
    seg.elevtn = z(r, c);
    seg.rivdst = distnc(r, c);
    seg.strord = static_cast<int>(strord(r, c));
    by_head.emplace(seg.idx, table.size());
    table.push_back(std::move(seg));
  }

  for (auto& seg : table) {
    auto it = by_head.find(seg.idx_ds);
    const double dst_ds = it != by_head.end() ? table[it->second].rivdst : seg.rivdst;
    seg.rivlen = seg.rivdst - dst_ds;
  }
  return table;
}

void joinRiverAttributes(RiverSegmentTable& table, const FeatureTable& features,
                         const std::vector<std::string>& columns,
                         double max_dist) {
  std::vector<Field> fields;
  for (const auto& name : columns) fields.push_back(fieldFor(name));
  if (features.empty() || fields.empty()) return;

  for (auto& seg : table) {
    if (seg.geometry.empty()) continue;
    const Point mid = interpolateAlong(seg.geometry, 0.5);
    const Feature* nearest = nullptr;
    double best = std::numeric_limits<double>::infinity();
    for (const auto& f : features) {
      const double d = distance(mid, f.geometry);
      if (d < best) {
        best = d;
        nearest = &f;
      }
    }
    if (!nearest || best > max_dist) continue;
    for (size_t k = 0; k < columns.size(); ++k) {
      if (nearest->has(columns[k])) seg.*fields[k] = nearest->get(columns[k]);
    }
  }
}

// ─── Masks ──────────────────────────────────────────────────────────────────

Mask riverMask(const RiverSegmentTable& table, const Raster& elevtn,
               const std::optional<Mask>& rivmsk) {
  if (rivmsk) {
    if (rivmsk->rows() != elevtn.rows() || rivmsk->cols() != elevtn.cols()) {
      throw ConfigError("riverMask: river mask does not match the elevation grid");
    }
    return lineMask(elevtn, segmentLines(table)) || *rivmsk;
  }
  if (!anyFinite(column(table, &RiverSegment::rivwth))) {
    throw ConfigError("No river width or river mask provided.");
  }
  if (elevtn.crs().geographic) {
    throw ConfigError("riverMask: buffering by river width requires a projected CRS");
  }
  MultiPolygon polygons;
  for (const auto& seg : table) {
    const double w = std::isfinite(seg.rivwth) ? seg.rivwth : 0.0;
    auto buffer = bufferLine(seg.geometry, std::max(w / 2.0, 1.0));
    polygons.insert(polygons.end(), buffer.begin(), buffer.end());
  }
  return geometryMask(elevtn, polygons) && elevtn.validMask();
}

RivbankDz getRivbankDz(const RiverSegmentTable& table, const Mask& river_mask,
                       const Raster& hand, int nmin, double q) {
  if (river_mask.rows() != hand.rows() || river_mask.cols() != hand.cols()) {
    throw ConfigError("getRivbankDz: river mask does not match the HAND grid");
  }
  const Eigen::MatrixXd hnd = hand.masked();

  // Banks are the cells adjacent to the river
  const Mask filled = binaryFillHoles(river_mask, Connectivity::Four);
  const Mask dilated = binaryDilation(filled, 1, Connectivity::Eight);
  const Eigen::MatrixXd segid = nearestSegment(table, hand, dilated);

  RivbankDz out;
  out.bank_mask = (hnd.array() > 0.0) && (dilated != filled);
  out.river_mask = (hnd.array() >= 0.0) && river_mask && !out.bank_mask;

  std::unordered_map<int, std::vector<double>> samples;
  for (Eigen::Index c = 0; c < hnd.cols(); ++c) {
    for (Eigen::Index r = 0; r < hnd.rows(); ++r) {
      if (out.bank_mask(r, c) && std::isfinite(segid(r, c))) {
        samples[static_cast<int>(segid(r, c))].push_back(hnd(r, c));
      }
    }
  }

  out.rivbank_dz.assign(table.size(), 0.0);
  for (size_t i = 0; i < table.size(); ++i) {
    auto it = samples.find(table[i].segid);
    if (it == samples.end() || static_cast<int>(it->second.size()) < nmin) continue;
    out.rivbank_dz[i] = percentile(it->second, q);
  }
  return out;
}

std::vector<double> segmentWidth(const RiverSegmentTable& table,
                                 const Mask& river_mask,
                                 const FlowDirRaster& flwdir) {
  const Raster& grid = flwdir.grid();
  if (river_mask.rows() != grid.rows() || river_mask.cols() != grid.cols()) {
    throw ConfigError("segmentWidth: river mask does not match the flow grid");
  }
  const Eigen::MatrixXd segid = nearestSegment(table, grid, river_mask);

  std::unordered_map<int, double> area;
  for (Eigen::Index c = 0; c < segid.cols(); ++c) {
    for (Eigen::Index r = 0; r < segid.rows(); ++r) {
      if (river_mask(r, c) && std::isfinite(segid(r, c))) {
        area[static_cast<int>(segid(r, c))] += grid.cellArea(static_cast<int>(r));
      }
    }
  }

  std::vector<double> width(table.size(), NAN);
  for (size_t i = 0; i < table.size(); ++i) {
    auto it = area.find(table[i].segid);
    if (it == area.end()) continue;
    double length = 0.0;
    for (int cell : table[i].cells) length += flwdir.linkLength(cell);
    if (length <= 0.0) length = grid.cellSizeMeters();
    width[i] = it->second / length;
  }
  return width;
}

// ─── Bed levels ─────────────────────────────────────────────────────────────

void estimateBedLevels(RiverSegmentTable& table, const RiverNetwork& network,
                       const std::vector<double>& rivbank_dz,
                       const config::RiverBathymetry& cfg,
                       const Logger& logger) {
  const size_t n = table.size();
  if (network.size() != n || rivbank_dz.size() != n) {
    throw ConfigError("estimateBedLevels: network or bank heights do not match "
                      "the segment table");
  }
  checkSegmentLength(cfg, "estimateBedLevels");
  auto& log = sink(logger);
  const int smooth_n = static_cast<int>(
      std::lround(cfg.smooth_length / cfg.segment_length / 2.0));

  const auto elevtn = column(table, &RiverSegment::elevtn);
  const auto rivdst = column(table, &RiverSegment::rivdst);

  // Bankfull water level
  log.info("[RiverZb] Deriving bankfull river surface elevation profile");
  std::vector<double> zs0(n);
  for (size_t i = 0; i < n; ++i) zs0[i] = elevtn[i] + rivbank_dz[i];
  setColumn(table, &RiverSegment::zs0, zs0);
  auto zs = network.demAdjust(network.movingAverage(zs0, smooth_n));
  for (size_t i = 0; i < n; ++i) {
    zs[i] = std::isfinite(zs[i]) ? std::max(elevtn[i], zs[i]) : elevtn[i];
    table[i].zs = zs[i];
    table[i].rivbank_dz = zs[i] - elevtn[i];
  }

  // Depth
  const auto rivwth = column(table, &RiverSegment::rivwth);
  const auto rivdph0 =
      riverDepth(network, column(table, &RiverSegment::qbankfull), rivwth, zs,
                 rivdst, cfg.hydraulics, logger);
  setColumn(table, &RiverSegment::rivdph0, rivdph0);
  auto rivdph = network.movingAverage(rivdph0, smooth_n);

  if (cfg.adjust_estuary) {
    const auto estuary = network.classifyEstuaries(
        elevtn, network.movingAverage(rivwth, smooth_n), rivdst,
        cfg.min_convergence, cfg.estuary_max_elevtn);
    std::vector<double> masked = rivdph;
    size_t n_estuary = 0;
    for (size_t i = 0; i < n; ++i) {
      table[i].estuary = estuary[i];
      if (estuary[i] == 1) {
        masked[i] = kNodata;
        ++n_estuary;
      }
    }
    if (n_estuary > 0) {
      masked = network.fillnodata(masked, kNodata, FillDirection::Down);
      size_t n_unfilled = 0;
      for (size_t i = 0; i < n; ++i) {
        if (masked[i] == kNodata) {
          masked[i] = rivdph[i];
          ++n_unfilled;
        }
      }
      if (n_unfilled > 0) {
        log.warn("[RiverZb] {} estuary segments without upstream river depth "
                 "keep their own depth",
                 n_unfilled);
      }
      log.debug("[RiverZb] {} estuary segments", n_estuary);
      rivdph = masked;
    }
  }

  // Bed level and slope
  std::vector<double> zb(n);
  for (size_t i = 0; i < n; ++i) zb[i] = zs[i] - rivdph[i];
  if (cfg.adjust_dem) zb = network.demAdjust(zb);
  for (size_t i = 0; i < n; ++i) {
    zb[i] = std::min(zb[i], elevtn[i]);
    table[i].zb = zb[i];
    table[i].rivdph = zs[i] - zb[i];
  }
  const auto zb_ds = network.downstream(zb);
  const auto dst_ds = network.downstream(rivdst);
  for (size_t i = 0; i < n; ++i) {
    const double slp = (zb[i] - zb_ds[i]) / (rivdst[i] - dst_ds[i]);
    table[i].rivslp = std::isfinite(slp) ? slp : 0.0;
  }
}

RiverZbResult getRiverZb(const RiverInputs& inputs, const FlowDirRaster& flwdir,
                         const config::RiverBathymetry& cfg,
                         const Logger& logger) {
  if (!inputs.elevtn.isInitialized()) {
    throw ConfigError("getRiverZb: no elevation data");
  }
  checkSegmentLength(cfg, "getRiverZb");
  auto& log = sink(logger);
  const Raster uparea = inputs.uparea ? *inputs.uparea : flwdir.upstreamArea();

  RiverZbResult result;
  result.segments = extractSegments(flwdir, inputs.elevtn, uparea, cfg);
  auto& table = result.segments;
  if (table.empty()) {
    log.warn("[RiverZb] No river cells with upstream area above {} km2",
             cfg.river_upa);
    result.river_mask = Mask::Constant(flwdir.rows(), flwdir.cols(), false);
    return result;
  }
  log.debug("[RiverZb] {} river segments", table.size());
  const RiverNetwork network = segmentNetwork(table);

  // River attributes
  if (inputs.rivers) {
    std::vector<std::string> cols;
    for (const char* c : {"rivwth", "qbankfull"}) {
      if (hasColumn(*inputs.rivers, c)) cols.emplace_back(c);
    }
    joinRiverAttributes(table, *inputs.rivers, cols, cfg.max_dist);
  }
  if (inputs.qbankfull && hasColumn(*inputs.qbankfull, "qbankfull")) {
    for (auto& seg : table) seg.qbankfull = NAN;
    joinRiverAttributes(table, *inputs.qbankfull, {"qbankfull"}, cfg.max_dist);
  }
  if (!anyFinite(column(table, &RiverSegment::qbankfull))) {
    throw ConfigError("getRiverZb: river segments have no \"qbankfull\" data");
  }
  const bool has_rivwth = anyFinite(column(table, &RiverSegment::rivwth));
  if (!(cfg.hydraulics.method == DepthMethod::Powlaw || cfg.adjust_rivwth ||
        has_rivwth)) {
    throw ConfigError("getRiverZb: river segments have no \"rivwth\" data");
  }
  setColumn(table, &RiverSegment::qbankfull,
            fillDown(network, column(table, &RiverSegment::qbankfull)));
  if (has_rivwth) {
    setColumn(table, &RiverSegment::rivwth,
              fillDown(network, column(table, &RiverSegment::rivwth)));
  }

  result.river_mask = riverMask(table, inputs.elevtn, inputs.rivmsk);

  // Bank heights from HAND
  const Mask rivd8 = uparea.masked().array() > cfg.river_upa;
  const Raster hand = flwdir.hand(rivd8, inputs.elevtn);
  const RivbankDz bank =
      getRivbankDz(table, result.river_mask, hand, cfg.nmin, cfg.bankq);

  if (cfg.adjust_rivwth) {
    log.info("[RiverZb] Deriving river segment average width");
    setColumn(table, &RiverSegment::rivwth,
              fillDown(network, segmentWidth(table, result.river_mask, flwdir)));
  }

  estimateBedLevels(table, network, bank.rivbank_dz, cfg, logger);
  return result;
}

}  // namespace demfuse
