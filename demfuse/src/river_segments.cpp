// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/bathymetry/river_segments.hpp"

#include "demfuse/errors.hpp"

namespace demfuse {

std::vector<double> column(const RiverSegmentTable& table,
                           double RiverSegment::*field) {
  std::vector<double> out;
  out.reserve(table.size());
  for (const auto& seg : table) out.push_back(seg.*field);
  return out;
}

void setColumn(RiverSegmentTable& table, double RiverSegment::*field,
               const std::vector<double>& values) {
  if (values.size() != table.size()) {
    throw ConfigError("setColumn: " + std::to_string(values.size()) +
                      " values for " + std::to_string(table.size()) +
                      " segments");
  }
  for (size_t i = 0; i < table.size(); ++i) table[i].*field = values[i];
}

RiverNetwork segmentNetwork(const RiverSegmentTable& table) {
  std::vector<int> idx;
  std::vector<int> idx_ds;
  idx.reserve(table.size());
  idx_ds.reserve(table.size());
  for (const auto& seg : table) {
    idx.push_back(seg.idx);
    idx_ds.push_back(seg.idx_ds);
  }
  return RiverNetwork(idx, idx_ds, column(table, &RiverSegment::uparea));
}

std::vector<LineString> segmentLines(const RiverSegmentTable& table) {
  std::vector<LineString> lines;
  lines.reserve(table.size());
  for (const auto& seg : table) lines.push_back(seg.geometry);
  return lines;
}

}  // namespace demfuse
