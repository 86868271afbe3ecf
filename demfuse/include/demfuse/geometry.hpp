// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * geometry.hpp
 *
 * Vector features (lines, points, polygons) and their rasterization
 * onto a Raster grid. Polygons are grid_map::Polygon.
 */

#ifndef DEMFUSE_GEOMETRY_HPP
#define DEMFUSE_GEOMETRY_HPP

#include <grid_map_core/Polygon.hpp>
#include <map>
#include <string>
#include <vector>

#include "demfuse/raster.hpp"

namespace demfuse {

using Point = grid_map::Position;
using LineString = std::vector<Point>;
using Polygon = grid_map::Polygon;
using MultiPolygon = std::vector<grid_map::Polygon>;

/**
 * @brief Line or point feature with numeric attributes.
 *
 * A point feature is a geometry with a single vertex. Attribute names
 * follow the model conventions ("rivwth", "qbankfull", "uparea", ...).
 */
struct Feature {
  LineString geometry;
  std::map<std::string, double> properties;

  bool has(const std::string& key) const;

  /// Attribute value, or `fallback` if absent.
  double get(const std::string& key, double fallback = NAN) const;
};

using FeatureTable = std::vector<Feature>;

/// True if any feature carries a finite value for `key`.
bool hasColumn(const FeatureTable& table, const std::string& key);

double lineLength(const LineString& line);

/// Point at `fraction` (0..1) of the line length.
Point interpolateAlong(const LineString& line, double fraction);

/// Minimum euclidean distance from a point to a line (or point).
double distance(const Point& p, const LineString& line);

/**
 * @brief Buffer a line by `distance`.
 *
 * Returns one rectangle per line piece plus a disc at every vertex,
 * which together cover the round-capped buffer.
 */
MultiPolygon bufferLine(const LineString& line, double distance);

/// Cells whose center lies inside any polygon.
Mask geometryMask(const Raster& like, const MultiPolygon& polygons);

/// Cells touched by any of the lines.
Mask lineMask(const Raster& like, const std::vector<LineString>& lines);

/**
 * @brief Burn line ids into the grid.
 *
 * Lines are drawn in order, later lines overwrite earlier ones.
 *
 * @return Matrix with the index of the last line touching each cell, -1
 *         where no line touches.
 */
Eigen::MatrixXi rasterizeLines(const Raster& like,
                               const std::vector<LineString>& lines);

}  // namespace demfuse

#endif  // DEMFUSE_GEOMETRY_HPP
