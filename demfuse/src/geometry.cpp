// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * geometry.cpp
 *
 * Line buffering, and rasterization of vector features through
 * GDALRasterizeGeometries.
 */

#include "demfuse/geometry.hpp"

#include <gdal_alg.h>
#include <ogr_geometry.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>

#include "gdal_dataset.hpp"

namespace demfuse {

namespace {

constexpr int kCircleVertices = 16;

double segmentDistance(const Point& p, const Point& a, const Point& b) {
  const Eigen::Vector2d ab = b - a;
  const double len_sq = ab.squaredNorm();
  if (len_sq == 0.0) return (p - a).norm();
  const double t = std::clamp((p - a).dot(ab) / len_sq, 0.0, 1.0);
  return (p - (a + t * ab)).norm();
}

std::unique_ptr<OGRGeometry> toOgr(const LineString& line) {
  if (line.empty()) return nullptr;
  if (line.size() == 1) {
    return std::make_unique<OGRPoint>(line.front().x(), line.front().y());
  }
  auto ogr = std::make_unique<OGRLineString>();
  for (const auto& p : line) ogr->addPoint(p.x(), p.y());
  return ogr;
}

std::unique_ptr<OGRGeometry> toOgr(const Polygon& polygon) {
  const auto& vertices = polygon.getVertices();
  if (vertices.size() < 3) return nullptr;
  OGRLinearRing ring;
  for (const auto& v : vertices) ring.addPoint(v.x(), v.y());
  ring.closeRings();
  auto ogr = std::make_unique<OGRPolygon>();
  ogr->addRing(&ring);
  return ogr;
}

// Burn each geometry's value into an Int32 band, in order. Untouched
// cells keep `fill`. `all_touched` burns every cell a geometry crosses,
// otherwise only cells whose center is covered.
Eigen::MatrixXi burn(const Raster& like,
                     const std::vector<std::unique_ptr<OGRGeometry>>& geoms,
                     const std::vector<double>& values, int fill,
                     bool all_touched) {
  std::vector<OGRGeometryH> handles;
  std::vector<double> burn_values;
  for (size_t i = 0; i < geoms.size(); ++i) {
    if (!geoms[i]) continue;
    handles.push_back(OGRGeometry::ToHandle(geoms[i].get()));
    burn_values.push_back(values[i]);
  }

  gdal::DatasetPtr ds = gdal::createMem(like, Crs{}, GDT_Int32, fill, fill);
  if (handles.empty()) return gdal::readBandInt(*ds);

  int band = 1;
  char** options = nullptr;
  if (all_touched) options = CSLSetNameValue(options, "ALL_TOUCHED", "TRUE");
  const CPLErr err = GDALRasterizeGeometries(
      GDALDataset::ToHandle(ds.get()), 1, &band,
      static_cast<int>(handles.size()), handles.data(), nullptr, nullptr,
      burn_values.data(), options, nullptr, nullptr);
  CSLDestroy(options);
  if (err != CE_None) {
    throw std::runtime_error("Failed to rasterize " +
                             std::to_string(handles.size()) + " geometries");
  }
  return gdal::readBandInt(*ds);
}

}  // namespace

bool Feature::has(const std::string& key) const {
  auto it = properties.find(key);
  return it != properties.end() && std::isfinite(it->second);
}

double Feature::get(const std::string& key, double fallback) const {
  auto it = properties.find(key);
  return it == properties.end() ? fallback : it->second;
}

bool hasColumn(const FeatureTable& table, const std::string& key) {
  return std::any_of(table.begin(), table.end(),
                     [&key](const Feature& f) { return f.has(key); });
}

double lineLength(const LineString& line) {
  double len = 0.0;
  for (size_t k = 0; k + 1 < line.size(); ++k) {
    len += (line[k + 1] - line[k]).norm();
  }
  return len;
}

Point interpolateAlong(const LineString& line, double fraction) {
  if (line.empty()) return Point(NAN, NAN);
  if (line.size() == 1) return line.front();

  const double target = std::clamp(fraction, 0.0, 1.0) * lineLength(line);
  double walked = 0.0;
  for (size_t k = 0; k + 1 < line.size(); ++k) {
    const double piece = (line[k + 1] - line[k]).norm();
    if (walked + piece >= target && piece > 0.0) {
      const double t = (target - walked) / piece;
      return line[k] + t * (line[k + 1] - line[k]);
    }
    walked += piece;
  }
  return line.back();
}

double distance(const Point& p, const LineString& line) {
  if (line.empty()) return INFINITY;
  if (line.size() == 1) return (p - line.front()).norm();
  double best = INFINITY;
  for (size_t k = 0; k + 1 < line.size(); ++k) {
    best = std::min(best, segmentDistance(p, line[k], line[k + 1]));
  }
  return best;
}

MultiPolygon bufferLine(const LineString& line, double distance) {
  MultiPolygon parts;
  if (line.empty() || distance <= 0.0) return parts;

  for (const auto& vertex : line) {
    parts.push_back(Polygon::fromCircle(vertex, distance, kCircleVertices));
  }
  for (size_t k = 0; k + 1 < line.size(); ++k) {
    const Eigen::Vector2d dir = line[k + 1] - line[k];
    if (dir.norm() == 0.0) continue;
    const Eigen::Vector2d normal =
        distance * Eigen::Vector2d(dir.y(), -dir.x()).normalized();
    Polygon rect;
    rect.addVertex(line[k] + normal);
    rect.addVertex(line[k + 1] + normal);
    rect.addVertex(line[k + 1] - normal);
    rect.addVertex(line[k] - normal);
    parts.push_back(rect);
  }
  return parts;
}

Mask geometryMask(const Raster& like, const MultiPolygon& polygons) {
  std::vector<std::unique_ptr<OGRGeometry>> geoms;
  for (const auto& polygon : polygons) geoms.push_back(toOgr(polygon));
  const std::vector<double> ones(geoms.size(), 1.0);
  return burn(like, geoms, ones, 0, false).array() == 1;
}

Mask lineMask(const Raster& like, const std::vector<LineString>& lines) {
  std::vector<std::unique_ptr<OGRGeometry>> geoms;
  for (const auto& line : lines) geoms.push_back(toOgr(line));
  const std::vector<double> ones(geoms.size(), 1.0);
  return burn(like, geoms, ones, 0, true).array() == 1;
}

Eigen::MatrixXi rasterizeLines(const Raster& like,
                               const std::vector<LineString>& lines) {
  std::vector<std::unique_ptr<OGRGeometry>> geoms;
  std::vector<double> ids;
  for (size_t i = 0; i < lines.size(); ++i) {
    geoms.push_back(toOgr(lines[i]));
    ids.push_back(static_cast<double>(i));
  }
  return burn(like, geoms, ids, -1, true);
}

}  // namespace demfuse
