// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * raster.hpp
 *
 * Georeferenced 2D grid with a single nodata sentinel.
 * Includes model layer name constants.
 */

#ifndef DEMFUSE_RASTER_HPP
#define DEMFUSE_RASTER_HPP

#include <Eigen/Core>
#include <cmath>
#include <limits>

namespace demfuse {

// ─── Layer name constants ───────────────────────────────────────────────────

namespace layer {

constexpr auto dep = "dep";          // merged topobathy [m+ref]
constexpr auto manning = "manning";  // Manning roughness [s.m-1/3]
constexpr auto msk = "msk";          // active model cells
constexpr auto uparea = "uparea";    // upstream area [km2]
constexpr auto hand = "hand";        // height above nearest drainage [m]
constexpr auto rivmsk = "rivmsk";    // river mask

}  // namespace layer

// ─── Grid neighbourhoods ────────────────────────────────────────────────────

namespace grid {

// 8-connected offsets, row-major scan order
inline constexpr int kDr8[8] = {-1, -1, -1, 0, 0, 1, 1, 1};
inline constexpr int kDc8[8] = {-1, 0, 1, -1, 1, -1, 0, 1};

// 4-connected (orthogonal) offsets
inline constexpr int kDr4[4] = {-1, 0, 0, 1};
inline constexpr int kDc4[4] = {0, -1, 1, 0};

}  // namespace grid

/// Boolean cell mask, same shape as the raster it belongs to.
using Mask = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;

/// Logical cell type. Storage is always double.
enum class DataType { UInt8, Int16, Int32, Float32, Float64 };

/// Coordinate reference system (EPSG code + geographic flag).
struct Crs {
  int epsg = 0;
  bool geographic = false;

  bool isDefined() const { return epsg != 0; }
  bool operator==(const Crs& other) const {
    return epsg == other.epsg && geographic == other.geographic;
  }
  bool operator!=(const Crs& other) const { return !(*this == other); }
};

/// Axis-aligned extent in CRS units.
struct Bounds {
  double xmin = 0.0;
  double ymin = 0.0;
  double xmax = 0.0;
  double ymax = 0.0;

  bool intersects(const Bounds& other) const {
    return xmin < other.xmax && other.xmin < xmax && ymin < other.ymax &&
           other.ymin < ymax;
  }
};

/**
 * @brief Affine pixel → world transform (GDAL ordering).
 *
 *   x = x0 + col * dx + row * rx
 *   y = y0 + col * ry + row * dy
 *
 * (x0, y0) is the outer corner of cell (0, 0). A negative dy means the
 * first row is the northern edge.
 */
struct GeoTransform {
  double x0 = 0.0;
  double dx = 1.0;
  double rx = 0.0;
  double y0 = 0.0;
  double ry = 0.0;
  double dy = -1.0;

  /// North-up transform with square cells.
  static GeoTransform northUp(double xmin, double ymax, double res) {
    return GeoTransform{xmin, res, 0.0, ymax, 0.0, -res};
  }

  bool isRotated() const { return rx != 0.0 || ry != 0.0; }

  /// Pixel coordinates (fractional col, row) → world.
  Eigen::Vector2d apply(double col, double row) const {
    return {x0 + col * dx + row * rx, y0 + col * ry + row * dy};
  }

  /// World → fractional pixel coordinates (col, row).
  Eigen::Vector2d invert(const Eigen::Vector2d& xy) const {
    const double det = dx * dy - rx * ry;
    const double u = xy.x() - x0;
    const double v = xy.y() - y0;
    return {(dy * u - rx * v) / det, (-ry * u + dx * v) / det};
  }

  bool operator==(const GeoTransform& o) const;
  bool operator!=(const GeoTransform& o) const { return !(*this == o); }
};

// ─── Raster ─────────────────────────────────────────────────────────────────

/**
 * @brief Georeferenced 2D grid of numeric values.
 *
 * Every raster carries exactly one nodata value. NaN cells are always
 * treated as nodata, in addition to cells equal to a finite sentinel.
 * Values are stored as double; dtype() records the logical type and
 * assignMasked() re-quantizes values to it.
 *
 * Cells are addressed by (row, col). Linear indices are row-major
 * (row * cols + col).
 */
class Raster {
 public:
  Raster() = default;

  Raster(int rows, int cols, const GeoTransform& transform,
         const Crs& crs = {}, double nodata = NAN,
         DataType dtype = DataType::Float32);

  Raster(Eigen::MatrixXd values, const GeoTransform& transform,
         const Crs& crs = {}, double nodata = NAN,
         DataType dtype = DataType::Float32);

  bool isInitialized() const { return values_.size() > 0; }

  int rows() const { return static_cast<int>(values_.rows()); }
  int cols() const { return static_cast<int>(values_.cols()); }
  Eigen::Index size() const { return values_.size(); }

  Eigen::Index linearIndex(int row, int col) const {
    return static_cast<Eigen::Index>(row) * cols() + col;
  }

  const Eigen::MatrixXd& values() const { return values_; }
  Eigen::MatrixXd& values() { return values_; }

  double operator()(int row, int col) const { return values_(row, col); }
  double& operator()(int row, int col) { return values_(row, col); }

  double nodata() const { return nodata_; }
  bool hasFiniteNodata() const { return std::isfinite(nodata_); }

  /// Re-tag: existing nodata cells are rewritten to the new sentinel.
  void setNodata(double nodata);

  DataType dtype() const { return dtype_; }
  void setDtype(DataType dtype) { dtype_ = dtype; }

  const GeoTransform& transform() const { return transform_; }
  const Crs& crs() const { return crs_; }
  void setCrs(const Crs& crs) { crs_ = crs; }

  bool isNodataValue(double v) const {
    return std::isnan(v) || (std::isfinite(nodata_) && v == nodata_);
  }

  bool isValid(int row, int col) const {
    return !isNodataValue(values_(row, col));
  }

  bool contains(int row, int col) const {
    return row >= 0 && row < rows() && col >= 0 && col < cols();
  }

  Mask validMask() const;

  Eigen::Index countNodata() const;

  /// Copy of the values with NaN at nodata cells.
  Eigen::MatrixXd masked() const;

  /// Write values where NaN marks nodata. Re-quantizes to dtype(), keeping
  /// valid cells off the nodata value.
  void assignMasked(const Eigen::MatrixXd& values);

  /// Same grid, metadata and dtype; every cell set to `fill`.
  Raster like(double fill) const;

  /// Same grid and metadata with values taken from a NaN-masked matrix.
  Raster withMasked(const Eigen::MatrixXd& values) const;

  /// Same shape, transform and CRS.
  bool identicalGrid(const Raster& other) const;

  Eigen::Vector2d cellCenter(int row, int col) const {
    return transform_.apply(col + 0.5, row + 0.5);
  }

  /// Cell containing a world position. Returns false if outside.
  bool index(const Eigen::Vector2d& xy, int& row, int& col) const;

  Bounds bounds() const;

  /// Cell width in metres (geographic CRS: 111111 m per degree).
  double cellSizeMeters() const;

  /// Cell area in m2 at the given row.
  double cellArea(int row) const;

  /// Round/clamp a value to the representable range of `dtype`.
  static double quantize(double value, DataType dtype);

  /**
   * @brief Quantize without producing the nodata sentinel.
   *
   * A valid value that rounds or clamps onto `nodata` becomes the nearest
   * representable value next to it, e.g. UInt8 300 with nodata 255 is 254.
   */
  static double quantize(double value, DataType dtype, double nodata);

 private:
  Eigen::MatrixXd values_;
  GeoTransform transform_;
  Crs crs_;
  double nodata_ = NAN;
  DataType dtype_ = DataType::Float32;
};

/// Metres per degree used for geographic grids.
inline constexpr double kMetersPerDegree = 111111.0;

}  // namespace demfuse

#endif  // DEMFUSE_RASTER_HPP
