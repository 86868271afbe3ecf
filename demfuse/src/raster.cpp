// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "demfuse/raster.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace demfuse {

namespace {

bool nearlyEqual(double a, double b) {
  return std::abs(a - b) <= 1e-9 * std::max({1.0, std::abs(a), std::abs(b)});
}

template <typename T>
double clampTo(double value) {
  const double lo = static_cast<double>(std::numeric_limits<T>::lowest());
  const double hi = static_cast<double>(std::numeric_limits<T>::max());
  return std::clamp(std::round(value), lo, hi);
}

}  // namespace

bool GeoTransform::operator==(const GeoTransform& o) const {
  return nearlyEqual(x0, o.x0) && nearlyEqual(dx, o.dx) &&
         nearlyEqual(rx, o.rx) && nearlyEqual(y0, o.y0) &&
         nearlyEqual(ry, o.ry) && nearlyEqual(dy, o.dy);
}

Raster::Raster(int rows, int cols, const GeoTransform& transform,
               const Crs& crs, double nodata, DataType dtype)
    : values_(Eigen::MatrixXd::Constant(rows, cols, nodata)),
      transform_(transform),
      crs_(crs),
      nodata_(nodata),
      dtype_(dtype) {}

Raster::Raster(Eigen::MatrixXd values, const GeoTransform& transform,
               const Crs& crs, double nodata, DataType dtype)
    : values_(std::move(values)),
      transform_(transform),
      crs_(crs),
      nodata_(nodata),
      dtype_(dtype) {}

void Raster::setNodata(double nodata) {
  for (Eigen::Index j = 0; j < values_.cols(); ++j) {
    for (Eigen::Index i = 0; i < values_.rows(); ++i) {
      if (isNodataValue(values_(i, j))) values_(i, j) = nodata;
    }
  }
  nodata_ = nodata;
}

Mask Raster::validMask() const {
  Mask mask(values_.rows(), values_.cols());
  for (Eigen::Index j = 0; j < values_.cols(); ++j) {
    for (Eigen::Index i = 0; i < values_.rows(); ++i) {
      mask(i, j) = !isNodataValue(values_(i, j));
    }
  }
  return mask;
}

Eigen::Index Raster::countNodata() const {
  return size() - validMask().count();
}

Eigen::MatrixXd Raster::masked() const {
  Eigen::MatrixXd out = values_;
  for (Eigen::Index j = 0; j < out.cols(); ++j) {
    for (Eigen::Index i = 0; i < out.rows(); ++i) {
      if (isNodataValue(out(i, j))) out(i, j) = NAN;
    }
  }
  return out;
}

void Raster::assignMasked(const Eigen::MatrixXd& values) {
  values_.resize(values.rows(), values.cols());
  for (Eigen::Index j = 0; j < values.cols(); ++j) {
    for (Eigen::Index i = 0; i < values.rows(); ++i) {
      const double v = values(i, j);
      values_(i, j) = std::isnan(v) ? nodata_ : quantize(v, dtype_, nodata_);
    }
  }
}

Raster Raster::like(double fill) const {
  Raster out(rows(), cols(), transform_, crs_, nodata_, dtype_);
  out.values_.setConstant(fill);
  return out;
}

Raster Raster::withMasked(const Eigen::MatrixXd& values) const {
  Raster out(rows(), cols(), transform_, crs_, nodata_, dtype_);
  out.assignMasked(values);
  return out;
}

bool Raster::identicalGrid(const Raster& other) const {
  return rows() == other.rows() && cols() == other.cols() &&
         transform_ == other.transform_ && crs_ == other.crs_;
}

bool Raster::index(const Eigen::Vector2d& xy, int& row, int& col) const {
  const Eigen::Vector2d px = transform_.invert(xy);
  const double c = std::floor(px.x());
  const double r = std::floor(px.y());
  if (r < 0 || c < 0 || r >= rows() || c >= cols()) return false;
  row = static_cast<int>(r);
  col = static_cast<int>(c);
  return true;
}

Bounds Raster::bounds() const {
  const Eigen::Vector2d corners[4] = {
      transform_.apply(0, 0), transform_.apply(cols(), 0),
      transform_.apply(0, rows()), transform_.apply(cols(), rows())};
  Bounds b{corners[0].x(), corners[0].y(), corners[0].x(), corners[0].y()};
  for (const auto& p : corners) {
    b.xmin = std::min(b.xmin, p.x());
    b.xmax = std::max(b.xmax, p.x());
    b.ymin = std::min(b.ymin, p.y());
    b.ymax = std::max(b.ymax, p.y());
  }
  return b;
}

double Raster::cellSizeMeters() const {
  const double res = std::hypot(transform_.dx, transform_.ry);
  return crs_.geographic ? res * kMetersPerDegree : res;
}

double Raster::cellArea(int row) const {
  const double w = std::hypot(transform_.dx, transform_.ry);
  const double h = std::hypot(transform_.rx, transform_.dy);
  if (!crs_.geographic) return w * h;
  const double lat = cellCenter(row, 0).y() * M_PI / 180.0;
  return w * kMetersPerDegree * std::cos(lat) * h * kMetersPerDegree;
}

double Raster::quantize(double value, DataType dtype) {
  if (!std::isfinite(value)) return value;
  switch (dtype) {
    case DataType::UInt8:
      return clampTo<std::uint8_t>(value);
    case DataType::Int16:
      return clampTo<std::int16_t>(value);
    case DataType::Int32:
      return clampTo<std::int32_t>(value);
    case DataType::Float32:
      return static_cast<double>(static_cast<float>(value));
    case DataType::Float64:
      break;
  }
  return value;
}

double Raster::quantize(double value, DataType dtype, double nodata) {
  const double q = quantize(value, dtype);
  if (!std::isfinite(nodata) || q != nodata || value == nodata) return q;

  // Valid value collapsed onto the sentinel: take the adjacent one
  if (dtype == DataType::Float32) {
    const float f = static_cast<float>(q);
    return std::nextafter(f, value > q ? std::numeric_limits<float>::max()
                                       : std::numeric_limits<float>::lowest());
  }
  const double step = value > q ? 1.0 : -1.0;
  const double stepped = quantize(q + step, dtype);
  return stepped != q ? stepped : quantize(q - step, dtype);
}

}  // namespace demfuse
