// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * demfuse.hpp
 *
 * demfuse: topobathymetry merging and river bed reconstruction for
 * flood model grids.
 */

#ifndef DEMFUSE_DEMFUSE_HPP
#define DEMFUSE_DEMFUSE_HPP

// Configs
#include "demfuse/config/demfuse.hpp"

// Data types
#include "demfuse/errors.hpp"
#include "demfuse/geometry.hpp"
#include "demfuse/logging.hpp"
#include "demfuse/raster.hpp"

// Merging
#include "demfuse/merge/merge.hpp"
#include "demfuse/merge/merge_multi.hpp"
#include "demfuse/merge/topobathy.hpp"

// Hydrology and river bathymetry
#include "demfuse/bathymetry/burn.hpp"
#include "demfuse/bathymetry/river_zb.hpp"
#include "demfuse/hydro/flow_direction.hpp"
#include "demfuse/hydro/hydraulics.hpp"
#include "demfuse/hydro/river_network.hpp"

// Model setup
#include "demfuse/catalog.hpp"
#include "demfuse/model.hpp"

#endif  // DEMFUSE_DEMFUSE_HPP
