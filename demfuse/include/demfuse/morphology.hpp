// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * morphology.hpp
 *
 * Binary morphology on cell masks.
 */

#ifndef DEMFUSE_MORPHOLOGY_HPP
#define DEMFUSE_MORPHOLOGY_HPP

#include "demfuse/raster.hpp"

namespace demfuse {

enum class Connectivity { Four = 4, Eight = 8 };

/**
 * @brief Grow a mask by `iterations` cells.
 *
 * @param mask Input mask
 * @param iterations Number of dilation passes (0 returns the input)
 * @param connectivity Structuring element (Eight: 3x3 square, Four: cross)
 */
Mask binaryDilation(const Mask& mask, int iterations = 1,
                    Connectivity connectivity = Connectivity::Eight);

/**
 * @brief Fill holes: background regions not connected to the border.
 *
 * @param mask Foreground mask
 * @param background Connectivity used to flood the background from the
 *        border. Eight lets background leak through diagonal gaps.
 */
Mask binaryFillHoles(const Mask& mask,
                     Connectivity background = Connectivity::Four);

}  // namespace demfuse

#endif  // DEMFUSE_MORPHOLOGY_HPP
