// Transform.h: Conversion between measurement set style visibility arrays and
// Datasets.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_TRANSFORM_H_
#define SELFCAL_BASE_TRANSFORM_H_

#include <complex>
#include <memory>
#include <vector>

#include <xtensor/xarray.hpp>

#include <selfcal/base/Dataset.h>

namespace selfcal::base {

/**
 * Creates a Dataset from a visibility array.
 *
 * The array has shape {n_baselines, n_channels, n_correlations} when the
 * metadata has one time, or {n_times, n_baselines, n_channels,
 * n_correlations}, which is the order of the DATA column of a measurement set.
 * The correlations are read as:
 * - kFull: xx, xy, yx, yy from a 4-correlation array.
 * - kDual: entries 0 and 1 of a 2-correlation array, or 0 and 3 of a
 *   4-correlation array. Cells for which both are exactly zero are left at
 *   their zero default; these are flagged or missing baselines.
 * - kXX: entry 0.
 * - kYY: the last entry.
 * @throw std::invalid_argument When the array shape does not match the
 * metadata or the polarization.
 */
Dataset Pack(const xt::xarray<std::complex<double>>& array,
             std::shared_ptr<const Metadata> metadata,
             Polarization polarization);

/**
 * As above, for the given subset of the channels of @p metadata. The array
 * holds all channels of @p metadata; the dataset only the selected ones.
 */
Dataset Pack(const xt::xarray<std::complex<double>>& array,
             const std::shared_ptr<const Metadata>& metadata,
             const std::vector<size_t>& channels, Polarization polarization);

/**
 * Creates a visibility array from a Dataset, with 4, 2 or 1 correlations for
 * kFull, kDual or kXX/kYY. The time axis is left out when the dataset has
 * a single time.
 */
xt::xarray<std::complex<double>> Unpack(const Dataset& dataset);

/**
 * Writes a Dataset into an existing visibility array of the measurement set
 * shape. Only the correlations that the polarization holds are written, e.g.
 * a kDual dataset writes entries 0 and 3 of a 4-correlation array and leaves
 * the cross-correlations untouched.
 * @throw std::invalid_argument When the array shape does not match.
 */
void UnpackInto(const Dataset& dataset,
                xt::xarray<std::complex<double>>& array);

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_TRANSFORM_H_
