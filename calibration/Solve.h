// Solve.h: Self-calibration of a dataset against a model.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_CALIBRATION_SOLVE_H_
#define SELFCAL_CALIBRATION_SOLVE_H_

#include <xtensor/xtensor.hpp>

#include <selfcal/base/Dataset.h>

#include "Calibration.h"
#include "GainSolver.h"

namespace selfcal::calibration {

/// One entry per (channel, baseline, time) cell; true when the cell is flagged.
using FlagMask = xt::xtensor<bool, 3>;

/// Marks the cells of @p data in which every correlation is zero, which is how
/// flagged visibilities are stored.
FlagMask ZeroCells(const base::Dataset& data);

/**
 * Solves the gains that make @p model match @p observed.
 *
 * Each channel is solved independently and in parallel, or, when
 * @p collapse_frequency is set, all channels are solved together for a
 * single solution. Self-baselines and baselines shorter than
 * settings.min_uvw wavelengths are not used, nor are cells in which the
 * observed or the model visibility is zero. A channel without any usable
 * model visibility keeps identity gains and is not converged.
 *
 * @returns A calibration with one channel per data channel, or a single
 * channel when collapsed.
 * @throw std::invalid_argument When the datasets have different shapes,
 * polarizations or numbers of antennas.
 */
Calibration Solve(const base::Dataset& observed, const base::Dataset& model,
                  GainType type, bool collapse_frequency,
                  const SolverSettings& settings);

/// As above, but the cells set in @p flags are excluded instead of the cells
/// in which @p observed is zero. This is used when @p observed is a residual
/// whose flagged cells no longer hold zeros.
/// @throw std::invalid_argument Also when @p flags does not have the shape of
/// the datasets.
Calibration Solve(const base::Dataset& observed, const base::Dataset& model,
                  const FlagMask& flags, GainType type,
                  bool collapse_frequency, const SolverSettings& settings);

}  // namespace selfcal::calibration

#endif  // SELFCAL_CALIBRATION_SOLVE_H_
