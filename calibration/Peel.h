// Peel.h: Direction dependent calibration by peeling sources one by one.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_CALIBRATION_PEEL_H_
#define SELFCAL_CALIBRATION_PEEL_H_

#include <vector>

#include <selfcal/base/Dataset.h>

#include "../base/ModelComponent.h"
#include "Calibration.h"
#include "GainSolver.h"

namespace selfcal::calibration {

struct PeelSettings {
  SolverSettings solver;
  /// Number of passes over all directions.
  size_t peel_iterations = 3;
  /// Solve full Jones gains instead of diagonal gains.
  bool full_polarization = false;
  /// Solve one gain over all channels instead of one per channel.
  bool collapse_frequency = false;
};

/**
 * Peels the directions with model visibilities @p models from @p residual.
 *
 * In every pass each direction is calibrated in turn against the residual,
 * after adding back what was subtracted for it in the previous pass. The
 * model, corrupted by the new solution, is then subtracted. After the last
 * pass @p residual holds the data with all directions removed.
 *
 * Cells of @p residual that are zero on entry are treated as flagged: they
 * are excluded from every solve and are zero again on return.
 *
 * @returns The last solution of every direction, in the order of @p models.
 * @throw std::invalid_argument When a model does not have the shape and
 * polarization of the residual.
 */
std::vector<Calibration> Peel(base::Dataset& residual,
                              const std::vector<base::Dataset>& models,
                              const PeelSettings& settings);

/// As above, predicting the model of every source with the metadata of
/// @p residual first.
std::vector<Calibration> Peel(
    base::Dataset& residual,
    const std::vector<base::ModelComponent::ConstPtr>& sources,
    const PeelSettings& settings);

}  // namespace selfcal::calibration

#endif  // SELFCAL_CALIBRATION_PEEL_H_
