// GainSolver.h: StefCal solver for the gains of one solution interval.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_CALIBRATION_GAIN_SOLVER_H_
#define SELFCAL_CALIBRATION_GAIN_SOLVER_H_

#include <vector>

#include "../common/JonesMatrix.h"
#include "Calibration.h"

namespace selfcal::calibration {

struct SolverSettings {
  size_t max_iterations = 20;
  /// Relative change of the gains below which the solve has converged.
  double tolerance = 1.0e-3;
  /// Baselines shorter than this length in wavelengths are not used.
  double min_uvw = 0.0;
};

/**
 * Solves V_pq = G_p M_pq G_q^H for the gains G with the StefCal algorithm
 * (Salvini & Wijnholds 2014), given observed (V) and model (M) visibilities.
 *
 * Every iteration performs two alternating updates in which each antenna
 * gain is the least squares solution with all other gains fixed:
 * G_p = (sum_q V_pq Z_pq^H) (sum_q Z_pq Z_pq^H)^-1 with Z_pq = M_pq G_q^H.
 * All antennas are updated from the gains of the previous update. When the
 * relative change between the two updates exceeds the tolerance, the gains
 * are averaged with those of the first update. This removes the oscillation
 * of the overall gain amplitude between consecutive updates.
 *
 * Diagonal gains use the diagonal of the same normal equations, i.e. each
 * polarization is solved as a scalar. An antenna whose normal matrix is
 * singular, e.g. because it has no terms, keeps its previous gain.
 */
class GainSolver {
 public:
  struct SolveResult {
    std::vector<common::JonesMatrix> gains;
    bool converged = false;
    size_t iterations = 0;
  };

  GainSolver(size_t n_antennas, GainType type, const SolverSettings& settings);

  /// Adds the visibilities of baseline (antenna1, antenna2). Self-baselines
  /// are not allowed.
  void AddTerm(size_t antenna1, size_t antenna2,
               const common::JonesMatrix& observed,
               const common::JonesMatrix& model);

  size_t NTerms() const { return n_terms_; }

  /// Starts from identity gains.
  SolveResult Solve() const;

 private:
  /// A baseline as seen from one of its antennas.
  struct Term {
    size_t other_antenna;
    common::JonesMatrix observed;
    common::JonesMatrix model;
  };

  void Update(std::vector<common::JonesMatrix>& gains) const;

  GainType type_;
  SolverSettings settings_;
  size_t n_terms_ = 0;
  /// For every antenna the baselines it takes part in.
  std::vector<std::vector<Term>> terms_;
};

}  // namespace selfcal::calibration

#endif  // SELFCAL_CALIBRATION_GAIN_SOLVER_H_
