// GainSolver.cc: StefCal solver for the gains of one solution interval.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "GainSolver.h"

#include <cmath>
#include <stdexcept>
#include <string>

using selfcal::common::JonesMatrix;

namespace selfcal::calibration {

GainSolver::GainSolver(size_t n_antennas, GainType type,
                       const SolverSettings& settings)
    : type_(type), settings_(settings), terms_(n_antennas) {}

void GainSolver::AddTerm(size_t antenna1, size_t antenna2,
                         const JonesMatrix& observed, const JonesMatrix& model) {
  if (antenna1 >= terms_.size() || antenna2 >= terms_.size() ||
      antenna1 == antenna2) {
    throw std::invalid_argument("Invalid solver baseline " +
                                std::to_string(antenna1) + "-" +
                                std::to_string(antenna2));
  }
  // V_qp = V_pq^H, so the term can be used for both antennas.
  terms_[antenna1].push_back(Term{antenna2, observed, model});
  terms_[antenna2].push_back(Term{antenna1, observed.HermitianTranspose(),
                                  model.HermitianTranspose()});
  ++n_terms_;
}

void GainSolver::Update(std::vector<JonesMatrix>& gains) const {
  const std::vector<JonesMatrix> previous = gains;
  for (size_t antenna = 0; antenna != terms_.size(); ++antenna) {
    JonesMatrix numerator = JonesMatrix::Zero();
    JonesMatrix normal = JonesMatrix::Zero();
    for (const Term& term : terms_[antenna]) {
      const JonesMatrix z =
          term.model * previous[term.other_antenna].HermitianTranspose();
      numerator += term.observed * z.HermitianTranspose();
      normal += z * z.HermitianTranspose();
    }

    if (type_ == GainType::kFullJones) {
      if (normal.Invert()) gains[antenna] = numerator * normal;
    } else {
      const std::complex<double> zero(0.0, 0.0);
      const std::complex<double> xx = normal.Xx() != zero
                                          ? numerator.Xx() / normal.Xx()
                                          : previous[antenna].Xx();
      const std::complex<double> yy = normal.Yy() != zero
                                          ? numerator.Yy() / normal.Yy()
                                          : previous[antenna].Yy();
      gains[antenna] = JonesMatrix(xx, 0.0, 0.0, yy);
    }
  }
}

GainSolver::SolveResult GainSolver::Solve() const {
  SolveResult result;
  result.gains.assign(terms_.size(), JonesMatrix::Identity());
  std::vector<JonesMatrix>& gains = result.gains;

  const double omega = 0.5;
  while (result.iterations < settings_.max_iterations) {
    ++result.iterations;
    Update(gains);
    const std::vector<JonesMatrix> previous = gains;
    Update(gains);

    double norm_difference = 0.0;
    double norm_gains = 0.0;
    for (size_t antenna = 0; antenna != gains.size(); ++antenna) {
      norm_difference += (gains[antenna] - previous[antenna]).Norm();
      norm_gains += gains[antenna].Norm();
    }
    const double dg = norm_gains > 0.0
                          ? std::sqrt(norm_difference / norm_gains)
                          : std::sqrt(norm_difference);
    if (dg <= settings_.tolerance) {
      result.converged = true;
      break;
    }
    for (size_t antenna = 0; antenna != gains.size(); ++antenna) {
      gains[antenna] =
          (1.0 - omega) * gains[antenna] + omega * previous[antenna];
    }
  }
  return result;
}

}  // namespace selfcal::calibration
