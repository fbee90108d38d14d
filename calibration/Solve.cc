// Solve.cc: Self-calibration of a dataset against a model.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "Solve.h"

#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

#include <aocommon/dynamicfor.h>
#include <aocommon/logger.h>

using selfcal::base::Baseline;
using selfcal::base::Dataset;
using selfcal::base::Metadata;

namespace selfcal::calibration {

namespace {

/// Adds the usable cells of one channel to the solver.
void AddChannel(const Dataset& observed, const Dataset& model,
                const FlagMask& flags, size_t channel, double min_uvw,
                GainSolver& solver) {
  const Metadata& metadata = observed.GetMetadata();
  const double wavelength = metadata.Wavelength(channel);
  for (size_t baseline = 0; baseline != observed.NBaselines(); ++baseline) {
    const Baseline& b = metadata.GetBaseline(baseline);
    if (b.IsAutoCorrelation()) continue;
    for (size_t time = 0; time != observed.NTimes(); ++time) {
      const std::array<double, 3> uvw = metadata.Uvw(time, baseline);
      const double length =
          std::sqrt(uvw[0] * uvw[0] + uvw[1] * uvw[1] + uvw[2] * uvw[2]);
      if (length / wavelength < min_uvw) continue;
      if (flags(channel, baseline, time) ||
          model.IsZero(channel, baseline, time))
        continue;
      solver.AddTerm(b.antenna1, b.antenna2,
                     observed.GetJones(channel, baseline, time),
                     model.GetJones(channel, baseline, time));
    }
  }
}

}  // namespace

FlagMask ZeroCells(const Dataset& data) {
  FlagMask flags({data.NChannels(), data.NBaselines(), data.NTimes()});
  for (size_t channel = 0; channel != data.NChannels(); ++channel) {
    for (size_t baseline = 0; baseline != data.NBaselines(); ++baseline) {
      for (size_t time = 0; time != data.NTimes(); ++time) {
        flags(channel, baseline, time) = data.IsZero(channel, baseline, time);
      }
    }
  }
  return flags;
}

Calibration Solve(const Dataset& observed, const Dataset& model,
                  GainType type, bool collapse_frequency,
                  const SolverSettings& settings) {
  return Solve(observed, model, ZeroCells(observed), type, collapse_frequency,
               settings);
}

Calibration Solve(const Dataset& observed, const Dataset& model,
                  const FlagMask& flags, GainType type,
                  bool collapse_frequency, const SolverSettings& settings) {
  if (observed.NChannels() != model.NChannels() ||
      observed.NBaselines() != model.NBaselines() ||
      observed.NTimes() != model.NTimes()) {
    throw std::invalid_argument(
        "Observed and model visibilities have different shapes");
  }
  if (observed.GetPolarization() != model.GetPolarization()) {
    throw std::invalid_argument(
        "Observed and model visibilities have different polarizations");
  }
  if (observed.GetMetadata().NAntennas() != model.GetMetadata().NAntennas()) {
    throw std::invalid_argument(
        "Observed and model visibilities have different numbers of antennas");
  }
  if (flags.shape(0) != observed.NChannels() ||
      flags.shape(1) != observed.NBaselines() ||
      flags.shape(2) != observed.NTimes()) {
    throw std::invalid_argument(
        "Flags do not have the shape of the visibilities");
  }

  const size_t n_antennas = observed.GetMetadata().NAntennas();
  const size_t n_solutions = collapse_frequency ? 1 : observed.NChannels();
  Calibration calibration(n_solutions, n_antennas, type);

  aocommon::DynamicFor<size_t> loop;
  loop.Run(0, n_solutions, [&](size_t solution) {
    GainSolver solver(n_antennas, type, settings);
    if (collapse_frequency) {
      for (size_t channel = 0; channel != observed.NChannels(); ++channel) {
        AddChannel(observed, model, flags, channel, settings.min_uvw,
                   solver);
      }
    } else {
      AddChannel(observed, model, flags, solution, settings.min_uvw, solver);
    }

    if (solver.NTerms() == 0) {
      aocommon::Logger::Debug << "No usable visibilities for solution "
                              << solution << '\n';
      return;
    }
    const GainSolver::SolveResult result = solver.Solve();
    for (size_t antenna = 0; antenna != n_antennas; ++antenna) {
      calibration.SetJones(solution, antenna, result.gains[antenna]);
    }
    calibration.SetConverged(solution, result.converged);
    aocommon::Logger::Debug << "Solution " << solution << ": "
                            << (result.converged ? "converged" : "stopped")
                            << " after " << result.iterations
                            << " iterations\n";
  });

  aocommon::Logger::Info << "Solved " << ToString(type) << " gains: "
                         << calibration.NConverged() << '/' << n_solutions
                         << " solutions converged\n";
  return calibration;
}

}  // namespace selfcal::calibration
