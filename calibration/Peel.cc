// Peel.cc: Direction dependent calibration by peeling sources one by one.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "Peel.h"

#include <aocommon/logger.h>

#include "../base/Predict.h"
#include "Solve.h"

using selfcal::base::Dataset;
using selfcal::base::ModelComponent;

namespace selfcal::calibration {

namespace {

void ZeroFlagged(const FlagMask& flags, Dataset& data) {
  for (size_t channel = 0; channel != data.NChannels(); ++channel) {
    for (size_t baseline = 0; baseline != data.NBaselines(); ++baseline) {
      for (size_t time = 0; time != data.NTimes(); ++time) {
        if (flags(channel, baseline, time)) {
          data.SetJones(channel, baseline, time,
                        common::JonesMatrix::Zero());
        }
      }
    }
  }
}

}  // namespace

std::vector<Calibration> Peel(Dataset& residual,
                              const std::vector<Dataset>& models,
                              const PeelSettings& settings) {
  const GainType type = settings.full_polarization ? GainType::kFullJones
                                                   : GainType::kDiagonal;
  const size_t n_solutions =
      settings.collapse_frequency ? 1 : residual.NChannels();
  const size_t n_antennas = residual.GetMetadata().NAntennas();
  std::vector<Calibration> calibrations(
      models.size(), Calibration(n_solutions, n_antennas, type));

  // What was subtracted for each direction in the previous pass.
  std::vector<Dataset> corrupted;
  corrupted.reserve(models.size());
  for (const Dataset& model : models) {
    if (model.GetPolarization() != residual.GetPolarization()) {
      throw std::invalid_argument(
          "Model and residual visibilities have different polarizations");
    }
    corrupted.emplace_back(residual.MetadataPtr(), residual.GetPolarization());
  }

  // The residual loses its zeros after the first subtraction, so the flags
  // are taken from the data as given.
  const FlagMask flags = ZeroCells(residual);

  for (size_t pass = 0; pass != settings.peel_iterations; ++pass) {
    for (size_t direction = 0; direction != models.size(); ++direction) {
      aocommon::Logger::Info << "Peeling pass " << (pass + 1) << '/'
                             << settings.peel_iterations << ", direction "
                             << direction << '\n';
      if (pass > 0) residual.Add(corrupted[direction]);

      calibrations[direction] =
          Solve(residual, models[direction], flags, type,
                settings.collapse_frequency, settings.solver);

      corrupted[direction] = models[direction];
      Corrupt(calibrations[direction], corrupted[direction]);
      residual.Subtract(corrupted[direction]);
    }
  }
  ZeroFlagged(flags, residual);
  return calibrations;
}

std::vector<Calibration> Peel(
    Dataset& residual, const std::vector<ModelComponent::ConstPtr>& sources,
    const PeelSettings& settings) {
  std::vector<Dataset> models;
  models.reserve(sources.size());
  for (const ModelComponent::ConstPtr& source : sources) {
    models.push_back(base::Predict(residual.MetadataPtr(), *source,
                                   residual.GetPolarization()));
  }
  return Peel(residual, models, settings);
}

}  // namespace selfcal::calibration
