// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_CALIBRATION_TEST_UNIT_FIXTURES_FCALIBRATION_H_
#define SELFCAL_CALIBRATION_TEST_UNIT_FIXTURES_FCALIBRATION_H_

#include <memory>
#include <random>

#include <selfcal/base/Dataset.h>

#include "../../../Calibration.h"

namespace selfcal::calibration::test {

/// Gains I + amplitude * E, with E uniform in [-0.5, 0.5] for the real and
/// imaginary part of every element. All channels are marked converged.
inline Calibration RandomCalibration(size_t n_channels, size_t n_antennas,
                                     GainType type, unsigned int seed,
                                     double amplitude = 0.3) {
  std::mt19937 rng(seed);
  const common::JonesMatrix centre(std::complex<double>(0.5, 0.5),
                                   std::complex<double>(0.5, 0.5),
                                   std::complex<double>(0.5, 0.5),
                                   std::complex<double>(0.5, 0.5));
  Calibration calibration(n_channels, n_antennas, type);
  for (size_t channel = 0; channel != n_channels; ++channel) {
    for (size_t antenna = 0; antenna != n_antennas; ++antenna) {
      const common::JonesMatrix error =
          common::JonesMatrix::Random(rng) - centre;
      calibration.SetJones(channel, antenna,
                           common::JonesMatrix::Identity() + amplitude * error);
    }
    calibration.SetConverged(channel, true);
  }
  return calibration;
}

/// Dataset with random visibilities in every cell, self-baselines included.
inline base::Dataset RandomModel(
    const std::shared_ptr<const base::Metadata>& metadata,
    base::Polarization polarization, unsigned int seed) {
  std::mt19937 rng(seed);
  base::Dataset model(metadata, polarization);
  for (size_t channel = 0; channel != model.NChannels(); ++channel) {
    for (size_t baseline = 0; baseline != model.NBaselines(); ++baseline) {
      for (size_t time = 0; time != model.NTimes(); ++time) {
        model.SetJones(channel, baseline, time,
                       common::JonesMatrix::Random(rng));
      }
    }
  }
  return model;
}

/// Copy of @p model with the gains of @p calibration applied.
inline base::Dataset Corrupted(const Calibration& calibration,
                               const base::Dataset& model) {
  base::Dataset result = model;
  Corrupt(calibration, result);
  return result;
}

/// |a - b| / |b| over all cells.
inline double RelativeDifference(const base::Dataset& a,
                                 const base::Dataset& b) {
  base::Dataset difference = a;
  difference.Subtract(b);
  return difference.Norm() / b.Norm();
}

}  // namespace selfcal::calibration::test

#endif  // SELFCAL_CALIBRATION_TEST_UNIT_FIXTURES_FCALIBRATION_H_
