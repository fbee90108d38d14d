// Calibration.cc: Per channel and antenna gain solutions.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "Calibration.h"

#include <algorithm>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>

#include <aocommon/dynamicfor.h>

using selfcal::base::Baseline;
using selfcal::base::Dataset;
using selfcal::base::Polarization;
using selfcal::common::JonesMatrix;

namespace selfcal::calibration {

namespace {

void CheckFits(const Calibration& calibration, const Dataset& dataset) {
  if (calibration.NAntennas() != dataset.GetMetadata().NAntennas()) {
    throw std::invalid_argument(
        "Calibration has " + std::to_string(calibration.NAntennas()) +
        " antennas, but the data has " +
        std::to_string(dataset.GetMetadata().NAntennas()));
  }
  if (calibration.NChannels() != 1 &&
      calibration.NChannels() != dataset.NChannels()) {
    throw std::invalid_argument(
        "Calibration has " + std::to_string(calibration.NChannels()) +
        " channels, but the data has " + std::to_string(dataset.NChannels()));
  }
}

/// The gains of one channel as they are applied to @p dataset.
std::vector<JonesMatrix> ChannelGains(const Calibration& calibration,
                                      size_t channel, const Dataset& dataset) {
  const bool full = dataset.GetPolarization() == Polarization::kFull;
  std::vector<JonesMatrix> gains(calibration.NAntennas());
  for (size_t antenna = 0; antenna != gains.size(); ++antenna) {
    const JonesMatrix gain = calibration.GetJones(channel, antenna);
    gains[antenna] = full ? gain : JonesMatrix(common::Diagonal(gain));
  }
  return gains;
}

}  // namespace

std::string ToString(GainType type) {
  switch (type) {
    case GainType::kDiagonal:
      return "diagonal";
    case GainType::kFullJones:
      return "fulljones";
  }
  return "invalid gain type";
}

GainType StringToGainType(const std::string& name) {
  const std::string lowercase = boost::to_lower_copy(name);
  if (lowercase == "diagonal")
    return GainType::kDiagonal;
  else if (lowercase == "fulljones")
    return GainType::kFullJones;
  else
    throw std::runtime_error("Unknown gain type: " + name);
}

size_t NGainPolarizations(GainType type) {
  return type == GainType::kDiagonal ? 2 : 4;
}

Calibration::Calibration(size_t n_channels, size_t n_antennas, GainType type)
    : type_(type),
      gains_({n_channels, n_antennas, NGainPolarizations(type)}),
      converged_(n_channels, 0) {
  for (size_t channel = 0; channel != n_channels; ++channel) {
    for (size_t antenna = 0; antenna != n_antennas; ++antenna) {
      SetJones(channel, antenna, JonesMatrix::Identity());
    }
  }
}

JonesMatrix Calibration::GetJones(size_t channel, size_t antenna) const {
  if (type_ == GainType::kDiagonal) {
    return JonesMatrix(gains_(channel, antenna, 0), 0.0, 0.0,
                       gains_(channel, antenna, 1));
  } else {
    return JonesMatrix(gains_(channel, antenna, 0), gains_(channel, antenna, 1),
                       gains_(channel, antenna, 2), gains_(channel, antenna, 3));
  }
}

void Calibration::SetJones(size_t channel, size_t antenna,
                           const JonesMatrix& gain) {
  if (type_ == GainType::kDiagonal) {
    gains_(channel, antenna, 0) = gain.Xx();
    gains_(channel, antenna, 1) = gain.Yy();
  } else {
    gains_(channel, antenna, 0) = gain.Xx();
    gains_(channel, antenna, 1) = gain.Xy();
    gains_(channel, antenna, 2) = gain.Yx();
    gains_(channel, antenna, 3) = gain.Yy();
  }
}

size_t Calibration::NConverged() const {
  return std::count(converged_.begin(), converged_.end(), 1);
}

size_t Calibration::SolutionChannel(size_t data_channel) const {
  if (NChannels() == 1) return 0;
  if (data_channel >= NChannels()) {
    throw std::invalid_argument("No solution for channel " +
                                std::to_string(data_channel) + " in a " +
                                std::to_string(NChannels()) +
                                "-channel calibration");
  }
  return data_channel;
}

void Corrupt(const Calibration& calibration, Dataset& dataset) {
  CheckFits(calibration, dataset);
  aocommon::DynamicFor<size_t> loop;
  loop.Run(0, dataset.NChannels(), [&](size_t channel) {
    const std::vector<JonesMatrix> gains = ChannelGains(
        calibration, calibration.SolutionChannel(channel), dataset);
    for (size_t baseline = 0; baseline != dataset.NBaselines(); ++baseline) {
      const Baseline& b = dataset.GetMetadata().GetBaseline(baseline);
      const JonesMatrix& g1 = gains[b.antenna1];
      const JonesMatrix g2_h = gains[b.antenna2].HermitianTranspose();
      for (size_t time = 0; time != dataset.NTimes(); ++time) {
        dataset.SetJones(channel, baseline, time,
                         g1 * dataset.GetJones(channel, baseline, time) * g2_h);
      }
    }
  });
}

void Correct(const Calibration& calibration, Dataset& dataset) {
  CheckFits(calibration, dataset);
  aocommon::DynamicFor<size_t> loop;
  loop.Run(0, dataset.NChannels(), [&](size_t channel) {
    const size_t solution_channel = calibration.SolutionChannel(channel);
    const bool converged = calibration.IsConverged(solution_channel);
    std::vector<JonesMatrix> inverses =
        ChannelGains(calibration, solution_channel, dataset);
    std::vector<bool> invertible(inverses.size());
    for (size_t antenna = 0; antenna != inverses.size(); ++antenna) {
      invertible[antenna] = inverses[antenna].Invert();
    }

    for (size_t baseline = 0; baseline != dataset.NBaselines(); ++baseline) {
      const Baseline& b = dataset.GetMetadata().GetBaseline(baseline);
      const bool flagged =
          !converged || !invertible[b.antenna1] || !invertible[b.antenna2];
      const JonesMatrix& g1_inv = inverses[b.antenna1];
      const JonesMatrix g2_inv_h = inverses[b.antenna2].HermitianTranspose();
      for (size_t time = 0; time != dataset.NTimes(); ++time) {
        if (flagged) {
          dataset.SetJones(channel, baseline, time, JonesMatrix::Zero());
        } else {
          dataset.SetJones(
              channel, baseline, time,
              g1_inv * dataset.GetJones(channel, baseline, time) * g2_inv_h);
        }
      }
    }
  });
}

}  // namespace selfcal::calibration
