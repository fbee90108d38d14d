// Metadata.cc: Description of the antennas, baselines, channels and times of
// an observation.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include <selfcal/base/Metadata.h>

#include <stdexcept>
#include <utility>

#include <casacore/casa/BasicSL/Constants.h>

#include "Beam.h"

namespace selfcal::base {

Metadata::Metadata(std::vector<Antenna> antennas,
                   std::vector<Baseline> baselines,
                   std::vector<double> channel_frequencies,
                   std::vector<double> times, xt::xtensor<double, 3> uvw,
                   const Direction& phase_centre,
                   std::shared_ptr<const Beam> beam)
    : antennas_(std::move(antennas)),
      baselines_(std::move(baselines)),
      channel_frequencies_(std::move(channel_frequencies)),
      times_(std::move(times)),
      uvw_(std::move(uvw)),
      phase_centre_(phase_centre),
      beam_(std::move(beam)) {
  if (!beam_) throw std::invalid_argument("Metadata requires a beam model");
  for (const Baseline& baseline : baselines_) {
    if (baseline.antenna1 >= antennas_.size() ||
        baseline.antenna2 >= antennas_.size()) {
      throw std::invalid_argument(
          "Baseline (" + std::to_string(baseline.antenna1) + ", " +
          std::to_string(baseline.antenna2) + ") refers to an antenna >= " +
          std::to_string(antennas_.size()));
    }
  }
  if (uvw_.shape(0) != times_.size() || uvw_.shape(1) != baselines_.size() ||
      uvw_.shape(2) != 3) {
    throw std::invalid_argument(
        "UVW shape does not match the number of times and baselines");
  }
}

double Metadata::Wavelength(size_t channel) const {
  return casacore::C::c / channel_frequencies_[channel];
}

Metadata Metadata::SelectChannels(const std::vector<size_t>& channels) const {
  std::vector<double> frequencies;
  frequencies.reserve(channels.size());
  for (size_t channel : channels) {
    if (channel >= channel_frequencies_.size()) {
      throw std::invalid_argument("Channel " + std::to_string(channel) +
                                  " does not exist, there are " +
                                  std::to_string(NChannels()) + " channels");
    }
    frequencies.push_back(channel_frequencies_[channel]);
  }
  return Metadata(antennas_, baselines_, std::move(frequencies), times_, uvw_,
                  phase_centre_, beam_);
}

}  // namespace selfcal::base
