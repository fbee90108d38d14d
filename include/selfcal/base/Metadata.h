// Metadata.h: Description of the antennas, baselines, channels and times of an
// observation.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

/// @file
/// @brief Description of the antennas, baselines, channels and times of an
/// observation.

#ifndef SELFCAL_BASE_METADATA_H_
#define SELFCAL_BASE_METADATA_H_

#include <array>
#include <memory>
#include <string>
#include <vector>

#include <xtensor/xtensor.hpp>

#include "Baseline.h"
#include "Direction.h"

namespace selfcal::base {

class Beam;

struct Antenna {
  std::string name;
  /// ITRF position in metres.
  std::array<double, 3> position;
};

/// @brief Description of the antennas, baselines, channels and times of an
/// observation.

/// A Metadata object is immutable once constructed. The Datasets of one
/// invocation share it through a std::shared_ptr<const Metadata>.
class Metadata {
 public:
  /**
   * @param antennas Antenna names and positions.
   * @param baselines Antenna index pairs, self-baselines included. The order
   * defines the baseline index of a Dataset.
   * @param channel_frequencies Channel centre frequencies in Hz.
   * @param times Time stamps in MJD seconds.
   * @param uvw Baseline coordinates in metres, shape
   * {n_times, n_baselines, 3}.
   * @param phase_centre Phase centre in radians.
   * @param beam Beam model of the antennas, may not be null.
   * @throw std::invalid_argument When the sizes do not match.
   */
  Metadata(std::vector<Antenna> antennas, std::vector<Baseline> baselines,
           std::vector<double> channel_frequencies, std::vector<double> times,
           xt::xtensor<double, 3> uvw, const Direction& phase_centre,
           std::shared_ptr<const Beam> beam);

  size_t NAntennas() const { return antennas_.size(); }
  size_t NBaselines() const { return baselines_.size(); }
  size_t NChannels() const { return channel_frequencies_.size(); }
  size_t NTimes() const { return times_.size(); }

  const std::vector<Antenna>& Antennas() const { return antennas_; }
  const std::vector<Baseline>& Baselines() const { return baselines_; }
  const Baseline& GetBaseline(size_t index) const { return baselines_[index]; }
  const std::vector<double>& ChannelFrequencies() const {
    return channel_frequencies_;
  }
  /// Wavelength of a channel in metres.
  double Wavelength(size_t channel) const;
  const std::vector<double>& Times() const { return times_; }

  const xt::xtensor<double, 3>& Uvw() const { return uvw_; }
  std::array<double, 3> Uvw(size_t time, size_t baseline) const {
    return {uvw_(time, baseline, 0), uvw_(time, baseline, 1),
            uvw_(time, baseline, 2)};
  }

  const Direction& PhaseCentre() const { return phase_centre_; }
  const Beam& GetBeam() const { return *beam_; }
  const std::shared_ptr<const Beam>& BeamPtr() const { return beam_; }

  /// Copy with only the given channels, in the given order.
  /// @throw std::invalid_argument When a channel index is out of range.
  Metadata SelectChannels(const std::vector<size_t>& channels) const;

 private:
  std::vector<Antenna> antennas_;
  std::vector<Baseline> baselines_;
  std::vector<double> channel_frequencies_;
  std::vector<double> times_;
  xt::xtensor<double, 3> uvw_;
  Direction phase_centre_;
  std::shared_ptr<const Beam> beam_;
};

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_METADATA_H_
