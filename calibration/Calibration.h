// Calibration.h: Per channel and antenna gain solutions.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_CALIBRATION_CALIBRATION_H_
#define SELFCAL_CALIBRATION_CALIBRATION_H_

#include <complex>
#include <cstdint>
#include <string>
#include <vector>

#include <xtensor/xtensor.hpp>

#include <selfcal/base/Dataset.h>

#include "../common/JonesMatrix.h"

namespace selfcal::calibration {

/// Diagonal gains solve xx and yy only, full Jones gains solve all four
/// elements and thereby also polarization leakage.
enum class GainType { kDiagonal, kFullJones };

std::string ToString(GainType type);
/// @throw std::runtime_error for names other than "diagonal" or "fulljones".
GainType StringToGainType(const std::string& name);
/// Number of complex values stored per gain: 2 or 4.
size_t NGainPolarizations(GainType type);

/**
 * Gain solutions with shape {n_channels, n_antennas}. Each gain is stored as
 * (xx, yy) for diagonal gains or (xx, xy, yx, yy) for full Jones gains.
 *
 * A calibration with a single channel is frequency collapsed and applies to
 * every data channel. A new calibration holds identity gains and has no
 * converged channels.
 */
class Calibration {
 public:
  Calibration(size_t n_channels, size_t n_antennas, GainType type);

  size_t NChannels() const { return gains_.shape(0); }
  size_t NAntennas() const { return gains_.shape(1); }
  GainType GetType() const { return type_; }

  common::JonesMatrix GetJones(size_t channel, size_t antenna) const;
  /// For diagonal gains, the off-diagonal elements of @p gain are dropped.
  void SetJones(size_t channel, size_t antenna, const common::JonesMatrix& gain);

  bool IsConverged(size_t channel) const { return converged_[channel] != 0; }
  void SetConverged(size_t channel, bool converged) {
    converged_[channel] = converged ? 1 : 0;
  }
  size_t NConverged() const;

  /// Returns the calibration channel that applies to a data channel.
  /// @throw std::invalid_argument When the calibration is neither collapsed
  /// nor has a channel @p data_channel.
  size_t SolutionChannel(size_t data_channel) const;

  /// Raw storage with shape {n_channels, n_antennas, n_polarizations}.
  const xt::xtensor<std::complex<double>, 3>& Gains() const { return gains_; }
  xt::xtensor<std::complex<double>, 3>& Gains() { return gains_; }

 private:
  GainType type_;
  xt::xtensor<std::complex<double>, 3> gains_;
  /// Flags are written concurrently per channel, so std::vector<bool> is not
  /// used.
  std::vector<uint8_t> converged_;
};

/**
 * Applies the gains to (model) visibilities: V_pq = G_p V_pq G_q^H.
 * Only the diagonal of the gains is used for datasets that are not kFull.
 * @throw std::invalid_argument When the calibration does not fit the dataset.
 */
void Corrupt(const Calibration& calibration, base::Dataset& dataset);

/**
 * Removes the gains from (observed) visibilities: V_pq = G_p^-1 V_pq G_q^-H.
 * Channels without a converged solution are flagged by zeroing them, as are
 * the baselines of antennas with a singular gain. Only the diagonal of the
 * gains is used for datasets that are not kFull.
 * @throw std::invalid_argument When the calibration does not fit the dataset.
 */
void Correct(const Calibration& calibration, base::Dataset& dataset);

}  // namespace selfcal::calibration

#endif  // SELFCAL_CALIBRATION_CALIBRATION_H_
