// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_BEAM_H_
#define SELFCAL_BASE_BEAM_H_

#include <memory>
#include <string>

#include "../common/JonesMatrix.h"

namespace selfcal::base {

/// \brief Antenna primary beam model.
class Beam {
 public:
  virtual ~Beam() = default;

  /**
   * Response of an antenna towards a direction.
   * @param frequency Frequency in Hz.
   * @param azimuth Azimuth in radians.
   * @param elevation Elevation in radians.
   */
  virtual common::JonesMatrix Evaluate(double frequency, double azimuth,
                                       double elevation) const = 0;

  virtual std::string Name() const = 0;
};

/// Unit response in every direction.
class ConstantBeam final : public Beam {
 public:
  common::JonesMatrix Evaluate(double, double, double) const override {
    return common::JonesMatrix::Identity();
  }
  std::string Name() const override { return "constant"; }
};

/// Response sin(elevation)^power, identical for both polarizations. Zero
/// below the horizon.
class SineBeam final : public Beam {
 public:
  static constexpr double kDefaultPower = 1.6;

  explicit SineBeam(double power = kDefaultPower) : power_(power) {}

  common::JonesMatrix Evaluate(double frequency, double azimuth,
                               double elevation) const override;
  std::string Name() const override;

  double Power() const { return power_; }

 private:
  double power_;
};

/**
 * Creates a beam by name: "constant" or "sine". A numeric suffix to "sine"
 * sets the power, e.g. "sine2.0".
 * @throws std::invalid_argument for unknown names.
 */
std::shared_ptr<const Beam> MakeBeam(const std::string& name);

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_BEAM_H_
