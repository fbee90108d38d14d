// PointSource.h: Point source model component with an optional spectrum.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_POINTSOURCE_H_
#define SELFCAL_BASE_POINTSOURCE_H_

#include <memory>
#include <string>
#include <vector>

#include "ModelComponent.h"
#include "Stokes.h"

namespace selfcal::base {

/// \brief Point source model component with an optional spectrum.
class PointSource : public ModelComponent {
 public:
  typedef std::shared_ptr<PointSource> Ptr;
  typedef std::shared_ptr<const PointSource> ConstPtr;

  PointSource(const std::string& name, const Direction& position,
              const Stokes& stokes);

  const Direction& GetDirection() const override { return direction_; }
  void SetDirection(const Direction& direction) { direction_ = direction; }

  /**
   * Sets a logarithmic spectrum:
   * S(v) = S(v0) * exp(c0 ln(v/v0) + c1 ln(v/v0)^2 + ...),
   * applied to all Stokes parameters.
   * @param reference_frequency v0 in Hz.
   * @param terms c0, c1, ...
   */
  void SetSpectralTerms(double reference_frequency, std::vector<double> terms);

  double ReferenceFrequency() const { return reference_frequency_; }
  const std::vector<double>& SpectralTerms() const { return spectral_terms_; }

  /// Flux at the given frequency in Hz.
  Stokes GetStokes(double frequency) const;

  void Accept(ModelComponentVisitor& visitor) const override;

 private:
  Direction direction_;
  Stokes stokes_;
  double reference_frequency_;
  std::vector<double> spectral_terms_;
};

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_POINTSOURCE_H_
