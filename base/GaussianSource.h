// GaussianSource.h: Gaussian source model component.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_GAUSSIANSOURCE_H_
#define SELFCAL_BASE_GAUSSIANSOURCE_H_

#include "PointSource.h"

namespace selfcal::base {

/// \brief Gaussian source model component.
class GaussianSource : public PointSource {
 public:
  typedef std::shared_ptr<GaussianSource> Ptr;
  typedef std::shared_ptr<const GaussianSource> ConstPtr;

  /**
   * @param major_axis Major axis FWHM in radians.
   * @param minor_axis Minor axis FWHM in radians.
   * @param position_angle The smallest angle between the major axis and
   * North, measured positively North over East, in radians.
   */
  GaussianSource(const std::string& name, const Direction& direction,
                 const Stokes& stokes, double major_axis, double minor_axis,
                 double position_angle);

  double GetMajorAxis() const { return major_axis_; }
  double GetMinorAxis() const { return minor_axis_; }
  double GetPositionAngle() const { return position_angle_; }

  void Accept(ModelComponentVisitor& visitor) const override;

 private:
  double major_axis_;
  double minor_axis_;
  double position_angle_;
};

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_GAUSSIANSOURCE_H_
