// GaussianSource.cc: Gaussian source model component.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "GaussianSource.h"

#include "ModelComponentVisitor.h"

namespace selfcal::base {

GaussianSource::GaussianSource(const std::string& name,
                               const Direction& direction,
                               const Stokes& stokes, double major_axis,
                               double minor_axis, double position_angle)
    : PointSource(name, direction, stokes),
      major_axis_(major_axis),
      minor_axis_(minor_axis),
      position_angle_(position_angle) {}

void GaussianSource::Accept(ModelComponentVisitor& visitor) const {
  visitor.Visit(*this);
}

}  // namespace selfcal::base
