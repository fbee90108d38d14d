// Patch.cc: A source made of several components that share their direction
// dependent effects.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "Patch.h"

#include <cmath>
#include <utility>

#include "ModelComponentVisitor.h"

namespace selfcal::base {

Patch::Patch(const std::string& name,
             std::vector<ModelComponent::ConstPtr> components)
    : ModelComponent(name), components_(std::move(components)) {
  ComputeDirection();
}

void Patch::ComputeDirection() {
  direction_ = Direction();

  if (!components_.empty()) {
    double x = 0.0, y = 0.0, z = 0.0;
    for (const ModelComponent::ConstPtr& component : components_) {
      const Direction& direction = component->GetDirection();
      const double cos_dec = std::cos(direction.dec);
      x += std::cos(direction.ra) * cos_dec;
      y += std::sin(direction.ra) * cos_dec;
      z += std::sin(direction.dec);
    }

    x /= components_.size();
    y /= components_.size();
    z /= components_.size();

    direction_.ra = std::atan2(y, x);
    direction_.dec = std::asin(z);
  }
}

void Patch::Accept(ModelComponentVisitor& visitor) const {
  visitor.Visit(*this);
}

}  // namespace selfcal::base
