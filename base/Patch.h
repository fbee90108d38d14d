// Patch.h: A source made of several components that share their direction
// dependent effects.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_PATCH_H_
#define SELFCAL_BASE_PATCH_H_

#include <memory>
#include <string>
#include <vector>

#include "ModelComponent.h"

namespace selfcal::base {

/// \brief A source made of several components that share their direction
/// dependent effects.

/// Peeling treats a patch as one direction, its predicted visibilities are
/// the sum of those of its components.
class Patch : public ModelComponent {
 public:
  typedef std::vector<ModelComponent::ConstPtr>::const_iterator const_iterator;

  Patch(const std::string& name,
        std::vector<ModelComponent::ConstPtr> components);

  /// The average of the positions of the components.
  const Direction& GetDirection() const override { return direction_; }

  size_t NComponents() const { return components_.size(); }
  const ModelComponent::ConstPtr& Component(size_t i) const {
    return components_[i];
  }

  const_iterator begin() const { return components_.begin(); }
  const_iterator end() const { return components_.end(); }

  void Accept(ModelComponentVisitor& visitor) const override;

 private:
  void ComputeDirection();

  std::vector<ModelComponent::ConstPtr> components_;
  Direction direction_;
};

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_PATCH_H_
