// ModelComponentVisitor.cc: Base class for visitors that visit model component
// hierarchies.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ModelComponentVisitor.h"

#include "Patch.h"

namespace selfcal::base {

void ModelComponentVisitor::Visit(const Patch& patch) {
  for (const ModelComponent::ConstPtr& component : patch) {
    component->Accept(*this);
  }
}

}  // namespace selfcal::base
