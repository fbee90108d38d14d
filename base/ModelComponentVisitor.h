// ModelComponentVisitor.h: Base class for visitors that visit model component
// hierarchies.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_MODELCOMPONENTVISITOR_H_
#define SELFCAL_BASE_MODELCOMPONENTVISITOR_H_

namespace selfcal::base {

class PointSource;
class GaussianSource;
class Patch;

/// \brief Base class for visitors that visit model component hierarchies.
class ModelComponentVisitor {
 public:
  virtual ~ModelComponentVisitor() = default;

  virtual void Visit(const PointSource&) = 0;
  virtual void Visit(const GaussianSource&) = 0;
  /// Visits every component of the patch by default.
  virtual void Visit(const Patch& patch);
};

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_MODELCOMPONENTVISITOR_H_
