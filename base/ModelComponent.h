// ModelComponent.h: Base class for model components.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_MODELCOMPONENT_H_
#define SELFCAL_BASE_MODELCOMPONENT_H_

#include <memory>
#include <string>

#include <selfcal/base/Direction.h>

namespace selfcal::base {

class ModelComponentVisitor;

/// \brief Base class for model components.
class ModelComponent {
 public:
  typedef std::shared_ptr<ModelComponent> Ptr;
  typedef std::shared_ptr<const ModelComponent> ConstPtr;

  explicit ModelComponent(const std::string& name) : name_(name) {}
  virtual ~ModelComponent() = default;

  const std::string& Name() const { return name_; }
  virtual const Direction& GetDirection() const = 0;
  virtual void Accept(ModelComponentVisitor& visitor) const = 0;

 private:
  std::string name_;
};

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_MODELCOMPONENT_H_
