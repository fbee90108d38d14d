// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "Beam.h"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace selfcal::base {

common::JonesMatrix SineBeam::Evaluate(double, double,
                                       double elevation) const {
  if (elevation <= 0.0) return common::JonesMatrix::Zero();
  const double response = std::pow(std::sin(elevation), power_);
  return common::JonesMatrix(response, 0.0, 0.0, response);
}

std::string SineBeam::Name() const {
  return "sine" + std::to_string(power_);
}

std::shared_ptr<const Beam> MakeBeam(const std::string& name) {
  const std::string lowercase = boost::to_lower_copy(name);
  if (lowercase == "constant") return std::make_shared<ConstantBeam>();
  if (boost::algorithm::starts_with(lowercase, "sine")) {
    const std::string suffix = lowercase.substr(4);
    if (suffix.empty()) return std::make_shared<SineBeam>();
    char* end = nullptr;
    const double power = std::strtod(suffix.c_str(), &end);
    if (end != suffix.c_str() && *end == '\0' && power >= 0.0)
      return std::make_shared<SineBeam>(power);
  }
  throw std::invalid_argument("Unknown beam model: " + name +
                              ". Please use constant or sine[power]");
}

}  // namespace selfcal::base
