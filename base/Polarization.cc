// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include <selfcal/base/Polarization.h>

#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>

namespace selfcal::base {

Polarization StringToPolarization(const std::string& name) {
  const std::string lowercase = boost::to_lower_copy(name);
  if (lowercase == "full")
    return Polarization::kFull;
  else if (lowercase == "dual")
    return Polarization::kDual;
  else if (lowercase == "xx")
    return Polarization::kXX;
  else if (lowercase == "yy")
    return Polarization::kYY;
  else
    throw std::invalid_argument("Unknown polarization: " + name +
                                ". Please use one of full, dual, xx, yy");
}

std::string ToString(Polarization polarization) {
  switch (polarization) {
    case Polarization::kFull:
      return "full";
    case Polarization::kDual:
      return "dual";
    case Polarization::kXX:
      return "xx";
    case Polarization::kYY:
      return "yy";
  }
  return "invalid polarization";
}

size_t NCorrelations(Polarization polarization) {
  switch (polarization) {
    case Polarization::kFull:
      return 4;
    case Polarization::kDual:
      return 2;
    case Polarization::kXX:
    case Polarization::kYY:
      return 1;
  }
  throw std::invalid_argument("Invalid polarization");
}

}  // namespace selfcal::base
