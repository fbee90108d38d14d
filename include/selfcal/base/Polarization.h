// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_POLARIZATION_H_
#define SELFCAL_BASE_POLARIZATION_H_

#include <cstddef>
#include <string>

namespace selfcal::base {

/// Which correlations a Dataset holds per cell.
enum class Polarization {
  /// xx, xy, yx and yy, stored as a JonesMatrix.
  kFull,
  /// xx and yy, stored as a DiagonalJonesMatrix.
  kDual,
  /// Only xx, stored as a complex scalar.
  kXX,
  /// Only yy, stored as a complex scalar.
  kYY
};

/// Parses "full", "dual", "xx" or "yy" (case insensitive).
/// @throws std::invalid_argument for other values.
Polarization StringToPolarization(const std::string& name);

std::string ToString(Polarization polarization);

/// Number of correlations a fresh unpacked array of this polarization has.
size_t NCorrelations(Polarization polarization);

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_POLARIZATION_H_
