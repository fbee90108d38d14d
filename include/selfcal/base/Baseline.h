// Baseline.h: Pair of antennas that together form a baseline (interferometer).
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

/// \file
/// \brief Pair of antennas that together form a baseline (interferometer).

#ifndef SELFCAL_BASE_BASELINE_H_
#define SELFCAL_BASE_BASELINE_H_

#include <cstddef>

namespace selfcal::base {

struct Baseline {
  constexpr Baseline() : antenna1(0), antenna2(0) {}
  constexpr Baseline(size_t _antenna1, size_t _antenna2)
      : antenna1(_antenna1), antenna2(_antenna2) {}

  /// A self-baseline measures the autocorrelation of one antenna.
  constexpr bool IsAutoCorrelation() const { return antenna1 == antenna2; }

  constexpr bool operator==(const Baseline& other) const {
    return antenna1 == other.antenna1 && antenna2 == other.antenna2;
  }

  size_t antenna1;
  size_t antenna2;
};

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_BASELINE_H_
