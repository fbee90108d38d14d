// Stokes.h: Stokes vector.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_STOKES_H_
#define SELFCAL_BASE_STOKES_H_

#include "../common/JonesMatrix.h"

namespace selfcal::base {

/// \brief Stokes vector in Jy.
class Stokes {
 public:
  Stokes();
  Stokes(double i, double q, double u, double v);

  /// Flux as seen by linearly polarized (x, y) feeds:
  /// @code
  ///   [ I + Q    U + iV ]
  ///   [ U - iV   I - Q  ]
  /// @endcode
  common::HermitianJonesMatrix Linear() const;

  Stokes& operator*=(double factor);

  double I, Q, U, V;
};

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_STOKES_H_
