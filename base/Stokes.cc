// Stokes.cc: Stokes vector.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "Stokes.h"

namespace selfcal::base {

Stokes::Stokes() : I(0.0), Q(0.0), U(0.0), V(0.0) {}

Stokes::Stokes(double i, double q, double u, double v)
    : I(i), Q(q), U(u), V(v) {}

common::HermitianJonesMatrix Stokes::Linear() const {
  return common::HermitianJonesMatrix(I + Q, std::complex<double>(U, V),
                                      I - Q);
}

Stokes& Stokes::operator*=(double factor) {
  I *= factor;
  Q *= factor;
  U *= factor;
  V *= factor;
  return *this;
}

}  // namespace selfcal::base
