// PointSource.cc: Point source model component with an optional spectrum.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "PointSource.h"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "ModelComponentVisitor.h"

namespace selfcal::base {

PointSource::PointSource(const std::string& name, const Direction& position,
                         const Stokes& stokes)
    : ModelComponent(name),
      direction_(position),
      stokes_(stokes),
      reference_frequency_(0.0) {}

void PointSource::SetSpectralTerms(double reference_frequency,
                                   std::vector<double> terms) {
  if (!terms.empty() && reference_frequency <= 0.0) {
    throw std::invalid_argument("Source " + Name() +
                                " has spectral terms but no valid reference "
                                "frequency");
  }
  reference_frequency_ = reference_frequency;
  spectral_terms_ = std::move(terms);
}

Stokes PointSource::GetStokes(double frequency) const {
  Stokes stokes(stokes_);
  if (!spectral_terms_.empty()) {
    // Compute c0 + c1 * x + c2 * x^2 + ... with Horner's rule, with
    // x = ln(v / v0). The exponent is x times that sum.
    const double base = std::log(frequency / reference_frequency_);
    double sum = 0.0;
    for (auto term = spectral_terms_.rbegin(); term != spectral_terms_.rend();
         ++term) {
      sum = sum * base + *term;
    }
    stokes *= std::exp(base * sum);
  }
  return stokes;
}

void PointSource::Accept(ModelComponentVisitor& visitor) const {
  visitor.Visit(*this);
}

}  // namespace selfcal::base
