// Predict.h: Computes model visibilities of sky model components.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_PREDICT_H_
#define SELFCAL_BASE_PREDICT_H_

#include <memory>
#include <vector>

#include <selfcal/base/Dataset.h>

#include "ModelComponent.h"
#include "ModelComponentVisitor.h"

namespace selfcal::base {

/**
 * Visitor that adds the visibilities of the components it visits to a
 * full polarization dataset.
 *
 * For a component in direction lmn relative to the phase centre the flux is
 * K = B K0 B^H, with B the beam of the metadata and K0 the linear flux of the
 * component. The beam is evaluated with the phase centre at zenith, i.e. at
 * elevation asin(n) and azimuth atan2(l, m). The visibility of baseline (p, q)
 * is K exp(-2 pi i (ul + vm + w(n-1)) / lambda), with uvw the coordinates of
 * the baseline as stored in the measurement set. Components with n <= 0 are
 * below the horizon and are skipped.
 */
class Predictor : public ModelComponentVisitor {
 public:
  /// @throw std::invalid_argument When the dataset is not kFull.
  explicit Predictor(Dataset& dataset);

  void Visit(const PointSource& component) override;
  void Visit(const GaussianSource& component) override;
  using ModelComponentVisitor::Visit;

 private:
  /// @param sigma_major Major axis standard deviation in radians, zero for a
  /// point source.
  void AddComponent(const PointSource& component, double sigma_major,
                    double sigma_minor, double position_angle);

  Dataset& dataset_;
};

/// Model visibilities of a single source (which may be a Patch). A kDual
/// request keeps the diagonal of the full model.
Dataset Predict(const std::shared_ptr<const Metadata>& metadata,
                const ModelComponent& source,
                Polarization polarization = Polarization::kFull);

/// Model visibilities of the sum of @p sources.
Dataset Predict(const std::shared_ptr<const Metadata>& metadata,
                const std::vector<ModelComponent::ConstPtr>& sources,
                Polarization polarization = Polarization::kFull);

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_PREDICT_H_
