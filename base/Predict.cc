// Predict.cc: Computes model visibilities of sky model components.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "Predict.h"

#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>

#include <aocommon/dynamicfor.h>

#include "Beam.h"
#include "GaussianSource.h"
#include "PointSource.h"

using selfcal::common::HermitianJonesMatrix;
using selfcal::common::JonesMatrix;

namespace selfcal::base {

Predictor::Predictor(Dataset& dataset) : dataset_(dataset) {
  if (dataset.GetPolarization() != Polarization::kFull) {
    throw std::invalid_argument(
        "Visibilities can only be predicted into a full polarization dataset");
  }
}

void Predictor::Visit(const PointSource& component) {
  AddComponent(component, 0.0, 0.0, 0.0);
}

void Predictor::Visit(const GaussianSource& component) {
  // Take care of the conversion of axis lengths from FWHM in radians to
  // sigma.
  const double fwhm2sigma = 1.0 / (2.0 * std::sqrt(2.0 * std::log(2.0)));
  AddComponent(component, component.GetMajorAxis() * fwhm2sigma,
               component.GetMinorAxis() * fwhm2sigma,
               component.GetPositionAngle());
}

void Predictor::AddComponent(const PointSource& component, double sigma_major,
                             double sigma_minor, double position_angle) {
  const Metadata& metadata = dataset_.GetMetadata();
  const std::array<double, 3> lmn =
      RaDecToLmn(metadata.PhaseCentre(), component.GetDirection());
  const double l = lmn[0];
  const double m = lmn[1];
  const double n = lmn[2];
  if (n <= 0.0) return;

  const double elevation = std::asin(std::min(n, 1.0));
  const double azimuth = std::atan2(l, m);
  const bool is_gaussian = sigma_major != 0.0 || sigma_minor != 0.0;

  // Convert position angle from North over East to the angle used to
  // rotate the right-handed UV-plane.
  const double phi = M_PI_2 + position_angle + M_PI;
  const double cos_phi = std::cos(phi);
  const double sin_phi = std::sin(phi);

  aocommon::DynamicFor<size_t> loop;
  loop.Run(0, dataset_.NChannels(), [&](size_t channel) {
    const double frequency = metadata.ChannelFrequencies()[channel];
    const double wavelength = metadata.Wavelength(channel);
    const JonesMatrix beam =
        metadata.GetBeam().Evaluate(frequency, azimuth, elevation);
    const JonesMatrix flux(common::CongruenceTransform(
        beam, component.GetStokes(frequency).Linear()));

    for (size_t time = 0; time != dataset_.NTimes(); ++time) {
      for (size_t baseline = 0; baseline != dataset_.NBaselines();
           ++baseline) {
        JonesMatrix& cell = dataset_.Full(channel, baseline, time);
        if (metadata.GetBaseline(baseline).IsAutoCorrelation()) {
          cell += flux;
          continue;
        }
        const std::array<double, 3> uvw = metadata.Uvw(time, baseline);
        const double u = uvw[0] / wavelength;
        const double v = uvw[1] / wavelength;
        const double w = uvw[2] / wavelength;
        const double phase =
            -2.0 * M_PI * (u * l + v * m + w * (n - 1.0));
        std::complex<double> fringe = std::polar(1.0, phase);
        if (is_gaussian) {
          // Rotate (u, v) by the position angle and scale with the major
          // and minor axis lengths.
          const double u_prime = sigma_major * (u * cos_phi - v * sin_phi);
          const double v_prime = sigma_minor * (u * sin_phi + v * cos_phi);
          fringe *= std::exp(-2.0 * M_PI * M_PI *
                             (u_prime * u_prime + v_prime * v_prime));
        }
        cell += flux * fringe;
      }
    }
  });
}

Dataset Predict(const std::shared_ptr<const Metadata>& metadata,
                const ModelComponent& source, Polarization polarization) {
  Dataset model(metadata, Polarization::kFull);
  Predictor predictor(model);
  source.Accept(predictor);
  if (polarization == Polarization::kFull) return model;

  Dataset result(metadata, polarization);
  for (size_t channel = 0; channel != model.NChannels(); ++channel) {
    for (size_t baseline = 0; baseline != model.NBaselines(); ++baseline) {
      for (size_t time = 0; time != model.NTimes(); ++time) {
        result.SetJones(channel, baseline, time,
                        model.Full(channel, baseline, time));
      }
    }
  }
  return result;
}

Dataset Predict(const std::shared_ptr<const Metadata>& metadata,
                const std::vector<ModelComponent::ConstPtr>& sources,
                Polarization polarization) {
  Dataset model(metadata, polarization);
  for (const ModelComponent::ConstPtr& source : sources) {
    model.Add(Predict(metadata, *source, polarization));
  }
  return model;
}

}  // namespace selfcal::base
