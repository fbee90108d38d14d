// Transform.cc: Conversion between measurement set style visibility arrays and
// Datasets.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "Transform.h"

#include <numeric>
#include <stdexcept>
#include <string>

using selfcal::common::DiagonalJonesMatrix;
using selfcal::common::JonesMatrix;

namespace selfcal::base {

namespace {

/// Row-major geometry of a visibility array.
struct ArrayShape {
  size_t n_times;
  size_t n_baselines;
  size_t n_channels;
  size_t n_correlations;

  size_t Index(size_t time, size_t baseline, size_t channel,
               size_t correlation) const {
    return ((time * n_baselines + baseline) * n_channels + channel) *
               n_correlations +
           correlation;
  }
};

std::string ShapeString(const xt::xarray<std::complex<double>>& array) {
  std::string result = "{";
  for (size_t i = 0; i != array.dimension(); ++i) {
    if (i != 0) result += ", ";
    result += std::to_string(array.shape(i));
  }
  return result + "}";
}

/// Validates the array against the metadata (with @p n_channels channels) and
/// the polarization.
ArrayShape GetShape(const xt::xarray<std::complex<double>>& array,
                    const Metadata& metadata, size_t n_channels,
                    Polarization polarization) {
  ArrayShape shape;
  if (array.dimension() == 3 && metadata.NTimes() == 1) {
    shape = ArrayShape{1, array.shape(0), array.shape(1), array.shape(2)};
  } else if (array.dimension() == 4) {
    shape = ArrayShape{array.shape(0), array.shape(1), array.shape(2),
                       array.shape(3)};
  } else {
    throw std::invalid_argument(
        "Visibility array of shape " + ShapeString(array) +
        " should have 3 (single time) or 4 dimensions, metadata has " +
        std::to_string(metadata.NTimes()) + " times");
  }

  if (shape.n_times != metadata.NTimes() ||
      shape.n_baselines != metadata.NBaselines() ||
      shape.n_channels != n_channels) {
    throw std::invalid_argument(
        "Visibility array of shape " + ShapeString(array) +
        " does not match the metadata: " + std::to_string(metadata.NTimes()) +
        " times, " + std::to_string(metadata.NBaselines()) + " baselines, " +
        std::to_string(n_channels) + " channels");
  }

  bool valid_correlations = false;
  switch (polarization) {
    case Polarization::kFull:
      valid_correlations = shape.n_correlations == 4;
      break;
    case Polarization::kDual:
      valid_correlations =
          shape.n_correlations == 2 || shape.n_correlations == 4;
      break;
    case Polarization::kXX:
    case Polarization::kYY:
      valid_correlations = shape.n_correlations >= 1;
      break;
  }
  if (!valid_correlations) {
    throw std::invalid_argument(
        "A visibility array with " + std::to_string(shape.n_correlations) +
        " correlations can not hold " + ToString(polarization) +
        " polarization");
  }
  return shape;
}

/// Index of the yy correlation for dual and yy polarizations.
size_t YyIndex(const ArrayShape& shape) { return shape.n_correlations - 1; }

void PackChannels(const xt::xarray<std::complex<double>>& array,
                  const ArrayShape& shape,
                  const std::vector<size_t>& channels, Dataset& dataset) {
  const std::complex<double>* data = array.data();
  const std::complex<double> zero(0.0, 0.0);
  for (size_t time = 0; time != shape.n_times; ++time) {
    for (size_t baseline = 0; baseline != shape.n_baselines; ++baseline) {
      for (size_t i = 0; i != channels.size(); ++i) {
        const size_t index = shape.Index(time, baseline, channels[i], 0);
        switch (dataset.GetPolarization()) {
          case Polarization::kFull:
            dataset.Full(i, baseline, time) =
                JonesMatrix(data[index], data[index + 1], data[index + 2],
                            data[index + 3]);
            break;
          case Polarization::kDual: {
            const std::complex<double> xx = data[index];
            const std::complex<double> yy = data[index + YyIndex(shape)];
            if (xx != zero || yy != zero)
              dataset.Dual(i, baseline, time) = DiagonalJonesMatrix(xx, yy);
          } break;
          case Polarization::kXX:
            dataset.Single(i, baseline, time) = data[index];
            break;
          case Polarization::kYY:
            dataset.Single(i, baseline, time) = data[index + YyIndex(shape)];
            break;
        }
      }
    }
  }
}

}  // namespace

Dataset Pack(const xt::xarray<std::complex<double>>& array,
             std::shared_ptr<const Metadata> metadata,
             Polarization polarization) {
  std::vector<size_t> channels(metadata->NChannels());
  std::iota(channels.begin(), channels.end(), 0);
  const ArrayShape shape =
      GetShape(array, *metadata, metadata->NChannels(), polarization);
  Dataset dataset(std::move(metadata), polarization);
  PackChannels(array, shape, channels, dataset);
  return dataset;
}

Dataset Pack(const xt::xarray<std::complex<double>>& array,
             const std::shared_ptr<const Metadata>& metadata,
             const std::vector<size_t>& channels, Polarization polarization) {
  const ArrayShape shape =
      GetShape(array, *metadata, metadata->NChannels(), polarization);
  auto selection =
      std::make_shared<const Metadata>(metadata->SelectChannels(channels));
  Dataset dataset(std::move(selection), polarization);
  PackChannels(array, shape, channels, dataset);
  return dataset;
}

xt::xarray<std::complex<double>> Unpack(const Dataset& dataset) {
  const size_t n_correlations = NCorrelations(dataset.GetPolarization());
  std::vector<size_t> shape;
  if (dataset.NTimes() != 1) shape.push_back(dataset.NTimes());
  shape.push_back(dataset.NBaselines());
  shape.push_back(dataset.NChannels());
  shape.push_back(n_correlations);
  auto array = xt::xarray<std::complex<double>>::from_shape(shape);
  array.fill(std::complex<double>(0.0, 0.0));
  UnpackInto(dataset, array);
  return array;
}

void UnpackInto(const Dataset& dataset,
                xt::xarray<std::complex<double>>& array) {
  const ArrayShape shape =
      GetShape(array, dataset.GetMetadata(), dataset.NChannels(),
               dataset.GetPolarization());
  std::complex<double>* data = array.data();
  for (size_t time = 0; time != shape.n_times; ++time) {
    for (size_t baseline = 0; baseline != shape.n_baselines; ++baseline) {
      for (size_t channel = 0; channel != shape.n_channels; ++channel) {
        const size_t index = shape.Index(time, baseline, channel, 0);
        switch (dataset.GetPolarization()) {
          case Polarization::kFull: {
            const JonesMatrix& cell = dataset.Full(channel, baseline, time);
            data[index] = cell.Xx();
            data[index + 1] = cell.Xy();
            data[index + 2] = cell.Yx();
            data[index + 3] = cell.Yy();
          } break;
          case Polarization::kDual: {
            const DiagonalJonesMatrix& cell =
                dataset.Dual(channel, baseline, time);
            data[index] = cell.Xx();
            data[index + YyIndex(shape)] = cell.Yy();
          } break;
          case Polarization::kXX:
            data[index] = dataset.Single(channel, baseline, time);
            break;
          case Polarization::kYY:
            data[index + YyIndex(shape)] =
                dataset.Single(channel, baseline, time);
            break;
        }
      }
    }
  }
}

}  // namespace selfcal::base
