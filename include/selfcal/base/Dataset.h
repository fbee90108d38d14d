// Dataset.h: Visibilities on a channel x baseline x time grid.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

/// @file
/// @brief Visibilities on a channel x baseline x time grid.

#ifndef SELFCAL_BASE_DATASET_H_
#define SELFCAL_BASE_DATASET_H_

#include <complex>
#include <memory>

#include <xtensor/xtensor.hpp>

#include "../../../common/JonesMatrix.h"
#include "Metadata.h"
#include "Polarization.h"

namespace selfcal::base {

/// @brief Visibilities on a channel x baseline x time grid.

/// The shape of a cell depends on the polarization of the dataset:
/// a JonesMatrix for kFull, a DiagonalJonesMatrix for kDual and a complex
/// scalar for kXX and kYY. Only the storage for that shape is allocated.
/// All cells start at zero.
///
/// The typed accessors (Full(), Dual(), Single()) throw std::invalid_argument
/// when called on a dataset of another polarization. GetJones() and SetJones()
/// work for every polarization, converting between the cell shape and a
/// general JonesMatrix.
class Dataset {
 public:
  using Complex = std::complex<double>;

  Dataset(std::shared_ptr<const Metadata> metadata, Polarization polarization);

  const Metadata& GetMetadata() const { return *metadata_; }
  const std::shared_ptr<const Metadata>& MetadataPtr() const {
    return metadata_;
  }
  Polarization GetPolarization() const { return polarization_; }

  size_t NChannels() const { return metadata_->NChannels(); }
  size_t NBaselines() const { return metadata_->NBaselines(); }
  size_t NTimes() const { return metadata_->NTimes(); }

  common::JonesMatrix& Full(size_t channel, size_t baseline, size_t time = 0);
  const common::JonesMatrix& Full(size_t channel, size_t baseline,
                                  size_t time = 0) const;

  common::DiagonalJonesMatrix& Dual(size_t channel, size_t baseline,
                                    size_t time = 0);
  const common::DiagonalJonesMatrix& Dual(size_t channel, size_t baseline,
                                          size_t time = 0) const;

  /// Cell of an XX or YY dataset.
  Complex& Single(size_t channel, size_t baseline, size_t time = 0);
  const Complex& Single(size_t channel, size_t baseline,
                        size_t time = 0) const;

  /// Any cell as a general matrix. An XX cell becomes diag(v, 0), a YY cell
  /// diag(0, v).
  common::JonesMatrix GetJones(size_t channel, size_t baseline,
                               size_t time = 0) const;

  /// Stores the part of @p value that the polarization can hold.
  void SetJones(size_t channel, size_t baseline, size_t time,
                const common::JonesMatrix& value);

  /// True when every correlation of the cell is zero.
  bool IsZero(size_t channel, size_t baseline, size_t time = 0) const;

  /// Adds another dataset cell by cell.
  /// @throw std::invalid_argument When the shape or polarization differs.
  void Add(const Dataset& other);
  /// Subtracts another dataset cell by cell.
  /// @throw std::invalid_argument When the shape or polarization differs.
  void Subtract(const Dataset& other);

  /// Frobenius norm over all cells.
  double Norm() const;

  void SetZero();

 private:
  void CheckPolarization(Polarization expected) const;
  void CheckCompatible(const Dataset& other) const;

  std::shared_ptr<const Metadata> metadata_;
  Polarization polarization_;
  /// Only one of these is allocated, each with shape
  /// {n_channels, n_baselines, n_times}.
  xt::xtensor<common::JonesMatrix, 3> full_;
  xt::xtensor<common::DiagonalJonesMatrix, 3> dual_;
  xt::xtensor<Complex, 3> single_;
};

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_DATASET_H_
