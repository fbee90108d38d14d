// Dataset.cc: Visibilities on a channel x baseline x time grid.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include <selfcal/base/Dataset.h>

#include <cmath>
#include <stdexcept>
#include <utility>

using selfcal::common::DiagonalJonesMatrix;
using selfcal::common::JonesMatrix;

namespace selfcal::base {

Dataset::Dataset(std::shared_ptr<const Metadata> metadata,
                 Polarization polarization)
    : metadata_(std::move(metadata)), polarization_(polarization) {
  if (!metadata_) throw std::invalid_argument("Dataset requires metadata");
  const std::array<size_t, 3> shape{metadata_->NChannels(),
                                    metadata_->NBaselines(),
                                    metadata_->NTimes()};
  switch (polarization_) {
    case Polarization::kFull:
      full_ = xt::xtensor<JonesMatrix, 3>(shape, JonesMatrix::Zero());
      break;
    case Polarization::kDual:
      dual_ = xt::xtensor<DiagonalJonesMatrix, 3>(shape,
                                                   DiagonalJonesMatrix::Zero());
      break;
    case Polarization::kXX:
    case Polarization::kYY:
      single_ = xt::xtensor<Complex, 3>(shape, Complex(0.0, 0.0));
      break;
  }
}

void Dataset::CheckPolarization(Polarization expected) const {
  const bool matches =
      expected == polarization_ ||
      (expected == Polarization::kXX && polarization_ == Polarization::kYY);
  if (!matches) {
    throw std::invalid_argument("Requested a " + ToString(expected) +
                                " cell from a dataset with polarization " +
                                ToString(polarization_));
  }
}

void Dataset::CheckCompatible(const Dataset& other) const {
  if (other.polarization_ != polarization_ ||
      other.NChannels() != NChannels() || other.NBaselines() != NBaselines() ||
      other.NTimes() != NTimes()) {
    throw std::invalid_argument(
        "Datasets differ in shape or polarization: " + ToString(polarization_) +
        " " + std::to_string(NChannels()) + "x" + std::to_string(NBaselines()) +
        "x" + std::to_string(NTimes()) + " versus " +
        ToString(other.polarization_) + " " +
        std::to_string(other.NChannels()) + "x" +
        std::to_string(other.NBaselines()) + "x" +
        std::to_string(other.NTimes()));
  }
}

JonesMatrix& Dataset::Full(size_t channel, size_t baseline, size_t time) {
  CheckPolarization(Polarization::kFull);
  return full_(channel, baseline, time);
}

const JonesMatrix& Dataset::Full(size_t channel, size_t baseline,
                                 size_t time) const {
  CheckPolarization(Polarization::kFull);
  return full_(channel, baseline, time);
}

DiagonalJonesMatrix& Dataset::Dual(size_t channel, size_t baseline,
                                   size_t time) {
  CheckPolarization(Polarization::kDual);
  return dual_(channel, baseline, time);
}

const DiagonalJonesMatrix& Dataset::Dual(size_t channel, size_t baseline,
                                         size_t time) const {
  CheckPolarization(Polarization::kDual);
  return dual_(channel, baseline, time);
}

Dataset::Complex& Dataset::Single(size_t channel, size_t baseline,
                                  size_t time) {
  CheckPolarization(Polarization::kXX);
  return single_(channel, baseline, time);
}

const Dataset::Complex& Dataset::Single(size_t channel, size_t baseline,
                                        size_t time) const {
  CheckPolarization(Polarization::kXX);
  return single_(channel, baseline, time);
}

JonesMatrix Dataset::GetJones(size_t channel, size_t baseline,
                              size_t time) const {
  switch (polarization_) {
    case Polarization::kFull:
      return full_(channel, baseline, time);
    case Polarization::kDual:
      return JonesMatrix(dual_(channel, baseline, time));
    case Polarization::kXX:
      return JonesMatrix(single_(channel, baseline, time), 0.0, 0.0, 0.0);
    case Polarization::kYY:
      return JonesMatrix(0.0, 0.0, 0.0, single_(channel, baseline, time));
  }
  throw std::invalid_argument("Invalid polarization");
}

void Dataset::SetJones(size_t channel, size_t baseline, size_t time,
                       const JonesMatrix& value) {
  switch (polarization_) {
    case Polarization::kFull:
      full_(channel, baseline, time) = value;
      break;
    case Polarization::kDual:
      dual_(channel, baseline, time) = common::Diagonal(value);
      break;
    case Polarization::kXX:
      single_(channel, baseline, time) = value.Xx();
      break;
    case Polarization::kYY:
      single_(channel, baseline, time) = value.Yy();
      break;
  }
}

bool Dataset::IsZero(size_t channel, size_t baseline, size_t time) const {
  switch (polarization_) {
    case Polarization::kFull:
      return full_(channel, baseline, time).IsZero();
    case Polarization::kDual:
      return dual_(channel, baseline, time).IsZero();
    case Polarization::kXX:
    case Polarization::kYY:
      return single_(channel, baseline, time) == Complex(0.0, 0.0);
  }
  return true;
}

void Dataset::Add(const Dataset& other) {
  CheckCompatible(other);
  switch (polarization_) {
    case Polarization::kFull:
      for (size_t i = 0; i != full_.size(); ++i)
        full_.data()[i] += other.full_.data()[i];
      break;
    case Polarization::kDual:
      for (size_t i = 0; i != dual_.size(); ++i)
        dual_.data()[i] += other.dual_.data()[i];
      break;
    case Polarization::kXX:
    case Polarization::kYY:
      single_ += other.single_;
      break;
  }
}

void Dataset::Subtract(const Dataset& other) {
  CheckCompatible(other);
  switch (polarization_) {
    case Polarization::kFull:
      for (size_t i = 0; i != full_.size(); ++i)
        full_.data()[i] -= other.full_.data()[i];
      break;
    case Polarization::kDual:
      for (size_t i = 0; i != dual_.size(); ++i)
        dual_.data()[i] -= other.dual_.data()[i];
      break;
    case Polarization::kXX:
    case Polarization::kYY:
      single_ -= other.single_;
      break;
  }
}

double Dataset::Norm() const {
  double sum = 0.0;
  switch (polarization_) {
    case Polarization::kFull:
      for (const JonesMatrix& cell : full_) sum += cell.Norm();
      break;
    case Polarization::kDual:
      for (const DiagonalJonesMatrix& cell : dual_) sum += cell.Norm();
      break;
    case Polarization::kXX:
    case Polarization::kYY:
      for (const Complex& cell : single_) sum += std::norm(cell);
      break;
  }
  return std::sqrt(sum);
}

void Dataset::SetZero() {
  full_.fill(JonesMatrix::Zero());
  dual_.fill(DiagonalJonesMatrix::Zero());
  single_.fill(Complex(0.0, 0.0));
}

}  // namespace selfcal::base
