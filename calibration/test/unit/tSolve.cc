// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../../Solve.h"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "../../../base/PointSource.h"
#include "../../../base/Predict.h"
#include "../../../base/test/unit/fixtures/fMetadata.h"
#include "fixtures/fCalibration.h"

using selfcal::base::Dataset;
using selfcal::base::Direction;
using selfcal::base::Metadata;
using selfcal::base::ModelComponent;
using selfcal::base::PointSource;
using selfcal::base::Polarization;
using selfcal::base::Predict;
using selfcal::base::Stokes;
using selfcal::base::test::kPhaseCentre;
using selfcal::base::test::MakeMetadata;
using selfcal::calibration::Calibration;
using selfcal::calibration::FlagMask;
using selfcal::calibration::GainType;
using selfcal::calibration::Solve;
using selfcal::calibration::SolverSettings;
using selfcal::calibration::test::Corrupted;
using selfcal::calibration::test::RandomCalibration;
using selfcal::calibration::test::RandomModel;
using selfcal::calibration::test::RelativeDifference;
using selfcal::common::JonesMatrix;

namespace {

/// Model of two unpolarized point sources near the phase centre.
Dataset TwoSourceModel(const std::shared_ptr<const Metadata>& metadata,
                       Polarization polarization) {
  const std::vector<ModelComponent::ConstPtr> sources{
      std::make_shared<PointSource>(
          "a",
          Direction(kPhaseCentre.ra + 0.01, kPhaseCentre.dec + 0.005),
          Stokes(2.0, 0.0, 0.0, 0.0)),
      std::make_shared<PointSource>(
          "b",
          Direction(kPhaseCentre.ra - 0.015, kPhaseCentre.dec + 0.02),
          Stokes(1.0, 0.0, 0.0, 0.0))};
  return Predict(metadata, sources, polarization);
}

SolverSettings AccurateSettings() {
  SolverSettings settings;
  settings.max_iterations = 1000;
  settings.tolerance = 1.0e-12;
  return settings;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(solve)

BOOST_AUTO_TEST_CASE(gaincal_unit_gains) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(5, 10);
  const PointSource source("centre", kPhaseCentre, Stokes(1.0, 0.0, 0.0, 0.0));
  const Dataset model = Predict(metadata, source, Polarization::kDual);

  const Calibration calibration =
      Solve(model, model, GainType::kDiagonal, false, SolverSettings());
  BOOST_REQUIRE_EQUAL(calibration.NChannels(), 10u);
  BOOST_REQUIRE_EQUAL(calibration.NAntennas(), 5u);
  BOOST_CHECK_EQUAL(calibration.NConverged(), 10u);
  for (size_t channel = 0; channel != 10; ++channel) {
    for (size_t antenna = 0; antenna != 5; ++antenna) {
      const JonesMatrix gain = calibration.GetJones(channel, antenna);
      BOOST_CHECK_SMALL(std::abs(gain.Xx() - 1.0), 1.0e-9);
      BOOST_CHECK_SMALL(std::abs(gain.Yy() - 1.0), 1.0e-9);
    }
  }
}

BOOST_AUTO_TEST_CASE(diagonal_per_channel) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(6, 3, 2);
  const Dataset model = TwoSourceModel(metadata, Polarization::kDual);
  const Dataset observed =
      Corrupted(RandomCalibration(3, 6, GainType::kDiagonal, 1), model);

  const Calibration calibration =
      Solve(observed, model, GainType::kDiagonal, false, AccurateSettings());
  BOOST_CHECK_EQUAL(calibration.NChannels(), 3u);
  BOOST_CHECK_EQUAL(calibration.NConverged(), 3u);
  BOOST_CHECK_LT(RelativeDifference(Corrupted(calibration, model), observed),
                 1.0e-7);
}

BOOST_AUTO_TEST_CASE(polcal_on_unpolarized_signal) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(6, 2, 2);
  const Dataset model = TwoSourceModel(metadata, Polarization::kFull);
  const Dataset observed =
      Corrupted(RandomCalibration(2, 6, GainType::kDiagonal, 2), model);

  const Calibration calibration =
      Solve(observed, model, GainType::kFullJones, false, AccurateSettings());
  BOOST_CHECK_EQUAL(calibration.NConverged(), 2u);
  for (size_t channel = 0; channel != 2; ++channel) {
    for (size_t antenna = 0; antenna != 6; ++antenna) {
      const JonesMatrix gain = calibration.GetJones(channel, antenna);
      BOOST_CHECK_SMALL(std::abs(gain.Xy()), 1.0e-9);
      BOOST_CHECK_SMALL(std::abs(gain.Yx()), 1.0e-9);
    }
  }
  BOOST_CHECK_LT(RelativeDifference(Corrupted(calibration, model), observed),
                 1.0e-7);
}

BOOST_AUTO_TEST_CASE(full_jones) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(6, 2);
  const Dataset model = RandomModel(metadata, Polarization::kFull, 3);
  const Dataset observed =
      Corrupted(RandomCalibration(2, 6, GainType::kFullJones, 4), model);

  const Calibration calibration =
      Solve(observed, model, GainType::kFullJones, false, AccurateSettings());
  BOOST_CHECK_EQUAL(calibration.NConverged(), 2u);
  BOOST_CHECK_LT(RelativeDifference(Corrupted(calibration, model), observed),
                 1.0e-7);
}

BOOST_AUTO_TEST_CASE(collapsed) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(5, 4);
  const Dataset model = TwoSourceModel(metadata, Polarization::kDual);
  const Dataset observed =
      Corrupted(RandomCalibration(1, 5, GainType::kDiagonal, 5), model);

  const Calibration calibration =
      Solve(observed, model, GainType::kDiagonal, true, AccurateSettings());
  BOOST_REQUIRE_EQUAL(calibration.NChannels(), 1u);
  BOOST_CHECK(calibration.IsConverged(0));
  BOOST_CHECK_LT(RelativeDifference(Corrupted(calibration, model), observed),
                 1.0e-7);
}

BOOST_AUTO_TEST_CASE(baselines_too_short) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(4, 2);
  const Dataset model = TwoSourceModel(metadata, Polarization::kDual);
  const Dataset observed =
      Corrupted(RandomCalibration(2, 4, GainType::kDiagonal, 6), model);

  SolverSettings settings;
  settings.min_uvw = 1.0e9;
  const Calibration calibration =
      Solve(observed, model, GainType::kDiagonal, false, settings);
  BOOST_CHECK_EQUAL(calibration.NConverged(), 0u);
  for (size_t antenna = 0; antenna != 4; ++antenna) {
    BOOST_CHECK(calibration.GetJones(0, antenna) == JonesMatrix::Identity());
  }
}

BOOST_AUTO_TEST_CASE(empty_model_channel) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(4, 3);
  Dataset model = TwoSourceModel(metadata, Polarization::kDual);
  for (size_t baseline = 0; baseline != model.NBaselines(); ++baseline) {
    model.SetJones(1, baseline, 0, JonesMatrix::Zero());
  }
  const Dataset observed =
      Corrupted(RandomCalibration(3, 4, GainType::kDiagonal, 7), model);

  const Calibration calibration =
      Solve(observed, model, GainType::kDiagonal, false, AccurateSettings());
  BOOST_CHECK(calibration.IsConverged(0));
  BOOST_CHECK(!calibration.IsConverged(1));
  BOOST_CHECK(calibration.IsConverged(2));
  for (size_t antenna = 0; antenna != 4; ++antenna) {
    BOOST_CHECK(calibration.GetJones(1, antenna) == JonesMatrix::Identity());
  }
}

BOOST_AUTO_TEST_CASE(flagged_cells) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(6, 2, 2);
  const Dataset model = TwoSourceModel(metadata, Polarization::kDual);
  Dataset observed =
      Corrupted(RandomCalibration(2, 6, GainType::kDiagonal, 8), model);
  // Flagged visibilities are zero.
  for (size_t baseline = 0; baseline < observed.NBaselines(); baseline += 3) {
    observed.SetJones(0, baseline, 1, JonesMatrix::Zero());
    observed.SetJones(1, baseline, 0, JonesMatrix::Zero());
  }

  const Calibration calibration =
      Solve(observed, model, GainType::kDiagonal, false, AccurateSettings());
  BOOST_CHECK_EQUAL(calibration.NConverged(), 2u);
  Dataset reproduced = Corrupted(calibration, model);
  for (size_t baseline = 0; baseline < observed.NBaselines(); baseline += 3) {
    reproduced.SetJones(0, baseline, 1, JonesMatrix::Zero());
    reproduced.SetJones(1, baseline, 0, JonesMatrix::Zero());
  }
  BOOST_CHECK_LT(RelativeDifference(reproduced, observed), 1.0e-7);
}

BOOST_AUTO_TEST_CASE(shape_mismatch) {
  const Dataset observed(MakeMetadata(4, 3), Polarization::kDual);
  const Dataset model(MakeMetadata(4, 2), Polarization::kDual);
  BOOST_CHECK_THROW(
      Solve(observed, model, GainType::kDiagonal, false, SolverSettings()),
      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(polarization_mismatch) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(4, 2);
  const Dataset observed(metadata, Polarization::kDual);
  const Dataset model(metadata, Polarization::kFull);
  BOOST_CHECK_THROW(
      Solve(observed, model, GainType::kDiagonal, false, SolverSettings()),
      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(antenna_mismatch) {
  const Dataset observed(MakeMetadata(4, 2), Polarization::kDual);
  const Dataset model(MakeMetadata(5, 2), Polarization::kDual);
  BOOST_CHECK_THROW(
      Solve(observed, model, GainType::kDiagonal, false, SolverSettings()),
      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(flagged_cells_are_excluded) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(6, 2, 2);
  const Dataset model = TwoSourceModel(metadata, Polarization::kDual);
  const Dataset truth =
      Corrupted(RandomCalibration(2, 6, GainType::kDiagonal, 3), model);

  // Corrupt one cross correlation and flag it.
  size_t bad = 0;
  while (metadata->GetBaseline(bad).IsAutoCorrelation()) ++bad;
  Dataset observed = truth;
  FlagMask flags(
      {observed.NChannels(), observed.NBaselines(), observed.NTimes()}, false);
  for (size_t channel = 0; channel != 2; ++channel) {
    for (size_t time = 0; time != 2; ++time) {
      observed.SetJones(channel, bad, time, JonesMatrix(5.0, 3.0, -2.0, 7.0));
      flags(channel, bad, time) = true;
    }
  }

  const Calibration calibration = Solve(observed, model, flags,
                                        GainType::kDiagonal, false,
                                        AccurateSettings());
  BOOST_CHECK_EQUAL(calibration.NConverged(), 2u);
  BOOST_CHECK_LT(RelativeDifference(Corrupted(calibration, model), truth),
                 1.0e-7);

  const FlagMask wrong_shape({1, 1, 1}, false);
  BOOST_CHECK_THROW(Solve(observed, model, wrong_shape, GainType::kDiagonal,
                          false, SolverSettings()),
                    std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
