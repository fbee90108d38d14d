// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../../Beam.h"

#include <cmath>
#include <stdexcept>

#include <boost/test/unit_test.hpp>

using selfcal::base::Beam;
using selfcal::base::MakeBeam;
using selfcal::base::SineBeam;
using selfcal::common::JonesMatrix;

BOOST_AUTO_TEST_SUITE(beam)

BOOST_AUTO_TEST_CASE(constant) {
  const std::shared_ptr<const Beam> beam = MakeBeam("constant");
  BOOST_CHECK_EQUAL(beam->Name(), "constant");
  BOOST_CHECK(beam->Evaluate(150.0e6, 0.3, 0.1) == JonesMatrix::Identity());
  BOOST_CHECK(beam->Evaluate(50.0e6, 2.0, 1.5) == JonesMatrix::Identity());
}

BOOST_AUTO_TEST_CASE(sine) {
  const std::shared_ptr<const Beam> beam = MakeBeam("sine");
  const auto* sine = dynamic_cast<const SineBeam*>(beam.get());
  BOOST_REQUIRE(sine);
  BOOST_CHECK_EQUAL(sine->Power(), SineBeam::kDefaultPower);

  const double elevation = 0.6;
  const double expected = std::pow(std::sin(elevation), 1.6);
  const JonesMatrix response = beam->Evaluate(150.0e6, 1.0, elevation);
  BOOST_CHECK_CLOSE(response.Xx().real(), expected, 1.0e-10);
  BOOST_CHECK_CLOSE(response.Yy().real(), expected, 1.0e-10);
  BOOST_CHECK_EQUAL(response.Xy(), 0.0);
  BOOST_CHECK_EQUAL(response.Yx(), 0.0);

  // Zenith
  BOOST_CHECK_CLOSE(beam->Evaluate(150.0e6, 0.0, M_PI_2).Xx().real(), 1.0,
                    1.0e-10);
  // Below the horizon
  BOOST_CHECK(beam->Evaluate(150.0e6, 0.0, -0.1) == JonesMatrix::Zero());
}

BOOST_AUTO_TEST_CASE(sine_with_power) {
  const std::shared_ptr<const Beam> beam = MakeBeam("Sine2.0");
  const auto* sine = dynamic_cast<const SineBeam*>(beam.get());
  BOOST_REQUIRE(sine);
  BOOST_CHECK_EQUAL(sine->Power(), 2.0);
  BOOST_CHECK_CLOSE(beam->Evaluate(150.0e6, 0.0, 0.5).Yy().real(),
                    std::sin(0.5) * std::sin(0.5), 1.0e-10);
}

BOOST_AUTO_TEST_CASE(unknown) {
  BOOST_CHECK_THROW(MakeBeam("hamaker"), std::invalid_argument);
  BOOST_CHECK_THROW(MakeBeam("sinex"), std::invalid_argument);
  BOOST_CHECK_THROW(MakeBeam(""), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
