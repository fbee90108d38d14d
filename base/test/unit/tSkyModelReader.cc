// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../../SkyModelReader.h"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <boost/test/unit_test.hpp>

#include "../../../common/test/unit/fixtures/fDirectory.h"
#include "../../GaussianSource.h"
#include "../../Patch.h"
#include "../../PointSource.h"
#include "../LoggerFixture.h"

using selfcal::base::GaussianSource;
using selfcal::base::ModelComponent;
using selfcal::base::ParseAngle;
using selfcal::base::Patch;
using selfcal::base::PointSource;
using selfcal::base::ReadSkyModel;
using selfcal::base::Stokes;

namespace {

const std::string kSkyModel = R"([
  {
    "name": "Cygnus A",
    "ra": "19h59m28.35663s",
    "dec": "+40d44m02.0970s",
    "I": 10690.0,
    "Q": 1.0,
    "U": 2.0,
    "V": 3.0,
    "freq": 74.0e6,
    "index": [-0.7, 0.1]
  },
  {
    "name": "gaussian",
    "ra": 1.5,
    "dec": 0.7,
    "I": 5.0,
    "major-fwhm": 0.001,
    "minor-fwhm": 0.0005,
    "position-angle": 0.3
  },
  {
    "name": "patch",
    "components": [
      { "name": "first", "ra": 1.0, "dec": 0.5, "I": 1.0 },
      { "name": "second", "ra": 1.2, "dec": 0.5, "I": 2.0 }
    ]
  }
])";

std::vector<ModelComponent::ConstPtr> Read(const std::string& json) {
  std::istringstream stream(json);
  return ReadSkyModel(stream, "test");
}

}  // namespace

BOOST_AUTO_TEST_SUITE(sky_model_reader)

BOOST_AUTO_TEST_CASE(parse_angle) {
  BOOST_CHECK_CLOSE(ParseAngle("1.25"), 1.25, 1.0e-12);
  BOOST_CHECK_CLOSE(ParseAngle("-0.5"), -0.5, 1.0e-12);
  BOOST_CHECK_CLOSE(ParseAngle("90deg"), M_PI_2, 1.0e-10);
  BOOST_CHECK_CLOSE(ParseAngle("12h00m00s"), M_PI, 1.0e-10);
  BOOST_CHECK_CLOSE(ParseAngle("+40d30m00s"), 40.5 * M_PI / 180.0, 1.0e-10);
  BOOST_CHECK_THROW(ParseAngle("north"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(read_stream, *boost::unit_test::fixture<
                               selfcal::base::test::LoggerFixture>()) {
  const std::vector<ModelComponent::ConstPtr> sources = Read(kSkyModel);
  BOOST_REQUIRE_EQUAL(sources.size(), 3u);

  const auto* cygnus = dynamic_cast<const PointSource*>(sources[0].get());
  BOOST_REQUIRE(cygnus);
  BOOST_CHECK_EQUAL(cygnus->Name(), "Cygnus A");
  BOOST_CHECK_CLOSE(cygnus->GetDirection().ra,
                    (19.0 + 59.0 / 60.0 + 28.35663 / 3600.0) * M_PI / 12.0,
                    1.0e-9);
  BOOST_CHECK_CLOSE(cygnus->GetDirection().dec,
                    (40.0 + 44.0 / 60.0 + 2.097 / 3600.0) * M_PI / 180.0,
                    1.0e-9);
  BOOST_CHECK_EQUAL(cygnus->ReferenceFrequency(), 74.0e6);
  BOOST_REQUIRE_EQUAL(cygnus->SpectralTerms().size(), 2u);
  BOOST_CHECK_EQUAL(cygnus->SpectralTerms()[0], -0.7);

  // log-polynomial spectrum in ln(nu / nu0).
  const double x = std::log(150.0e6 / 74.0e6);
  const double scale = std::exp(-0.7 * x + 0.1 * x * x);
  const Stokes stokes = cygnus->GetStokes(150.0e6);
  BOOST_CHECK_CLOSE(stokes.I, 10690.0 * scale, 1.0e-9);
  BOOST_CHECK_CLOSE(stokes.V, 3.0 * scale, 1.0e-9);

  const auto* gaussian = dynamic_cast<const GaussianSource*>(sources[1].get());
  BOOST_REQUIRE(gaussian);
  BOOST_CHECK_CLOSE(gaussian->GetDirection().ra, 1.5, 1.0e-12);
  BOOST_CHECK_CLOSE(gaussian->GetMajorAxis(), 0.001, 1.0e-12);
  BOOST_CHECK_CLOSE(gaussian->GetMinorAxis(), 0.0005, 1.0e-12);
  BOOST_CHECK_CLOSE(gaussian->GetPositionAngle(), 0.3, 1.0e-12);
  BOOST_CHECK_EQUAL(gaussian->GetStokes(150.0e6).I, 5.0);
  BOOST_CHECK_EQUAL(gaussian->GetStokes(150.0e6).Q, 0.0);

  const auto* patch = dynamic_cast<const Patch*>(sources[2].get());
  BOOST_REQUIRE(patch);
  BOOST_REQUIRE_EQUAL(patch->NComponents(), 2u);
  BOOST_CHECK_EQUAL(patch->Component(1)->Name(), "second");
  BOOST_CHECK_CLOSE(patch->GetDirection().ra, 1.1, 1.0e-10);
  BOOST_CHECK_CLOSE(patch->GetDirection().dec, 0.5, 1.0e-10);
}

BOOST_AUTO_TEST_CASE(read_file, *boost::unit_test::fixture<
                                    selfcal::common::test::FixtureDirectory>()) {
  {
    std::ofstream file("sources.json");
    file << kSkyModel;
  }
  BOOST_CHECK_EQUAL(ReadSkyModel("sources.json").size(), 3u);
  BOOST_CHECK_THROW(ReadSkyModel("missing.json"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(errors) {
  // Invalid JSON
  BOOST_CHECK_THROW(Read("[ { \"name\": "), std::runtime_error);
  // Missing flux
  BOOST_CHECK_THROW(Read(R"([ { "ra": 1.0, "dec": 0.5 } ])"),
                    std::runtime_error);
  // Missing direction
  BOOST_CHECK_THROW(Read(R"([ { "ra": 1.0, "I": 1.0 } ])"),
                    std::runtime_error);
  // Invalid angle
  BOOST_CHECK_THROW(Read(R"([ { "ra": "east", "dec": 0.5, "I": 1.0 } ])"),
                    std::runtime_error);
  // Spectral index without reference frequency
  BOOST_CHECK_THROW(
      Read(R"([ { "ra": 1.0, "dec": 0.5, "I": 1.0, "index": [-0.7] } ])"),
      std::runtime_error);
  // Empty patch
  BOOST_CHECK_THROW(Read(R"([ { "name": "p", "components": [] } ])"),
                    std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
