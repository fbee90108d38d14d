// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include <selfcal/base/Polarization.h>

#include <stdexcept>

#include <boost/test/unit_test.hpp>

using selfcal::base::NCorrelations;
using selfcal::base::Polarization;
using selfcal::base::StringToPolarization;

BOOST_AUTO_TEST_SUITE(polarization)

BOOST_AUTO_TEST_CASE(parse) {
  BOOST_CHECK(StringToPolarization("full") == Polarization::kFull);
  BOOST_CHECK(StringToPolarization("dual") == Polarization::kDual);
  BOOST_CHECK(StringToPolarization("xx") == Polarization::kXX);
  BOOST_CHECK(StringToPolarization("yy") == Polarization::kYY);
  BOOST_CHECK_THROW(StringToPolarization("xy"), std::invalid_argument);
  BOOST_CHECK_THROW(StringToPolarization(""), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(to_string) {
  for (Polarization polarization :
       {Polarization::kFull, Polarization::kDual, Polarization::kXX,
        Polarization::kYY}) {
    BOOST_CHECK(StringToPolarization(ToString(polarization)) == polarization);
  }
}

BOOST_AUTO_TEST_CASE(n_correlations) {
  BOOST_CHECK_EQUAL(NCorrelations(Polarization::kFull), 4u);
  BOOST_CHECK_EQUAL(NCorrelations(Polarization::kDual), 2u);
  BOOST_CHECK_EQUAL(NCorrelations(Polarization::kXX), 1u);
  BOOST_CHECK_EQUAL(NCorrelations(Polarization::kYY), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
