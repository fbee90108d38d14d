// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../../ParameterSet.h"

#include <fstream>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "fixtures/fDirectory.h"

using selfcal::common::ParameterSet;

BOOST_AUTO_TEST_SUITE(parameterset)

BOOST_AUTO_TEST_CASE(argv) {
  const char* arguments[] = {"selfcal", "peel", "input=test.ms",
                             "--maxiter=30", "tolerance=1e-6", "noequals"};
  ParameterSet parset;
  parset.adoptArgv(6, arguments);
  BOOST_CHECK_EQUAL(parset.size(), 3u);
  BOOST_CHECK_EQUAL(parset.getString("input"), "test.ms");
  BOOST_CHECK_EQUAL(parset.getUint("maxiter"), 30u);
  BOOST_CHECK_CLOSE(parset.getDouble("tolerance"), 1.0e-6, 1.0e-9);
  BOOST_CHECK(!parset.isDefined("noequals"));
}

BOOST_AUTO_TEST_CASE(defaults) {
  ParameterSet parset;
  BOOST_CHECK_EQUAL(parset.getUint("maxiter", 20), 20u);
  BOOST_CHECK_EQUAL(parset.getDouble("minuvw", 0.0), 0.0);
  BOOST_CHECK_EQUAL(parset.getString("beam", "sine"), "sine");
  BOOST_CHECK_EQUAL(parset.getBool("verbose", false), false);
  BOOST_CHECK_THROW(parset.getString("input"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(conversions) {
  ParameterSet parset;
  parset.add("flag", "True");
  parset.add("other_flag", "no");
  parset.add("count", "-3");
  parset.add("list", "[a, b ,c]");
  BOOST_CHECK(parset.getBool("flag"));
  BOOST_CHECK(!parset.getBool("other_flag"));
  BOOST_CHECK_EQUAL(parset.getInt("count"), -3);
  BOOST_CHECK_THROW(parset.getUint("count"), std::runtime_error);
  BOOST_CHECK(parset.getStringVector("list", {}) ==
              std::vector<std::string>({"a", "b", "c"}));
  BOOST_CHECK_THROW(parset.add("count", "4"), std::runtime_error);
  parset.replace("count", "4");
  BOOST_CHECK_EQUAL(parset.getUint("count"), 4u);
}

BOOST_AUTO_TEST_CASE(malformed_values) {
  ParameterSet parset;
  parset.add("maxiter", "twenty");
  parset.add("tolerance", "1e-3x");
  parset.add("verbose", "maybe");
  BOOST_CHECK_THROW(parset.getUint("maxiter"), std::runtime_error);
  BOOST_CHECK_THROW(parset.getDouble("tolerance"), std::runtime_error);
  BOOST_CHECK_THROW(parset.getBool("verbose"), std::runtime_error);
}

BOOST_FIXTURE_TEST_CASE(file, selfcal::common::test::FixtureDirectory) {
  {
    std::ofstream file("test.parset");
    file << "# comment line\n"
         << "input = observation.ms   # trailing comment\n"
         << "\n"
         << "peeliter=5\n";
  }
  ParameterSet parset("test.parset");
  BOOST_CHECK_EQUAL(parset.getString("input"), "observation.ms");
  BOOST_CHECK_EQUAL(parset.getUint("peeliter"), 5u);
  BOOST_CHECK_THROW(parset.adoptFile("does_not_exist.parset"),
                    std::runtime_error);
}

BOOST_AUTO_TEST_CASE(unused_keys) {
  ParameterSet parset;
  parset.add("input", "a.ms");
  parset.add("typo", "1");
  parset.getString("input");
  BOOST_CHECK(parset.unusedKeys() == std::vector<std::string>({"typo"}));
}

BOOST_AUTO_TEST_SUITE_END()
