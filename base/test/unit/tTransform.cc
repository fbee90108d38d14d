// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "../../Transform.h"

#include <complex>
#include <random>
#include <stdexcept>

#include <boost/test/unit_test.hpp>

#include "fixtures/fMetadata.h"

using selfcal::base::Dataset;
using selfcal::base::Metadata;
using selfcal::base::Pack;
using selfcal::base::Polarization;
using selfcal::base::Unpack;
using selfcal::base::UnpackInto;
using selfcal::base::test::MakeMetadata;
using selfcal::common::DiagonalJonesMatrix;
using selfcal::common::JonesMatrix;

namespace {

using Array = xt::xarray<std::complex<double>>;

Array RandomArray(const std::vector<size_t>& shape, unsigned int seed) {
  std::mt19937 rng(seed);
  std::normal_distribution<double> distribution;
  Array array = Array::from_shape(shape);
  for (std::complex<double>& value : array) {
    value = {distribution(rng), distribution(rng)};
  }
  return array;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(transform)

BOOST_AUTO_TEST_CASE(full_round_trip) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(4, 3, 2);
  const Array array = RandomArray({2, 10, 3, 4}, 1);
  const Dataset dataset = Pack(array, metadata, Polarization::kFull);

  // Correlations are stored as xx, xy, yx, yy.
  const JonesMatrix& cell = dataset.Full(2, 7, 1);
  BOOST_CHECK_EQUAL(cell.Xx(), array(1, 7, 2, 0));
  BOOST_CHECK_EQUAL(cell.Xy(), array(1, 7, 2, 1));
  BOOST_CHECK_EQUAL(cell.Yx(), array(1, 7, 2, 2));
  BOOST_CHECK_EQUAL(cell.Yy(), array(1, 7, 2, 3));

  const Array unpacked = Unpack(dataset);
  BOOST_REQUIRE(unpacked.shape() == array.shape());
  BOOST_CHECK(unpacked == array);
}

BOOST_AUTO_TEST_CASE(single_time) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(3, 2, 1);
  const Array array = RandomArray({6, 2, 4}, 2);
  const Dataset dataset = Pack(array, metadata, Polarization::kFull);
  BOOST_CHECK_EQUAL(dataset.Full(1, 4).Yx(), array(4, 1, 2));

  const Array unpacked = Unpack(dataset);
  BOOST_REQUIRE_EQUAL(unpacked.dimension(), 3u);
  BOOST_CHECK(unpacked == array);
}

BOOST_AUTO_TEST_CASE(dual) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(3, 2, 1);
  const Array four = RandomArray({6, 2, 4}, 3);
  const Dataset from_four = Pack(four, metadata, Polarization::kDual);
  BOOST_CHECK(from_four.Dual(1, 3) ==
              DiagonalJonesMatrix(four(3, 1, 0), four(3, 1, 3)));

  const Array two = RandomArray({6, 2, 2}, 4);
  const Dataset from_two = Pack(two, metadata, Polarization::kDual);
  BOOST_CHECK(from_two.Dual(0, 5) ==
              DiagonalJonesMatrix(two(5, 0, 0), two(5, 0, 1)));
  BOOST_CHECK(Unpack(from_two) == two);
}

BOOST_AUTO_TEST_CASE(dual_unpack_into_keeps_cross_hands) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(3, 2, 1);
  const Array original = RandomArray({6, 2, 4}, 5);
  Dataset dataset = Pack(original, metadata, Polarization::kDual);
  dataset.Dual(1, 2) = DiagonalJonesMatrix(10.0, 20.0);

  Array array = original;
  UnpackInto(dataset, array);
  BOOST_CHECK_EQUAL(array(2, 1, 0), std::complex<double>(10.0, 0.0));
  BOOST_CHECK_EQUAL(array(2, 1, 3), std::complex<double>(20.0, 0.0));
  BOOST_CHECK_EQUAL(array(2, 1, 1), original(2, 1, 1));
  BOOST_CHECK_EQUAL(array(2, 1, 2), original(2, 1, 2));
  BOOST_CHECK_EQUAL(array(4, 0, 3), original(4, 0, 3));
}

BOOST_AUTO_TEST_CASE(dual_skips_zero_cells) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(3, 2, 1);
  Array array = RandomArray({6, 2, 4}, 6);
  array(2, 1, 0) = 0.0;
  array(2, 1, 3) = 0.0;
  const Dataset dataset = Pack(array, metadata, Polarization::kDual);
  BOOST_CHECK(dataset.IsZero(1, 2));
  BOOST_CHECK(!dataset.IsZero(0, 2));
}

BOOST_AUTO_TEST_CASE(single_polarizations) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(3, 2, 1);
  const Array array = RandomArray({6, 2, 4}, 7);
  const Dataset xx = Pack(array, metadata, Polarization::kXX);
  const Dataset yy = Pack(array, metadata, Polarization::kYY);
  BOOST_CHECK_EQUAL(xx.Single(1, 4), array(4, 1, 0));
  BOOST_CHECK_EQUAL(yy.Single(1, 4), array(4, 1, 3));

  const Array two = RandomArray({6, 2, 2}, 8);
  BOOST_CHECK_EQUAL(Pack(two, metadata, Polarization::kYY).Single(0, 1),
                    two(1, 0, 1));

  const Array unpacked = Unpack(xx);
  BOOST_REQUIRE_EQUAL(unpacked.shape(2), 1u);
  BOOST_CHECK_EQUAL(unpacked(4, 1, 0), array(4, 1, 0));
}

BOOST_AUTO_TEST_CASE(channel_selection) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(3, 4, 1);
  const Array array = RandomArray({6, 4, 4}, 9);
  const Dataset dataset =
      Pack(array, metadata, std::vector<size_t>{3, 1}, Polarization::kFull);
  BOOST_REQUIRE_EQUAL(dataset.NChannels(), 2u);
  BOOST_CHECK_EQUAL(dataset.GetMetadata().ChannelFrequencies()[0], 123.0e6);
  BOOST_CHECK_EQUAL(dataset.Full(0, 5).Xy(), array(5, 3, 1));
  BOOST_CHECK_EQUAL(dataset.Full(1, 5).Xy(), array(5, 1, 1));
}

BOOST_AUTO_TEST_CASE(shape_mismatch) {
  const std::shared_ptr<const Metadata> metadata = MakeMetadata(3, 2, 2);
  // Wrong number of baselines, channels and times.
  BOOST_CHECK_THROW(
      Pack(RandomArray({2, 5, 2, 4}, 10), metadata, Polarization::kFull),
      std::invalid_argument);
  BOOST_CHECK_THROW(
      Pack(RandomArray({2, 6, 3, 4}, 11), metadata, Polarization::kFull),
      std::invalid_argument);
  BOOST_CHECK_THROW(
      Pack(RandomArray({3, 6, 2, 4}, 12), metadata, Polarization::kFull),
      std::invalid_argument);
  // Three dimensions only for a single time.
  BOOST_CHECK_THROW(
      Pack(RandomArray({6, 2, 4}, 13), metadata, Polarization::kFull),
      std::invalid_argument);
  // Correlations that can not hold the polarization.
  BOOST_CHECK_THROW(
      Pack(RandomArray({2, 6, 2, 2}, 14), metadata, Polarization::kFull),
      std::invalid_argument);
  BOOST_CHECK_THROW(
      Pack(RandomArray({2, 6, 2, 1}, 15), metadata, Polarization::kDual),
      std::invalid_argument);

  const Dataset dataset(metadata, Polarization::kFull);
  Array too_small = RandomArray({2, 6, 1, 4}, 16);
  BOOST_CHECK_THROW(UnpackInto(dataset, too_small), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
