// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#define BOOST_TEST_MODULE selfcal

#include <boost/test/unit_test.hpp>
