// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_LOGGER_FIXTURE_H_
#define SELFCAL_BASE_LOGGER_FIXTURE_H_

#include <aocommon/logger.h>

namespace selfcal::base::test {

/// Silences the logger during a test.
class LoggerFixture {
 public:
  LoggerFixture(aocommon::LogVerbosityLevel test_verbosity =
                    aocommon::LogVerbosityLevel::kQuiet) {
    aocommon::Logger::SetVerbosity(test_verbosity);
  }
  ~LoggerFixture() {
    aocommon::Logger::SetVerbosity(aocommon::LogVerbosityLevel::kNormal);
  }
};

}  // namespace selfcal::base::test

#endif
