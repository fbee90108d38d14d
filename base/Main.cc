// Main.cc: Entry point of the selfcal program.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include <stdexcept>

#include <aocommon/logger.h>
#include <H5Cpp.h>

#include <selfcal/base/SelfCal.h>

int main(int argc, char* argv[]) {
  try {
    selfcal::base::ExecuteFromCommandLine(argc, argv);
    return 0;
  } catch (const std::exception& err) {
    aocommon::Logger::Error << "\nstd exception detected: " << err.what()
                            << '\n';
    return 1;
  } catch (const H5::Exception& err) {
    // H5::Exception is not derived from std::exception.
    aocommon::Logger::Error << "\nH5 exception detected: " << err.getDetailMsg()
                            << '\n';
    return 1;
  }
}
