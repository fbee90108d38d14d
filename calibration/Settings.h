// Settings.h: Settings of the selfcal commands.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_CALIBRATION_SETTINGS_H_
#define SELFCAL_CALIBRATION_SETTINGS_H_

#include <ostream>
#include <string>

#include "GainSolver.h"
#include "Peel.h"

namespace selfcal {
namespace common {
class ParameterSet;
}

namespace calibration {

enum class Command {
  kGainCal,
  kPolCal,
  kPeel,
  kZest,
  kShave,
  kPrune,
  kApplyCal
};

std::string ToString(Command command);
/// @throw std::runtime_error for an unknown command name.
Command StringToCommand(const std::string& name);
/// True for peel, zest, shave and prune.
bool IsPeelCommand(Command command);

/// @brief This struct parses the selfcal parset settings and stores them.
struct Settings {
 public:
  /**
   * Construct the object by reading settings from a parameter set.
   * @throw std::runtime_error When a setting that @p command requires is
   * missing or a value can not be converted.
   */
  Settings(const common::ParameterSet& parset, Command command);

  SolverSettings GetSolverSettings() const;
  /// Peel settings, with the polarization and frequency collapse following
  /// from the peel command.
  PeelSettings GetPeelSettings() const;

  const Command command;
  /// Measurement set.
  const std::string input;
  /// Solution file, empty if no solutions are written.
  const std::string output;
  /// JSON sky model.
  const std::string sources;
  const std::string beam;
  const size_t max_iterations;
  const double tolerance;
  const size_t peel_iterations;
  /// In wavelengths.
  const double min_uvw;
  /// Solution file to apply.
  const std::string calibration;
  const bool corrected;
  const bool force_imaging;
  /// Zero means all cores.
  const size_t n_threads;
  const bool verbose;
};

std::ostream& operator<<(std::ostream& stream, const Settings& settings);

}  // namespace calibration
}  // namespace selfcal

#endif  // SELFCAL_CALIBRATION_SETTINGS_H_
