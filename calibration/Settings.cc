// Settings.cc: Settings of the selfcal commands.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "Settings.h"

#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>

#include "../common/ParameterSet.h"

namespace selfcal {
namespace calibration {

namespace {

bool NeedsSources(Command command) { return command != Command::kApplyCal; }

bool NeedsOutput(Command command) {
  return command == Command::kGainCal || command == Command::kPolCal;
}

std::string GetString(const common::ParameterSet& parset,
                      const std::string& key, Command command,
                      bool required) {
  if (required && !parset.isDefined(key)) {
    throw std::runtime_error("Command " + ToString(command) +
                             " requires setting '" + key + "'");
  }
  return parset.getString(key, "");
}

}  // namespace

std::string ToString(Command command) {
  switch (command) {
    case Command::kGainCal:
      return "gaincal";
    case Command::kPolCal:
      return "polcal";
    case Command::kPeel:
      return "peel";
    case Command::kZest:
      return "zest";
    case Command::kShave:
      return "shave";
    case Command::kPrune:
      return "prune";
    case Command::kApplyCal:
      return "applycal";
  }
  return "invalid command";
}

Command StringToCommand(const std::string& name) {
  const std::string lowercase = boost::to_lower_copy(name);
  if (lowercase == "gaincal")
    return Command::kGainCal;
  else if (lowercase == "polcal")
    return Command::kPolCal;
  else if (lowercase == "peel")
    return Command::kPeel;
  else if (lowercase == "zest")
    return Command::kZest;
  else if (lowercase == "shave")
    return Command::kShave;
  else if (lowercase == "prune")
    return Command::kPrune;
  else if (lowercase == "applycal")
    return Command::kApplyCal;
  else
    throw std::runtime_error("Unknown command: " + name);
}

bool IsPeelCommand(Command command) {
  return command == Command::kPeel || command == Command::kZest ||
         command == Command::kShave || command == Command::kPrune;
}

Settings::Settings(const common::ParameterSet& parset, Command _command)
    : command(_command),
      input(GetString(parset, "input", command, true)),
      output(GetString(parset, "output", command, NeedsOutput(command))),
      sources(GetString(parset, "sources", command, NeedsSources(command))),
      beam(parset.getString("beam", "sine")),
      max_iterations(parset.getUint("maxiter", 20)),
      tolerance(parset.getDouble("tolerance", 1.0e-3)),
      peel_iterations(parset.getUint("peeliter", 3)),
      min_uvw(parset.getDouble("minuvw", 0.0)),
      calibration(GetString(parset, "calibration", command,
                            command == Command::kApplyCal)),
      corrected(parset.getBool("corrected", false)),
      force_imaging(parset.getBool("force-imaging", false)),
      n_threads(parset.getUint("numthreads", 0)),
      verbose(parset.getBool("verbose", false)) {
  if (max_iterations == 0) {
    throw std::runtime_error("Setting 'maxiter' should be positive");
  }
  if (tolerance <= 0.0) {
    throw std::runtime_error("Setting 'tolerance' should be positive");
  }
}

SolverSettings Settings::GetSolverSettings() const {
  SolverSettings settings;
  settings.max_iterations = max_iterations;
  settings.tolerance = tolerance;
  settings.min_uvw = min_uvw;
  return settings;
}

PeelSettings Settings::GetPeelSettings() const {
  PeelSettings settings;
  settings.solver = GetSolverSettings();
  settings.peel_iterations = peel_iterations;
  settings.full_polarization =
      command == Command::kZest || command == Command::kPrune;
  settings.collapse_frequency =
      command == Command::kShave || command == Command::kPrune;
  return settings;
}

std::ostream& operator<<(std::ostream& stream, const Settings& settings) {
  stream << "selfcal " << ToString(settings.command) << '\n'
         << "  input:         " << settings.input << '\n';
  if (!settings.output.empty())
    stream << "  output:        " << settings.output << '\n';
  if (!settings.sources.empty())
    stream << "  sources:       " << settings.sources << '\n';
  if (!settings.calibration.empty())
    stream << "  calibration:   " << settings.calibration << '\n';
  stream << "  beam:          " << settings.beam << '\n'
         << "  maxiter:       " << settings.max_iterations << '\n'
         << "  tolerance:     " << settings.tolerance << '\n'
         << "  minuvw:        " << settings.min_uvw << '\n';
  if (IsPeelCommand(settings.command))
    stream << "  peeliter:      " << settings.peel_iterations << '\n';
  if (settings.command == Command::kApplyCal)
    stream << "  corrected:     " << std::boolalpha << settings.corrected
           << '\n'
           << "  force-imaging: " << settings.force_imaging << '\n';
  return stream;
}

}  // namespace calibration
}  // namespace selfcal
