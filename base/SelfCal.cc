// SelfCal.cc: Command line interface of the selfcal program.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include <selfcal/base/SelfCal.h>

#include <sstream>
#include <stdexcept>
#include <vector>

#include <aocommon/logger.h>
#include <aocommon/system.h>
#include <aocommon/threadpool.h>

#include <selfcal/base/Dataset.h>

#include "../calibration/Calibration.h"
#include "../calibration/Peel.h"
#include "../calibration/Settings.h"
#include "../calibration/Solve.h"
#include "../calibration/SolutionFile.h"
#include "Beam.h"
#include "MeasurementSet.h"
#include "Predict.h"
#include "SkyModelReader.h"
#include "Transform.h"

using selfcal::calibration::Calibration;
using selfcal::calibration::Command;
using selfcal::calibration::GainType;
using selfcal::calibration::Settings;

namespace selfcal {
namespace base {

namespace {

const std::string kData = "DATA";
const std::string kCorrectedData = "CORRECTED_DATA";

/// Full polarization when the data has all four correlations.
Polarization DataPolarization(const xt::xarray<std::complex<double>>& data) {
  return data.shape(data.dimension() - 1) == 4 ? Polarization::kFull
                                               : Polarization::kDual;
}

std::string CalibrationColumn(const MeasurementSet& ms) {
  return ms.HasColumn(kCorrectedData) ? kCorrectedData : kData;
}

void RunSolve(const Settings& settings) {
  const bool full = settings.command == Command::kPolCal;
  MeasurementSet ms(settings.input, false);
  const std::shared_ptr<const Metadata> metadata =
      ms.ReadMetadata(MakeBeam(settings.beam));
  const std::string column = full ? CalibrationColumn(ms) : kData;
  const Polarization polarization =
      full ? Polarization::kFull : Polarization::kDual;
  aocommon::Logger::Info << "Reading " << column << " as "
                         << ToString(polarization) << " visibilities\n";

  const Dataset observed = Pack(ms.ReadData(column), metadata, polarization);
  const Dataset model =
      Predict(metadata, ReadSkyModel(settings.sources), polarization);
  const Calibration solution =
      calibration::Solve(observed, model,
                         full ? GainType::kFullJones : GainType::kDiagonal,
                         false, settings.GetSolverSettings());
  calibration::WriteSolutions(settings.output, {solution}, *metadata);
}

void RunPeel(const Settings& settings) {
  MeasurementSet ms(settings.input, true);
  const std::shared_ptr<const Metadata> metadata =
      ms.ReadMetadata(MakeBeam(settings.beam));
  const std::string column = CalibrationColumn(ms);
  xt::xarray<std::complex<double>> data = ms.ReadData(column);
  const std::vector<ModelComponent::ConstPtr> sources =
      ReadSkyModel(settings.sources);
  aocommon::Logger::Info << "Peeling " << sources.size()
                         << " source(s) from " << column << '\n';

  Dataset residual = Pack(data, metadata, DataPolarization(data));
  const double initial_norm = residual.Norm();
  const std::vector<Calibration> solutions =
      calibration::Peel(residual, sources, settings.GetPeelSettings());
  aocommon::Logger::Info << "Residual norm: " << residual.Norm()
                         << " (was " << initial_norm << ")\n";

  UnpackInto(residual, data);
  ms.WriteData(column, data, false);
  if (!settings.output.empty()) {
    calibration::WriteSolutions(settings.output, solutions, *metadata);
  }
}

void RunApplyCal(const Settings& settings) {
  const std::vector<Calibration> solutions =
      calibration::ReadSolutions(settings.calibration);
  if (solutions.empty()) {
    throw std::runtime_error(settings.calibration + " contains no solutions");
  }
  if (solutions.size() > 1) {
    aocommon::Logger::Warn << settings.calibration << " contains "
                           << solutions.size()
                           << " directions, only the first one is applied\n";
  }

  MeasurementSet ms(settings.input, true);
  const std::shared_ptr<const Metadata> metadata =
      ms.ReadMetadata(MakeBeam(settings.beam));
  const bool has_corrected = ms.HasColumn(kCorrectedData);
  const std::string input_column =
      (settings.corrected && has_corrected) ? kCorrectedData : kData;
  const std::string output_column =
      (settings.force_imaging || has_corrected) ? kCorrectedData : kData;
  aocommon::Logger::Info << "Applying " << settings.calibration << " to "
                         << input_column << ", writing " << output_column
                         << '\n';

  xt::xarray<std::complex<double>> data = ms.ReadData(input_column);
  Dataset dataset = Pack(data, metadata, DataPolarization(data));
  calibration::Correct(solutions.front(), dataset);
  UnpackInto(dataset, data);
  ms.WriteData(output_column, data, settings.force_imaging);
}

}  // namespace

void ShowUsage() {
  aocommon::Logger::Info
      << "Usage: selfcal <command> [parsetkeys...]\n"
         "  command: one of\n"
         "    gaincal   solve diagonal gains against a sky model\n"
         "    polcal    solve full Jones gains against a sky model\n"
         "    peel      peel sources, diagonal gains per channel\n"
         "    zest      peel sources, full Jones gains per channel\n"
         "    shave     peel sources, diagonal gains over all channels\n"
         "    prune     peel sources, full Jones gains over all channels\n"
         "    applycal  apply a solution file\n"
         "  parsetkeys: any number of key=value pairs, e.g. input=my.MS\n"
         "    input, output, sources, beam, maxiter, tolerance, peeliter,\n"
         "    minuvw, calibration, corrected, force-imaging, numthreads,\n"
         "    verbose\n"
         "  parset=<file> reads key=value pairs from a file. Keys on the\n"
         "  command line override those in the file.\n";
}

void ExecuteFromCommandLine(int argc, char* argv[]) {
  if (argc < 2) {
    ShowUsage();
    return;
  }
  const std::string command = argv[1];
  if (command == "--help" || command == "-help" || command == "-h" ||
      command == "--usage" || command == "-usage") {
    ShowUsage();
    return;
  }

  common::ParameterSet arguments;
  arguments.adoptArgv(argc - 2, argv + 2);
  common::ParameterSet parset;
  if (arguments.isDefined("parset")) {
    parset.adoptFile(arguments.getString("parset"));
    arguments.remove("parset");
  }
  for (const auto& [key, value] : arguments) parset.replace(key, value);

  Execute(command, parset);
}

void Execute(const std::string& command_name,
             const common::ParameterSet& parset) {
  Command command;
  try {
    command = calibration::StringToCommand(command_name);
  } catch (std::runtime_error&) {
    ShowUsage();
    throw;
  }

  const Settings settings(parset, command);
  if (settings.verbose) {
    aocommon::Logger::SetVerbosity(aocommon::LogVerbosityLevel::kVerbose);
  }
  size_t n_threads = settings.n_threads;
  if (n_threads == 0) n_threads = aocommon::system::ProcessorCount();
  aocommon::ThreadPool::GetInstance().SetNThreads(n_threads);
  aocommon::Logger::Debug << "selfcal started with " << n_threads
                          << " threads.\n";

  std::ostringstream os;
  os << settings;
  aocommon::Logger::Info << os.str();

  // Show unused parameters (might be misspelled).
  const std::vector<std::string> unused = parset.unusedKeys();
  if (!unused.empty()) {
    aocommon::Logger::Warn
        << "\n*** WARNING: the following parset keywords were not used ***"
        << "\n             maybe they are misspelled"
        << "\n";
    for (const std::string& s : unused)
      aocommon::Logger::Warn << "    - " << s << '\n';
    aocommon::Logger::Warn << '\n';
  }

  switch (command) {
    case Command::kGainCal:
    case Command::kPolCal:
      RunSolve(settings);
      break;
    case Command::kPeel:
    case Command::kZest:
    case Command::kShave:
    case Command::kPrune:
      RunPeel(settings);
      break;
    case Command::kApplyCal:
      RunApplyCal(settings);
      break;
  }
}

}  // namespace base
}  // namespace selfcal
