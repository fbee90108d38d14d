// SolutionFile.h: Stores calibration solutions in HDF5 files.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_CALIBRATION_SOLUTION_FILE_H_
#define SELFCAL_CALIBRATION_SOLUTION_FILE_H_

#include <string>
#include <vector>

#include <selfcal/base/Metadata.h>

#include "Calibration.h"

namespace selfcal::calibration {

/**
 * Writes the solutions of one or more directions to an HDF5 file, replacing
 * an existing file. The file has:
 * - root attribute n_directions and dataset frequencies (the channel
 *   frequencies of @p metadata, in Hz);
 * - per direction i a group "direction<i>" with attribute type ("diagonal" or
 *   "fulljones"), dataset gains (double, {n_channels, n_antennas,
 *   n_polarizations, 2} with the real and imaginary parts) and dataset
 *   converged (uint8, {n_channels}).
 * @throw std::runtime_error When the file can not be written.
 */
void WriteSolutions(const std::string& filename,
                    const std::vector<Calibration>& calibrations,
                    const base::Metadata& metadata);

/// Reads the solutions written by WriteSolutions().
/// @throw std::runtime_error When the file can not be read or is invalid.
std::vector<Calibration> ReadSolutions(const std::string& filename);

}  // namespace selfcal::calibration

#endif  // SELFCAL_CALIBRATION_SOLUTION_FILE_H_
