// SkyModelReader.h: Reads a sky model from a JSON file.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_SKYMODELREADER_H_
#define SELFCAL_BASE_SKYMODELREADER_H_

#include <iosfwd>
#include <string>
#include <vector>

#include "ModelComponent.h"

namespace selfcal::base {

/**
 * Reads the sources of a JSON sky model. The file contains an array of
 * sources like
 * @code
 * [{"name": "Cyg A", "ra": "19h59m28.35663s", "dec": "+40d44m02.0970s",
 *   "I": 21850.0, "Q": 0.0, "U": 0.0, "V": 0.0,
 *   "freq": 47e6, "index": [-0.51, -0.18]}]
 * @endcode
 * Angles are casacore angle strings or numbers in radians. The optional keys
 * "major-fwhm", "minor-fwhm" and "position-angle" (radians) make a
 * GaussianSource. A source with a "components" array of such sources becomes
 * a Patch.
 * @returns The sources in file order.
 * @throw std::runtime_error When the file can not be read or a key is missing
 * or invalid.
 */
std::vector<ModelComponent::ConstPtr> ReadSkyModel(const std::string& filename);

/// As above, reading from a stream. @p source_name is used in messages.
std::vector<ModelComponent::ConstPtr> ReadSkyModel(
    std::istream& stream, const std::string& source_name);

/// Parses an angle: a number in radians, or a casacore angle such as
/// "19h59m28.3s", "+40d44m02.1s" or "40.5deg".
/// @throw std::runtime_error When the value is not an angle.
double ParseAngle(const std::string& value);

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_SKYMODELREADER_H_
