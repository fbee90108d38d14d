// SolutionFile.cc: Stores calibration solutions in HDF5 files.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "SolutionFile.h"

#include <array>
#include <cstdint>
#include <stdexcept>

#include <H5Cpp.h>

#include <aocommon/logger.h>

namespace selfcal::calibration {

namespace {

std::string GroupName(size_t direction) {
  return "direction" + std::to_string(direction);
}

void WriteStringAttribute(H5::H5Object& object, const std::string& name,
                          const std::string& value) {
  const H5::StrType type(H5::PredType::C_S1, value.size());
  H5::Attribute attribute =
      object.createAttribute(name, type, H5::DataSpace(H5S_SCALAR));
  attribute.write(type, value);
}

std::string ReadStringAttribute(const H5::H5Object& object,
                                const std::string& name) {
  const H5::Attribute attribute = object.openAttribute(name);
  std::string value;
  attribute.read(attribute.getStrType(), value);
  return value;
}

void WriteDirection(H5::H5File& file, size_t direction,
                    const Calibration& calibration) {
  H5::Group group = file.createGroup(GroupName(direction));
  WriteStringAttribute(group, "type", ToString(calibration.GetType()));

  const std::array<hsize_t, 4> gain_dims{
      calibration.NChannels(), calibration.NAntennas(),
      NGainPolarizations(calibration.GetType()), 2};
  const H5::DataSpace gain_space(gain_dims.size(), gain_dims.data());
  H5::DataSet gains = group.createDataSet(
      "gains", H5::PredType::IEEE_F64LE, gain_space);
  // A complex<double> is stored as two consecutive doubles.
  gains.write(calibration.Gains().data(), H5::PredType::NATIVE_DOUBLE);

  std::vector<uint8_t> converged(calibration.NChannels());
  for (size_t channel = 0; channel != converged.size(); ++channel) {
    converged[channel] = calibration.IsConverged(channel) ? 1 : 0;
  }
  const hsize_t converged_dims = converged.size();
  const H5::DataSpace converged_space(1, &converged_dims);
  H5::DataSet converged_set = group.createDataSet(
      "converged", H5::PredType::STD_U8LE, converged_space);
  converged_set.write(converged.data(), H5::PredType::NATIVE_UINT8);
}

Calibration ReadDirection(const H5::H5File& file, size_t direction) {
  const H5::Group group = file.openGroup(GroupName(direction));
  const GainType type = StringToGainType(ReadStringAttribute(group, "type"));

  const H5::DataSet gains = group.openDataSet("gains");
  const H5::DataSpace gain_space = gains.getSpace();
  std::array<hsize_t, 4> gain_dims;
  if (gain_space.getSimpleExtentNdims() != 4) {
    throw std::runtime_error("Gains of " + GroupName(direction) +
                             " should have 4 dimensions");
  }
  gain_space.getSimpleExtentDims(gain_dims.data());
  if (gain_dims[2] != NGainPolarizations(type) || gain_dims[3] != 2) {
    throw std::runtime_error("Gains of " + GroupName(direction) +
                             " do not match gain type " + ToString(type));
  }
  Calibration calibration(gain_dims[0], gain_dims[1], type);
  gains.read(calibration.Gains().data(), H5::PredType::NATIVE_DOUBLE);

  const H5::DataSet converged_set = group.openDataSet("converged");
  hsize_t n_converged = 0;
  const H5::DataSpace converged_space = converged_set.getSpace();
  if (converged_space.getSimpleExtentNdims() != 1) {
    throw std::runtime_error("Converged flags of " + GroupName(direction) +
                             " should have 1 dimension");
  }
  converged_space.getSimpleExtentDims(&n_converged);
  if (n_converged != calibration.NChannels()) {
    throw std::runtime_error("Converged flags of " + GroupName(direction) +
                             " do not match the number of channels");
  }
  std::vector<uint8_t> converged(n_converged);
  converged_set.read(converged.data(), H5::PredType::NATIVE_UINT8);
  for (size_t channel = 0; channel != converged.size(); ++channel) {
    calibration.SetConverged(channel, converged[channel] != 0);
  }
  return calibration;
}

}  // namespace

void WriteSolutions(const std::string& filename,
                    const std::vector<Calibration>& calibrations,
                    const base::Metadata& metadata) {
  try {
    H5::H5File file(filename, H5F_ACC_TRUNC);

    const unsigned int n_directions = calibrations.size();
    H5::Attribute n_directions_attribute = file.createAttribute(
        "n_directions", H5::PredType::STD_U32LE, H5::DataSpace(H5S_SCALAR));
    n_directions_attribute.write(H5::PredType::NATIVE_UINT, &n_directions);

    const std::vector<double>& frequencies = metadata.ChannelFrequencies();
    const hsize_t n_frequencies = frequencies.size();
    H5::DataSet frequency_set =
        file.createDataSet("frequencies", H5::PredType::IEEE_F64LE,
                           H5::DataSpace(1, &n_frequencies));
    frequency_set.write(frequencies.data(), H5::PredType::NATIVE_DOUBLE);

    for (size_t direction = 0; direction != calibrations.size(); ++direction) {
      WriteDirection(file, direction, calibrations[direction]);
    }
    file.close();
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Error writing solutions to '" + filename +
                             "': " + e.getDetailMsg());
  }
  aocommon::Logger::Info << "Wrote solutions of " << calibrations.size()
                         << " direction(s) to " << filename << '\n';
}

std::vector<Calibration> ReadSolutions(const std::string& filename) {
  try {
    const H5::H5File file(filename, H5F_ACC_RDONLY);
    unsigned int n_directions = 0;
    file.openAttribute("n_directions")
        .read(H5::PredType::NATIVE_UINT, &n_directions);

    std::vector<Calibration> calibrations;
    calibrations.reserve(n_directions);
    for (size_t direction = 0; direction != n_directions; ++direction) {
      calibrations.push_back(ReadDirection(file, direction));
    }
    return calibrations;
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Error reading solutions from '" + filename +
                             "': " + e.getDetailMsg());
  }
}

}  // namespace selfcal::calibration
