// MeasurementSet.cc: Reads visibilities and metadata from a measurement set and
// writes visibilities back.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "MeasurementSet.h"

#include <stdexcept>
#include <vector>

#include <casacore/casa/Arrays/Array.h>
#include <casacore/casa/Arrays/Matrix.h>
#include <casacore/casa/Arrays/Vector.h>
#include <casacore/casa/Containers/Record.h>
#include <casacore/casa/Exceptions/Error.h>
#include <casacore/casa/Utilities/LinearSearch.h>
#include <casacore/tables/Tables/ArrayColumn.h>
#include <casacore/tables/Tables/ScalarColumn.h>
#include <casacore/tables/Tables/TableDesc.h>
#include <casacore/tables/Tables/TableRecord.h>

#include <aocommon/logger.h>

#include "Beam.h"

using casacore::ArrayColumn;
using casacore::IPosition;
using casacore::ScalarColumn;
using casacore::Table;

namespace selfcal::base {

MeasurementSet::MeasurementSet(const std::string& path, bool writable)
    : path_(path) {
  try {
    table_ = Table(path, writable ? Table::Update : Table::Old);
  } catch (casacore::AipsError& error) {
    throw std::runtime_error("Unable to open measurement set " + path + ": " +
                             error.what());
  }
}

size_t MeasurementSet::NTimes() const {
  const casacore::Vector<double> row_times =
      ScalarColumn<double>(table_, "TIME").getColumn();
  size_t n_times = 0;
  for (size_t row = 0; row != row_times.size(); ++row) {
    if (row == 0 || row_times[row] != row_times[row - 1]) ++n_times;
  }
  if (n_times == 0) throw std::runtime_error(path_ + " has no rows");
  return n_times;
}

bool MeasurementSet::HasColumn(const std::string& name) const {
  return table_.tableDesc().isColumn(name);
}

std::shared_ptr<const Metadata> MeasurementSet::ReadMetadata(
    std::shared_ptr<const Beam> beam) const {
  // Get the antenna names and positions.
  const Table antenna_table(table_.keywordSet().asTable("ANTENNA"));
  const casacore::Vector<casacore::String> names =
      ScalarColumn<casacore::String>(antenna_table, "NAME").getColumn();
  const casacore::Matrix<double> positions(
      ArrayColumn<double>(antenna_table, "POSITION").getColumn());
  std::vector<Antenna> antennas(antenna_table.nrow());
  for (size_t i = 0; i != antennas.size(); ++i) {
    antennas[i].name = names[i];
    antennas[i].position = {positions(0, i), positions(1, i),
                            positions(2, i)};
  }

  // Only the first spectral window is used.
  const Table spw_table(table_.keywordSet().asTable("SPECTRAL_WINDOW"));
  if (spw_table.nrow() == 0)
    throw std::runtime_error("SPECTRAL_WINDOW table of " + path_ +
                             " is empty");
  if (spw_table.nrow() > 1)
    aocommon::Logger::Warn << path_
                           << " has multiple spectral windows, only the "
                              "first one is used.\n";
  const std::vector<double> frequencies =
      ArrayColumn<double>(spw_table, "CHAN_FREQ")(0).tovector();

  // Only use the main value from the PHASE_DIR array.
  const Table field_table(table_.keywordSet().asTable("FIELD"));
  if (field_table.nrow() == 0)
    throw std::runtime_error("FIELD table of " + path_ + " is empty");
  const casacore::Matrix<double> phase_dir(
      ArrayColumn<double>(field_table, "PHASE_DIR")(0));
  const Direction phase_centre(phase_dir(0, 0), phase_dir(1, 0));

  // Derive the time and baseline layout from the main table.
  const casacore::Vector<double> row_times =
      ScalarColumn<double>(table_, "TIME").getColumn();
  const casacore::Vector<int> antenna1 =
      ScalarColumn<int>(table_, "ANTENNA1").getColumn();
  const casacore::Vector<int> antenna2 =
      ScalarColumn<int>(table_, "ANTENNA2").getColumn();
  const size_t n_rows = row_times.size();
  if (n_rows == 0) throw std::runtime_error(path_ + " has no rows");

  std::vector<double> times;
  for (size_t row = 0; row != n_rows; ++row) {
    if (times.empty() || row_times[row] != times.back()) {
      times.push_back(row_times[row]);
    }
  }
  const size_t n_times = times.size();
  if (n_rows % n_times != 0) {
    throw std::runtime_error("The number of rows in " + path_ +
                             " is not a multiple of the number of times");
  }
  const size_t n_baselines = n_rows / n_times;

  std::vector<Baseline> baselines;
  baselines.reserve(n_baselines);
  for (size_t row = 0; row != n_baselines; ++row) {
    baselines.emplace_back(antenna1[row], antenna2[row]);
  }
  for (size_t row = 0; row != n_rows; ++row) {
    const Baseline& expected = baselines[row % n_baselines];
    if (row_times[row] != times[row / n_baselines] ||
        size_t(antenna1[row]) != expected.antenna1 ||
        size_t(antenna2[row]) != expected.antenna2) {
      throw std::runtime_error(
          "The ANTENNA1/ANTENNA2/TIME columns of " + path_ +
          " are not ordered by time with a fixed baseline order (row " +
          std::to_string(row) + ")");
    }
  }

  const casacore::Matrix<double> row_uvw(
      ArrayColumn<double>(table_, "UVW").getColumn());
  xt::xtensor<double, 3> uvw({n_times, n_baselines, 3});
  for (size_t row = 0; row != n_rows; ++row) {
    for (size_t i = 0; i != 3; ++i) {
      uvw(row / n_baselines, row % n_baselines, i) = row_uvw(i, row);
    }
  }

  aocommon::Logger::Info << path_ << ": " << antennas.size() << " antennas, "
                         << n_baselines << " baselines, "
                         << frequencies.size() << " channels, " << n_times
                         << " times\n";
  return std::make_shared<const Metadata>(
      std::move(antennas), std::move(baselines), frequencies, std::move(times),
      std::move(uvw), phase_centre, std::move(beam));
}

xt::xarray<std::complex<double>> MeasurementSet::ReadData(
    const std::string& column) const {
  if (!HasColumn(column))
    throw std::runtime_error("Column " + column + " does not exist in " +
                             path_);
  const casacore::Array<casacore::Complex> data =
      ArrayColumn<casacore::Complex>(table_, column).getColumn();
  casacore::Array<bool> flags;
  if (HasColumn("FLAG")) {
    flags = ArrayColumn<bool>(table_, "FLAG").getColumn();
    if (!flags.shape().isEqual(data.shape()))
      throw std::runtime_error("FLAG and " + column + " columns of " + path_ +
                               " have different shapes");
  }

  // The casacore array has shape (n_correlations, n_channels, n_rows), which
  // in memory equals {n_rows, n_channels, n_correlations} in row-major order.
  const IPosition& shape = data.shape();
  const size_t n_rows = table_.nrow();
  const size_t n_times = NTimes();
  if (shape.size() != 3 || static_cast<size_t>(shape[2]) != n_rows ||
      n_rows % n_times != 0) {
    throw std::runtime_error("Unexpected shape of column " + column + " in " +
                             path_);
  }

  auto result = xt::xarray<std::complex<double>>::from_shape(
      {n_times, n_rows / n_times, size_t(shape[1]), size_t(shape[0])});
  bool delete_data = false;
  bool delete_flags = false;
  const casacore::Complex* data_storage = data.getStorage(delete_data);
  const bool* flag_storage =
      flags.empty() ? nullptr : flags.getStorage(delete_flags);
  for (size_t i = 0; i != result.size(); ++i) {
    if (flag_storage && flag_storage[i]) {
      result.data()[i] = std::complex<double>(0.0, 0.0);
    } else {
      result.data()[i] = std::complex<double>(data_storage[i]);
    }
  }
  data.freeStorage(data_storage, delete_data);
  if (flag_storage) flags.freeStorage(flag_storage, delete_flags);
  return result;
}

void MeasurementSet::AddColumnLike(const std::string& column,
                                   const std::string& template_column) {
  // Use the same storage manager as the template column.
  const casacore::Record dminfo = table_.dataManagerInfo();
  casacore::Record colinfo;
  for (size_t i = 0; i < dminfo.nfields(); ++i) {
    const casacore::Record& subrec = dminfo.subRecord(i);
    if (casacore::linearSearch1(casacore::Vector<casacore::String>(
                                    subrec.asArrayString("COLUMNS")),
                                casacore::String(template_column)) >= 0) {
      colinfo = subrec;
      break;
    }
  }
  if (colinfo.nfields() == 0)
    throw std::runtime_error("Could not obtain column info of " +
                             template_column + " in " + path_);
  casacore::TableDesc td;
  td.addColumn(table_.tableDesc().columnDesc(template_column), column);
  colinfo.define("NAME", column + "_dm");
  table_.addColumn(td, colinfo);
  aocommon::Logger::Info << "Added column " << column << " to " << path_
                         << '\n';
}

void MeasurementSet::WriteData(const std::string& column,
                               const xt::xarray<std::complex<double>>& data,
                               bool create) {
  if (!table_.isWritable()) table_.reopenRW();
  if (!HasColumn(column)) {
    if (!create)
      throw std::runtime_error("Column " + column + " does not exist in " +
                               path_);
    AddColumnLike(column, "DATA");
  }

  const size_t n_rows = table_.nrow();
  if (data.dimension() != 4 || data.shape(0) * data.shape(1) != n_rows) {
    throw std::runtime_error("Visibilities to write do not match the " +
                             std::to_string(n_rows) + " rows of " + path_);
  }
  const IPosition shape(3, data.shape(3), data.shape(2), n_rows);
  casacore::Array<casacore::Complex> casa_data(shape);
  bool delete_storage = false;
  casacore::Complex* storage = casa_data.getStorage(delete_storage);
  for (size_t i = 0; i != data.size(); ++i) {
    storage[i] = casacore::Complex(data.data()[i]);
  }
  casa_data.putStorage(storage, delete_storage);
  ArrayColumn<casacore::Complex>(table_, column).putColumn(casa_data);
  table_.flush();
}

}  // namespace selfcal::base
