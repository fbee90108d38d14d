// MeasurementSet.h: Reads visibilities and metadata from a measurement set and
// writes visibilities back.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_MEASUREMENTSET_H_
#define SELFCAL_BASE_MEASUREMENTSET_H_

#include <complex>
#include <memory>
#include <string>

#include <casacore/tables/Tables/Table.h>

#include <xtensor/xarray.hpp>

#include <selfcal/base/Metadata.h>

namespace selfcal::base {

class Beam;

/**
 * Access to the main table of a measurement set and the ANTENNA,
 * SPECTRAL_WINDOW and FIELD subtables.
 *
 * The rows are expected to be ordered by time, with the same baselines in the
 * same order for every time. Only the first spectral window and field are
 * used.
 */
class MeasurementSet {
 public:
  /// @throw std::runtime_error When the table can not be opened.
  MeasurementSet(const std::string& path, bool writable);

  const std::string& Path() const { return path_; }

  bool HasColumn(const std::string& name) const;

  /// @param beam Beam model to attach to the metadata.
  /// @throw std::runtime_error When the table is inconsistent.
  std::shared_ptr<const Metadata> ReadMetadata(
      std::shared_ptr<const Beam> beam) const;

  /**
   * Reads a visibility column, e.g. DATA or CORRECTED_DATA.
   * @returns Array of shape {n_times, n_baselines, n_channels,
   * n_correlations}. Flagged visibilities are set to zero.
   */
  xt::xarray<std::complex<double>> ReadData(const std::string& column) const;

  /**
   * Writes a visibility column. When the column does not exist and @p create
   * is set, it is added with the description and storage of DATA.
   * @throw std::runtime_error When the column does not exist and may not be
   * created, or the shape does not match.
   */
  void WriteData(const std::string& column,
                 const xt::xarray<std::complex<double>>& data, bool create);

 private:
  /// Number of distinct consecutive values in the TIME column.
  size_t NTimes() const;
  void AddColumnLike(const std::string& column,
                     const std::string& template_column);

  std::string path_;
  casacore::Table table_;
};

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_MEASUREMENTSET_H_
