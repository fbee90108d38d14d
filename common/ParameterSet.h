// ParameterSet.h: Implements a map of Key-Value pairs.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_COMMON_PARAMETERSET_H_
#define SELFCAL_COMMON_PARAMETERSET_H_

#include <map>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace selfcal::common {

/// \brief Implements a map of Key-Value pairs.

/// The ParameterSet class is a key-value implementation of the type
/// map<string, string>.
/// Values are stored as a string and converted on request by the getXxx
/// routines. Conversion errors throw std::runtime_error naming the key.
/// Keys that were never asked for can be listed with unusedKeys(), which
/// helps to report misspelled settings.
class ParameterSet {
 public:
  using const_iterator = std::map<std::string, std::string>::const_iterator;

  /// Create an empty collection.
  ParameterSet() = default;

  /// Construct a ParameterSet from the contents of \a filename.
  explicit ParameterSet(const std::string& filename);

  bool empty() const { return values_.empty(); }
  size_t size() const { return values_.size(); }

  const_iterator begin() const { return values_.begin(); }
  const_iterator end() const { return values_.end(); }

  void clear();

  /// Adds the key=value lines in the given file. Empty lines and text after
  /// a '#' are ignored. Each key is prefixed with \a prefix.
  void adoptFile(const std::string& filename, const std::string& prefix = "");

  /// Adds the key=value pairs in the given buffer, see adoptFile().
  void adoptBuffer(const std::string& buffer, const std::string& prefix = "");

  /// Adds the Key-Values pairs in the argument list. Leading dashes of a key
  /// are removed, so both key=value and --key=value are accepted.
  /// It ignores arguments not having the Key=Value syntax.
  void adoptArgv(int nr, char const* const argv[]);

  /// Adds a pair; throws std::runtime_error when the key already exists.
  void add(const std::string& key, const std::string& value);

  /// Adds or replaces a pair.
  void replace(const std::string& key, const std::string& value);

  void remove(const std::string& key);

  bool isDefined(const std::string& key) const;

  /// \name Value conversion
  /// The variants without default throw std::runtime_error when the key is
  /// not defined.
  /// @{
  bool getBool(const std::string& key) const;
  bool getBool(const std::string& key, bool default_value) const;
  int getInt(const std::string& key) const;
  int getInt(const std::string& key, int default_value) const;
  unsigned int getUint(const std::string& key) const;
  unsigned int getUint(const std::string& key,
                       unsigned int default_value) const;
  double getDouble(const std::string& key) const;
  double getDouble(const std::string& key, double default_value) const;
  std::string getString(const std::string& key) const;
  std::string getString(const std::string& key,
                        const std::string& default_value) const;
  /// Parses a value like [a, b, c] or a, b, c.
  std::vector<std::string> getStringVector(
      const std::string& key,
      const std::vector<std::string>& default_value) const;
  /// @}

  /// Keys that were never retrieved or tested with isDefined().
  std::vector<std::string> unusedKeys() const;

  friend std::ostream& operator<<(std::ostream& stream,
                                  const ParameterSet& set);

 private:
  const std::string& get(const std::string& key) const;

  std::map<std::string, std::string> values_;
  mutable std::set<std::string> accessed_keys_;
};

}  // namespace selfcal::common

#endif  // SELFCAL_COMMON_PARAMETERSET_H_
