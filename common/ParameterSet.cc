// ParameterSet.cc: Implements a map of Key-Value pairs.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ParameterSet.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace selfcal::common {

namespace {

std::runtime_error ConversionError(const std::string& key,
                                   const std::string& value,
                                   const std::string& type) {
  return std::runtime_error("Parameter '" + key + "' has value '" + value +
                            "', which can not be converted to " + type);
}

long ParseInteger(const std::string& key, const std::string& value) {
  const char* begin = value.c_str();
  char* end = nullptr;
  errno = 0;
  const long result = std::strtol(begin, &end, 10);
  if (end == begin || *end != '\0' || errno == ERANGE)
    throw ConversionError(key, value, "an integer");
  return result;
}

}  // namespace

ParameterSet::ParameterSet(const std::string& filename) {
  adoptFile(filename);
}

void ParameterSet::clear() {
  values_.clear();
  accessed_keys_.clear();
}

void ParameterSet::adoptFile(const std::string& filename,
                             const std::string& prefix) {
  std::ifstream file(filename);
  if (!file)
    throw std::runtime_error("Unable to open parameter file " + filename);
  std::stringstream buffer;
  buffer << file.rdbuf();
  adoptBuffer(buffer.str(), prefix);
}

void ParameterSet::adoptBuffer(const std::string& buffer,
                               const std::string& prefix) {
  std::istringstream stream(buffer);
  std::string line;
  size_t line_number = 0;
  while (std::getline(stream, line)) {
    ++line_number;
    const size_t comment = line.find('#');
    if (comment != std::string::npos) line.erase(comment);
    boost::algorithm::trim(line);
    if (line.empty()) continue;
    const size_t separator = line.find('=');
    if (separator == std::string::npos) {
      throw std::runtime_error("Line " + std::to_string(line_number) +
                               " of parameter set has no key=value syntax: " +
                               line);
    }
    const std::string key =
        boost::algorithm::trim_copy(line.substr(0, separator));
    const std::string value =
        boost::algorithm::trim_copy(line.substr(separator + 1));
    replace(prefix + key, value);
  }
}

void ParameterSet::adoptArgv(int nr, char const* const argv[]) {
  for (int i = 0; i < nr; ++i) {
    const std::string argument = argv[i];
    const size_t separator = argument.find('=');
    if (separator == std::string::npos || separator == 0) continue;
    std::string key = argument.substr(0, separator);
    const size_t first = key.find_first_not_of('-');
    if (first == std::string::npos) continue;
    key.erase(0, first);
    replace(key, argument.substr(separator + 1));
  }
}

void ParameterSet::add(const std::string& key, const std::string& value) {
  if (!values_.emplace(key, value).second)
    throw std::runtime_error("Parameter '" + key + "' is already defined");
}

void ParameterSet::replace(const std::string& key, const std::string& value) {
  values_[key] = value;
}

void ParameterSet::remove(const std::string& key) { values_.erase(key); }

bool ParameterSet::isDefined(const std::string& key) const {
  accessed_keys_.insert(key);
  return values_.find(key) != values_.end();
}

const std::string& ParameterSet::get(const std::string& key) const {
  accessed_keys_.insert(key);
  const auto iterator = values_.find(key);
  if (iterator == values_.end())
    throw std::runtime_error("Parameter '" + key + "' is not defined");
  return iterator->second;
}

bool ParameterSet::getBool(const std::string& key) const {
  const std::string value = get(key);
  const std::string lowercase = boost::to_lower_copy(value);
  if (lowercase == "true" || lowercase == "t" || lowercase == "yes" ||
      lowercase == "y" || lowercase == "1")
    return true;
  if (lowercase == "false" || lowercase == "f" || lowercase == "no" ||
      lowercase == "n" || lowercase == "0")
    return false;
  throw ConversionError(key, value, "a boolean");
}

bool ParameterSet::getBool(const std::string& key, bool default_value) const {
  return isDefined(key) ? getBool(key) : default_value;
}

int ParameterSet::getInt(const std::string& key) const {
  const std::string& value = get(key);
  const long result = ParseInteger(key, value);
  if (result < std::numeric_limits<int>::min() ||
      result > std::numeric_limits<int>::max())
    throw ConversionError(key, value, "an integer");
  return result;
}

int ParameterSet::getInt(const std::string& key, int default_value) const {
  return isDefined(key) ? getInt(key) : default_value;
}

unsigned int ParameterSet::getUint(const std::string& key) const {
  const std::string& value = get(key);
  const long result = ParseInteger(key, value);
  if (result < 0 || static_cast<unsigned long>(result) >
                        std::numeric_limits<unsigned int>::max())
    throw ConversionError(key, value, "an unsigned integer");
  return result;
}

unsigned int ParameterSet::getUint(const std::string& key,
                                   unsigned int default_value) const {
  return isDefined(key) ? getUint(key) : default_value;
}

double ParameterSet::getDouble(const std::string& key) const {
  const std::string& value = get(key);
  const char* begin = value.c_str();
  char* end = nullptr;
  const double result = std::strtod(begin, &end);
  if (end == begin || *end != '\0')
    throw ConversionError(key, value, "a floating point value");
  return result;
}

double ParameterSet::getDouble(const std::string& key,
                               double default_value) const {
  return isDefined(key) ? getDouble(key) : default_value;
}

std::string ParameterSet::getString(const std::string& key) const {
  return get(key);
}

std::string ParameterSet::getString(const std::string& key,
                                    const std::string& default_value) const {
  return isDefined(key) ? get(key) : default_value;
}

std::vector<std::string> ParameterSet::getStringVector(
    const std::string& key,
    const std::vector<std::string>& default_value) const {
  if (!isDefined(key)) return default_value;
  std::string value = boost::algorithm::trim_copy(get(key));
  if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
    value = value.substr(1, value.size() - 2);
  }
  std::vector<std::string> result;
  if (boost::algorithm::trim_copy(value).empty()) return result;
  boost::algorithm::split(result, value, boost::algorithm::is_any_of(","));
  for (std::string& element : result) boost::algorithm::trim(element);
  return result;
}

std::vector<std::string> ParameterSet::unusedKeys() const {
  std::vector<std::string> unused;
  for (const auto& [key, value] : values_) {
    if (accessed_keys_.count(key) == 0) unused.push_back(key);
  }
  return unused;
}

std::ostream& operator<<(std::ostream& stream, const ParameterSet& set) {
  for (const auto& [key, value] : set.values_) {
    stream << key << '=' << value << '\n';
  }
  return stream;
}

}  // namespace selfcal::common
