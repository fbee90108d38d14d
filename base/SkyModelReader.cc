// SkyModelReader.cc: Reads a sky model from a JSON file.
//
// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "SkyModelReader.h"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <casacore/casa/Quanta/MVAngle.h>
#include <casacore/casa/Quanta/Quantum.h>

#include <aocommon/logger.h>

#include "GaussianSource.h"
#include "Patch.h"
#include "PointSource.h"

using boost::property_tree::ptree;

namespace selfcal::base {

namespace {

std::string GetName(const ptree& node, size_t index) {
  return node.get<std::string>("name", "source" + std::to_string(index));
}

double GetDouble(const ptree& node, const std::string& key,
                 const std::string& source_name) {
  const boost::optional<double> value = node.get_optional<double>(key);
  if (!value) {
    throw std::runtime_error("Source '" + source_name +
                             "' has no valid numeric value for '" + key + "'");
  }
  return *value;
}

double GetAngle(const ptree& node, const std::string& key,
                const std::string& source_name) {
  const boost::optional<std::string> value =
      node.get_optional<std::string>(key);
  if (!value) {
    throw std::runtime_error("Source '" + source_name + "' has no '" + key +
                             "'");
  }
  try {
    return ParseAngle(*value);
  } catch (std::runtime_error& error) {
    throw std::runtime_error("Source '" + source_name + "': " + error.what());
  }
}

ModelComponent::ConstPtr ReadSource(const ptree& node, size_t index);

ModelComponent::ConstPtr ReadPatch(const std::string& name,
                                   const ptree& components) {
  std::vector<ModelComponent::ConstPtr> parts;
  size_t component_index = 0;
  for (const ptree::value_type& component : components) {
    parts.push_back(ReadSource(component.second, component_index));
    ++component_index;
  }
  if (parts.empty()) {
    throw std::runtime_error("Source '" + name + "' has no components");
  }
  return std::make_shared<Patch>(name, std::move(parts));
}

ModelComponent::ConstPtr ReadSource(const ptree& node, size_t index) {
  const std::string name = GetName(node, index);
  const boost::optional<const ptree&> components =
      node.get_child_optional("components");
  if (components) return ReadPatch(name, *components);

  const Direction direction(GetAngle(node, "ra", name),
                            GetAngle(node, "dec", name));
  const Stokes stokes(GetDouble(node, "I", name), node.get<double>("Q", 0.0),
                      node.get<double>("U", 0.0), node.get<double>("V", 0.0));

  std::shared_ptr<PointSource> source;
  if (node.count("major-fwhm") != 0 || node.count("minor-fwhm") != 0) {
    source = std::make_shared<GaussianSource>(
        name, direction, stokes, GetAngle(node, "major-fwhm", name),
        GetAngle(node, "minor-fwhm", name),
        node.count("position-angle") != 0
            ? GetAngle(node, "position-angle", name)
            : 0.0);
  } else {
    source = std::make_shared<PointSource>(name, direction, stokes);
  }

  const boost::optional<const ptree&> index_node =
      node.get_child_optional("index");
  if (index_node && !index_node->empty()) {
    std::vector<double> terms;
    for (const ptree::value_type& term : *index_node) {
      const boost::optional<double> value =
          term.second.get_value_optional<double>();
      if (!value) {
        throw std::runtime_error("Source '" + name +
                                 "' has an invalid spectral index term");
      }
      terms.push_back(*value);
    }
    source->SetSpectralTerms(GetDouble(node, "freq", name), std::move(terms));
  }
  return source;
}

}  // namespace

double ParseAngle(const std::string& value) {
  const char* begin = value.c_str();
  char* end = nullptr;
  const double radians = std::strtod(begin, &end);
  if (end != begin && *end == '\0') return radians;

  casacore::Quantity quantity;
  if (!casacore::MVAngle::read(quantity, value)) {
    throw std::runtime_error(value + " is an invalid angle");
  }
  return quantity.getValue("rad");
}

std::vector<ModelComponent::ConstPtr> ReadSkyModel(
    std::istream& stream, const std::string& source_name) {
  ptree root;
  try {
    boost::property_tree::read_json(stream, root);
  } catch (boost::property_tree::json_parser_error& error) {
    throw std::runtime_error("Error parsing sky model " + source_name + ": " +
                             error.what());
  }

  std::vector<ModelComponent::ConstPtr> sources;
  size_t index = 0;
  try {
    for (const ptree::value_type& node : root) {
      sources.push_back(ReadSource(node.second, index));
      ++index;
    }
  } catch (std::runtime_error& error) {
    throw std::runtime_error("Error in sky model " + source_name + ": " +
                             error.what());
  } catch (std::invalid_argument& error) {
    throw std::runtime_error("Error in sky model " + source_name + ": " +
                             error.what());
  }
  aocommon::Logger::Debug << "Read " << sources.size() << " sources from "
                          << source_name << '\n';
  return sources;
}

std::vector<ModelComponent::ConstPtr> ReadSkyModel(
    const std::string& filename) {
  std::ifstream file(filename);
  if (!file) throw std::runtime_error("Unable to open sky model " + filename);
  return ReadSkyModel(file, filename);
}

}  // namespace selfcal::base
