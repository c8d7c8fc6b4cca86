#pragma once

#include <optional>
#include <string>
#include <vector>

namespace glucolumin::model {

struct Feature {
  std::string name;
  double      value = 0.0;
};

// Fixed-order feature list. The order is part of the model contract.
using FeatureVector = std::vector<Feature>;

inline std::vector<std::string> FeatureNames(const FeatureVector& features) {
  std::vector<std::string> names;
  names.reserve(features.size());
  for (const auto& feature : features) {
    names.push_back(feature.name);
  }
  return names;
}

inline std::optional<double> FindFeature(const FeatureVector& features, const std::string& name) {
  for (const auto& feature : features) {
    if (feature.name == name) {
      return feature.value;
    }
  }
  return std::nullopt;
}

} // namespace glucolumin::model
