#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <numbers>
#include <stdexcept>
#include <vector>

#include "internal/signal/feature_extractor.hpp"
#include "internal/util/errors.hpp"

namespace {

using glucolumin::model::FindFeature;
using glucolumin::signal::FeatureExtractor;
using glucolumin::signal::SignalConditioningOptions;

double Get(const glucolumin::model::FeatureVector& features, const std::string& name) {
  auto value = FindFeature(features, name);
  assert(value.has_value());
  return *value;
}

void TestFeatureOrder() {
  FeatureExtractor extractor(SignalConditioningOptions{});
  const auto&      names = extractor.FeatureNames();

  const std::vector<std::string> expected = {"feat_mean",
                                             "feat_std",
                                             "feat_rms",
                                             "feat_peak_to_peak",
                                             "fft_peak1_power",
                                             "fft_peak2_power",
                                             "dominant_frequency",
                                             "low_band_energy_ratio",
                                             "spectral_entropy",
                                             "wavelet_energy_low",
                                             "wavelet_energy_mid",
                                             "wavelet_energy_high"};
  assert(names == expected);

  const auto features = extractor.Extract(std::vector<double>(64, 120.0));
  assert(glucolumin::model::FeatureNames(features) == expected);
}

void TestConstantSignal() {
  FeatureExtractor extractor(SignalConditioningOptions{});
  const auto       features = extractor.Extract(std::vector<double>(64, 200.0));

  assert(std::fabs(Get(features, "feat_mean") - 200.0) < 1e-9);
  assert(Get(features, "feat_std") < 1e-9);
  assert(std::fabs(Get(features, "feat_rms") - 200.0) < 1e-9);
  assert(Get(features, "feat_peak_to_peak") < 1e-9);
  // All power is at DC.
  assert(std::fabs(Get(features, "fft_peak1_power") - 200.0 * 64) < 1e-6);
}

void TestLowMagnitudeRescale() {
  FeatureExtractor extractor(SignalConditioningOptions{});
  const auto       features = extractor.Extract(std::vector<double>(64, 1.5));
  assert(std::fabs(Get(features, "feat_mean") - 990.0) < 1e-6);

  // Above the threshold the signal is used as is.
  const auto raw = extractor.Extract(std::vector<double>(64, 10.0));
  assert(std::fabs(Get(raw, "feat_mean") - 10.0) < 1e-9);
}

void TestSinusoidSpectralFeatures() {
  FeatureExtractor    extractor(SignalConditioningOptions{});
  const std::size_t   n = 128;
  std::vector<double> samples;
  for (std::size_t i = 0; i < n; ++i) {
    samples.push_back(200.0 + 50.0 * std::sin(2.0 * std::numbers::pi * 8.0 * static_cast<double>(i) / static_cast<double>(n)));
  }

  const auto features = extractor.Extract(samples);
  assert(std::fabs(Get(features, "dominant_frequency") - 8.0 / 128.0) < 1e-12);
  assert(Get(features, "low_band_energy_ratio") > 0.95);
  assert(Get(features, "spectral_entropy") > 0.0);
  assert(Get(features, "feat_peak_to_peak") > 90.0);
}

void TestDeterministic() {
  FeatureExtractor    extractor(SignalConditioningOptions{});
  std::vector<double> samples;
  for (int i = 0; i < 300; ++i) {
    samples.push_back(150.0 + std::sin(0.1 * i) + 0.01 * (i % 7));
  }
  const auto a = extractor.Extract(samples);
  const auto b = extractor.Extract(samples);
  assert(a.size() == b.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    assert(a[i].name == b[i].name);
    assert(a[i].value == b[i].value);
  }
}

void TestShortSeriesRejected() {
  FeatureExtractor extractor(SignalConditioningOptions{});
  bool             threw = false;
  try {
    extractor.Extract(std::vector<double>(15, 100.0));
  } catch (const glucolumin::util::InsufficientSamplesError&) {
    threw = true;
  }
  assert(threw);
}

void TestNonFiniteSampleRejected() {
  FeatureExtractor    extractor(SignalConditioningOptions{});
  std::vector<double> samples(32, 100.0);
  samples[7] = std::numeric_limits<double>::quiet_NaN();

  bool threw = false;
  try {
    extractor.Extract(samples);
  } catch (const glucolumin::util::SignalProcessingError&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidOptions() {
  SignalConditioningOptions options;
  options.min_samples = 5;

  bool threw = false;
  try {
    FeatureExtractor extractor(options);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFeatureOrder();
  TestConstantSignal();
  TestLowMagnitudeRescale();
  TestSinusoidSpectralFeatures();
  TestDeterministic();
  TestShortSeriesRejected();
  TestNonFiniteSampleRejected();
  TestInvalidOptions();

  std::cout << "glucolumin_unit_feature_extractor: pass\n";
  return 0;
}
