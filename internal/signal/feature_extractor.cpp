#include "feature_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

#include "internal/signal/fft.hpp"
#include "internal/signal/wavelet.hpp"
#include "internal/util/errors.hpp"

namespace glucolumin::signal {

namespace {

const std::vector<std::string> kTimeDomainNames = {"feat_mean", "feat_std", "feat_rms", "feat_peak_to_peak"};

const std::vector<std::string> kSpectralNames = {"fft_peak1_power", "fft_peak2_power", "dominant_frequency", "low_band_energy_ratio",
                                                 "spectral_entropy"};

double Mean(const std::vector<double>& v) {
  return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

void RequireFinite(const std::vector<double>& values, const char* stage) {
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (!std::isfinite(values[i])) {
      throw util::SignalProcessingError(std::string("non-finite value after ") + stage + " at sample " + std::to_string(i));
    }
  }
}

struct SpectralFeatures {
  double peak1              = 0.0;
  double peak2              = 0.0;
  double dominant_frequency = 0.0;
  double low_band_ratio     = 0.0;
  double entropy            = 0.0;
};

SpectralFeatures ComputeSpectral(const std::vector<double>& signal) {
  SpectralFeatures out;
  const auto       magnitude = HalfSpectrumMagnitude(signal);
  const auto       half      = magnitude.size();
  if (half == 0) {
    return out;
  }

  auto sorted = magnitude;
  std::sort(sorted.begin(), sorted.end(), std::greater<>());
  out.peak1 = sorted[0];
  out.peak2 = sorted.size() > 1 ? sorted[1] : 0.0;

  // Dominant frequency ignores DC, which carries the signal offset.
  if (half > 1) {
    const auto dominant    = std::max_element(magnitude.begin() + 1, magnitude.end()) - magnitude.begin();
    out.dominant_frequency = static_cast<double>(dominant) / static_cast<double>(signal.size());

    const std::size_t cutoff = std::max<std::size_t>(2, signal.size() / 8);
    double            low    = 0.0;
    double            total  = 0.0;
    for (std::size_t k = 1; k < half; ++k) {
      const double power = magnitude[k] * magnitude[k];
      total += power;
      if (k < cutoff) low += power;
    }
    out.low_band_ratio = total > 0.0 ? low / total : 0.0;
  }

  const double sum = std::accumulate(magnitude.begin(), magnitude.end(), 0.0);
  if (sum > 0.0) {
    for (double m : magnitude) {
      const double p = m / sum;
      if (p > 0.0) out.entropy -= p * std::log(p);
    }
  }
  return out;
}

} // namespace

FeatureExtractor::FeatureExtractor(SignalConditioningOptions options) : options_(options), filter_(options.savgol) {
  if (options_.min_samples < options_.savgol.window_length) {
    throw std::invalid_argument("feature extractor: min_samples must be >= savgol window_length");
  }
  if (options_.wavelet_levels == 0) {
    throw std::invalid_argument("feature extractor: wavelet_levels must be >= 1");
  }

  names_ = kTimeDomainNames;
  names_.insert(names_.end(), kSpectralNames.begin(), kSpectralNames.end());
  const auto wavelet_names = WaveletFeatureNames(options_.wavelet_levels);
  names_.insert(names_.end(), wavelet_names.begin(), wavelet_names.end());
}

std::vector<double> FeatureExtractor::Condition(const std::vector<double>& samples) const {
  if (samples.size() < options_.min_samples) {
    throw util::InsufficientSamplesError("need at least " + std::to_string(options_.min_samples) + " samples, got " +
                                         std::to_string(samples.size()));
  }

  std::vector<double> input = samples;
  if (Mean(input) < options_.low_magnitude_threshold) {
    for (auto& v : input) v *= options_.low_magnitude_gain;
  }

  auto smoothed = filter_.Apply(input);
  RequireFinite(smoothed, "smoothing");
  return smoothed;
}

model::FeatureVector FeatureExtractor::Extract(const std::vector<double>& samples) const {
  const auto signal = Condition(samples);

  const double mean = Mean(signal);
  double       sq   = 0.0;
  double       var  = 0.0;
  for (double v : signal) {
    sq += v * v;
    var += (v - mean) * (v - mean);
  }
  const auto [lo, hi] = std::minmax_element(signal.begin(), signal.end());
  const double n      = static_cast<double>(signal.size());

  const auto spectral = ComputeSpectral(signal);
  const auto energies = BandEnergies(Db4Wavedec(signal, options_.wavelet_levels));

  std::vector<double> values = {
      mean,
      std::sqrt(var / n),
      std::sqrt(sq / n),
      *hi - *lo,
      spectral.peak1,
      spectral.peak2,
      spectral.dominant_frequency,
      spectral.low_band_ratio,
      spectral.entropy,
  };
  values.insert(values.end(), energies.begin(), energies.end());

  if (values.size() != names_.size()) {
    throw util::SignalProcessingError("feature vector has " + std::to_string(values.size()) + " values, expected " +
                                      std::to_string(names_.size()));
  }
  RequireFinite(values, "feature extraction");

  model::FeatureVector features;
  features.reserve(values.size());
  for (std::size_t i = 0; i < values.size(); ++i) {
    features.push_back({names_[i], values[i]});
  }
  return features;
}

} // namespace glucolumin::signal
