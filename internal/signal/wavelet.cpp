#include "wavelet.hpp"

#include <array>

#include "internal/util/errors.hpp"

namespace glucolumin::signal {

namespace {

constexpr std::array<double, 8> kDb4Low = {
    -0.010597401784997278, 0.032883011666982945, 0.030841381835986965, -0.18703481171888114,
    -0.02798376941698385,  0.6308807679295904,   0.7148465705525415,   0.23037781330885523,
};

// Quadrature mirror of the low-pass decomposition filter.
constexpr std::array<double, 8> MakeHighPass() {
  std::array<double, 8> high{};
  for (std::size_t k = 0; k < kDb4Low.size(); ++k) {
    const double value = kDb4Low[kDb4Low.size() - 1 - k];
    high[k]            = (k % 2 == 0) ? -value : value;
  }
  return high;
}

constexpr std::array<double, 8> kDb4High = MakeHighPass();

std::size_t SymmetricIndex(long long k, std::size_t n) {
  const auto period = static_cast<long long>(2 * n);
  k %= period;
  if (k < 0) k += period;
  return static_cast<std::size_t>(k < static_cast<long long>(n) ? k : period - 1 - k);
}

std::vector<double> DownsampleConvolve(const std::vector<double>& input, const std::array<double, 8>& filter) {
  const std::size_t n      = input.size();
  const std::size_t taps   = filter.size();
  const std::size_t length = (n + taps - 1) / 2;

  std::vector<double> out(length, 0.0);
  for (std::size_t o = 0; o < length; ++o) {
    const long long centre = static_cast<long long>(2 * o + 1);
    double          acc    = 0.0;
    for (std::size_t j = 0; j < taps; ++j) {
      acc += filter[j] * input[SymmetricIndex(centre - static_cast<long long>(j), n)];
    }
    out[o] = acc;
  }
  return out;
}

} // namespace

DwtLevel Db4Dwt(const std::vector<double>& input) {
  if (input.empty()) {
    throw util::SignalProcessingError("wavelet: empty input");
  }
  return {DownsampleConvolve(input, kDb4Low), DownsampleConvolve(input, kDb4High)};
}

WaveletDecomposition Db4Wavedec(const std::vector<double>& input, std::size_t levels) {
  if (levels == 0) {
    throw util::SignalProcessingError("wavelet: at least one decomposition level is required");
  }

  WaveletDecomposition result;
  std::vector<double>  current = input;
  for (std::size_t level = 0; level < levels; ++level) {
    auto step = Db4Dwt(current);
    result.details.insert(result.details.begin(), std::move(step.detail));
    current = std::move(step.approximation);
  }
  result.approximation = std::move(current);
  return result;
}

double Energy(const std::vector<double>& coefficients) {
  double acc = 0.0;
  for (double c : coefficients) acc += c * c;
  return acc;
}

std::vector<double> BandEnergies(const WaveletDecomposition& decomposition) {
  std::vector<double> energies;
  energies.reserve(decomposition.details.size() + 1);
  energies.push_back(Energy(decomposition.approximation));
  for (const auto& detail : decomposition.details) {
    energies.push_back(Energy(detail));
  }
  return energies;
}

std::vector<std::string> WaveletFeatureNames(std::size_t levels) {
  if (levels == 2) {
    return {"wavelet_energy_low", "wavelet_energy_mid", "wavelet_energy_high"};
  }

  std::vector<std::string> names;
  names.reserve(levels + 1);
  names.push_back("wavelet_energy_low");
  for (std::size_t level = levels; level >= 1; --level) {
    names.push_back("wavelet_energy_d" + std::to_string(level));
  }
  return names;
}

} // namespace glucolumin::signal
