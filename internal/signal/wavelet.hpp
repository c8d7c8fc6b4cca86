#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace glucolumin::signal {

/*
  Daubechies-4 discrete wavelet transform with half-sample symmetric
  boundary extension. A single level of length n produces
  floor((n + 7) / 2) approximation and detail coefficients.
*/

struct DwtLevel {
  std::vector<double> approximation;
  std::vector<double> detail;
};

struct WaveletDecomposition {
  // Coarsest approximation.
  std::vector<double> approximation;

  // details[0] is the coarsest level, details.back() the finest.
  std::vector<std::vector<double>> details;
};

DwtLevel Db4Dwt(const std::vector<double>& input);

// Throws SignalProcessingError for levels == 0 or empty input.
WaveletDecomposition Db4Wavedec(const std::vector<double>& input, std::size_t levels);

double Energy(const std::vector<double>& coefficients);

// Approximation energy first, then each detail level from coarsest to finest.
std::vector<double> BandEnergies(const WaveletDecomposition& decomposition);

std::vector<std::string> WaveletFeatureNames(std::size_t levels);

} // namespace glucolumin::signal
