#pragma once

#include <complex>
#include <vector>

namespace glucolumin::signal {

// Forward DFT of a real sequence, any length. Radix-2 for powers of two,
// Bluestein chirp-z otherwise.
std::vector<std::complex<double>> Fft(const std::vector<double>& input);

std::vector<std::complex<double>> Fft(std::vector<std::complex<double>> input);

std::vector<std::complex<double>> InverseFft(std::vector<std::complex<double>> input);

// |X_k| for k in [0, n/2).
std::vector<double> HalfSpectrumMagnitude(const std::vector<double>& input);

bool IsPowerOfTwo(std::size_t n);

} // namespace glucolumin::signal
