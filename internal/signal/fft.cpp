#include "fft.hpp"

#include <cmath>
#include <numbers>

namespace glucolumin::signal {

namespace {

using Complex = std::complex<double>;

std::size_t NextPowerOfTwo(std::size_t n) {
  std::size_t p = 1;
  while (p < n) p <<= 1;
  return p;
}

void Radix2InPlace(std::vector<Complex>& a, bool inverse) {
  const std::size_t n = a.size();
  if (n <= 1) return;

  for (std::size_t i = 1, j = 0; i < n; ++i) {
    std::size_t bit = n >> 1;
    for (; j & bit; bit >>= 1) j ^= bit;
    j ^= bit;
    if (i < j) std::swap(a[i], a[j]);
  }

  for (std::size_t len = 2; len <= n; len <<= 1) {
    const double  angle = 2.0 * std::numbers::pi / static_cast<double>(len) * (inverse ? 1.0 : -1.0);
    const Complex step(std::cos(angle), std::sin(angle));
    for (std::size_t i = 0; i < n; i += len) {
      Complex w(1.0, 0.0);
      for (std::size_t k = 0; k < len / 2; ++k) {
        const Complex u = a[i + k];
        const Complex v = a[i + k + len / 2] * w;
        a[i + k]           = u + v;
        a[i + k + len / 2] = u - v;
        w *= step;
      }
    }
  }

  if (inverse) {
    for (auto& x : a) x /= static_cast<double>(n);
  }
}

std::vector<Complex> Bluestein(const std::vector<Complex>& x, bool inverse) {
  const std::size_t n = x.size();
  const std::size_t m = NextPowerOfTwo(2 * n - 1);
  const double      sign = inverse ? 1.0 : -1.0;

  // Chirp w_k = exp(sign * i*pi*k^2/n); k^2 reduced mod 2n to keep the angle small.
  std::vector<Complex> chirp(n);
  for (std::size_t k = 0; k < n; ++k) {
    const auto   k2    = (static_cast<unsigned long long>(k) * k) % (2ULL * n);
    const double angle = sign * std::numbers::pi * static_cast<double>(k2) / static_cast<double>(n);
    chirp[k]           = Complex(std::cos(angle), std::sin(angle));
  }

  std::vector<Complex> a(m, Complex(0.0, 0.0));
  std::vector<Complex> b(m, Complex(0.0, 0.0));
  for (std::size_t k = 0; k < n; ++k) a[k] = x[k] * chirp[k];
  b[0] = std::conj(chirp[0]);
  for (std::size_t k = 1; k < n; ++k) {
    b[k]     = std::conj(chirp[k]);
    b[m - k] = std::conj(chirp[k]);
  }

  Radix2InPlace(a, false);
  Radix2InPlace(b, false);
  for (std::size_t i = 0; i < m; ++i) a[i] *= b[i];
  Radix2InPlace(a, true);

  std::vector<Complex> out(n);
  for (std::size_t k = 0; k < n; ++k) {
    out[k] = a[k] * chirp[k];
    if (inverse) out[k] /= static_cast<double>(n);
  }
  return out;
}

std::vector<Complex> Transform(std::vector<Complex> input, bool inverse) {
  if (input.size() <= 1) {
    return input;
  }
  if (IsPowerOfTwo(input.size())) {
    Radix2InPlace(input, inverse);
    return input;
  }
  return Bluestein(input, inverse);
}

} // namespace

bool IsPowerOfTwo(std::size_t n) {
  return n != 0 && (n & (n - 1)) == 0;
}

std::vector<Complex> Fft(const std::vector<double>& input) {
  std::vector<Complex> data(input.begin(), input.end());
  return Transform(std::move(data), false);
}

std::vector<Complex> Fft(std::vector<Complex> input) {
  return Transform(std::move(input), false);
}

std::vector<Complex> InverseFft(std::vector<Complex> input) {
  return Transform(std::move(input), true);
}

std::vector<double> HalfSpectrumMagnitude(const std::vector<double>& input) {
  const auto          spectrum = Fft(input);
  const std::size_t   half     = input.size() / 2;
  std::vector<double> magnitude(half);
  for (std::size_t k = 0; k < half; ++k) magnitude[k] = std::abs(spectrum[k]);
  return magnitude;
}

} // namespace glucolumin::signal
