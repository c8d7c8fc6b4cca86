#include "savitzky_golay.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace glucolumin::signal {

namespace {

using Matrix = std::vector<std::vector<double>>;

// Gauss-Jordan with partial pivoting. The normal matrix is small (order + 1).
Matrix Invert(Matrix m) {
  const std::size_t n = m.size();
  Matrix            inv(n, std::vector<double>(n, 0.0));
  for (std::size_t i = 0; i < n; ++i) inv[i][i] = 1.0;

  for (std::size_t col = 0; col < n; ++col) {
    std::size_t pivot = col;
    for (std::size_t row = col + 1; row < n; ++row) {
      if (std::fabs(m[row][col]) > std::fabs(m[pivot][col])) pivot = row;
    }
    if (std::fabs(m[pivot][col]) < 1e-12) {
      throw util::SignalProcessingError("savitzky-golay: singular normal matrix");
    }
    std::swap(m[col], m[pivot]);
    std::swap(inv[col], inv[pivot]);

    const double scale = m[col][col];
    for (std::size_t k = 0; k < n; ++k) {
      m[col][k] /= scale;
      inv[col][k] /= scale;
    }
    for (std::size_t row = 0; row < n; ++row) {
      if (row == col) continue;
      const double factor = m[row][col];
      if (factor == 0.0) continue;
      for (std::size_t k = 0; k < n; ++k) {
        m[row][k] -= factor * m[col][k];
        inv[row][k] -= factor * inv[col][k];
      }
    }
  }
  return inv;
}

} // namespace

SavitzkyGolayFilter::SavitzkyGolayFilter(SavitzkyGolayOptions options) : options_(options) {
  const auto window = options_.window_length;
  const auto order  = options_.poly_order;
  if (window % 2 == 0) {
    throw std::invalid_argument("savitzky-golay: window_length must be odd");
  }
  if (window < order + 2) {
    throw std::invalid_argument("savitzky-golay: window_length must be >= poly_order + 2");
  }

  // Vandermonde design over centred positions t = i - half.
  const auto half  = static_cast<double>(window / 2);
  const auto terms = order + 1;
  Matrix     design(window, std::vector<double>(terms, 0.0));
  for (std::size_t i = 0; i < window; ++i) {
    const double t = static_cast<double>(i) - half;
    double       p = 1.0;
    for (std::size_t j = 0; j < terms; ++j) {
      design[i][j] = p;
      p *= t;
    }
  }

  Matrix normal(terms, std::vector<double>(terms, 0.0));
  for (std::size_t a = 0; a < terms; ++a) {
    for (std::size_t b = 0; b < terms; ++b) {
      for (std::size_t i = 0; i < window; ++i) normal[a][b] += design[i][a] * design[i][b];
    }
  }
  const Matrix normal_inv = Invert(std::move(normal));

  // projection = A (A^T A)^-1 A^T
  Matrix fit(terms, std::vector<double>(window, 0.0));
  for (std::size_t a = 0; a < terms; ++a) {
    for (std::size_t i = 0; i < window; ++i) {
      for (std::size_t b = 0; b < terms; ++b) fit[a][i] += normal_inv[a][b] * design[i][b];
    }
  }
  projection_.assign(window, std::vector<double>(window, 0.0));
  for (std::size_t k = 0; k < window; ++k) {
    for (std::size_t i = 0; i < window; ++i) {
      for (std::size_t a = 0; a < terms; ++a) projection_[k][i] += design[k][a] * fit[a][i];
    }
  }
}

std::vector<double> SavitzkyGolayFilter::Apply(const std::vector<double>& input) const {
  const auto window = options_.window_length;
  const auto n      = input.size();
  if (n < window) {
    throw util::InsufficientSamplesError("savitzky-golay: need at least " + std::to_string(window) + " samples, got " +
                                         std::to_string(n));
  }

  const auto          half = window / 2;
  std::vector<double> out(n, 0.0);

  const auto& centre = projection_[half];
  for (std::size_t i = half; i + half < n; ++i) {
    double acc = 0.0;
    for (std::size_t j = 0; j < window; ++j) acc += centre[j] * input[i - half + j];
    out[i] = acc;
  }

  for (std::size_t k = 0; k < half; ++k) {
    double head = 0.0;
    double tail = 0.0;
    for (std::size_t j = 0; j < window; ++j) {
      head += projection_[k][j] * input[j];
      tail += projection_[half + 1 + k][j] * input[n - window + j];
    }
    out[k]            = head;
    out[n - half + k] = tail;
  }
  return out;
}

} // namespace glucolumin::signal
