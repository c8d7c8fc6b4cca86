#pragma once

#include <cstddef>
#include <vector>

namespace glucolumin::signal {

struct SavitzkyGolayOptions {
  std::size_t window_length = 11;
  std::size_t poly_order    = 3;
};

/*
  Savitzky-Golay smoothing filter.

  Interior samples are the convolution of the window with the centre row
  of the least-squares projection. The first and last half windows are
  taken from the polynomial fitted to the first and last full window, so
  the output has the same length as the input.
*/
class SavitzkyGolayFilter {
 public:
  explicit SavitzkyGolayFilter(SavitzkyGolayOptions options);

  const SavitzkyGolayOptions& Options() const {
    return options_;
  }

  // Throws InsufficientSamplesError when the input is shorter than the window.
  std::vector<double> Apply(const std::vector<double>& input) const;

  // Row k holds the weights that evaluate the fitted polynomial at window position k.
  const std::vector<std::vector<double>>& Projection() const {
    return projection_;
  }

 private:
  SavitzkyGolayOptions             options_;
  std::vector<std::vector<double>> projection_;
};

} // namespace glucolumin::signal
