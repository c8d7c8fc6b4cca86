#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "internal/signal/savitzky_golay.hpp"
#include "internal/util/errors.hpp"

namespace {

using glucolumin::signal::SavitzkyGolayFilter;
using glucolumin::signal::SavitzkyGolayOptions;

bool Near(double a, double b, double tol = 1e-8) {
  return std::fabs(a - b) <= tol;
}

void TestCubicIsPreservedIncludingEdges() {
  SavitzkyGolayFilter filter(SavitzkyGolayOptions{11, 3});

  std::vector<double> input;
  for (int i = 0; i < 40; ++i) {
    const double t = static_cast<double>(i);
    input.push_back(0.002 * t * t * t - 0.1 * t * t + 2.0 * t + 5.0);
  }

  const auto out = filter.Apply(input);
  assert(out.size() == input.size());
  for (std::size_t i = 0; i < input.size(); ++i) {
    assert(Near(out[i], input[i], 1e-6));
  }
}

void TestConstantSignalUnchanged() {
  SavitzkyGolayFilter       filter(SavitzkyGolayOptions{});
  const std::vector<double> input(11, 3.25);
  const auto                out = filter.Apply(input);
  for (double v : out) {
    assert(Near(v, 3.25));
  }
}

void TestSmoothingReducesAlternatingNoise() {
  SavitzkyGolayFilter filter(SavitzkyGolayOptions{11, 3});

  std::vector<double> input;
  for (int i = 0; i < 64; ++i) {
    input.push_back(100.0 + (i % 2 == 0 ? 1.0 : -1.0));
  }
  const auto out = filter.Apply(input);

  double in_dev  = 0.0;
  double out_dev = 0.0;
  for (std::size_t i = 5; i + 5 < input.size(); ++i) {
    in_dev += std::fabs(input[i] - 100.0);
    out_dev += std::fabs(out[i] - 100.0);
  }
  assert(out_dev < in_dev * 0.5);
}

void TestShortInputRejected() {
  SavitzkyGolayFilter filter(SavitzkyGolayOptions{11, 3});
  bool                threw = false;
  try {
    filter.Apply(std::vector<double>(10, 1.0));
  } catch (const glucolumin::util::InsufficientSamplesError&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidOptionsRejected() {
  bool threw = false;
  try {
    SavitzkyGolayFilter even(SavitzkyGolayOptions{10, 3});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    SavitzkyGolayFilter too_small(SavitzkyGolayOptions{3, 3});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCubicIsPreservedIncludingEdges();
  TestConstantSignalUnchanged();
  TestSmoothingReducesAlternatingNoise();
  TestShortInputRejected();
  TestInvalidOptionsRejected();

  std::cout << "glucolumin_unit_savitzky_golay: pass\n";
  return 0;
}
