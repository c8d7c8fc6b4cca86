#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "internal/signal/wavelet.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace glucolumin::signal;

void TestSingleLevelLengths() {
  const std::vector<double> input(16, 1.0);
  const auto                level = Db4Dwt(input);
  assert(level.approximation.size() == 11);
  assert(level.detail.size() == 11);
}

void TestConstantSignalHasNoDetail() {
  const std::vector<double> input(32, 2.0);
  const auto                level = Db4Dwt(input);
  for (double d : level.detail) {
    assert(std::fabs(d) < 1e-9);
  }
  for (double a : level.approximation) {
    assert(std::fabs(a - 2.0 * std::sqrt(2.0)) < 1e-9);
  }
}

void TestMultiLevelOrderingAndEnergies() {
  std::vector<double> input;
  for (int i = 0; i < 100; ++i) {
    input.push_back(std::sin(0.1 * i) + (i % 2 == 0 ? 0.2 : -0.2));
  }

  const auto decomposition = Db4Wavedec(input, 2);
  assert(decomposition.details.size() == 2);
  // Finest level first in the transform, last in the result.
  assert(decomposition.details.back().size() == (input.size() + 7) / 2);
  assert(decomposition.details.front().size() == (decomposition.details.back().size() + 7) / 2);
  assert(decomposition.approximation.size() == decomposition.details.front().size());

  const auto energies = BandEnergies(decomposition);
  assert(energies.size() == 3);
  assert(energies[0] == Energy(decomposition.approximation));
  for (double e : energies) {
    assert(e >= 0.0);
  }
  // Alternating component lands in the finest detail band.
  assert(energies[2] > energies[1]);
}

void TestFeatureNames() {
  const auto two = WaveletFeatureNames(2);
  assert(two.size() == 3);
  assert(two[0] == "wavelet_energy_low");
  assert(two[1] == "wavelet_energy_mid");
  assert(two[2] == "wavelet_energy_high");

  const auto three = WaveletFeatureNames(3);
  assert(three.size() == 4);
  assert(three[1] == "wavelet_energy_d3");
  assert(three[3] == "wavelet_energy_d1");
}

void TestInvalidInput() {
  bool threw = false;
  try {
    Db4Wavedec(std::vector<double>(8, 1.0), 0);
  } catch (const glucolumin::util::SignalProcessingError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    Db4Dwt({});
  } catch (const glucolumin::util::SignalProcessingError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSingleLevelLengths();
  TestConstantSignalHasNoDetail();
  TestMultiLevelOrderingAndEnergies();
  TestFeatureNames();
  TestInvalidInput();

  std::cout << "glucolumin_unit_wavelet: pass\n";
  return 0;
}
