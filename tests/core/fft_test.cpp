/// @file fft_test.cpp
/// @brief Tests for FFT wrapper and analysis windows.

#include "core/fft.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <complex>
#include <vector>

#include "core/window.h"
#include "util/exception.h"

using namespace emotrace;
using Catch::Matchers::WithinAbs;

namespace {
constexpr float kTwoPi = 2.0f * 3.14159265358979323846f;
}  // namespace

TEST_CASE("FFT forward / inverse roundtrip", "[fft]") {
  constexpr int n_fft = 64;
  FFT fft(n_fft);

  std::vector<float> input(n_fft);
  for (int i = 0; i < n_fft; ++i) {
    input[i] = std::sin(kTwoPi * 4 * i / n_fft);
  }

  std::vector<std::complex<float>> spectrum(fft.n_bins());
  fft.forward(input.data(), spectrum.data());

  int peak = 0;
  for (int i = 1; i < fft.n_bins(); ++i) {
    if (std::abs(spectrum[i]) > std::abs(spectrum[peak])) peak = i;
  }
  REQUIRE(peak == 4);

  std::vector<float> output(n_fft);
  fft.inverse(spectrum.data(), output.data());
  for (int i = 0; i < n_fft; ++i) {
    REQUIRE_THAT(output[i], WithinAbs(input[i], 1e-5f));
  }
}

TEST_CASE("FFT magnitude zero-pads short frames", "[fft]") {
  FFT fft(16);
  std::vector<float> frame(8, 1.0f);
  std::vector<float> mag(fft.n_bins());
  fft.magnitude(frame.data(), static_cast<int>(frame.size()), mag.data());

  // DC bin holds the sum of the frame
  REQUIRE_THAT(mag[0], WithinAbs(8.0f, 1e-4f));
  REQUIRE(fft.n_bins() == 9);
}

TEST_CASE("FFT autocorrelation matches the direct sum", "[fft]") {
  constexpr int size = 32;
  FFT fft(64);

  std::vector<float> frame(size);
  for (int i = 0; i < size; ++i) {
    frame[i] = std::sin(kTwoPi * i / 8.0f) + 0.25f * std::cos(kTwoPi * i / 5.0f);
  }

  std::vector<float> acf(size);
  fft.autocorrelation(frame.data(), size, acf.data());

  for (int lag = 0; lag < size; ++lag) {
    float expected = 0.0f;
    for (int i = 0; i + lag < size; ++i) expected += frame[i] * frame[i + lag];
    REQUIRE_THAT(acf[lag], WithinAbs(expected, 1e-3f));
  }
  // Period 8 shows up as a local peak
  REQUIRE(acf[8] > acf[7]);
  REQUIRE(acf[8] > acf[9]);
}

TEST_CASE("FFT rejects invalid sizes", "[fft]") {
  REQUIRE_THROWS_AS(FFT(0), EmotraceException);
  REQUIRE_THROWS_AS(FFT(7), EmotraceException);
}

TEST_CASE("hann_window", "[window]") {
  std::vector<float> w = hann_window(8);
  REQUIRE(w.size() == 8);
  REQUIRE_THAT(w[0], WithinAbs(0.0f, 1e-6f));
  REQUIRE_THAT(w[4], WithinAbs(1.0f, 1e-6f));
  REQUIRE_THAT(w[2], WithinAbs(w[6], 1e-6f));

  const std::vector<float>& cached = hann_window_cached(8);
  REQUIRE(&cached == &hann_window_cached(8));
  REQUIRE_THAT(cached[3], WithinAbs(w[3], 1e-7f));
}

TEST_CASE("apply_window", "[window]") {
  std::vector<float> frame(4, 2.0f);
  std::vector<float> window = {0.0f, 0.5f, 1.0f, 0.5f};
  std::vector<float> out(4);
  apply_window(frame.data(), window.data(), 4, out.data());
  REQUIRE(out[0] == 0.0f);
  REQUIRE(out[1] == 1.0f);
  REQUIRE(out[2] == 2.0f);
}
