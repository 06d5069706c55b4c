#pragma once

/// @file fft.h
/// @brief Real FFT wrapper using KissFFT.

#include <complex>
#include <memory>
#include <vector>

namespace emotrace {

/// @brief Real-valued FFT processor using KissFFT.
/// @details A single instance holds mutable KissFFT state and scratch buffers, so it
/// must not be shared between threads. Create one instance per worker.
class FFT {
 public:
  /// @brief Constructs FFT processor.
  /// @param n_fft FFT size (even, power of 2 recommended)
  /// @throws EmotraceException if n_fft is invalid or allocation fails
  explicit FFT(int n_fft);

  ~FFT();

  // Non-copyable, movable
  FFT(const FFT&) = delete;
  FFT& operator=(const FFT&) = delete;
  FFT(FFT&&) noexcept;
  FFT& operator=(FFT&&) noexcept;

  /// @brief Performs forward FFT (real to complex).
  /// @param input Input signal (n_fft samples)
  /// @param output Complex spectrum (n_bins values)
  void forward(const float* input, std::complex<float>* output);

  /// @brief Performs inverse FFT (complex to real), scaled by 1/n_fft.
  /// @param input Complex spectrum (n_bins values)
  /// @param output Output signal (n_fft samples)
  void inverse(const std::complex<float>* input, float* output);

  /// @brief Computes the magnitude spectrum of a frame.
  /// @param input Frame of at most n_fft samples, zero-padded to n_fft
  /// @param size Number of input samples
  /// @param magnitude Output magnitudes (n_bins values)
  void magnitude(const float* input, int size, float* magnitude);

  /// @brief Computes the linear autocorrelation of a frame via the power spectrum.
  /// @details The frame must be at most n_fft / 2 samples long so the circular
  /// correlation does not wrap.
  /// @param input Frame samples
  /// @param size Number of samples (<= n_fft / 2)
  /// @param output Autocorrelation for lags 0..size-1
  void autocorrelation(const float* input, int size, float* output);

  /// @brief Returns FFT size.
  int n_fft() const { return n_fft_; }

  /// @brief Returns number of frequency bins (n_fft/2 + 1).
  int n_bins() const { return n_fft_ / 2 + 1; }

 private:
  void load_frame(const float* input, int size);

  int n_fft_;
  std::vector<float> frame_;
  std::vector<std::complex<float>> spectrum_;
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace emotrace
