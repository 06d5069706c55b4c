/// @file fft.cpp
/// @brief Implementation of FFT wrapper.

#include "core/fft.h"

#include <algorithm>
#include <string>

#include "util/exception.h"

extern "C" {
#include "kiss_fft.h"
#include "kiss_fftr.h"
}

namespace emotrace {

struct FFT::Impl {
  kiss_fftr_cfg forward_cfg;
  kiss_fftr_cfg inverse_cfg;

  explicit Impl(int n_fft) {
    forward_cfg = kiss_fftr_alloc(n_fft, 0, nullptr, nullptr);
    inverse_cfg = kiss_fftr_alloc(n_fft, 1, nullptr, nullptr);
    if (!forward_cfg || !inverse_cfg) {
      if (forward_cfg) kiss_fft_free(forward_cfg);
      if (inverse_cfg) kiss_fft_free(inverse_cfg);
      throw EmotraceException(ErrorCode::InvalidParameter, "Failed to allocate KissFFT config");
    }
  }

  ~Impl() {
    kiss_fft_free(forward_cfg);
    kiss_fft_free(inverse_cfg);
  }
};

namespace {

int checked_size(int n_fft) {
  EMOTRACE_CHECK_MSG(n_fft >= 2 && n_fft % 2 == 0, ErrorCode::InvalidParameter,
                     "FFT size must be even and >= 2: " + std::to_string(n_fft));
  return n_fft;
}

}  // namespace

FFT::FFT(int n_fft)
    : n_fft_(checked_size(n_fft)),
      frame_(n_fft),
      spectrum_(n_fft / 2 + 1),
      impl_(std::make_unique<Impl>(n_fft)) {}

FFT::~FFT() = default;

FFT::FFT(FFT&&) noexcept = default;
FFT& FFT::operator=(FFT&&) noexcept = default;

void FFT::forward(const float* input, std::complex<float>* output) {
  kiss_fftr(impl_->forward_cfg, input, reinterpret_cast<kiss_fft_cpx*>(output));
}

void FFT::inverse(const std::complex<float>* input, float* output) {
  kiss_fftri(impl_->inverse_cfg, reinterpret_cast<const kiss_fft_cpx*>(input), output);

  // KissFFT doesn't scale, so normalize manually
  float scale = 1.0f / n_fft_;
  for (int i = 0; i < n_fft_; ++i) {
    output[i] *= scale;
  }
}

void FFT::load_frame(const float* input, int size) {
  int n = std::min(size, n_fft_);
  std::copy(input, input + n, frame_.begin());
  std::fill(frame_.begin() + n, frame_.end(), 0.0f);
}

void FFT::magnitude(const float* input, int size, float* magnitude) {
  load_frame(input, size);
  forward(frame_.data(), spectrum_.data());
  for (int k = 0; k < n_bins(); ++k) {
    magnitude[k] = std::abs(spectrum_[k]);
  }
}

void FFT::autocorrelation(const float* input, int size, float* output) {
  EMOTRACE_CHECK_MSG(size > 0 && size <= n_fft_ / 2, ErrorCode::InvalidParameter,
                     "Autocorrelation frame must fit in half the FFT size");
  load_frame(input, size);
  forward(frame_.data(), spectrum_.data());
  for (auto& bin : spectrum_) {
    bin = std::complex<float>(std::norm(bin), 0.0f);
  }
  inverse(spectrum_.data(), frame_.data());
  std::copy(frame_.begin(), frame_.begin() + size, output);
}

}  // namespace emotrace
