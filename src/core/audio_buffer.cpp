#include "core/audio_buffer.h"

#include <algorithm>

#include "util/exception.h"

namespace emotrace {

AudioBuffer::AudioBuffer() : storage_(nullptr), offset_(0), length_(0), sample_rate_(0) {}

AudioBuffer::AudioBuffer(std::shared_ptr<const std::vector<float>> storage, size_t offset,
                         size_t length, int sample_rate)
    : storage_(std::move(storage)), offset_(offset), length_(length), sample_rate_(sample_rate) {}

AudioBuffer AudioBuffer::from_buffer(const float* samples, size_t size, int sample_rate) {
  EMOTRACE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter,
                     "Sample rate must be positive: " + std::to_string(sample_rate));
  auto storage = std::make_shared<std::vector<float>>(samples, samples + size);
  return AudioBuffer(storage, 0, size, sample_rate);
}

AudioBuffer AudioBuffer::from_vector(std::vector<float> samples, int sample_rate) {
  EMOTRACE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter,
                     "Sample rate must be positive: " + std::to_string(sample_rate));
  size_t size = samples.size();
  auto storage = std::make_shared<std::vector<float>>(std::move(samples));
  return AudioBuffer(storage, 0, size, sample_rate);
}

const float* AudioBuffer::data() const {
  if (!storage_) {
    return nullptr;
  }
  return storage_->data() + offset_;
}

float AudioBuffer::duration() const {
  if (sample_rate_ == 0) {
    return 0.0f;
  }
  return static_cast<float>(static_cast<double>(length_) / sample_rate_);
}

AudioBuffer AudioBuffer::slice_samples(size_t start_sample, size_t end_sample) const {
  if (!storage_) {
    return AudioBuffer();
  }

  start_sample = std::min(start_sample, length_);
  end_sample = std::min(end_sample, length_);
  if (start_sample >= end_sample) {
    // Keep the rate so empty slices still report a valid timebase
    return AudioBuffer(storage_, offset_ + start_sample, 0, sample_rate_);
  }

  return AudioBuffer(storage_, offset_ + start_sample, end_sample - start_sample, sample_rate_);
}

float AudioBuffer::operator[](size_t index) const {
  EMOTRACE_CHECK(index < length_, ErrorCode::InvalidParameter);
  return (*storage_)[offset_ + index];
}

}  // namespace emotrace
