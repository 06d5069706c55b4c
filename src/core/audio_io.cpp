#include "core/audio_io.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "util/exception.h"

// dr_wav implementation
#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

// minimp3 implementation
#define MINIMP3_IMPLEMENTATION
#include "minimp3.h"
#include "minimp3_ex.h"

namespace emotrace {

namespace {

/// @brief RAII guard for MP3 decode buffer.
/// @details Ensures mp3dec_file_info_t.buffer is freed even on exception.
struct Mp3BufferGuard {
  mp3d_sample_t* ptr = nullptr;
  ~Mp3BufferGuard() {
    if (ptr) {
      free(ptr);
    }
  }
};

/// @brief RAII guard for an initialized drwav handle.
struct DrwavGuard {
  drwav* wav = nullptr;
  ~DrwavGuard() {
    if (wav) {
      drwav_uninit(wav);
    }
  }
};

std::vector<int16_t> to_pcm16(const float* samples, size_t size) {
  std::vector<int16_t> pcm(size);
  for (size_t i = 0; i < size; ++i) {
    float clamped = std::max(-1.0f, std::min(1.0f, samples[i]));
    pcm[i] = static_cast<int16_t>(clamped * 32767.0f);
  }
  return pcm;
}

drwav_data_format mono_pcm16_format(int sample_rate) {
  drwav_data_format format;
  format.container = drwav_container_riff;
  format.format = DR_WAVE_FORMAT_PCM;
  format.channels = 1;
  format.sampleRate = static_cast<drwav_uint32>(sample_rate);
  format.bitsPerSample = 16;
  return format;
}

}  // namespace

const char* format_name(AudioFormat format) {
  switch (format) {
    case AudioFormat::WAV:
      return "wav";
    case AudioFormat::MP3:
      return "mp3";
    default:
      return "unknown";
  }
}

AudioFormat detect_format(const uint8_t* data, size_t size) {
  if (size < 12) {
    return AudioFormat::Unknown;
  }

  // WAV: "RIFF....WAVE"
  if (data[0] == 'R' && data[1] == 'I' && data[2] == 'F' && data[3] == 'F' && data[8] == 'W' &&
      data[9] == 'A' && data[10] == 'V' && data[11] == 'E') {
    return AudioFormat::WAV;
  }

  // MP3: ID3 tag or MPEG frame sync (11 set bits)
  if ((data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) ||
      (data[0] == 'I' && data[1] == 'D' && data[2] == '3')) {
    return AudioFormat::MP3;
  }

  return AudioFormat::Unknown;
}

DecodedAudio decode_wav(const uint8_t* data, size_t size) {
  drwav wav;
  if (!drwav_init_memory(&wav, data, size, nullptr)) {
    throw UnsupportedFormatError("Failed to parse WAV data");
  }
  DrwavGuard guard;
  guard.wav = &wav;

  DecodedAudio result;
  result.channels = static_cast<int>(wav.channels);
  result.sample_rate = static_cast<int>(wav.sampleRate);
  if (result.channels <= 0 || result.sample_rate <= 0) {
    throw UnsupportedFormatError("WAV header has no channels or sample rate");
  }

  if (wav.totalPCMFrameCount == 0) {
    return result;
  }

  result.samples.resize(static_cast<size_t>(wav.totalPCMFrameCount) * wav.channels);
  drwav_uint64 frames_read =
      drwav_read_pcm_frames_f32(&wav, wav.totalPCMFrameCount, result.samples.data());
  result.samples.resize(static_cast<size_t>(frames_read) * wav.channels);
  return result;
}

DecodedAudio decode_mp3(const uint8_t* data, size_t size) {
  mp3dec_t mp3d;
  mp3dec_file_info_t info{};

  mp3dec_init(&mp3d);
  int status = mp3dec_load_buf(&mp3d, data, size, &info, nullptr, nullptr);

  Mp3BufferGuard buffer_guard;
  buffer_guard.ptr = info.buffer;

  if (status != 0 || info.samples == 0 || info.channels <= 0 || info.hz <= 0) {
    throw UnsupportedFormatError("No decodable MPEG audio frames");
  }

  DecodedAudio result;
  result.channels = info.channels;
  result.sample_rate = info.hz;
  result.samples.resize(static_cast<size_t>(info.samples));
  for (size_t i = 0; i < result.samples.size(); ++i) {
    result.samples[i] = static_cast<float>(info.buffer[i]) / 32768.0f;
  }
  return result;
}

DecodedAudio decode_audio(const uint8_t* data, size_t size) {
  AudioFormat format = detect_format(data, size);

  switch (format) {
    case AudioFormat::WAV:
      return decode_wav(data, size);
    case AudioFormat::MP3:
      return decode_mp3(data, size);
    default:
      throw UnsupportedFormatError("Unknown or unsupported audio format (" +
                                   std::to_string(size) + " bytes)");
  }
}

std::vector<uint8_t> read_file(const std::string& path, size_t max_size) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  EMOTRACE_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  auto size = static_cast<size_t>(file.tellg());
  EMOTRACE_CHECK_MSG(max_size == 0 || size <= max_size, ErrorCode::InvalidParameter,
                     "File too large: " + std::to_string(size) + " bytes (max: " +
                         std::to_string(max_size) + " bytes)");
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(size);
  if (size > 0) {
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size));
    EMOTRACE_CHECK_MSG(file.good(), ErrorCode::FileNotFound, "Failed to read file: " + path);
  }
  return buffer;
}

std::vector<uint8_t> encode_wav(const float* samples, size_t size, int sample_rate) {
  EMOTRACE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "Invalid sample rate");

  drwav_data_format format = mono_pcm16_format(sample_rate);
  void* out_data = nullptr;
  size_t out_size = 0;

  drwav wav;
  EMOTRACE_CHECK_MSG(drwav_init_memory_write(&wav, &out_data, &out_size, &format, nullptr),
                     ErrorCode::InvalidParameter, "Failed to initialize WAV encoder");

  std::vector<int16_t> pcm = to_pcm16(samples, size);
  drwav_uint64 written = drwav_write_pcm_frames(&wav, size, pcm.data());
  drwav_uninit(&wav);

  std::vector<uint8_t> bytes(static_cast<uint8_t*>(out_data),
                             static_cast<uint8_t*>(out_data) + out_size);
  drwav_free(out_data, nullptr);

  EMOTRACE_CHECK_MSG(written == size, ErrorCode::InvalidParameter, "Failed to encode all samples");
  return bytes;
}

void save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate) {
  EMOTRACE_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter, "Invalid sample rate");

  drwav_data_format format = mono_pcm16_format(sample_rate);
  drwav wav;
  EMOTRACE_CHECK_MSG(drwav_init_file_write(&wav, path.c_str(), &format, nullptr),
                     ErrorCode::FileNotFound, "Failed to create WAV file: " + path);

  std::vector<int16_t> pcm = to_pcm16(samples.data(), samples.size());
  drwav_uint64 written = drwav_write_pcm_frames(&wav, samples.size(), pcm.data());
  drwav_uninit(&wav);
  EMOTRACE_CHECK_MSG(written == samples.size(), ErrorCode::FileNotFound,
                     "Failed to write all samples to " + path);
}

}  // namespace emotrace
