#pragma once

/// @file audio_io.h
/// @brief Container decoding with dr_wav and minimp3.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace emotrace {

/// @brief Detected container format.
enum class AudioFormat {
  Unknown,
  WAV,
  MP3,
};

/// @brief Raw decoder output before normalization.
struct DecodedAudio {
  std::vector<float> samples;  ///< Interleaved samples in [-1, 1]
  int channels = 0;            ///< Channel count
  int sample_rate = 0;         ///< Native sample rate in Hz

  /// @brief Returns the number of sample frames.
  size_t frames() const {
    return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
  }
};

/// @brief Returns the name of a format.
const char* format_name(AudioFormat format);

/// @brief Detects container format from the first bytes.
/// @param data Pointer to audio bytes
/// @param size Size of data in bytes
/// @return Detected format (Unknown when fewer than 12 bytes)
AudioFormat detect_format(const uint8_t* data, size_t size);

/// @brief Decodes a RIFF/WAVE byte stream.
/// @details A valid header with no sample frames decodes to an empty result.
/// @throws UnsupportedFormatError if the stream cannot be parsed
DecodedAudio decode_wav(const uint8_t* data, size_t size);

/// @brief Decodes an MPEG audio byte stream.
/// @throws UnsupportedFormatError if no frame decodes
DecodedAudio decode_mp3(const uint8_t* data, size_t size);

/// @brief Decodes a byte stream after sniffing its format.
/// @throws UnsupportedFormatError on unknown or undecodable data
DecodedAudio decode_audio(const uint8_t* data, size_t size);

/// @brief Reads a whole file into memory.
/// @param path File path
/// @param max_size Maximum accepted size in bytes (0 = no limit)
/// @throws EmotraceException on missing file, read failure or oversize file
std::vector<uint8_t> read_file(const std::string& path, size_t max_size = 0);

/// @brief Encodes mono samples as a 16-bit PCM WAV byte stream.
/// @param samples Samples in [-1, 1]
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
/// @throws EmotraceException on encoder failure
std::vector<uint8_t> encode_wav(const float* samples, size_t size, int sample_rate);

/// @brief Writes mono samples as a 16-bit PCM WAV file.
/// @throws EmotraceException on write error
void save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate);

}  // namespace emotrace
