#pragma once

/// @file audio_io.h
/// @brief Audio file loading utilities using dr_wav and minimp3.

#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace notechart {

/// @brief Detected audio format.
enum class AudioFormat {
  Unknown,
  WAV,
  MP3,
};

/// @brief How multi-channel audio is reduced to mono.
enum class Mixdown {
  FirstChannel,  ///< Keep channel 0 only
  Average,       ///< Average all channels
};

/// @brief Result of audio loading: samples and sample rate.
using AudioLoadResult = std::tuple<std::vector<float>, int>;

/// @brief Options for audio loading.
struct AudioLoadOptions {
  /// @brief Maximum file size in bytes (0 = no limit).
  /// @details Default is 500MB. Set to 0 to disable size checking.
  size_t max_file_size = 500 * 1024 * 1024;

  /// @brief Channel reduction. Charts are built from the first channel.
  Mixdown mixdown = Mixdown::FirstChannel;
};

/// @brief Default audio load options.
inline const AudioLoadOptions kDefaultLoadOptions{};

/// @brief Parses a mixdown name ("first" or "average"; case-insensitive).
/// @throws NotechartException with InvalidParameter for any other name
Mixdown parse_mixdown(const std::string& name);

/// @brief Detects audio format from buffer header.
/// @param data Pointer to audio data
/// @param size Size of data in bytes
/// @return Detected audio format
AudioFormat detect_format(const uint8_t* data, size_t size);

/// @brief Reduces interleaved samples to mono.
/// @param data Interleaved samples
/// @param total_samples Number of samples across all channels
/// @param channels Channel count (>= 1)
/// @param mixdown Channel reduction mode
/// @return Mono samples, one per frame
std::vector<float> to_mono(const float* data, size_t total_samples, int channels,
                           Mixdown mixdown);

/// @brief Loads WAV from memory buffer.
/// @param data Pointer to WAV data
/// @param size Size of data in bytes
/// @param mixdown Channel reduction mode
/// @return Tuple of (mono samples normalized to [-1,1], sample rate)
/// @throws NotechartException on decode error
AudioLoadResult load_buffer_wav(const uint8_t* data, size_t size,
                                Mixdown mixdown = Mixdown::FirstChannel);

/// @brief Loads MP3 from memory buffer.
/// @param data Pointer to MP3 data
/// @param size Size of data in bytes
/// @param mixdown Channel reduction mode
/// @return Tuple of (mono samples normalized to [-1,1], sample rate)
/// @throws NotechartException on decode error
AudioLoadResult load_buffer_mp3(const uint8_t* data, size_t size,
                                Mixdown mixdown = Mixdown::FirstChannel);

/// @brief Loads audio file (auto-detect format).
/// @param path Path to audio file
/// @param options Loading options (max file size, mixdown)
/// @return Tuple of (mono samples normalized to [-1,1], sample rate)
/// @throws NotechartException on file not found, unknown format, file too large, or decode error
AudioLoadResult load_audio(const std::string& path,
                           const AudioLoadOptions& options = kDefaultLoadOptions);

/// @brief Loads audio from memory buffer (auto-detect format).
/// @param data Pointer to audio data
/// @param size Size of data in bytes
/// @param options Loading options (mixdown; max_file_size is ignored)
/// @return Tuple of (mono samples normalized to [-1,1], sample rate)
/// @throws NotechartException on unknown format or decode error
AudioLoadResult load_buffer(const uint8_t* data, size_t size,
                            const AudioLoadOptions& options = kDefaultLoadOptions);

/// @brief Saves audio samples to a WAV file.
/// @param path Output file path
/// @param samples Audio samples (mono, normalized to [-1,1])
/// @param n_samples Number of samples
/// @param sample_rate Sample rate in Hz
/// @param bits_per_sample Bit depth (16 or 24, default 16)
/// @throws NotechartException on write error
void save_wav(const std::string& path, const float* samples, size_t n_samples, int sample_rate,
              int bits_per_sample = 16);

/// @brief Saves audio samples to a WAV file.
/// @param path Output file path
/// @param samples Audio samples (mono, normalized to [-1,1])
/// @param sample_rate Sample rate in Hz
/// @param bits_per_sample Bit depth (16 or 24, default 16)
/// @throws NotechartException on write error
void save_wav(const std::string& path, const std::vector<float>& samples, int sample_rate,
              int bits_per_sample = 16);

}  // namespace notechart
