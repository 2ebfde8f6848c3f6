/// @file notechart_c.cpp
/// @brief Implementation of C API.

#include "notechart_c.h"

#include <cstring>
#include <new>

#include "analysis/chart_generator.h"
#include "core/audio.h"
#include "notechart.h"
#include "quick.h"
#include "util/exception.h"

using namespace notechart;

// Internal wrapper structure
struct NotechartAudio {
  Audio audio;
};

namespace {

/// @brief Minimum valid sample rate (8kHz - telephone quality)
constexpr int kMinSampleRate = 8000;
/// @brief Maximum valid sample rate (384kHz - high-res audio)
constexpr int kMaxSampleRate = 384000;
/// @brief Maximum buffer size (~6 hours at 22050Hz)
constexpr size_t kMaxBufferSize = 500000000;

NotechartError to_c_error(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return NOTECHART_OK;
    case ErrorCode::FileNotFound:
      return NOTECHART_ERROR_FILE_NOT_FOUND;
    case ErrorCode::InvalidFormat:
      return NOTECHART_ERROR_INVALID_FORMAT;
    case ErrorCode::DecodeFailed:
      return NOTECHART_ERROR_DECODE_FAILED;
    case ErrorCode::InvalidParameter:
      return NOTECHART_ERROR_INVALID_PARAMETER;
    case ErrorCode::OutOfMemory:
      return NOTECHART_ERROR_OUT_OF_MEMORY;
  }
  return NOTECHART_ERROR_UNKNOWN;
}

bool valid_samples(const float* samples, size_t length, int sample_rate) {
  return samples != nullptr && length > 0 && length <= kMaxBufferSize &&
         sample_rate >= kMinSampleRate && sample_rate <= kMaxSampleRate;
}

bool valid_difficulty(NotechartDifficulty difficulty) {
  return difficulty == NOTECHART_DIFFICULTY_EASY || difficulty == NOTECHART_DIFFICULTY_MEDIUM ||
         difficulty == NOTECHART_DIFFICULTY_HARD;
}

/// @brief Copies notes into a caller-owned array (nullptr when empty).
void export_notes(const std::vector<NoteEvent>& notes, NotechartNote** out_notes,
                  size_t* out_count) {
  *out_count = notes.size();
  if (notes.empty()) {
    *out_notes = nullptr;
    return;
  }
  *out_notes = new NotechartNote[notes.size()];
  for (size_t i = 0; i < notes.size(); ++i) {
    (*out_notes)[i].time = notes[i].time;
    (*out_notes)[i].lane = static_cast<NotechartLane>(notes[i].lane);
  }
}

}  // namespace

// Audio functions

NotechartError notechart_audio_from_buffer(const float* data, size_t length, int sample_rate,
                                           NotechartAudio** out) {
  if (out == nullptr || !valid_samples(data, length, sample_rate)) {
    return NOTECHART_ERROR_INVALID_PARAMETER;
  }

  try {
    *out = new NotechartAudio{Audio::from_buffer(data, length, sample_rate)};
    return NOTECHART_OK;
  } catch (const NotechartException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return NOTECHART_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception&) {
    return NOTECHART_ERROR_UNKNOWN;
  }
}

NotechartError notechart_audio_from_interleaved(const float* data, size_t n_frames, int channels,
                                                int sample_rate, NotechartAudio** out) {
  if (out == nullptr || channels < 1 ||
      !valid_samples(data, n_frames * static_cast<size_t>(channels), sample_rate)) {
    return NOTECHART_ERROR_INVALID_PARAMETER;
  }

  try {
    *out = new NotechartAudio{Audio::from_interleaved(data, n_frames, channels, sample_rate)};
    return NOTECHART_OK;
  } catch (const NotechartException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return NOTECHART_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception&) {
    return NOTECHART_ERROR_UNKNOWN;
  }
}

NotechartError notechart_audio_from_memory(const uint8_t* data, size_t length,
                                           NotechartAudio** out) {
  if (data == nullptr || out == nullptr || length == 0) {
    return NOTECHART_ERROR_INVALID_PARAMETER;
  }

  try {
    *out = new NotechartAudio{Audio::from_memory(data, length)};
    return NOTECHART_OK;
  } catch (const NotechartException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return NOTECHART_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception&) {
    return NOTECHART_ERROR_UNKNOWN;
  }
}

#ifndef __EMSCRIPTEN__
NotechartError notechart_audio_from_file(const char* path, NotechartAudio** out) {
  if (path == nullptr || out == nullptr) {
    return NOTECHART_ERROR_INVALID_PARAMETER;
  }

  try {
    *out = new NotechartAudio{Audio::from_file(path)};
    return NOTECHART_OK;
  } catch (const NotechartException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return NOTECHART_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception&) {
    return NOTECHART_ERROR_UNKNOWN;
  }
}
#endif

void notechart_audio_free(NotechartAudio* audio) { delete audio; }

const float* notechart_audio_data(const NotechartAudio* audio) {
  if (audio == nullptr) {
    return nullptr;
  }
  return audio->audio.data();
}

size_t notechart_audio_length(const NotechartAudio* audio) {
  if (audio == nullptr) {
    return 0;
  }
  return audio->audio.size();
}

int notechart_audio_sample_rate(const NotechartAudio* audio) {
  if (audio == nullptr) {
    return 0;
  }
  return audio->audio.sample_rate();
}

double notechart_audio_duration(const NotechartAudio* audio) {
  if (audio == nullptr) {
    return 0.0;
  }
  return audio->audio.duration();
}

// Chart generation

NotechartError notechart_generate_chart(const float* samples, size_t length, int sample_rate,
                                        NotechartDifficulty difficulty,
                                        NotechartNote** out_notes, size_t* out_count) {
  if (out_notes == nullptr || out_count == nullptr ||
      !valid_samples(samples, length, sample_rate) || !valid_difficulty(difficulty)) {
    return NOTECHART_ERROR_INVALID_PARAMETER;
  }

  try {
    std::vector<NoteEvent> notes = quick::generate_chart(samples, length, sample_rate,
                                                         static_cast<Difficulty>(difficulty));
    export_notes(notes, out_notes, out_count);
    return NOTECHART_OK;
  } catch (const NotechartException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return NOTECHART_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception&) {
    return NOTECHART_ERROR_UNKNOWN;
  }
}

NotechartError notechart_generate_chart_audio(const NotechartAudio* audio,
                                              NotechartDifficulty difficulty,
                                              NotechartNote** out_notes, size_t* out_count) {
  if (audio == nullptr || out_notes == nullptr || out_count == nullptr ||
      !valid_difficulty(difficulty)) {
    return NOTECHART_ERROR_INVALID_PARAMETER;
  }

  try {
    std::vector<NoteEvent> notes =
        generate_chart(audio->audio, static_cast<Difficulty>(difficulty));
    export_notes(notes, out_notes, out_count);
    return NOTECHART_OK;
  } catch (const NotechartException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return NOTECHART_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception&) {
    return NOTECHART_ERROR_UNKNOWN;
  }
}

// Intermediate stages

NotechartError notechart_detect_onsets(const float* samples, size_t length, int sample_rate,
                                       NotechartDifficulty difficulty, double** out_times,
                                       size_t* out_count) {
  if (out_times == nullptr || out_count == nullptr ||
      !valid_samples(samples, length, sample_rate) || !valid_difficulty(difficulty)) {
    return NOTECHART_ERROR_INVALID_PARAMETER;
  }

  try {
    std::vector<double> onsets = quick::detect_onsets(samples, length, sample_rate,
                                                      static_cast<Difficulty>(difficulty));
    *out_count = onsets.size();
    if (onsets.empty()) {
      *out_times = nullptr;
    } else {
      *out_times = new double[onsets.size()];
      std::memcpy(*out_times, onsets.data(), onsets.size() * sizeof(double));
    }
    return NOTECHART_OK;
  } catch (const NotechartException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return NOTECHART_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception&) {
    return NOTECHART_ERROR_UNKNOWN;
  }
}

NotechartError notechart_estimate_tempo(const float* samples, size_t length, int sample_rate,
                                        NotechartTempo* out) {
  if (out == nullptr || !valid_samples(samples, length, sample_rate)) {
    return NOTECHART_ERROR_INVALID_PARAMETER;
  }

  try {
    TempoEstimate tempo = quick::estimate_tempo(samples, length, sample_rate);
    out->beat_period = tempo.beat_period;
    out->bpm = tempo.bpm;
    out->fallback = tempo.fallback ? 1 : 0;
    return NOTECHART_OK;
  } catch (const NotechartException& e) {
    return to_c_error(e.code());
  } catch (const std::bad_alloc&) {
    return NOTECHART_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception&) {
    return NOTECHART_ERROR_UNKNOWN;
  }
}

// Memory management

void notechart_free_notes(NotechartNote* notes) { delete[] notes; }

void notechart_free_times(double* times) { delete[] times; }

// Names

const char* notechart_lane_name(NotechartLane lane) {
  if (lane < NOTECHART_LANE_UP || lane > NOTECHART_LANE_RIGHT) {
    return "Unknown";
  }
  return lane_name(static_cast<Lane>(lane));
}

const char* notechart_difficulty_name(NotechartDifficulty difficulty) {
  if (!valid_difficulty(difficulty)) {
    return "unknown";
  }
  return difficulty_name(static_cast<Difficulty>(difficulty));
}

// Error handling

const char* notechart_error_message(NotechartError error) {
  switch (error) {
    case NOTECHART_OK:
      return "OK";
    case NOTECHART_ERROR_FILE_NOT_FOUND:
      return "File not found";
    case NOTECHART_ERROR_INVALID_FORMAT:
      return "Invalid format";
    case NOTECHART_ERROR_DECODE_FAILED:
      return "Decode failed";
    case NOTECHART_ERROR_INVALID_PARAMETER:
      return "Invalid parameter";
    case NOTECHART_ERROR_OUT_OF_MEMORY:
      return "Out of memory";
    default:
      return "Unknown error";
  }
}

// Version

const char* notechart_version(void) { return NOTECHART_VERSION_STRING; }
