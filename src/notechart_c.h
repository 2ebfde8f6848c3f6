#pragma once

/// @file notechart_c.h
/// @brief C API for libnotechart.
/// @details Provides a C-compatible interface for use from C code and WASM.

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Error codes
typedef enum {
  NOTECHART_OK = 0,
  NOTECHART_ERROR_FILE_NOT_FOUND = 1,
  NOTECHART_ERROR_INVALID_FORMAT = 2,
  NOTECHART_ERROR_DECODE_FAILED = 3,
  NOTECHART_ERROR_INVALID_PARAMETER = 4,
  NOTECHART_ERROR_OUT_OF_MEMORY = 5,
  NOTECHART_ERROR_UNKNOWN = 99
} NotechartError;

// Difficulty enum
typedef enum {
  NOTECHART_DIFFICULTY_EASY = 0,
  NOTECHART_DIFFICULTY_MEDIUM = 1,
  NOTECHART_DIFFICULTY_HARD = 2
} NotechartDifficulty;

// Lane enum (Up/Down strong, Left/Right weak)
typedef enum {
  NOTECHART_LANE_UP = 0,
  NOTECHART_LANE_DOWN = 1,
  NOTECHART_LANE_LEFT = 2,
  NOTECHART_LANE_RIGHT = 3
} NotechartLane;

// Opaque types
typedef struct NotechartAudio NotechartAudio;

// Chart note
typedef struct {
  double time;
  NotechartLane lane;
} NotechartNote;

// Tempo estimate
typedef struct {
  double beat_period;
  double bpm;
  int fallback;
} NotechartTempo;

// Audio functions
NotechartError notechart_audio_from_buffer(const float* data, size_t length, int sample_rate,
                                           NotechartAudio** out);
// Keeps channel 0 of interleaved samples
NotechartError notechart_audio_from_interleaved(const float* data, size_t n_frames, int channels,
                                                int sample_rate, NotechartAudio** out);
NotechartError notechart_audio_from_memory(const uint8_t* data, size_t length,
                                           NotechartAudio** out);

#ifndef __EMSCRIPTEN__
NotechartError notechart_audio_from_file(const char* path, NotechartAudio** out);
#endif

void notechart_audio_free(NotechartAudio* audio);
const float* notechart_audio_data(const NotechartAudio* audio);
size_t notechart_audio_length(const NotechartAudio* audio);
int notechart_audio_sample_rate(const NotechartAudio* audio);
double notechart_audio_duration(const NotechartAudio* audio);

// Chart generation
NotechartError notechart_generate_chart(const float* samples, size_t length, int sample_rate,
                                        NotechartDifficulty difficulty,
                                        NotechartNote** out_notes, size_t* out_count);
NotechartError notechart_generate_chart_audio(const NotechartAudio* audio,
                                              NotechartDifficulty difficulty,
                                              NotechartNote** out_notes, size_t* out_count);

// Intermediate stages
NotechartError notechart_detect_onsets(const float* samples, size_t length, int sample_rate,
                                       NotechartDifficulty difficulty, double** out_times,
                                       size_t* out_count);
NotechartError notechart_estimate_tempo(const float* samples, size_t length, int sample_rate,
                                        NotechartTempo* out);

// Memory management
void notechart_free_notes(NotechartNote* notes);
void notechart_free_times(double* times);

// Names
const char* notechart_lane_name(NotechartLane lane);
const char* notechart_difficulty_name(NotechartDifficulty difficulty);

// Error handling
const char* notechart_error_message(NotechartError error);

// Version
const char* notechart_version(void);

#ifdef __cplusplus
}
#endif
