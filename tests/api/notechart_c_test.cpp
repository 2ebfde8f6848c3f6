/// @file notechart_c_test.cpp
/// @brief Tests for C API functions.

#include "notechart_c.h"

#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <cstring>
#include <string>
#include <vector>

namespace {

// One 2048-sample block of 0.8 at 1 s in a 2 s buffer
std::vector<float> generate_impulse(int sample_rate = 22050) {
  std::vector<float> samples(2 * sample_rate, 0.0f);
  for (int i = sample_rate; i < sample_rate + 2048; ++i) samples[i] = 0.8f;
  return samples;
}

}  // namespace

TEST_CASE("notechart_audio_from_buffer", "[c_api]") {
  SECTION("creates audio from valid buffer") {
    auto samples = generate_impulse();
    NotechartAudio* audio = nullptr;

    NotechartError err =
        notechart_audio_from_buffer(samples.data(), samples.size(), 22050, &audio);

    REQUIRE(err == NOTECHART_OK);
    REQUIRE(audio != nullptr);
    REQUIRE(notechart_audio_length(audio) == samples.size());
    REQUIRE(notechart_audio_sample_rate(audio) == 22050);
    REQUIRE(notechart_audio_duration(audio) > 1.9);
    REQUIRE(notechart_audio_duration(audio) < 2.1);
    REQUIRE(notechart_audio_data(audio)[22050] == 0.8f);

    notechart_audio_free(audio);
  }

  SECTION("returns error for null data") {
    NotechartAudio* audio = nullptr;
    REQUIRE(notechart_audio_from_buffer(nullptr, 100, 22050, &audio) ==
            NOTECHART_ERROR_INVALID_PARAMETER);
    REQUIRE(audio == nullptr);
  }

  SECTION("returns error for out-of-range sample rate") {
    auto samples = generate_impulse();
    NotechartAudio* audio = nullptr;
    REQUIRE(notechart_audio_from_buffer(samples.data(), samples.size(), 100, &audio) ==
            NOTECHART_ERROR_INVALID_PARAMETER);
    REQUIRE(notechart_audio_from_buffer(samples.data(), samples.size(), 1000000, &audio) ==
            NOTECHART_ERROR_INVALID_PARAMETER);
  }

  SECTION("accessors tolerate null") {
    REQUIRE(notechart_audio_data(nullptr) == nullptr);
    REQUIRE(notechart_audio_length(nullptr) == 0);
    REQUIRE(notechart_audio_sample_rate(nullptr) == 0);
    REQUIRE(notechart_audio_duration(nullptr) == 0.0);
    notechart_audio_free(nullptr);
  }
}

TEST_CASE("notechart_audio_from_interleaved", "[c_api]") {
  auto mono = generate_impulse();
  std::vector<float> stereo(mono.size() * 2);
  for (size_t i = 0; i < mono.size(); ++i) {
    stereo[2 * i] = mono[i];
    stereo[2 * i + 1] = -0.5f;
  }

  SECTION("keeps the first channel") {
    NotechartAudio* audio = nullptr;
    REQUIRE(notechart_audio_from_interleaved(stereo.data(), mono.size(), 2, 22050, &audio) ==
            NOTECHART_OK);
    REQUIRE(notechart_audio_length(audio) == mono.size());
    REQUIRE(notechart_audio_data(audio)[0] == 0.0f);
    REQUIRE(notechart_audio_data(audio)[22050] == 0.8f);

    NotechartNote* notes = nullptr;
    size_t count = 0;
    REQUIRE(notechart_generate_chart_audio(audio, NOTECHART_DIFFICULTY_MEDIUM, &notes, &count) ==
            NOTECHART_OK);
    REQUIRE(count == 1);
    notechart_free_notes(notes);
    notechart_audio_free(audio);
  }

  SECTION("rejects invalid layout") {
    NotechartAudio* audio = nullptr;
    REQUIRE(notechart_audio_from_interleaved(stereo.data(), mono.size(), 0, 22050, &audio) ==
            NOTECHART_ERROR_INVALID_PARAMETER);
    REQUIRE(notechart_audio_from_interleaved(stereo.data(), mono.size(), 2, 0, &audio) ==
            NOTECHART_ERROR_INVALID_PARAMETER);
    REQUIRE(notechart_audio_from_interleaved(nullptr, mono.size(), 2, 22050, &audio) ==
            NOTECHART_ERROR_INVALID_PARAMETER);
    REQUIRE(audio == nullptr);
  }
}

TEST_CASE("notechart_audio_from_memory", "[c_api]") {
  std::vector<uint8_t> junk(64, 0x11);
  NotechartAudio* audio = nullptr;

  REQUIRE(notechart_audio_from_memory(junk.data(), junk.size(), &audio) ==
          NOTECHART_ERROR_INVALID_FORMAT);
  REQUIRE(notechart_audio_from_memory(nullptr, 10, &audio) == NOTECHART_ERROR_INVALID_PARAMETER);
}

TEST_CASE("notechart_audio_from_file", "[c_api]") {
  NotechartAudio* audio = nullptr;
  REQUIRE(notechart_audio_from_file("/nonexistent/file.wav", &audio) ==
          NOTECHART_ERROR_FILE_NOT_FOUND);
  REQUIRE(notechart_audio_from_file(nullptr, &audio) == NOTECHART_ERROR_INVALID_PARAMETER);
}

TEST_CASE("notechart_generate_chart", "[c_api]") {
  SECTION("single impulse gives one strong note") {
    auto samples = generate_impulse();
    NotechartNote* notes = nullptr;
    size_t count = 0;

    NotechartError err = notechart_generate_chart(samples.data(), samples.size(), 22050,
                                                  NOTECHART_DIFFICULTY_MEDIUM, &notes, &count);

    REQUIRE(err == NOTECHART_OK);
    REQUIRE(count == 1);
    REQUIRE(notes != nullptr);
    REQUIRE(notes[0].lane == NOTECHART_LANE_DOWN);
    REQUIRE(notes[0].time > 0.9);
    REQUIRE(notes[0].time < 1.1);

    notechart_free_notes(notes);
  }

  SECTION("silence gives no notes") {
    std::vector<float> samples(22050, 0.0f);
    NotechartNote* notes = nullptr;
    size_t count = 99;

    REQUIRE(notechart_generate_chart(samples.data(), samples.size(), 22050,
                                     NOTECHART_DIFFICULTY_EASY, &notes, &count) == NOTECHART_OK);
    REQUIRE(count == 0);
    REQUIRE(notes == nullptr);
  }

  SECTION("rejects invalid difficulty") {
    auto samples = generate_impulse();
    NotechartNote* notes = nullptr;
    size_t count = 0;
    REQUIRE(notechart_generate_chart(samples.data(), samples.size(), 22050,
                                     static_cast<NotechartDifficulty>(3), &notes,
                                     &count) == NOTECHART_ERROR_INVALID_PARAMETER);
  }

  SECTION("rejects null outputs") {
    auto samples = generate_impulse();
    size_t count = 0;
    REQUIRE(notechart_generate_chart(samples.data(), samples.size(), 22050,
                                     NOTECHART_DIFFICULTY_HARD, nullptr,
                                     &count) == NOTECHART_ERROR_INVALID_PARAMETER);
  }
}

TEST_CASE("notechart_generate_chart_audio", "[c_api]") {
  auto samples = generate_impulse();
  NotechartAudio* audio = nullptr;
  REQUIRE(notechart_audio_from_buffer(samples.data(), samples.size(), 22050, &audio) ==
          NOTECHART_OK);

  NotechartNote* notes = nullptr;
  size_t count = 0;
  REQUIRE(notechart_generate_chart_audio(audio, NOTECHART_DIFFICULTY_HARD, &notes, &count) ==
          NOTECHART_OK);
  REQUIRE(count == 1);
  REQUIRE(notes[0].lane == NOTECHART_LANE_DOWN);

  notechart_free_notes(notes);
  notechart_audio_free(audio);

  REQUIRE(notechart_generate_chart_audio(nullptr, NOTECHART_DIFFICULTY_HARD, &notes, &count) ==
          NOTECHART_ERROR_INVALID_PARAMETER);
}

TEST_CASE("notechart_detect_onsets", "[c_api]") {
  auto samples = generate_impulse();
  double* times = nullptr;
  size_t count = 0;

  REQUIRE(notechart_detect_onsets(samples.data(), samples.size(), 22050,
                                  NOTECHART_DIFFICULTY_MEDIUM, &times, &count) == NOTECHART_OK);
  REQUIRE(count == 1);
  REQUIRE(times[0] > 0.9);
  REQUIRE(times[0] < 1.1);

  notechart_free_times(times);
  notechart_free_times(nullptr);
}

TEST_CASE("notechart_estimate_tempo", "[c_api]") {
  auto samples = generate_impulse();
  NotechartTempo tempo;

  REQUIRE(notechart_estimate_tempo(samples.data(), samples.size(), 22050, &tempo) ==
          NOTECHART_OK);
  REQUIRE(tempo.fallback == 1);
  REQUIRE(std::abs(tempo.beat_period - 0.5) < 1e-9);
  REQUIRE(std::abs(tempo.bpm - 120.0) < 1e-6);

  REQUIRE(notechart_estimate_tempo(samples.data(), samples.size(), 22050, nullptr) ==
          NOTECHART_ERROR_INVALID_PARAMETER);
}

TEST_CASE("notechart names and messages", "[c_api]") {
  REQUIRE(std::string(notechart_lane_name(NOTECHART_LANE_UP)) == "ArrowUp");
  REQUIRE(std::string(notechart_lane_name(NOTECHART_LANE_RIGHT)) == "ArrowRight");

  REQUIRE(std::string(notechart_difficulty_name(NOTECHART_DIFFICULTY_MEDIUM)) == "medium");
  REQUIRE(std::string(notechart_difficulty_name(static_cast<NotechartDifficulty>(3))) ==
          "unknown");

  REQUIRE(std::strcmp(notechart_error_message(NOTECHART_OK), "OK") == 0);
  REQUIRE(std::strcmp(notechart_error_message(NOTECHART_ERROR_FILE_NOT_FOUND),
                      "File not found") == 0);
  REQUIRE(std::strcmp(notechart_error_message(static_cast<NotechartError>(42)),
                      "Unknown error") == 0);
}

TEST_CASE("notechart_version", "[c_api]") {
  REQUIRE(std::string(notechart_version()) == "1.0.0");
}
