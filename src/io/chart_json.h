#pragma once

/// @file chart_json.h
/// @brief Chart serialization to JSON.
///
/// Format:
/// @code
/// {"difficulty": "medium", "bpm": 120, "beat_period": 0.5,
///  "notes": [{"time": 0.99845805, "key": "ArrowDown"}, ...]}
/// @endcode

#include <string>
#include <vector>

#include "analysis/chart_generator.h"

namespace notechart {

/// @brief Serializes notes with their difficulty and tempo.
/// @param notes Chart notes
/// @param difficulty Difficulty the chart was generated for
/// @param tempo Beat period estimate
/// @return JSON text
std::string chart_to_json(const std::vector<NoteEvent>& notes, Difficulty difficulty,
                          const TempoEstimate& tempo);

/// @brief Serializes a chart generation result.
/// @param result Chart result
/// @return JSON text
std::string chart_to_json(const ChartResult& result);

/// @brief Writes a chart generation result as JSON.
/// @param path Output file path
/// @param result Chart result
/// @throws NotechartException if the file cannot be written
void save_chart_json(const std::string& path, const ChartResult& result);

}  // namespace notechart
