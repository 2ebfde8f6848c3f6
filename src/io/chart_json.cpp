#include "io/chart_json.h"

#include <fstream>

#include "io/json_writer.h"
#include "util/exception.h"

namespace notechart {

std::string chart_to_json(const std::vector<NoteEvent>& notes, Difficulty difficulty,
                          const TempoEstimate& tempo) {
  JsonWriter json;
  json.object()
      .field("difficulty", difficulty_name(difficulty))
      .field("bpm", tempo.bpm)
      .field("beat_period", tempo.beat_period)
      .key("notes")
      .array();

  for (const auto& note : notes) {
    json.object().field("time", note.time).field("key", lane_name(note.lane)).close();
  }

  json.close().close();
  return json.str();
}

std::string chart_to_json(const ChartResult& result) {
  return chart_to_json(result.notes, result.difficulty, result.tempo);
}

void save_chart_json(const std::string& path, const ChartResult& result) {
  std::ofstream file(path);
  NOTECHART_CHECK_MSG(file.is_open(), ErrorCode::FileNotFound, "Cannot open file: " + path);

  file << chart_to_json(result) << "\n";
  NOTECHART_CHECK_MSG(file.good(), ErrorCode::InvalidFormat, "Failed to write file: " + path);
}

}  // namespace notechart
