/// @file notechart_cli.cpp
/// @brief Command-line interface for rhythm chart generation.

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "analysis/chart_generator.h"
#include "analysis/difficulty.h"
#include "core/audio.h"
#include "core/audio_io.h"
#include "feature/envelope.h"
#include "feature/onset_curve.h"
#include "io/chart_json.h"
#include "io/json_writer.h"
#include "notechart.h"
#include "util/math_utils.h"

using namespace notechart;

// ============================================================================
// CLI Arguments
// ============================================================================

struct CliArgs {
  std::string command;
  std::string input_file;
  std::string output_file;
  bool json_output = false;
  bool quiet = false;
  bool help = false;

  int window_length = 1024;
  int hop_length = 512;
  int smooth_width = 3;
  double start = 0.0;
  double end = -1.0;

  std::map<std::string, std::string> options;

  double get_double(const std::string& k, double def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stod(it->second) : def;
  }

  bool has(const std::string& k) const { return options.count(k) > 0; }

  std::string get_string(const std::string& k, const std::string& def = "") const {
    auto it = options.find(k);
    return it != options.end() ? it->second : def;
  }
};

// ============================================================================
// Argument Parser
// ============================================================================

class ArgParser {
 public:
  static CliArgs parse(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
      } else if (arg == "--json") {
        args.json_output = true;
      } else if (arg == "--quiet" || arg == "-q") {
        args.quiet = true;
      } else if (try_parse_global_option(args, arg, argv, i, argc)) {
        // Handled
      } else if (arg.substr(0, 2) == "--") {
        parse_option(args, arg.substr(2), argv, i, argc);
      } else if (args.command.empty()) {
        args.command = arg;
      } else if (args.input_file.empty()) {
        args.input_file = arg;
      }
    }

    return args;
  }

 private:
  static bool try_parse_global_option(CliArgs& args, const std::string& arg, char* argv[], int& i,
                                      int argc) {
    static const std::map<std::string, std::function<void(CliArgs&, const std::string&)>>
        global_opts = {
            {"--window", [](CliArgs& a, const std::string& v) { a.window_length = std::stoi(v); }},
            {"--hop", [](CliArgs& a, const std::string& v) { a.hop_length = std::stoi(v); }},
            {"--smooth", [](CliArgs& a, const std::string& v) { a.smooth_width = std::stoi(v); }},
            {"--start", [](CliArgs& a, const std::string& v) { a.start = std::stod(v); }},
            {"--end", [](CliArgs& a, const std::string& v) { a.end = std::stod(v); }},
            {"-o", [](CliArgs& a, const std::string& v) { a.output_file = v; }},
            {"--output", [](CliArgs& a, const std::string& v) { a.output_file = v; }},
        };

    auto it = global_opts.find(arg);
    if (it != global_opts.end() && i + 1 < argc) {
      it->second(args, argv[++i]);
      return true;
    }
    return false;
  }

  static void parse_option(CliArgs& args, const std::string& key, char* argv[], int& i, int argc) {
    if (i + 1 < argc) {
      std::string next = argv[i + 1];
      bool is_negative_num = next.size() > 1 && next[0] == '-' &&
                             std::isdigit(static_cast<unsigned char>(next[1]));
      bool is_option = next.size() > 1 && next[0] == '-' && !is_negative_num;

      if (!is_option) {
        args.options[key] = argv[++i];
        return;
      }
    }
    args.options[key] = "true";
  }
};

// ============================================================================
// Output Helpers
// ============================================================================

void progress_callback(float progress, const char* stage) {
  std::cerr << "\r" << stage << ": " << static_cast<int>(progress * 100) << "%   " << std::flush;
}

void clear_progress() { std::cerr << "\r                              \r"; }

void print_json(const JsonWriter& json) { std::cout << json.str() << "\n"; }

void print_times(const char* label, const std::vector<double>& times) {
  std::cout << label << " (" << times.size() << "):\n";
  for (size_t i = 0; i < times.size(); ++i) {
    std::cout << times[i];
    if (i < times.size() - 1) std::cout << ", ";
    if ((i + 1) % 10 == 0) std::cout << "\n";
  }
  std::cout << "\n";
}

/// @brief Builds the pipeline configuration from difficulty and CLI overrides.
ChartConfig make_config(const CliArgs& args) {
  ChartConfig config = ChartConfig::for_difficulty(
      parse_difficulty(args.get_string("difficulty", "medium")));
  config.envelope.window_length = args.window_length;
  config.envelope.hop_length = args.hop_length;
  config.onset_curve.smooth_width = args.smooth_width;
  config.tempo.bpm_min = args.get_double("bpm-min", config.tempo.bpm_min);
  config.tempo.bpm_max = args.get_double("bpm-max", config.tempo.bpm_max);
  if (args.has("sensitivity")) {
    config.pick.sensitivity =
        static_cast<float>(args.get_double("sensitivity", config.pick.sensitivity));
  }
  if (args.has("min-separation")) {
    config.assign.min_separation =
        args.get_double("min-separation", config.assign.min_separation);
  }
  return config;
}

// ============================================================================
// Command Handler Type
// ============================================================================

using CommandHandler = std::function<int(const CliArgs&, const Audio&)>;

// ============================================================================
// Command Implementations
// ============================================================================

int cmd_version(const CliArgs& args) {
  if (args.json_output) {
    JsonWriter json;
    json.object().field("cli_version", "1.0.0").field("lib_version", version()).close();
    print_json(json);
  } else {
    std::cout << "notechart-cli version 1.0.0\n";
    std::cout << "libnotechart version " << version() << "\n";
  }
  return 0;
}

int cmd_info(const CliArgs& args, const Audio& audio) {
  float peak_db = 20.0f * std::log10(std::max(audio.peak(), 1e-10f));
  float rms_db = 20.0f * std::log10(std::max(audio.rms(), 1e-10f));

  if (args.json_output) {
    JsonWriter json;
    json.object()
        .field("path", args.input_file)
        .field("duration", audio.duration())
        .field("sample_rate", audio.sample_rate())
        .field("samples", audio.size())
        .field("peak_db", peak_db)
        .field("rms_db", rms_db)
        .close();
    print_json(json);
  } else {
    int mins = static_cast<int>(audio.duration()) / 60;
    double secs = audio.duration() - mins * 60;
    std::cout << "Audio File: " << args.input_file << "\n";
    std::cout << "  Duration:    " << mins << ":" << std::fixed << std::setprecision(1) << secs
              << " (" << audio.duration() << "s)\n";
    std::cout << "  Sample Rate: " << audio.sample_rate() << " Hz\n";
    std::cout << "  Samples:     " << audio.size() << "\n";
    std::cout << "  Peak Level:  " << std::fixed << std::setprecision(1) << peak_db << " dB\n";
    std::cout << "  RMS Level:   " << rms_db << " dB\n";
  }
  return 0;
}

int cmd_envelope(const CliArgs& args, const Audio& audio) {
  ChartConfig config = make_config(args);
  ChartGenerator generator(audio, config);
  const auto& envelope = generator.envelope();
  const auto& curve = generator.onset_curve();

  float env_peak = envelope.empty() ? 0.0f : *std::max_element(envelope.begin(), envelope.end());
  int curve_peak_frame = static_cast<int>(argmax(curve.data(), curve.size()));
  double curve_peak_time =
      frame_to_time(curve_peak_frame, config.envelope.hop_length, audio.sample_rate());

  if (args.json_output) {
    JsonWriter json;
    json.object()
        .field("n_frames", envelope.size())
        .field("window_length", config.envelope.window_length)
        .field("hop_length", config.envelope.hop_length)
        .field("envelope_peak", env_peak)
        .field("onset_peak_time", curve_peak_time);
    if (args.has("full")) {
      json.key("envelope").numbers(envelope);
      json.key("onset_curve").numbers(curve);
    }
    json.close();
    print_json(json);
  } else {
    std::cout << "RMS Envelope:\n";
    printf("  Frames:          %zu\n", envelope.size());
    printf("  Window / Hop:    %d / %d\n", config.envelope.window_length,
           config.envelope.hop_length);
    printf("  Envelope Peak:   %.4f\n", env_peak);
    printf("  Onset Peak Time: %.3fs\n", curve_peak_time);
  }
  return 0;
}

int cmd_onsets(const CliArgs& args, const Audio& audio) {
  ChartGenerator generator(audio, make_config(args));
  OnsetPicker& picker = generator.onset_picker();

  if (args.json_output) {
    JsonWriter json;
    json.object()
        .field("count", picker.count())
        .field("threshold", picker.threshold())
        .field("rescued", picker.rescued())
        .key("onsets")
        .array();
    for (const auto& c : picker.candidates()) {
      json.object()
          .field("time", c.time)
          .field("strength", c.strength)
          .field("salience", c.salience)
          .close();
    }
    json.close().close();
    print_json(json);
  } else {
    printf("Threshold: %.5f%s\n", picker.threshold(),
           picker.rescued() ? " (leading onset rescued)" : "");
    print_times("Onset times", picker.onset_times());
  }
  return 0;
}

int cmd_tempo(const CliArgs& args, const Audio& audio) {
  ChartGenerator generator(audio, make_config(args));
  TempoEstimator& tempo = generator.tempo_estimator();

  if (args.json_output) {
    JsonWriter json;
    json.object()
        .field("bpm", tempo.bpm())
        .field("beat_period", tempo.beat_period())
        .field("raw_interval", tempo.raw_interval())
        .field("fallback", tempo.used_fallback())
        .field("n_intervals", tempo.intervals().size())
        .close();
    print_json(json);
  } else {
    std::cout << "Tempo Estimate:\n";
    printf("  BPM:          %.1f%s\n", tempo.bpm(), tempo.used_fallback() ? " (default)" : "");
    printf("  Beat Period:  %.3fs\n", tempo.beat_period());
    printf("  Raw Interval: %.3fs\n", tempo.raw_interval());
    printf("  Intervals:    %zu\n", tempo.intervals().size());
  }
  return 0;
}

int cmd_chart(const CliArgs& args, const Audio& audio) {
  ChartGenerator generator(audio, make_config(args));
  if (!args.quiet && !args.json_output) {
    generator.set_progress_callback(progress_callback);
  }

  ChartResult result = generator.generate();

  if (!args.quiet && !args.json_output) {
    clear_progress();
  }

  if (!args.output_file.empty()) {
    save_chart_json(args.output_file, result);
    if (!args.quiet && !args.json_output) {
      std::cerr << "Saved " << result.notes.size() << " notes to " << args.output_file << "\n";
    }
  }

  if (args.json_output) {
    std::cout << chart_to_json(result) << "\n";
    return 0;
  }

  std::cout << "Chart (" << difficulty_name(result.difficulty) << "):\n";
  printf("  BPM:       %.1f%s\n", result.tempo.bpm, result.tempo.fallback ? " (default)" : "");
  printf("  Onsets:    %zu\n", result.candidates.size());
  printf("  Notes:     %zu\n\n", result.notes.size());
  std::cout << "Time      Key\n";
  for (const auto& note : result.notes) {
    printf("%-9.3f %s\n", note.time, lane_name(note.lane));
  }
  return 0;
}

// ============================================================================
// Command Registry
// ============================================================================

struct CommandInfo {
  std::string name;
  std::string description;
  CommandHandler handler;
  bool requires_audio;
};

const std::vector<CommandInfo>& get_commands() {
  static std::vector<CommandInfo> commands = {
      // Charting
      {"chart", "Generate a note chart", cmd_chart, true},
      {"onsets", "Detect onset times", cmd_onsets, true},
      {"tempo", "Estimate beat period", cmd_tempo, true},
      // Features
      {"envelope", "Compute RMS envelope and onset curve", cmd_envelope, true},
      // Utility
      {"info", "Show audio file information", cmd_info, true},
  };
  return commands;
}

const CommandInfo* find_command(const std::string& name) {
  for (const auto& cmd : get_commands()) {
    if (cmd.name == name) return &cmd;
  }
  return nullptr;
}

// ============================================================================
// Usage
// ============================================================================

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <command> [options] <audio_file> [-o output]\n\n";

  std::cerr << "CHART COMMANDS:\n";
  for (const auto& cmd : get_commands()) {
    if (cmd.name == "envelope") std::cerr << "\nFEATURE COMMANDS:\n";
    if (cmd.name == "info") std::cerr << "\nUTILITY COMMANDS:\n";
    fprintf(stderr, "  %-14s %s\n", cmd.name.c_str(), cmd.description.c_str());
  }
  std::cerr << "  version        Show library version\n";

  std::cerr << "\nGLOBAL OPTIONS:\n"
            << "  --json               Output results in JSON format\n"
            << "  --quiet, -q          Suppress progress output\n"
            << "  --help, -h           Show help\n"
            << "  -o, --output         Chart JSON output path (chart)\n"
            << "  --difficulty <name>  easy, medium or hard (default: medium)\n"
            << "  --window <int>       RMS window length (default: 1024)\n"
            << "  --hop <int>          Hop length (default: 512)\n"
            << "  --smooth <int>       Onset curve smoothing width (default: 3)\n"
            << "  --bpm-min <float>    Tempo band lower edge (default: 60)\n"
            << "  --bpm-max <float>    Tempo band upper edge (default: 200)\n"
            << "  --start <sec>        Analyze from this time\n"
            << "  --end <sec>          Analyze up to this time\n"
            << "  --mixdown <mode>     first or average (default: first)\n"
            << "\nExamples:\n"
            << "  " << prog << " chart music.mp3 --difficulty hard -o level.json\n"
            << "  " << prog << " tempo music.wav --json\n"
            << "  " << prog << " onsets music.wav --start 30 --end 60\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  CliArgs args = ArgParser::parse(argc, argv);

  if (args.help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command.empty()) {
    std::cerr << "Error: No command specified\n\n";
    print_usage(argv[0]);
    return 1;
  }

  // Version command (no audio needed)
  if (args.command == "version") {
    return cmd_version(args);
  }

  // Find command
  const CommandInfo* cmd = find_command(args.command);
  if (!cmd) {
    std::cerr << "Error: Unknown command '" << args.command << "'\n\n";
    print_usage(argv[0]);
    return 1;
  }

  // Check for audio file
  if (cmd->requires_audio && args.input_file.empty()) {
    std::cerr << "Error: Missing audio file\n\n";
    print_usage(argv[0]);
    return 1;
  }

  try {
    if (!args.quiet && !args.json_output) {
      std::cerr << "Loading " << args.input_file << "...\n";
    }

    AudioLoadOptions options;
    options.mixdown = parse_mixdown(args.get_string("mixdown", "first"));

    Audio audio = Audio::from_file(args.input_file, options);
    if (audio.empty()) {
      std::cerr << "Error: Failed to load audio file\n";
      return 1;
    }

    if (args.start > 0.0 || args.end >= 0.0) {
      audio = audio.slice(args.start, args.end);
    }

    if (!args.quiet && !args.json_output) {
      std::cerr << "Loaded " << audio.duration() << "s @ " << audio.sample_rate() << "Hz\n";
    }

    return cmd->handler(args, audio);

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
