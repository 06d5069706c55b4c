/// @file emotrace_cli.cpp
/// @brief Command-line interface for emotrace emotion timeline analysis.

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "emotrace.h"

using namespace emotrace;

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
  bool truncate = false;

  std::map<std::string, std::string> options;

  float get_float(const std::string& k, float def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stof(it->second) : def;
  }

  int get_int(const std::string& k, int def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stoi(it->second) : def;
  }

  bool has(const std::string& k) const { return options.count(k) > 0; }

  std::string get_string(const std::string& k, const std::string& def = "") const {
    auto it = options.find(k);
    return it != options.end() ? it->second : def;
  }

  /// @brief Show progress and log lines on stderr.
  bool verbose() const { return !quiet && !json_output; }
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
      } else if (arg == "--truncate") {
        args.truncate = true;
      } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
        args.output_file = argv[++i];
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
  static void parse_option(CliArgs& args, const std::string& key, char* argv[], int& i, int argc) {
    if (i + 1 < argc) {
      std::string next = argv[i + 1];
      bool is_negative_num =
          next.size() > 1 && next[0] == '-' && (std::isdigit(next[1]) || next[1] == '.');
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
// Configuration
// ============================================================================

PipelineConfig build_config(const CliArgs& args) {
  PipelineConfig config;

  config.normalizer.target_sample_rate =
      args.get_int("sample-rate", config.normalizer.target_sample_rate);
  config.normalizer.max_duration_sec =
      args.get_float("max-duration", config.normalizer.max_duration_sec);
  if (args.truncate) {
    config.normalizer.duration_policy = DurationPolicy::Truncate;
  }

  config.segmenter.window_sec = args.get_float("window", config.segmenter.window_sec);
  config.segmenter.overlap_sec = args.get_float("overlap", config.segmenter.overlap_sec);
  config.segmenter.min_tail_fraction =
      args.get_float("min-tail", config.segmenter.min_tail_fraction);

  config.timeline.n_threads = args.get_int("threads", config.timeline.n_threads);
  std::string policy = args.get_string("on-failure", "abort");
  if (policy == "placeholder") {
    config.timeline.failure_policy = FailurePolicy::Placeholder;
  } else if (policy != "abort") {
    throw EmotraceException(ErrorCode::InvalidParameter,
                            "--on-failure must be 'abort' or 'placeholder': " + policy);
  }

  config.transitions.significance_threshold =
      args.get_float("threshold", config.transitions.significance_threshold);

  config.sentiment.positive_threshold =
      args.get_float("positive", config.sentiment.positive_threshold);
  config.sentiment.negative_threshold =
      args.get_float("negative", config.sentiment.negative_threshold);

  return config;
}

// ============================================================================
// Output Helpers
// ============================================================================

void progress_callback(float progress, const char* stage) {
  std::cerr << "\r" << stage << ": " << static_cast<int>(progress * 100) << "%   " << std::flush;
}

void clear_progress() { std::cerr << "\r                              \r"; }

void print_json(const JsonWriter& json) { std::cout << json.str() << "\n"; }

/// @brief Writes the full report as indented JSON when -o was given.
bool write_report_file(const CliArgs& args, const AnalysisReport& report) {
  if (args.output_file.empty()) return true;

  std::ofstream out(args.output_file, std::ios::binary);
  if (!out) {
    std::cerr << "Error: Cannot open output file: " << args.output_file << "\n";
    return false;
  }
  out << to_json(report, 2) << "\n";
  if (!out) {
    std::cerr << "Error: Failed to write output file: " << args.output_file << "\n";
    return false;
  }
  if (args.verbose()) {
    std::cerr << "Report written to " << args.output_file << "\n";
  }
  return true;
}

AnalysisReport run_analysis(const CliArgs& args, const EmotionPipeline& pipeline,
                            const AudioBuffer& audio) {
  AnalysisReport report = pipeline.analyze(audio);
  if (args.verbose()) {
    clear_progress();
  }
  return report;
}

void print_distribution(const EmotionDistribution& distribution) {
  for (Emotion e : kAllEmotions) {
    std::printf("  %-9s %6.2f%%\n", emotion_name(e), distribution[emotion_index(e)]);
  }
}

// ============================================================================
// Command Handler Type
// ============================================================================

using CommandHandler =
    std::function<int(const CliArgs&, const EmotionPipeline&, const AudioBuffer&)>;

// ============================================================================
// Command Implementations
// ============================================================================

int cmd_version(const CliArgs& args) {
  if (args.json_output) {
    JsonWriter json;
    json.begin_object().kv("cli_version", "1.0.0").kv("lib_version", version()).end_object();
    print_json(json);
  } else {
    std::cout << "emotrace-cli version 1.0.0\n";
    std::cout << "libemotrace version " << version() << "\n";
  }
  return 0;
}

int cmd_info(const CliArgs& args, const EmotionPipeline& pipeline, const AudioBuffer& audio) {
  float peak = 0.0f;
  double sum_sq = 0.0;
  for (float s : audio) {
    peak = std::max(peak, std::abs(s));
    sum_sq += static_cast<double>(s) * s;
  }
  float rms = static_cast<float>(std::sqrt(sum_sq / static_cast<double>(audio.size())));
  float peak_db = 20.0f * std::log10(std::max(peak, 1e-10f));
  float rms_db = 20.0f * std::log10(std::max(rms, 1e-10f));
  size_t n_windows = pipeline.segment(audio).size();

  if (args.json_output) {
    JsonWriter json;
    json.begin_object()
        .kv("path", args.input_file)
        .kv("duration", static_cast<double>(audio.duration()), 2)
        .kv("sample_rate", audio.sample_rate())
        .kv("samples", audio.size())
        .kv("peak_db", static_cast<double>(peak_db), 2)
        .kv("rms_db", static_cast<double>(rms_db), 2)
        .kv("windows", n_windows)
        .end_object();
    print_json(json);
  } else {
    std::cout << "Audio File: " << args.input_file << "\n";
    std::cout << "  Duration:    " << format_timestamp(audio.duration()) << " (" << std::fixed
              << std::setprecision(2) << audio.duration() << "s)\n";
    std::cout << "  Sample Rate: " << audio.sample_rate() << " Hz\n";
    std::cout << "  Samples:     " << audio.size() << "\n";
    std::cout << "  Peak Level:  " << std::setprecision(1) << peak_db << " dB\n";
    std::cout << "  RMS Level:   " << rms_db << " dB\n";
    std::cout << "  Windows:     " << n_windows << "\n";
  }
  return 0;
}

int cmd_segments(const CliArgs& args, const EmotionPipeline& pipeline, const AudioBuffer& audio) {
  std::vector<Window> windows = pipeline.segment(audio);

  if (args.json_output) {
    JsonWriter json;
    json.begin_object().kv("count", windows.size()).key("segments");
    write_windows(json, windows);
    json.end_object();
    print_json(json);
  } else {
    std::cout << "Segments: " << windows.size() << "\n";
    for (size_t i = 0; i < windows.size(); ++i) {
      std::printf("  %3zu  %8.3fs - %8.3fs  (%zu samples)\n", i, windows[i].start_seconds,
                  windows[i].end_seconds, windows[i].length());
    }
  }
  return 0;
}

int cmd_quick(const CliArgs& args, const EmotionPipeline& pipeline, const AudioBuffer& audio) {
  QuickResult r = pipeline.quick_analyze(audio);

  if (args.json_output) {
    JsonWriter json;
    json.begin_object()
        .kv("emotion", emotion_name(r.emotion))
        .kv("confidence", static_cast<double>(r.confidence), 3)
        .key("scores");
    write_scores(json, r.scores);
    json.end_object();
    print_json(json);
  } else {
    std::printf("Emotion: %s (confidence: %.3f)\n", emotion_name(r.emotion), r.confidence);
  }
  return 0;
}

int cmd_timeline(const CliArgs& args, const EmotionPipeline& pipeline, const AudioBuffer& audio) {
  AnalysisReport report = run_analysis(args, pipeline, audio);
  if (!write_report_file(args, report)) return 1;

  if (args.json_output) {
    JsonWriter json;
    json.begin_object().key("timeline");
    write_timeline(json, report);
    json.end_object();
    print_json(json);
  } else {
    const auto& sentiment = report.sentiment_timeline();
    for (size_t i = 0; i < report.timeline().size(); ++i) {
      const TimelineEntry& e = report.timeline()[i];
      if (!e.classified) {
        std::printf("%s-%s  (unclassified)\n", e.start_formatted.c_str(),
                    e.end_formatted.c_str());
        continue;
      }
      std::printf("%s-%s  %-9s %.3f  %s\n", e.start_formatted.c_str(), e.end_formatted.c_str(),
                  emotion_name(e.emotion()), e.confidence(),
                  polarity_name(sentiment[i].category));
    }
  }
  return 0;
}

int cmd_transitions(const CliArgs& args, const EmotionPipeline& pipeline,
                    const AudioBuffer& audio) {
  AnalysisReport report = run_analysis(args, pipeline, audio);
  if (!write_report_file(args, report)) return 1;

  if (args.json_output) {
    JsonWriter json;
    json.begin_object().kv("count", report.transitions().size()).key("transitions");
    write_transitions(json, report.transitions());
    json.end_object();
    print_json(json);
  } else {
    std::cout << "Transitions: " << report.transitions().size() << "\n";
    for (const auto& t : report.transitions()) {
      std::printf("  %s  %s -> %s  (%+.3f)%s\n", t.time_formatted.c_str(),
                  emotion_name(t.from_emotion), emotion_name(t.to_emotion), t.confidence_change,
                  t.is_significant ? "  significant" : "");
    }
  }
  return 0;
}

int cmd_sentiment(const CliArgs& args, const EmotionPipeline& pipeline, const AudioBuffer& audio) {
  AnalysisReport report = run_analysis(args, pipeline, audio);
  if (!write_report_file(args, report)) return 1;

  const SentimentSummary& s = report.sentiment();
  if (args.json_output) {
    JsonWriter json;
    write_sentiment(json, s);
    print_json(json);
  } else {
    std::printf("Sentiment: %s (score: %.3f)\n", polarity_name(s.category), s.score);
    std::printf("  positive  %6.2f%%\n", s.breakdown.positive);
    std::printf("  neutral   %6.2f%%\n", s.breakdown.neutral);
    std::printf("  negative  %6.2f%%\n", s.breakdown.negative);
  }
  return 0;
}

int cmd_analyze(const CliArgs& args, const EmotionPipeline& pipeline, const AudioBuffer& audio) {
  AnalysisReport report = run_analysis(args, pipeline, audio);
  if (!write_report_file(args, report)) return 1;

  if (args.json_output) {
    std::cout << to_json(report) << "\n";
    return 0;
  }

  const ReportMetadata& meta = report.metadata();
  const JourneySummary& journey = report.journey();
  size_t significant = static_cast<size_t>(
      std::count_if(report.transitions().begin(), report.transitions().end(),
                    [](const Transition& t) { return t.is_significant; }));

  std::printf("Duration: %.2fs (%zu segments @ %dHz)\n", meta.duration, meta.total_segments,
              meta.sample_rate);
  std::printf("Primary Emotion: %s\n", emotion_name(journey.primary_emotion));
  std::printf("Sentiment: %s (score: %.3f)\n", polarity_name(report.sentiment().category),
              report.sentiment().score);
  std::printf("Transitions: %zu (%zu significant)\n", journey.total_transitions, significant);
  std::printf("Stability: %.3f (variability: %s)\n", journey.stability_score,
              journey.high_variability ? "high" : "low");
  if (!journey.dominant_emotions.empty()) {
    std::cout << "Dominant: ";
    for (size_t i = 0; i < journey.dominant_emotions.size(); ++i) {
      if (i > 0) std::cout << ", ";
      std::printf("%s (%.1f%%)", emotion_name(journey.dominant_emotions[i].emotion),
                  journey.dominant_emotions[i].percentage);
    }
    std::cout << "\n";
  }
  std::cout << "Distribution:\n";
  print_distribution(report.distribution());
  return 0;
}

// ============================================================================
// Command Registry
// ============================================================================

struct CommandInfo {
  std::string name;
  std::string description;
  CommandHandler handler;
};

const std::vector<CommandInfo>& get_commands() {
  static std::vector<CommandInfo> commands = {
      // Analysis
      {"analyze", "Full emotion timeline report", cmd_analyze},
      {"timeline", "Per-window emotion predictions", cmd_timeline},
      {"transitions", "Emotion changes and their significance", cmd_transitions},
      {"sentiment", "Overall sentiment score and breakdown", cmd_sentiment},
      {"quick", "Single whole-recording prediction", cmd_quick},
      // Utility
      {"segments", "Show analysis window boundaries", cmd_segments},
      {"info", "Show normalized audio information", cmd_info},
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
  std::cerr << "Usage: " << prog << " <command> [options] <audio_file> [-o report.json]\n\n";

  std::cerr << "ANALYSIS COMMANDS:\n";
  for (const auto& cmd : get_commands()) {
    if (cmd.name == "segments") std::cerr << "\nUTILITY COMMANDS:\n";
    fprintf(stderr, "  %-14s %s\n", cmd.name.c_str(), cmd.description.c_str());
  }
  std::cerr << "  version        Show library version\n";

  std::cerr << "\nGLOBAL OPTIONS:\n"
            << "  --json                 Output results in JSON format\n"
            << "  --quiet, -q            Suppress progress output\n"
            << "  --help, -h             Show help\n"
            << "  -o, --output <file>    Write the full JSON report to a file\n"
            << "\nANALYSIS OPTIONS:\n"
            << "  --window <sec>         Window length (default: 2.0)\n"
            << "  --overlap <sec>        Window overlap (default: 1.0)\n"
            << "  --min-tail <frac>      Shortest trailing window, fraction of window (default: 0.5)\n"
            << "  --threshold <value>    Transition significance threshold (default: 0.15)\n"
            << "  --positive <value>     Positive sentiment threshold (default: 0.15)\n"
            << "  --negative <value>     Negative sentiment threshold (default: -0.15)\n"
            << "  --sample-rate <hz>     Analysis sample rate (default: 16000)\n"
            << "  --max-duration <sec>   Duration ceiling (default: 600)\n"
            << "  --truncate             Truncate audio over the ceiling instead of failing\n"
            << "  --threads <n>          Classification threads, 0 = all cores (default: 1)\n"
            << "  --on-failure <policy>  abort | placeholder (default: abort)\n"
            << "\nExamples:\n"
            << "  " << prog << " analyze speech.wav\n"
            << "  " << prog << " transitions speech.mp3 --threshold 0.2 --json\n"
            << "  " << prog << " analyze speech.wav --threads 4 -o report.json\n";
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

  if (args.input_file.empty()) {
    std::cerr << "Error: Missing audio file\n\n";
    print_usage(argv[0]);
    return 1;
  }

  try {
    EmotionPipeline pipeline(build_config(args));
    if (args.verbose()) {
      pipeline.set_progress_callback(progress_callback);
      std::cerr << "Loading " << args.input_file << "...\n";
    }

    AudioBuffer audio = pipeline.load_file(args.input_file);

    if (args.verbose()) {
      std::cerr << "Loaded " << audio.duration() << "s @ " << audio.sample_rate() << "Hz\n";
    }

    return cmd->handler(args, pipeline, audio);

  } catch (const ClassificationError& e) {
    if (args.verbose()) clear_progress();
    std::cerr << "Error: " << e.what() << " (window " << e.start_seconds() << "s - "
              << e.end_seconds() << "s)\n";
    return 1;
  } catch (const std::exception& e) {
    if (args.verbose()) clear_progress();
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
