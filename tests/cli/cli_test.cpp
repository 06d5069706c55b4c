/// @file cli_test.cpp
/// @brief Tests for the emotrace CLI tool.

#include <array>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "core/audio_io.h"
#include "util/test_helpers.h"

using namespace emotrace;
using Catch::Matchers::ContainsSubstring;

namespace {

/// @brief Writes a 16-bit WAV file holding a sine tone.
void create_test_wav(const std::string& path, float duration = 6.0f, int sample_rate = 16000) {
  save_wav(path, test::sine(220.0f, duration, sample_rate, 0.4f), sample_rate);
}

/// @brief Runs a shell command.
/// @return Pair of (exit_code, combined stdout and stderr)
std::pair<int, std::string> exec_command(const std::string& cmd) {
  std::array<char, 4096> buffer;
  std::string output;

  std::string full_cmd = cmd + " 2>&1";
  std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_cmd.c_str(), "r"), pclose);
  if (!pipe) {
    return {-1, "popen failed"};
  }
  while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
    output += buffer.data();
  }

  int status = pclose(pipe.release());
  return {WEXITSTATUS(status), output};
}

std::string cli(const std::string& arguments) {
  return std::string("\"") + EMOTRACE_CLI_PATH + "\" " + arguments;
}

std::string read_text(const std::string& path) {
  std::ifstream file(path);
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

}  // namespace

TEST_CASE("CLI version and help", "[cli]") {
  auto version = exec_command(cli("version"));
  REQUIRE(version.first == 0);
  REQUIRE_THAT(version.second, ContainsSubstring("libemotrace version 1.0.0"));

  auto help = exec_command(cli("--help"));
  REQUIRE(help.first == 0);
  REQUIRE_THAT(help.second, ContainsSubstring("ANALYSIS COMMANDS"));
  REQUIRE_THAT(help.second, ContainsSubstring("transitions"));

  auto none = exec_command(cli(""));
  REQUIRE(none.first == 1);
}

TEST_CASE("CLI usage errors", "[cli]") {
  auto unknown = exec_command(cli("dance input.wav"));
  REQUIRE(unknown.first == 1);
  REQUIRE_THAT(unknown.second, ContainsSubstring("Unknown command"));

  auto missing = exec_command(cli("analyze"));
  REQUIRE(missing.first == 1);
  REQUIRE_THAT(missing.second, ContainsSubstring("Missing audio file"));

  auto not_found = exec_command(cli("analyze -q /nonexistent/emotrace.wav"));
  REQUIRE(not_found.first == 1);
  REQUIRE_THAT(not_found.second, ContainsSubstring("Error"));
}

TEST_CASE("CLI analysis commands", "[cli]") {
  const std::string wav = "emotrace_cli_test.wav";
  create_test_wav(wav);

  SECTION("info") {
    auto r = exec_command(cli("info " + wav));
    REQUIRE(r.first == 0);
    REQUIRE_THAT(r.second, ContainsSubstring("Sample Rate: 16000 Hz"));
    REQUIRE_THAT(r.second, ContainsSubstring("Windows:     5"));
  }

  SECTION("segments") {
    auto r = exec_command(cli("segments -q " + wav));
    REQUIRE(r.first == 0);
    REQUIRE_THAT(r.second, ContainsSubstring("Segments: 5"));
  }

  SECTION("analyze --json") {
    auto r = exec_command(cli("analyze --json " + wav));
    REQUIRE(r.first == 0);
    REQUIRE_THAT(r.second, ContainsSubstring("\"total_segments\": 5"));
    REQUIRE_THAT(r.second, ContainsSubstring("\"sentiment_analysis\""));
  }

  SECTION("analyze writes a report file") {
    const std::string out = "emotrace_cli_report.json";
    auto r = exec_command(cli("analyze -q " + wav + " -o " + out));
    REQUIRE(r.first == 0);
    std::string report = read_text(out);
    REQUIRE_THAT(report, ContainsSubstring("\"journey_analysis\""));
    REQUIRE_THAT(report, ContainsSubstring("\"heatmap_data\""));
    std::remove(out.c_str());
  }

  SECTION("timeline, transitions, sentiment and quick") {
    REQUIRE(exec_command(cli("timeline -q " + wav)).first == 0);
    REQUIRE(exec_command(cli("transitions -q " + wav)).first == 0);

    auto sentiment = exec_command(cli("sentiment -q " + wav));
    REQUIRE(sentiment.first == 0);
    REQUIRE_THAT(sentiment.second, ContainsSubstring("Sentiment:"));

    auto quick = exec_command(cli("quick -q " + wav));
    REQUIRE(quick.first == 0);
    REQUIRE_THAT(quick.second, ContainsSubstring("Emotion:"));
  }

  SECTION("invalid window options") {
    auto r = exec_command(cli("analyze -q --window 2 --overlap 3 " + wav));
    REQUIRE(r.first == 1);
    REQUIRE_THAT(r.second, ContainsSubstring("overlap"));
  }

  SECTION("invalid failure policy") {
    auto r = exec_command(cli("analyze -q --on-failure retry " + wav));
    REQUIRE(r.first == 1);
    REQUIRE_THAT(r.second, ContainsSubstring("--on-failure"));
  }

  std::remove(wav.c_str());
}

TEST_CASE("CLI duration ceiling", "[cli]") {
  const std::string wav = "emotrace_cli_long.wav";
  create_test_wav(wav, 4.0f);

  auto rejected = exec_command(cli("analyze -q --max-duration 3 " + wav));
  REQUIRE(rejected.first == 1);
  REQUIRE_THAT(rejected.second, ContainsSubstring("exceeds maximum"));

  auto truncated = exec_command(cli("analyze --json --max-duration 3 --truncate " + wav));
  REQUIRE(truncated.first == 0);
  REQUIRE_THAT(truncated.second, ContainsSubstring("\"total_segments\": 2"));

  std::remove(wav.c_str());
}
