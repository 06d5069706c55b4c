#pragma once

/// @file report_json.h
/// @brief Stable JSON shape of an AnalysisReport.

#include <string>
#include <vector>

#include "analysis/report_aggregator.h"
#include "core/segmenter.h"
#include "util/json_writer.h"

namespace emotrace {

/// @brief Serializes a report.
/// @details Keys appear in a fixed order and emotion mappings follow canonical label
/// order. Scores and times use 3 decimals, percentages and durations use 2, so equal
/// reports serialize to identical bytes.
/// @param report Report to serialize
/// @param indent Spaces per nesting level (0 = single line)
std::string to_json(const AnalysisReport& report, int indent = 0);

/// @brief Writes the full report object.
void write_report(JsonWriter& json, const AnalysisReport& report);

/// @brief Writes the sentiment-enriched timeline array.
void write_timeline(JsonWriter& json, const AnalysisReport& report);

/// @brief Writes a transitions array.
void write_transitions(JsonWriter& json, const std::vector<Transition>& transitions);

/// @brief Writes an emotion -> percentage object.
void write_distribution(JsonWriter& json, const EmotionDistribution& distribution);

/// @brief Writes an emotion -> probability object.
void write_scores(JsonWriter& json, const EmotionScores& scores);

/// @brief Writes the sentiment summary object.
void write_sentiment(JsonWriter& json, const SentimentSummary& sentiment);

/// @brief Writes the journey summary object.
void write_journey(JsonWriter& json, const JourneySummary& journey);

/// @brief Writes an array of window boundaries.
void write_windows(JsonWriter& json, const std::vector<Window>& windows);

}  // namespace emotrace
