// Report writers: plain-text console report, JSON result set and simple HTML.
#pragma once

#include "options_file.hpp"

#include <shingle_eval/analysis/aggregator.hpp>
#include <shingle_eval/scoring/evaluator.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace analyzer {

// Write JSON to path (pretty), creating parent directories. Return true on success.
bool write_json(const std::filesystem::path& path, const nlohmann::json& j);

// Write text to path, creating parent directories. Return true on success.
bool write_text(const std::filesystem::path& path, const std::string& text);

// Flat result set: one object per document with per-source f1/precision/recall/len,
// true_len and f1_gap (reference - candidate).
nlohmann::json make_results_json(
    const shingle_eval::ResultSet& results,
    size_t candidate,
    size_t reference);

// Run summary: options, category counts, worst document.
nlohmann::json make_summary_json(
    const shingle_eval::AnalysisReport& report,
    const RunOptions& opts);

// Console report: ranked tables, category counts, boilerplate, worst sample.
std::string make_text_report(
    const shingle_eval::AnalysisReport& report,
    const shingle_eval::AnalysisConfig& config);

// Standalone HTML rendering of the same report.
std::string make_html_report(
    const shingle_eval::AnalysisReport& report,
    const shingle_eval::AnalysisConfig& config);

} // namespace analyzer
