// Run options: evaluation + analysis tunables, loadable from a JSON file.
#pragma once

#include "io.hpp"

#include <shingle_eval/analysis/aggregator.hpp>
#include <shingle_eval/scoring/evaluator.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace analyzer {

struct RunOptions {
    shingle_eval::EvalConfig eval;
    shingle_eval::AnalysisConfig analysis;
    std::string text_field = DEFAULT_TEXT_FIELD;
};

bool parse_overlap_mode(const std::string& s, shingle_eval::OverlapMode& out);
bool parse_tokenizer_mode(const std::string& s, shingle_eval::TokenizerMode& out);

std::string to_string(shingle_eval::OverlapMode mode);
std::string to_string(shingle_eval::TokenizerMode mode);

// Apply the keys present in j on top of opts. Unknown mode strings make the
// whole call fail; opts is left untouched in that case.
bool apply_options_json(const nlohmann::json& j, RunOptions& opts);

// Read a JSON config file (comments allowed) and apply it. Return false if
// the file cannot be read or holds invalid values.
bool load_options_file(const std::filesystem::path& path, RunOptions& opts);

nlohmann::json options_to_json(const RunOptions& opts);

} // namespace analyzer
