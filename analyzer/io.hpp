// Ground-truth and prediction collection loading (JSON).
#pragma once

#include <shingle_eval/scoring/evaluator.hpp>

#include <filesystem>
#include <string>

namespace analyzer {

// Text field read from every record when none is configured.
inline const std::string DEFAULT_TEXT_FIELD = "articleBody";

// Read a {id: {field: text, ...}, ...} JSON file. Records whose field is
// missing or not a string map to the empty text. Return true on success.
bool load_collection(
    const std::filesystem::path& path,
    const std::string& text_field,
    shingle_eval::DocumentCollection& out);

// Load a named prediction source; same rules as load_collection.
bool load_prediction_source(
    const std::string& name,
    const std::filesystem::path& path,
    const std::string& text_field,
    shingle_eval::PredictionSource& out);

} // namespace analyzer
