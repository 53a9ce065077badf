// Collections are JSON objects keyed by document id, as written by the
// extraction benchmark.

#include "io.hpp"

#include <shingle_eval/utils/logger.hpp>

#include <nlohmann/json.hpp>

#include <fstream>

namespace analyzer {

using shingle_eval::logger;

bool load_collection(
    const std::filesystem::path& path,
    const std::string& text_field,
    shingle_eval::DocumentCollection& out)
{
    std::ifstream in(path);
    if (!in.good()) {
        logger().error("cannot open collection {}", path.string());
        return false;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        logger().error("invalid JSON in {}: {}", path.string(), e.what());
        return false;
    }
    if (!j.is_object()) {
        logger().error("{}: expected an object keyed by document id", path.string());
        return false;
    }

    out.clear();
    size_t missing = 0;
    for (const auto& [id, record] : j.items()) {
        std::string text;
        if (record.is_object()) {
            const auto it = record.find(text_field);
            if (it != record.end() && it->is_string()) {
                text = it->get<std::string>();
            } else {
                ++missing;
            }
        } else {
            ++missing;
        }
        out.emplace(id, std::move(text));
    }
    if (missing > 0) {
        logger().debug(
            "{}: {} records without a string '{}' field", path.string(),
            missing, text_field);
    }
    logger().info("loaded {} documents from {}", out.size(), path.string());
    return true;
}

bool load_prediction_source(
    const std::string& name,
    const std::filesystem::path& path,
    const std::string& text_field,
    shingle_eval::PredictionSource& out)
{
    out.name = name;
    return load_collection(path, text_field, out.documents);
}

} // namespace analyzer
