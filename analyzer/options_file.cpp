#include "options_file.hpp"

#include <shingle_eval/utils/logger.hpp>

#include <fstream>

namespace analyzer {

using shingle_eval::logger;
using shingle_eval::OverlapMode;
using shingle_eval::TokenizerMode;

bool parse_overlap_mode(const std::string& s, OverlapMode& out)
{
    if (s == "multiset") {
        out = OverlapMode::Multiset;
    } else if (s == "set") {
        out = OverlapMode::Set;
    } else {
        return false;
    }
    return true;
}

bool parse_tokenizer_mode(const std::string& s, TokenizerMode& out)
{
    if (s == "word") {
        out = TokenizerMode::Word;
    } else if (s == "whitespace") {
        out = TokenizerMode::Whitespace;
    } else {
        return false;
    }
    return true;
}

std::string to_string(OverlapMode mode)
{
    return mode == OverlapMode::Set ? "set" : "multiset";
}

std::string to_string(TokenizerMode mode)
{
    return mode == TokenizerMode::Whitespace ? "whitespace" : "word";
}

bool apply_options_json(const nlohmann::json& j, RunOptions& opts)
{
    if (!j.is_object()) {
        logger().error("options must be a JSON object");
        return false;
    }
    RunOptions o = opts;
    try {
        auto& e = o.eval;
        auto& a = o.analysis;
        e.ngram_size = j.value("ngram_size", e.ngram_size);
        if (j.contains("mode")
            && !parse_overlap_mode(j["mode"].get<std::string>(), e.overlap_mode)) {
            logger().error("unknown mode '{}'", j["mode"].get<std::string>());
            return false;
        }
        if (j.contains("tokenizer")
            && !parse_tokenizer_mode(
                j["tokenizer"].get<std::string>(), e.tokenizer_mode)) {
            logger().error(
                "unknown tokenizer '{}'", j["tokenizer"].get<std::string>());
            return false;
        }
        o.text_field = j.value("text_field", o.text_field);

        a.deficit_threshold = j.value("deficit_threshold", a.deficit_threshold);
        a.over_extraction_ratio =
            j.value("over_extraction_ratio", a.over_extraction_ratio);
        a.over_extraction_min_length =
            j.value("over_extraction_min_length", a.over_extraction_min_length);
        a.f1_table_size = j.value("f1_table_size", a.f1_table_size);
        a.precision_table_size =
            j.value("precision_table_size", a.precision_table_size);
        a.boilerplate_documents =
            j.value("boilerplate_documents", a.boilerplate_documents);
        a.boilerplate_top_tokens =
            j.value("boilerplate_top_tokens", a.boilerplate_top_tokens);
        a.boilerplate_min_token_length = j.value(
            "boilerplate_min_token_length", a.boilerplate_min_token_length);
        a.empty_listing_size =
            j.value("empty_listing_size", a.empty_listing_size);
        a.excerpt_chars = j.value("excerpt_chars", a.excerpt_chars);
    } catch (const nlohmann::json::type_error& err) {
        logger().error("invalid option value: {}", err.what());
        return false;
    }
    opts = std::move(o);
    return true;
}

bool load_options_file(const std::filesystem::path& path, RunOptions& opts)
{
    std::ifstream in(path);
    if (!in.good()) {
        logger().error("cannot open config {}", path.string());
        return false;
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in, nullptr, true, true);
    } catch (const nlohmann::json::parse_error& e) {
        logger().error("invalid JSON in {}: {}", path.string(), e.what());
        return false;
    }
    return apply_options_json(j, opts);
}

nlohmann::json options_to_json(const RunOptions& opts)
{
    const auto& e = opts.eval;
    const auto& a = opts.analysis;
    return {
        { "ngram_size", e.ngram_size },
        { "mode", to_string(e.overlap_mode) },
        { "tokenizer", to_string(e.tokenizer_mode) },
        { "text_field", opts.text_field },
        { "deficit_threshold", a.deficit_threshold },
        { "over_extraction_ratio", a.over_extraction_ratio },
        { "over_extraction_min_length", a.over_extraction_min_length },
        { "f1_table_size", a.f1_table_size },
        { "precision_table_size", a.precision_table_size },
        { "boilerplate_documents", a.boilerplate_documents },
        { "boilerplate_top_tokens", a.boilerplate_top_tokens },
        { "boilerplate_min_token_length", a.boilerplate_min_token_length },
        { "empty_listing_size", a.empty_listing_size },
        { "excerpt_chars", a.excerpt_chars },
    };
}

} // namespace analyzer
