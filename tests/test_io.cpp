#include <catch2/catch_test_macros.hpp>

#include "io.hpp"
#include "options_file.hpp"

#include <shingle_eval/analysis/aggregator.hpp>

#include <filesystem>
namespace fs = std::filesystem;

using namespace shingle_eval;

TEST_CASE("Load ground-truth collection", "[io]")
{
    const fs::path data(SHINGLE_EVAL_DATA_DIR);

    DocumentCollection truth;
    REQUIRE(analyzer::load_collection(data / "ground-truth.json", analyzer::DEFAULT_TEXT_FIELD, truth));
    REQUIRE(truth.size() == 5);
    CHECK(truth.at("doc-a") == "The cat sat on the mat.");
    CHECK(truth.at("doc-b") == "a b c d e");
    // missing or null field loads as empty text
    CHECK(truth.at("doc-d").empty());
    CHECK(truth.at("doc-e").empty());

    DocumentCollection titles;
    REQUIRE(analyzer::load_collection(data / "ground-truth.json", "title", titles));
    CHECK(titles.at("doc-d") == "record without a body");
    CHECK(titles.at("doc-a").empty());
}

TEST_CASE("Unusable collection files are rejected", "[io]")
{
    const fs::path data(SHINGLE_EVAL_DATA_DIR);

    DocumentCollection c;
    CHECK_FALSE(analyzer::load_collection(data / "does-not-exist.json", "articleBody", c));
    CHECK_FALSE(analyzer::load_collection(data / "malformed.json", "articleBody", c));
    CHECK_FALSE(analyzer::load_collection(data / "array.json", "articleBody", c));
}

TEST_CASE("Evaluate the fixture benchmark", "[io][evaluator]")
{
    const fs::path data(SHINGLE_EVAL_DATA_DIR);
    const std::string field = analyzer::DEFAULT_TEXT_FIELD;

    Corpus corpus;
    REQUIRE(analyzer::load_collection(data / "ground-truth.json", field, corpus.truth));
    PredictionSource cand, ref;
    REQUIRE(analyzer::load_prediction_source("candidate", data / "output" / "candidate.json", field, cand));
    REQUIRE(analyzer::load_prediction_source("reference", data / "output" / "reference.json", field, ref));
    CHECK(cand.name == "candidate");
    CHECK(cand.documents.count("extra-only") == 1);
    corpus.sources = { cand, ref };

    const auto results = evaluate_corpus(corpus, EvalConfig {});
    REQUIRE(results.size() == 5);
    for (const auto& doc : results) {
        CHECK(doc.document_id != "extra-only");
        CHECK(doc.records.size() == 2);
    }

    const auto& a = results[0];
    CHECK(a.document_id == "doc-a");
    CHECK(a.truth_length == 6);
    CHECK(a.records[0].prediction_length == 12);
    CHECK(a.records[0].score.true_positives == 3);
    CHECK(a.records[0].score.false_positives == 6);
    CHECK(a.records[0].score.recall == 1.0);
    CHECK(a.records[1].score.f1 == 1.0);

    const auto d = classify_deficits(results, 0, 1, AnalysisConfig {});
    CHECK(d.f1_gap == std::vector<DocumentId> { "doc-a", "doc-b" });
    CHECK(d.empty_extraction == std::vector<DocumentId> { "doc-b" });
}

TEST_CASE("Options file overrides defaults", "[io][options]")
{
    const fs::path data(SHINGLE_EVAL_DATA_DIR);

    analyzer::RunOptions opts;
    REQUIRE(analyzer::load_options_file(data / "options.json", opts));
    CHECK(opts.eval.overlap_mode == OverlapMode::Set);
    CHECK(opts.eval.ngram_size == 3);
    CHECK(opts.eval.tokenizer_mode == TokenizerMode::Whitespace);
    CHECK(opts.text_field == "body");
    CHECK(opts.analysis.deficit_threshold == 0.2);
    CHECK(opts.analysis.over_extraction_min_length == 50);
    CHECK(opts.analysis.excerpt_chars == 100);
    // absent keys keep their defaults
    CHECK(opts.analysis.over_extraction_ratio == 2.0);
    CHECK(opts.analysis.f1_table_size == 30);
    CHECK(opts.analysis.boilerplate_documents == 20);
}

TEST_CASE("Invalid options leave the previous values", "[io][options]")
{
    const fs::path data(SHINGLE_EVAL_DATA_DIR);

    analyzer::RunOptions opts;
    CHECK_FALSE(analyzer::load_options_file(data / "bad_mode.json", opts));
    CHECK_FALSE(analyzer::load_options_file(data / "bad_type.json", opts));
    CHECK_FALSE(analyzer::load_options_file(data / "does-not-exist.json", opts));
    CHECK_FALSE(analyzer::load_options_file(data / "malformed.json", opts));
    CHECK_FALSE(analyzer::apply_options_json(nlohmann::json::array(), opts));
    CHECK(opts.eval.ngram_size == DEFAULT_NGRAM_SIZE);
    CHECK(opts.eval.overlap_mode == OverlapMode::Multiset);
    CHECK(opts.text_field == analyzer::DEFAULT_TEXT_FIELD);
}

TEST_CASE("Mode names", "[io][options]")
{
    OverlapMode m = OverlapMode::Multiset;
    CHECK(analyzer::parse_overlap_mode("set", m));
    CHECK(m == OverlapMode::Set);
    CHECK(analyzer::parse_overlap_mode("multiset", m));
    CHECK(m == OverlapMode::Multiset);
    CHECK_FALSE(analyzer::parse_overlap_mode("SET", m));

    TokenizerMode t = TokenizerMode::Word;
    CHECK(analyzer::parse_tokenizer_mode("whitespace", t));
    CHECK(t == TokenizerMode::Whitespace);
    CHECK_FALSE(analyzer::parse_tokenizer_mode("regex", t));

    CHECK(analyzer::to_string(OverlapMode::Set) == "set");
    CHECK(analyzer::to_string(TokenizerMode::Word) == "word");
}

TEST_CASE("Options survive a JSON round trip", "[io][options]")
{
    analyzer::RunOptions a;
    a.eval.ngram_size = 2;
    a.eval.overlap_mode = OverlapMode::Set;
    a.analysis.boilerplate_top_tokens = 7;
    a.analysis.deficit_threshold = 0.25;

    analyzer::RunOptions b;
    REQUIRE(analyzer::apply_options_json(analyzer::options_to_json(a), b));
    CHECK(b.eval.ngram_size == 2);
    CHECK(b.eval.overlap_mode == OverlapMode::Set);
    CHECK(b.analysis.boilerplate_top_tokens == 7);
    CHECK(b.analysis.deficit_threshold == 0.25);
    CHECK(analyzer::options_to_json(b) == analyzer::options_to_json(a));
}
