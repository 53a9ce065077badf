#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <shingle_eval/scoring/evaluator.hpp>
#include <shingle_eval/utils/logger.hpp>

#include <spdlog/sinks/null_sink.h>

#include <memory>

#include <string>
#include <vector>

using namespace shingle_eval;
using Catch::Approx;

static PredictionSource make_source(const std::string& name, DocumentCollection docs)
{
    PredictionSource s;
    s.name = name;
    s.documents = std::move(docs);
    return s;
}

TEST_CASE("Document evaluation reuses truth across sources", "[evaluator]")
{
    const std::vector<PredictionSource> sources = {
        make_source("same", { { "doc", "The cat sat on the mat" } }),
        make_source("missing", { { "other", "the cat sat on the mat" } }),
    };
    const auto r = evaluate_document("doc", "the cat sat on the mat", sources, EvalConfig {});

    CHECK(r.document_id == "doc");
    CHECK(r.truth_length == 6);
    REQUIRE(r.records.size() == 2);

    CHECK(r.records[0].source == "same");
    CHECK(r.records[0].document_id == "doc");
    CHECK(r.records[0].score.true_positives == 3);
    CHECK(r.records[0].score.f1 == 1.0);
    CHECK(r.records[0].truth_length == 6);
    CHECK(r.records[0].prediction_length == 6);

    // a missing entry is empty text, not an error
    CHECK(r.records[1].source == "missing");
    CHECK(r.records[1].prediction_length == 0);
    CHECK(r.records[1].score.precision == 0.0);
    CHECK(r.records[1].score.recall == 0.0);
    CHECK(r.records[1].score.f1 == 0.0);
}

TEST_CASE("Worked examples", "[evaluator]")
{
    const EvalConfig cfg;
    {
        const auto r = evaluate_document(
            "a", "a b c d e", { make_source("s", { { "a", "" } }) }, cfg);
        CHECK(r.records[0].score.precision == 0.0);
        CHECK(r.records[0].score.recall == 0.0);
        CHECK(r.records[0].score.f1 == 0.0);
        CHECK(r.records[0].prediction_length == 0);
        CHECK(r.records[0].truth_length == 5);
    }
    {
        const auto r = evaluate_document(
            "b", "", { make_source("s", { { "b", "x y z w" } }) }, cfg);
        CHECK(r.records[0].score.precision == 0.0);
        CHECK(r.records[0].score.recall == 1.0);
        CHECK(r.records[0].score.f1 == 0.0);
        CHECK(r.records[0].truth_length == 0);
        CHECK(r.records[0].prediction_length == 4);
    }
}

TEST_CASE("Overlap mode and shingle size come from the config", "[evaluator]")
{
    const std::vector<PredictionSource> sources = {
        make_source("s", { { "d", "a b a b" } }),
    };

    EvalConfig cfg;
    cfg.ngram_size = 2;
    cfg.overlap_mode = OverlapMode::Multiset;
    const auto m = evaluate_document("d", "a b a b a b", sources, cfg);
    CHECK(m.records[0].score.recall == Approx(0.6));

    cfg.overlap_mode = OverlapMode::Set;
    const auto s = evaluate_document("d", "a b a b a b", sources, cfg);
    CHECK(s.records[0].score.recall == Approx(1.0));

    cfg.ngram_size = 1;
    cfg.overlap_mode = OverlapMode::Multiset;
    const auto u = evaluate_document("d", "a b a b a b", sources, cfg);
    CHECK(u.records[0].score.true_positives == 4);
    CHECK(u.records[0].score.false_negatives == 2);
}

TEST_CASE("Tokenizer mode applies to truth and predictions", "[evaluator]")
{
    const std::vector<PredictionSource> sources = {
        make_source("s", { { "d", "Hello, world. Good day!" } }),
    };
    EvalConfig cfg;
    cfg.ngram_size = 2;

    cfg.tokenizer_mode = TokenizerMode::Word;
    CHECK(evaluate_document("d", "hello world good day", sources, cfg).records[0].score.f1 == 1.0);

    cfg.tokenizer_mode = TokenizerMode::Whitespace;
    CHECK(evaluate_document("d", "hello world good day", sources, cfg).records[0].score.f1 < 1.0);
}

TEST_CASE("Ground truth defines the document universe", "[evaluator]")
{
    Corpus corpus;
    corpus.truth = { { "b", "one two three four" }, { "a", "five six seven eight" } };
    corpus.sources.push_back(make_source(
        "cand", { { "a", "five six seven eight" }, { "zzz", "only in predictions" } }));
    corpus.sources.push_back(make_source("ref", {}));

    const auto results = evaluate_corpus(corpus, EvalConfig {});
    REQUIRE(results.size() == 2);
    CHECK(results[0].document_id == "a");
    CHECK(results[1].document_id == "b");
    for (const auto& doc : results) {
        REQUIRE(doc.records.size() == 2);
        CHECK(doc.records[0].source == "cand");
        CHECK(doc.records[1].source == "ref");
        CHECK(doc.records[1].score.f1 == 0.0);
    }
    CHECK(results[0].records[0].score.f1 == 1.0);
    CHECK(results[1].records[0].prediction_length == 0);
}

TEST_CASE("Parallel corpus evaluation matches sequential evaluation", "[evaluator]")
{
    Corpus corpus;
    PredictionSource cand, ref;
    cand.name = "cand";
    ref.name = "ref";
    for (int i = 0; i < 300; ++i) {
        const std::string id = "doc" + std::to_string(i);
        std::string truth;
        for (int w = 0; w < 20 + i % 7; ++w) {
            truth += "w" + std::to_string((i * 31 + w * 7) % 50) + " ";
        }
        corpus.truth[id] = truth;
        if (i % 5 != 0)
            cand.documents[id] = "nav menu " + truth;
        if (i % 3 != 0)
            ref.documents[id] = truth.substr(0, truth.size() / 2);
    }
    corpus.sources = { cand, ref };

    const EvalConfig cfg;
    const auto a = evaluate_corpus(corpus, cfg);
    const auto b = evaluate_corpus(corpus, cfg);
    REQUIRE(a.size() == corpus.truth.size());
    REQUIRE(b.size() == a.size());

    size_t i = 0;
    for (const auto& [id, text] : corpus.truth) {
        const auto seq = evaluate_document(id, text, corpus.sources, cfg);
        CHECK(a[i].document_id == id);
        CHECK(b[i].document_id == id);
        for (size_t s = 0; s < seq.records.size(); ++s) {
            CHECK(a[i].records[s].score.f1 == seq.records[s].score.f1);
            CHECK(b[i].records[s].score.true_positives == seq.records[s].score.true_positives);
        }
        ++i;
    }
}

TEST_CASE("Lookup of a missing id is the empty text", "[evaluator]")
{
    const DocumentCollection c = { { "a", "text" } };
    CHECK(lookup_text(c, "a") == "text");
    CHECK(lookup_text(c, "b").empty());
}

TEST_CASE("Library logger can be replaced", "[evaluator][logger]")
{
    auto quiet = std::make_shared<spdlog::logger>(
        "quiet", std::make_shared<spdlog::sinks::null_sink_mt>());
    set_logger(quiet);
    CHECK(&logger() == quiet.get());

    Corpus corpus;
    corpus.truth = { { "a", "one two three four" } };
    corpus.sources.push_back(make_source("s", { { "a", "one two three four" } }));
    CHECK(evaluate_corpus(corpus, EvalConfig {}).size() == 1);

    // back to the default logger
    set_logger(nullptr);
    CHECK(logger().name() == "shingle_eval");
}
