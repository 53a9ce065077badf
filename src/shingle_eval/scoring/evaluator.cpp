#include "evaluator.hpp"

#include <shingle_eval/utils/logger.hpp>
#include <shingle_eval/utils/timer.hpp>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace shingle_eval {

namespace {
    // Score all sources against an already-shingled truth. build() turns a
    // token sequence into the collection type matching the overlap mode.
    template <typename Collection, typename Builder>
    void score_sources(
        const Collection& truth_shingles,
        const DocumentId& doc_id,
        const std::vector<PredictionSource>& sources,
        const EvalConfig& config,
        Builder build,
        DocumentResult& out)
    {
        for (const auto& source : sources) {
            const TokenSequence tokens = tokenize(
                lookup_text(source.documents, doc_id), config.tokenizer_mode);
            ComparisonRecord r;
            r.document_id = doc_id;
            r.source = source.name;
            r.score = score_overlap(truth_shingles, build(tokens));
            r.truth_length = out.truth_length;
            r.prediction_length = tokens.size();
            out.records.push_back(std::move(r));
        }
    }
} // namespace

const std::string&
lookup_text(const DocumentCollection& collection, const DocumentId& id)
{
    static const std::string empty;
    const auto it = collection.find(id);
    return it != collection.end() ? it->second : empty;
}

DocumentResult evaluate_document(
    const DocumentId& doc_id,
    const std::string& truth_text,
    const std::vector<PredictionSource>& sources,
    const EvalConfig& config)
{
    DocumentResult out;
    out.document_id = doc_id;
    out.records.reserve(sources.size());

    const TokenSequence truth_tokens =
        tokenize(truth_text, config.tokenizer_mode);
    out.truth_length = truth_tokens.size();

    const size_t n = config.ngram_size;
    if (config.overlap_mode == OverlapMode::Set) {
        score_sources(
            make_shingle_set(truth_tokens, n), doc_id, sources, config,
            [n](const TokenSequence& t) { return make_shingle_set(t, n); },
            out);
    } else {
        score_sources(
            make_shingle_counts(truth_tokens, n), doc_id, sources, config,
            [n](const TokenSequence& t) { return make_shingle_counts(t, n); },
            out);
    }
    return out;
}

ResultSet evaluate_corpus(const Corpus& corpus, const EvalConfig& config)
{
    std::vector<const DocumentCollection::value_type*> docs;
    docs.reserve(corpus.truth.size());
    for (const auto& entry : corpus.truth) {
        docs.push_back(&entry);
    }

    Timer timer;
    timer.start();

    ResultSet results(docs.size());
    tbb::parallel_for(
        tbb::blocked_range<size_t>(0, docs.size()),
        [&](const tbb::blocked_range<size_t>& range) {
            for (size_t i = range.begin(); i != range.end(); ++i) {
                results[i] = evaluate_document(
                    docs[i]->first, docs[i]->second, corpus.sources, config);
            }
        });

    timer.stop();
    logger().debug(
        "evaluated {} documents x {} sources in {:.3f} ms", results.size(),
        corpus.sources.size(), timer.getElapsedTimeInMilliSec());
    return results;
}

} // namespace shingle_eval
