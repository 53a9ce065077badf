#include "aggregator.hpp"

#include <shingle_eval/utils/logger.hpp>

#include <unicode/utf8.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>

namespace shingle_eval {

namespace {
    RankedRow make_row(
        const ResultSet& results,
        const RankedDocument& rd,
        size_t candidate,
        size_t reference)
    {
        const DocumentResult& doc = results[rd.index];
        RankedRow row;
        row.document_id = doc.document_id;
        row.candidate = doc.records.at(candidate);
        row.reference = doc.records.at(reference);
        row.gap = rd.gap;
        return row;
    }

    std::vector<RankedRow> make_rows(
        const ResultSet& results,
        const std::vector<RankedDocument>& ranked,
        size_t candidate,
        size_t reference)
    {
        std::vector<RankedRow> rows;
        rows.reserve(ranked.size());
        for (const auto& rd : ranked) {
            rows.push_back(make_row(results, rd, candidate, reference));
        }
        return rows;
    }
} // namespace

double metric_value(const OverlapScore& score, RankMetric metric)
{
    switch (metric) {
    case RankMetric::PrecisionGap:
        return score.precision;
    case RankMetric::RecallGap:
        return score.recall;
    case RankMetric::F1Gap:
    default:
        return score.f1;
    }
}

std::vector<RankedDocument> rank_documents(
    const ResultSet& results,
    RankMetric metric,
    size_t candidate,
    size_t reference)
{
    std::vector<RankedDocument> ranked;
    ranked.reserve(results.size());
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& records = results[i].records;
        const double gap = metric_value(records.at(reference).score, metric)
            - metric_value(records.at(candidate).score, metric);
        ranked.push_back({ i, gap });
    }
    std::stable_sort(
        ranked.begin(), ranked.end(),
        [&](const RankedDocument& a, const RankedDocument& b) {
            if (a.gap != b.gap)
                return a.gap > b.gap;
            return results[a.index].document_id < results[b.index].document_id;
        });
    return ranked;
}

std::vector<RankedDocument>
top_k(const std::vector<RankedDocument>& ranked, size_t k)
{
    const size_t n = std::min(k, ranked.size());
    return std::vector<RankedDocument>(ranked.begin(), ranked.begin() + n);
}

DeficitSummary classify_deficits(
    const ResultSet& results,
    size_t candidate,
    size_t reference,
    const AnalysisConfig& config)
{
    DeficitSummary out;
    const double t = config.deficit_threshold;
    for (const auto& doc : results) {
        const ComparisonRecord& cand = doc.records.at(candidate);
        const ComparisonRecord& ref = doc.records.at(reference);

        if (ref.score.f1 - cand.score.f1 > t)
            out.f1_gap.push_back(doc.document_id);
        if (cand.score.precision < ref.score.precision - t)
            out.precision_deficit.push_back(doc.document_id);
        if (cand.score.recall < ref.score.recall - t)
            out.recall_deficit.push_back(doc.document_id);
        if (cand.prediction_length == 0 && doc.truth_length > 0)
            out.empty_extraction.push_back(doc.document_id);
        if (ref.prediction_length > config.over_extraction_min_length
            && static_cast<double>(cand.prediction_length)
                > config.over_extraction_ratio
                    * static_cast<double>(ref.prediction_length))
            out.over_extraction.push_back(doc.document_id);
    }
    return out;
}

std::vector<TokenCount> count_boilerplate(
    const std::vector<RankedDocument>& ranked,
    const ResultSet& results,
    const Corpus& corpus,
    size_t candidate,
    const EvalConfig& eval_config,
    const AnalysisConfig& config)
{
    const PredictionSource& source = corpus.sources.at(candidate);

    std::map<Token, size_t> counts;
    for (const auto& rd : top_k(ranked, config.boilerplate_documents)) {
        const DocumentId& id = results[rd.index].document_id;
        const auto truth = token_set(
            tokenize(lookup_text(corpus.truth, id), eval_config.tokenizer_mode));
        for (const auto& tok : tokenize(
                 lookup_text(source.documents, id), eval_config.tokenizer_mode)) {
            if (truth.count(tok) == 0)
                ++counts[tok];
        }
    }

    std::vector<TokenCount> out;
    out.reserve(counts.size());
    for (const auto& [tok, n] : counts) {
        out.push_back({ tok, n });
    }
    // counts is keyed by token, so a stable sort keeps ties alphabetical
    std::stable_sort(
        out.begin(), out.end(),
        [](const TokenCount& a, const TokenCount& b) {
            return a.count > b.count;
        });
    if (out.size() > config.boilerplate_top_tokens)
        out.resize(config.boilerplate_top_tokens);
    out.erase(
        std::remove_if(
            out.begin(), out.end(),
            [&](const TokenCount& tc) {
                return char_count(tc.token) < config.boilerplate_min_token_length;
            }),
        out.end());
    return out;
}

std::string excerpt(const std::string& text, size_t max_chars)
{
    constexpr size_t limit = std::numeric_limits<int32_t>::max();
    const auto* s = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(std::min(text.size(), limit));
    const auto n = static_cast<int32_t>(std::min(max_chars, limit));
    int32_t end = 0;
    U8_FWD_N(s, end, length, n);
    return text.substr(0, static_cast<size_t>(end));
}

AnalysisReport summarize(
    const ResultSet& results,
    const Corpus& corpus,
    size_t candidate,
    size_t reference,
    const EvalConfig& eval_config,
    const AnalysisConfig& config)
{
    AnalysisReport report;
    report.candidate = corpus.sources.at(candidate).name;
    report.reference = corpus.sources.at(reference).name;
    report.document_count = results.size();

    const auto by_f1 =
        rank_documents(results, RankMetric::F1Gap, candidate, reference);
    const auto by_precision =
        rank_documents(results, RankMetric::PrecisionGap, candidate, reference);

    report.f1_ranking = make_rows(
        results, top_k(by_f1, config.f1_table_size), candidate, reference);
    report.precision_ranking = make_rows(
        results, top_k(by_precision, config.precision_table_size), candidate,
        reference);
    report.deficits = classify_deficits(results, candidate, reference, config);
    report.boilerplate = count_boilerplate(
        by_precision, results, corpus, candidate, eval_config, config);

    if (!by_precision.empty()) {
        WorstDocumentSample w;
        w.row = make_row(results, by_precision.front(), candidate, reference);
        w.candidate_excerpt = excerpt(
            lookup_text(corpus.sources[candidate].documents, w.row.document_id),
            config.excerpt_chars);
        w.reference_excerpt = excerpt(
            lookup_text(corpus.sources[reference].documents, w.row.document_id),
            config.excerpt_chars);
        report.worst = std::move(w);
    }

    logger().info(
        "{} vs {}: {} documents, {} with F1 gap > {}", report.candidate,
        report.reference, report.document_count, report.deficits.f1_gap.size(),
        config.deficit_threshold);
    return report;
}

} // namespace shingle_eval
