#pragma once

#include <shingle_eval/scoring/evaluator.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace shingle_eval {

/// Tunables of the comparative analysis. Defaults reproduce the historical
/// benchmark scripts.
struct AnalysisConfig {
    /// Absolute metric gap beyond which a document counts as a deficit
    double deficit_threshold = 0.1;
    /// Candidate/reference length ratio beyond which a document is over-extracted
    double over_extraction_ratio = 2.0;
    /// Reference length (tokens) required before the ratio is considered
    size_t over_extraction_min_length = 100;

    size_t f1_table_size = 30;
    size_t precision_table_size = 10;

    /// Worst documents (by precision gap) scanned for boilerplate
    size_t boilerplate_documents = 20;
    size_t boilerplate_top_tokens = 30;
    size_t boilerplate_min_token_length = 3;

    size_t empty_listing_size = 10;
    /// Characters (code points) of each output shown for the worst document
    size_t excerpt_chars = 800;
};

enum class RankMetric { F1Gap, PrecisionGap, RecallGap };

/// Position in a ResultSet plus its gap (reference - candidate).
struct RankedDocument {
    size_t index = 0;
    double gap = 0.0;
};

struct DeficitSummary {
    std::vector<DocumentId> f1_gap;
    std::vector<DocumentId> precision_deficit;
    std::vector<DocumentId> recall_deficit;
    std::vector<DocumentId> empty_extraction;
    std::vector<DocumentId> over_extraction;
};

struct TokenCount {
    Token token;
    size_t count = 0;
};

/// One row of a ranked table.
struct RankedRow {
    DocumentId document_id;
    ComparisonRecord candidate;
    ComparisonRecord reference;
    double gap = 0.0;
};

struct WorstDocumentSample {
    RankedRow row;
    std::string candidate_excerpt;
    std::string reference_excerpt;
};

struct AnalysisReport {
    std::string candidate;
    std::string reference;
    size_t document_count = 0;
    std::vector<RankedRow> f1_ranking;
    std::vector<RankedRow> precision_ranking;
    DeficitSummary deficits;
    std::vector<TokenCount> boilerplate;
    std::optional<WorstDocumentSample> worst;
};

/// @brief Value of the metric a ranking is based on.
double metric_value(const OverlapScore& score, RankMetric metric);

/// @brief Rank documents by how far the candidate trails the reference.
///
/// Gap = reference metric - candidate metric. Order is gap descending, ties
/// broken by document id ascending, so the ranking is a total order that only
/// changes when the records change.
///
/// @param results Evaluated documents.
/// @param metric Metric the gap is computed on.
/// @param candidate Source index of the extractor under scrutiny.
/// @param reference Source index it is compared against.
/// @throws std::out_of_range if a source index is not present in the records.
std::vector<RankedDocument> rank_documents(
    const ResultSet& results,
    RankMetric metric,
    size_t candidate,
    size_t reference);

/// First k entries (or all of them if fewer).
std::vector<RankedDocument>
top_k(const std::vector<RankedDocument>& ranked, size_t k);

/// @brief Sort documents into deficit categories.
///
/// Lists keep ResultSet order.
DeficitSummary classify_deficits(
    const ResultSet& results,
    size_t candidate,
    size_t reference,
    const AnalysisConfig& config);

/// @brief Tokens the candidate emits that the ground truth never contains.
///
/// Scans the first config.boilerplate_documents ranked documents. Each
/// candidate token (with repetition) missing from the truth token set is
/// counted. The config.boilerplate_top_tokens most frequent tokens are kept,
/// then tokens shorter than config.boilerplate_min_token_length code points
/// are dropped.
/// Order is count descending, token ascending.
std::vector<TokenCount> count_boilerplate(
    const std::vector<RankedDocument>& ranked,
    const ResultSet& results,
    const Corpus& corpus,
    size_t candidate,
    const EvalConfig& eval_config,
    const AnalysisConfig& config);

/// @brief The first max_chars code points of UTF-8 text.
std::string excerpt(const std::string& text, size_t max_chars);

/// @brief Full comparative analysis of candidate vs. reference.
AnalysisReport summarize(
    const ResultSet& results,
    const Corpus& corpus,
    size_t candidate,
    size_t reference,
    const EvalConfig& eval_config,
    const AnalysisConfig& config);

} // namespace shingle_eval
