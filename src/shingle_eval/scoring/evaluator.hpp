#pragma once

#include <shingle_eval/scoring/overlap.hpp>
#include <shingle_eval/text/shingles.hpp>
#include <shingle_eval/text/tokenizer.hpp>

#include <map>
#include <string>
#include <vector>

namespace shingle_eval {

using DocumentId = std::string;
/// Document id -> body text, iterated in lexicographic id order.
using DocumentCollection = std::map<DocumentId, std::string>;

/// One extractor's output over a document set.
struct PredictionSource {
    std::string name;
    DocumentCollection documents;
};

/// Ground truth plus the competing prediction sources, in source order.
struct Corpus {
    DocumentCollection truth;
    std::vector<PredictionSource> sources;
};

struct EvalConfig {
    /// Tokens per shingle (0 is treated as 1)
    size_t ngram_size = DEFAULT_NGRAM_SIZE;
    OverlapMode overlap_mode = OverlapMode::Multiset;
    TokenizerMode tokenizer_mode = TokenizerMode::Word;
};

/// Score of one source on one document.
struct ComparisonRecord {
    DocumentId document_id;
    std::string source;
    OverlapScore score;
    /// Token counts, not shingle counts
    size_t truth_length = 0;
    size_t prediction_length = 0;
};

struct DocumentResult {
    DocumentId document_id;
    size_t truth_length = 0;
    /// One record per source, same order as Corpus::sources
    std::vector<ComparisonRecord> records;
};

using ResultSet = std::vector<DocumentResult>;

/// @brief Text of a document, or an empty string if the collection lacks it.
const std::string&
lookup_text(const DocumentCollection& collection, const DocumentId& id);

/// @brief Score every prediction source against one ground-truth text.
///
/// The truth is tokenized and shingled once and reused for every source.
/// A source without an entry for doc_id is scored as an empty prediction.
///
/// @param doc_id Document identifier.
/// @param truth_text Ground-truth body text.
/// @param sources Prediction sources, looked up by doc_id.
/// @param config Tokenizer, shingle size and overlap mode.
/// @return One record per source, in source order.
DocumentResult evaluate_document(
    const DocumentId& doc_id,
    const std::string& truth_text,
    const std::vector<PredictionSource>& sources,
    const EvalConfig& config);

/// @brief Evaluate every ground-truth document of a corpus.
///
/// Ids present only in prediction sources are ignored. Documents are scored
/// in parallel; the result is in lexicographic id order regardless of
/// scheduling.
ResultSet evaluate_corpus(const Corpus& corpus, const EvalConfig& config);

} // namespace shingle_eval
