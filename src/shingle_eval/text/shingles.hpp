#pragma once

#include <shingle_eval/text/tokenizer.hpp>

#include <cstddef>
#include <map>
#include <set>
#include <vector>

namespace shingle_eval {

/// Ordered tuple of consecutive tokens; the unit of comparison.
using Shingle = std::vector<Token>;
/// Presence-only shingle collection.
using ShingleSet = std::set<Shingle>;
/// Frequency-aware shingle collection (shingle -> occurrence count).
using ShingleCounts = std::map<Shingle, size_t>;

/// Shingle size used when none is configured.
constexpr size_t DEFAULT_NGRAM_SIZE = 4;

enum class OverlapMode {
    /// Repeated shingles are matched as many times as they occur on both sides.
    Multiset,
    /// A repeated shingle counts once.
    Set,
};

/// @brief Distinct n-gram shingles of a token sequence.
///
/// A sequence shorter than n yields one truncated shingle holding all its
/// tokens, or nothing if it is empty. n = 0 is treated as 1.
ShingleSet make_shingle_set(const TokenSequence& tokens, size_t n);

/// @brief Occurrence count of every n-gram shingle of a token sequence.
///
/// For a sequence of length L >= n the counts sum to L - n + 1. Short
/// sequences follow the same rule as make_shingle_set.
ShingleCounts make_shingle_counts(const TokenSequence& tokens, size_t n);

/// Sum of all counts.
size_t total_shingles(const ShingleCounts& shingles);

} // namespace shingle_eval
