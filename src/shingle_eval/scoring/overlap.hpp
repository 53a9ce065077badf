#pragma once

#include <shingle_eval/text/shingles.hpp>

#include <cstddef>

namespace shingle_eval {

struct OverlapScore {
    /// Shingles matched on both sides
    size_t true_positives = 0;
    /// Predicted shingles absent from the truth
    size_t false_positives = 0;
    /// Truth shingles the prediction missed
    size_t false_negatives = 0;

    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
};

/// @brief Harmonic mean of precision and recall, 0 when both are 0.
double f1_score(double precision, double recall);

/// @brief Count-aware overlap between truth and prediction.
///
/// For every shingle in either collection, tp += min(t, p),
/// fp += max(0, p - t) and fn += max(0, t - p).
///
/// An empty prediction scores precision = recall = f1 = 0 whatever the truth.
/// An empty truth against a non-empty prediction scores precision = 0,
/// recall = 1 and f1 = 0. The counts are filled in in both cases.
OverlapScore
score_overlap(const ShingleCounts& truth, const ShingleCounts& prediction);

/// @brief Presence-only overlap: tp = |T ∩ P|, fp = |P - T|, fn = |T - P|.
///
/// Same degenerate-input policy as the multiset overload.
OverlapScore
score_overlap(const ShingleSet& truth, const ShingleSet& prediction);

} // namespace shingle_eval
