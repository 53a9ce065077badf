#include "overlap.hpp"

#include <algorithm>
#include <iterator>

namespace shingle_eval {

namespace {
    double ratio(size_t num, size_t den)
    {
        return den > 0 ? static_cast<double>(num) / static_cast<double>(den)
                       : 0.0;
    }

    void finish_score(bool truth_empty, bool prediction_empty, OverlapScore& s)
    {
        if (prediction_empty) {
            s.precision = s.recall = s.f1 = 0.0;
            return;
        }
        if (truth_empty) {
            s.precision = 0.0;
            s.recall = 1.0;
            s.f1 = 0.0;
            return;
        }
        s.precision = ratio(s.true_positives, s.true_positives + s.false_positives);
        s.recall = ratio(s.true_positives, s.true_positives + s.false_negatives);
        s.f1 = f1_score(s.precision, s.recall);
    }
} // namespace

double f1_score(double precision, double recall)
{
    if (precision + recall <= 0.0)
        return 0.0;
    return 2.0 * precision * recall / (precision + recall);
}

OverlapScore
score_overlap(const ShingleCounts& truth, const ShingleCounts& prediction)
{
    OverlapScore s;

    // Both maps are ordered: walk them side by side over the union of keys.
    auto t = truth.begin();
    auto p = prediction.begin();
    while (t != truth.end() || p != prediction.end()) {
        size_t t_count = 0, p_count = 0;
        if (p == prediction.end() || (t != truth.end() && t->first < p->first)) {
            t_count = t->second;
            ++t;
        } else if (t == truth.end() || p->first < t->first) {
            p_count = p->second;
            ++p;
        } else {
            t_count = t->second;
            p_count = p->second;
            ++t;
            ++p;
        }
        s.true_positives += std::min(t_count, p_count);
        if (p_count > t_count)
            s.false_positives += p_count - t_count;
        else
            s.false_negatives += t_count - p_count;
    }

    finish_score(truth.empty(), prediction.empty(), s);
    return s;
}

OverlapScore
score_overlap(const ShingleSet& truth, const ShingleSet& prediction)
{
    OverlapScore s;

    std::vector<Shingle> inter;
    inter.reserve(std::min(truth.size(), prediction.size()));
    std::set_intersection(
        truth.begin(), truth.end(), prediction.begin(), prediction.end(),
        std::back_inserter(inter));
    s.true_positives = inter.size();
    s.false_positives = prediction.size() - inter.size();
    s.false_negatives = truth.size() - inter.size();

    finish_score(truth.empty(), prediction.empty(), s);
    return s;
}

} // namespace shingle_eval
