#include "shingles.hpp"

#include <algorithm>

namespace shingle_eval {

namespace {
    // Calls fn(begin, end) for every window of the sequence.
    template <typename Fn>
    void for_each_window(const TokenSequence& tokens, size_t n, Fn&& fn)
    {
        if (tokens.empty())
            return;
        n = std::max<size_t>(n, 1);
        if (tokens.size() < n) {
            fn(tokens.begin(), tokens.end());
            return;
        }
        for (size_t i = 0; i + n <= tokens.size(); ++i) {
            fn(tokens.begin() + i, tokens.begin() + i + n);
        }
    }
} // namespace

ShingleSet make_shingle_set(const TokenSequence& tokens, size_t n)
{
    ShingleSet out;
    for_each_window(tokens, n, [&](auto first, auto last) {
        out.emplace(first, last);
    });
    return out;
}

ShingleCounts make_shingle_counts(const TokenSequence& tokens, size_t n)
{
    ShingleCounts out;
    for_each_window(tokens, n, [&](auto first, auto last) {
        ++out[Shingle(first, last)];
    });
    return out;
}

size_t total_shingles(const ShingleCounts& shingles)
{
    size_t total = 0;
    for (const auto& [shingle, count] : shingles) {
        total += count;
    }
    return total;
}

} // namespace shingle_eval
