#pragma once

#include <set>
#include <string>
#include <vector>

namespace shingle_eval {

using Token = std::string;
using TokenSequence = std::vector<Token>;

enum class TokenizerMode {
    /// Maximal runs of word characters; punctuation is dropped.
    Word,
    /// Whitespace-separated fields, punctuation kept attached.
    Whitespace,
};

/// @brief Split UTF-8 text into lower-case tokens.
///
/// The whole text is lower-cased with full Unicode case mapping before it is
/// split. In Word mode a word character is a letter or number of any script,
/// or '_'; everything else (spaces, punctuation, symbols, invalid bytes)
/// separates tokens. Whitespace mode splits on Unicode white space, including
/// no-break spaces. Empty input yields an empty sequence.
///
/// @param text Input text (possibly empty).
/// @param mode Tokenization strategy, must be the same for truth and predictions.
/// @return Ordered token sequence.
TokenSequence tokenize(const std::string& text, TokenizerMode mode);

/// @brief Distinct tokens of a sequence.
std::set<Token> token_set(const TokenSequence& tokens);

/// Letter (L*), number (N*) or '_'.
bool is_word_char(char32_t c);

/// Number of code points in a UTF-8 string.
size_t char_count(const std::string& text);

} // namespace shingle_eval
