#include "tokenizer.hpp"

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace shingle_eval {

bool is_word_char(char32_t c)
{
    const auto cp = static_cast<UChar32>(c);
    if (cp == '_')
        return true;
    return (U_GET_GC_MASK(cp) & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
}

size_t char_count(const std::string& text)
{
    return static_cast<size_t>(icu::UnicodeString::fromUTF8(text).countChar32());
}

TokenSequence tokenize(const std::string& text, TokenizerMode mode)
{
    TokenSequence tokens;
    if (text.empty())
        return tokens;

    // Invalid UTF-8 decodes to U+FFFD
    icu::UnicodeString us = icu::UnicodeString::fromUTF8(text);
    us.toLower(icu::Locale::getRoot());

    int32_t start = -1;
    auto flush = [&](int32_t end) {
        if (start < 0)
            return;
        std::string token;
        us.tempSubStringBetween(start, end).toUTF8String(token);
        tokens.push_back(std::move(token));
        start = -1;
    };

    const int32_t length = us.length();
    for (int32_t i = 0; i < length;) {
        const UChar32 c = us.char32At(i);
        const int32_t next = us.moveIndex32(i, 1);
        const bool keep = mode == TokenizerMode::Word
            ? is_word_char(static_cast<char32_t>(c))
            : !u_isspace(c);
        if (keep) {
            if (start < 0)
                start = i;
        } else {
            flush(i);
        }
        i = next;
    }
    flush(length);
    return tokens;
}

std::set<Token> token_set(const TokenSequence& tokens)
{
    return std::set<Token>(tokens.begin(), tokens.end());
}

} // namespace shingle_eval
