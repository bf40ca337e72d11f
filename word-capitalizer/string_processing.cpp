#include <cstdint>

#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include "string_processing.h"

using namespace std;

vector<string> SplitIntoWords(const string& text) {
    string word;
    vector<string> words;
    for (const auto ch : text) {
        if (ch == kWordDelimiter) {
            if (!word.empty()) {
                words.push_back(word);
                word.clear();
            }
        } else {
            word += ch;
        }
    }
    if (!word.empty()) {
        words.push_back(word);
    }

    return words;
}

bool IsBlank(const string& text) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());
    int32_t offset = 0;
    while (offset < length) {
        UChar32 code_point;
        U8_NEXT(bytes, offset, length, code_point);
        // malformed sequences come back negative and count as visible text
        if (code_point < 0 || !u_isUWhiteSpace(code_point)) {
            return false;
        }
    }
    return true;
}

string ToLower(const string& text) {
    string lowered;
    icu::UnicodeString::fromUTF8(text).toLower(icu::Locale::getRoot()).toUTF8String(lowered);
    return lowered;
}

string CapitalizeFirst(const string& word) {
    auto capitalized = icu::UnicodeString::fromUTF8(word);
    if (capitalized.isEmpty()) {
        return {};
    }
    capitalized.toLower(icu::Locale::getRoot());

    const auto first_length = U16_LENGTH(capitalized.char32At(0));
    icu::UnicodeString first(capitalized, 0, first_length);
    first.toUpper(icu::Locale::getRoot());
    capitalized.replace(0, first_length, first);

    string result;
    capitalized.toUTF8String(result);
    return result;
}
