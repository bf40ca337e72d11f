#pragma once

#include <string>
#include <vector>

constexpr char kWordDelimiter = ' ';

// Splits text on single spaces, consecutive spaces never produce empty words.
std::vector<std::string> SplitIntoWords(const std::string& text);

// Text is UTF-8. Whitespace is any code point with the Unicode White_Space property.
bool IsBlank(const std::string& text);

std::string ToLower(const std::string& text);

// "kOtlin" -> "Kotlin", "éCOLE" -> "École"
std::string CapitalizeFirst(const std::string& word);
