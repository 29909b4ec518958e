// File: src/learning/text_processing.hpp
#pragma once

#include <string>
#include <vector>

namespace engram {
namespace text {

/// Split on '.', '!' and '?'. Fragments are returned untrimmed, empty ones
/// included, so callers see exactly what the delimiters produced.
std::vector<std::string> SplitSentences(const std::string& text);

/// Split on runs of whitespace
std::vector<std::string> SplitWhitespace(const std::string& text);

/// ASCII lower-case copy
std::string ToLower(const std::string& s);

/// Lower-case and strip leading/trailing non-letters ("World!" -> "world")
std::string NormalizeWord(const std::string& word);

/// Strip leading/trailing whitespace
std::string Trim(const std::string& s);

/// Join tokens [begin, end) with single spaces
std::string Join(const std::vector<std::string>& tokens, size_t begin, size_t end);

/// Join all tokens with single spaces
std::string Join(const std::vector<std::string>& tokens);

/// True if needle occurs in haystack
bool Contains(const std::string& haystack, const std::string& needle);

} // namespace text
} // namespace engram
