// File: src/learning/text_processing.cpp
#include "learning/text_processing.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace engram {
namespace text {

std::vector<std::string> SplitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::string current;

    for (char c : text) {
        if (c == '.' || c == '!' || c == '?') {
            sentences.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    sentences.push_back(current);

    return sentences;
}

std::vector<std::string> SplitWhitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string ToLower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string NormalizeWord(const std::string& word) {
    auto is_letter = [](unsigned char c) { return std::isalpha(c) != 0; };

    size_t begin = 0;
    while (begin < word.size() && !is_letter(static_cast<unsigned char>(word[begin]))) {
        ++begin;
    }
    size_t end = word.size();
    while (end > begin && !is_letter(static_cast<unsigned char>(word[end - 1]))) {
        --end;
    }

    return ToLower(word.substr(begin, end - begin));
}

std::string Trim(const std::string& s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    size_t begin = 0;
    while (begin < s.size() && is_space(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && is_space(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

std::string Join(const std::vector<std::string>& tokens, size_t begin, size_t end) {
    std::string result;
    end = std::min(end, tokens.size());
    for (size_t i = begin; i < end; ++i) {
        if (i > begin) {
            result.push_back(' ');
        }
        result += tokens[i];
    }
    return result;
}

std::string Join(const std::vector<std::string>& tokens) {
    return Join(tokens, 0, tokens.size());
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace text
} // namespace engram
