/**
 * @file text.cpp
 * @brief Lexical helpers
 */

#include <utils/text.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace Russell::text {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string normalize_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

std::vector<std::string> split_words(std::string_view s) {
    std::vector<std::string> words;
    std::istringstream iss{std::string(s)};
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::string strip_punctuation(std::string_view word) {
    size_t begin = 0;
    size_t end = word.size();
    while (begin < end && std::ispunct(static_cast<unsigned char>(word[begin]))) ++begin;
    while (end > begin && std::ispunct(static_cast<unsigned char>(word[end - 1]))) --end;
    return std::string(word.substr(begin, end - begin));
}

bool contains_any(std::string_view haystack, const std::vector<std::string>& markers) {
    std::string lower = to_lower(haystack);
    for (const auto& marker : markers) {
        if (lower.find(marker) != std::string::npos) return true;
    }
    return false;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out.append(sep);
        out.append(parts[i]);
    }
    return out;
}

std::string fixed(double value, int precision) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return buf;
}

} // namespace Russell::text
