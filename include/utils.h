#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <vector>

namespace cabin_voice {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

/**
 * @brief Trim whitespace from both ends of a string (returns copy)
 */
inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Normalize string to lowercase (returns copy)
 */
inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Whole-word (or whole-phrase) match in already-normalized text
 *
 * "heat" matches "turn the heat up" but not "heated seats".
 */
inline bool contains_word(const std::string& normalized, const std::string& phrase) {
    if (phrase.empty()) return false;
    size_t pos = normalized.find(phrase);
    while (pos != std::string::npos) {
        bool start_ok = (pos == 0 || !std::isalnum(static_cast<unsigned char>(normalized[pos - 1])));
        size_t end_pos = pos + phrase.length();
        bool end_ok = (end_pos >= normalized.length() ||
                       !std::isalnum(static_cast<unsigned char>(normalized[end_pos])));
        if (start_ok && end_ok) {
            return true;
        }
        pos = normalized.find(phrase, pos + 1);
    }
    return false;
}

/**
 * @brief True if any of the phrases occurs as a whole word
 */
inline bool contains_any(const std::string& normalized, const std::vector<std::string>& phrases) {
    for (const auto& phrase : phrases) {
        if (contains_word(normalized, phrase)) return true;
    }
    return false;
}

/**
 * @brief Numbers in text, as digits ("21.5") or spoken words ("twenty")
 */
inline std::vector<double> extract_numbers(const std::string& text) {
    static const std::map<std::string, double> SPOKEN_NUMBERS = {
        {"zero", 0}, {"one", 1}, {"two", 2}, {"three", 3}, {"four", 4}, {"five", 5},
        {"six", 6}, {"seven", 7}, {"eight", 8}, {"nine", 9}, {"ten", 10},
        {"eleven", 11}, {"twelve", 12}, {"fifteen", 15}, {"sixteen", 16},
        {"seventeen", 17}, {"eighteen", 18}, {"nineteen", 19}, {"twenty", 20},
        {"thirty", 30}, {"forty", 40}, {"fifty", 50}, {"hundred", 100}
    };

    std::vector<double> numbers;
    std::string lower = normalize_copy(text);

    // Tokenize by spaces and non-alphanumeric chars
    std::vector<std::string> tokens;
    std::string current_token;
    for (char c : lower) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-') {
            current_token += c;
        } else if (!current_token.empty()) {
            tokens.push_back(current_token);
            current_token.clear();
        }
    }
    if (!current_token.empty()) {
        tokens.push_back(current_token);
    }

    for (auto token : tokens) {
        // Sentence-final period
        while (!token.empty() && token.back() == '.') token.pop_back();
        if (token.empty()) continue;

        // Try as numeric literal first
        char* end = nullptr;
        double val = std::strtod(token.c_str(), &end);
        if (end != token.c_str() && *end == '\0') {
            numbers.push_back(val);
            continue;
        }

        // Try as spoken number word
        auto it = SPOKEN_NUMBERS.find(token);
        if (it != SPOKEN_NUMBERS.end()) {
            numbers.push_back(it->second);
        }
    }

    return numbers;
}

/**
 * @brief Text following the first occurrence of any marker word, trimmed
 * @return Empty if no marker occurs
 */
inline std::string text_after(const std::string& normalized, const std::vector<std::string>& markers) {
    for (const auto& marker : markers) {
        size_t pos = normalized.find(marker + " ");
        if (pos != std::string::npos && (pos == 0 || normalized[pos - 1] == ' ')) {
            std::string rest = normalized.substr(pos + marker.size() + 1);
            while (!rest.empty() && std::ispunct(static_cast<unsigned char>(rest.back()))) rest.pop_back();
            return trim_copy(rest);
        }
    }
    return "";
}

} // namespace utils

} // namespace cabin_voice
