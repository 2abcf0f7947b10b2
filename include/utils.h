#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace luna_voice {

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
 * @brief Lowercase copy of a string
 */
inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief True if `haystack` contains any of `needles` (case-sensitive)
 */
inline bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (!needle.empty() && haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Check if transcript text carries no words
 *
 * Empty or whitespace-only text is blank, and so is text made only of
 * bracketed annotations such as "[BLANK_AUDIO]" or "(silence)" that
 * speech recognizers emit for non-speech audio.
 */
inline bool is_blank_transcript(const std::string& text) {
    std::string t = trim_copy(text);
    if (t.empty()) return true;

    std::string outside;
    int depth = 0;
    for (char c : t) {
        if (c == '[' || c == '(') {
            depth++;
        } else if ((c == ']' || c == ')') && depth > 0) {
            depth--;
        } else if (depth == 0) {
            outside += c;
        }
    }
    for (char c : outside) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Read an environment variable, empty when unset or name is empty
 */
inline std::string env_or_empty(const std::string& name) {
    if (name.empty()) return "";
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace utils

} // namespace luna_voice
