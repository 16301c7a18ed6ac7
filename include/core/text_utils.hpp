#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tfa {

// ============================================================================
// UTF-8 helpers
// ============================================================================
//
// Comments arrive as UTF-8 and mix Latin (French, transliterated Darija) and
// Arabic script. These helpers work on code points so that lower-casing,
// truncation and tokenization never split a multi-byte sequence.

/**
 * @brief Decode UTF-8 into code points (invalid bytes become U+FFFD)
 */
std::vector<char32_t> decode_utf8(const std::string& text);

/**
 * @brief Encode code points back to UTF-8
 */
std::string encode_utf8(const std::vector<char32_t>& code_points);

/**
 * @brief Append a single code point to a UTF-8 string
 */
void append_utf8(std::string& out, char32_t cp);

/**
 * @brief Lower-case ASCII and Latin-1/Latin Extended-A letters
 *
 * Arabic script has no case and is returned unchanged.
 */
std::string to_lower_utf8(const std::string& text);

/**
 * @brief Keep at most max_code_points code points
 */
std::string truncate_utf8(const std::string& text, size_t max_code_points);

/**
 * @brief Number of code points
 */
size_t utf8_length(const std::string& text);

bool is_blank(const std::string& text);
std::string trim(const std::string& text);
std::vector<std::string> split_whitespace(const std::string& text);

/**
 * @brief Arabic block U+0600..U+06FF
 */
bool is_arabic_code_point(char32_t cp);

/**
 * @brief Letter in the Latin, Greek, Cyrillic or Arabic scripts
 */
bool is_alpha_code_point(char32_t cp);

/**
 * @brief Letter, digit, combining mark or underscore
 */
bool is_word_code_point(char32_t cp);

/**
 * @brief Split into runs of word code points
 */
std::vector<std::string> word_tokens(const std::string& text);

} // namespace tfa
