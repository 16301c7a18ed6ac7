#include "core/text_utils.hpp"
#include <cctype>
#include <sstream>

namespace tfa {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

char32_t lower_code_point(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') {
        return cp + 32;
    }
    // Latin-1 supplement: À..Þ except the multiplication sign
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) {
        return cp + 32;
    }
    if (cp == 0x0178) {  // Ÿ
        return 0x00FF;
    }
    // Latin Extended-A pairs (upper even, lower odd) in the ranges that
    // follow that convention
    if ((cp >= 0x0100 && cp <= 0x0137) || (cp >= 0x014A && cp <= 0x0177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    return cp;
}

}  // namespace

std::vector<char32_t> decode_utf8(const std::string& text) {
    std::vector<char32_t> out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t extra = 0;

        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            if (i + k >= text.size()) {
                valid = false;
                break;
            }
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (!valid) {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += extra + 1;
    }

    return out;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string encode_utf8(const std::vector<char32_t>& code_points) {
    std::string out;
    out.reserve(code_points.size());
    for (char32_t cp : code_points) {
        append_utf8(out, cp);
    }
    return out;
}

std::string to_lower_utf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : decode_utf8(text)) {
        append_utf8(out, lower_code_point(cp));
    }
    return out;
}

std::string truncate_utf8(const std::string& text, size_t max_code_points) {
    auto cps = decode_utf8(text);
    if (cps.size() <= max_code_points) {
        return text;
    }
    cps.resize(max_code_points);
    return encode_utf8(cps);
}

size_t utf8_length(const std::string& text) {
    return decode_utf8(text).size();
}

bool is_blank(const std::string& text) {
    for (unsigned char c : text) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\n\r\f\v");
    return text.substr(first, last - first + 1);
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> words;
    std::stringstream ss(text);
    std::string word;
    while (ss >> word) {
        words.push_back(word);
    }
    return words;
}

bool is_arabic_code_point(char32_t cp) {
    return cp >= 0x0600 && cp <= 0x06FF;
}

bool is_alpha_code_point(char32_t cp) {
    if ((cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z')) return true;
    if (cp == 0x00AA || cp == 0x00B5 || cp == 0x00BA) return true;
    if (cp >= 0x00C0 && cp <= 0x024F) return cp != 0x00D7 && cp != 0x00F7;
    if (cp >= 0x0370 && cp <= 0x03FF) return true;   // Greek
    if (cp >= 0x0400 && cp <= 0x04FF) return true;   // Cyrillic
    if (cp >= 0x0620 && cp <= 0x064A) return true;   // Arabic letters
    if (cp >= 0x066E && cp <= 0x066F) return true;
    if (cp >= 0x0671 && cp <= 0x06D3) return true;
    if (cp == 0x06D5) return true;
    if (cp >= 0x06EE && cp <= 0x06EF) return true;
    if (cp >= 0x06FA && cp <= 0x06FC) return true;
    if (cp >= 0x0750 && cp <= 0x077F) return true;   // Arabic supplement
    if (cp >= 0x08A0 && cp <= 0x08C9) return true;   // Arabic extended-A
    if (cp >= 0xFB50 && cp <= 0xFDFF) return true;   // presentation forms A
    if (cp >= 0xFE70 && cp <= 0xFEFC) return true;   // presentation forms B
    return false;
}

bool is_word_code_point(char32_t cp) {
    if (cp == U'_') return true;
    if (cp >= U'0' && cp <= U'9') return true;
    if (cp >= 0x0660 && cp <= 0x0669) return true;   // Arabic-Indic digits
    if (cp >= 0x06F0 && cp <= 0x06F9) return true;
    if (cp >= 0x0300 && cp <= 0x036F) return true;   // combining diacritics
    if (cp >= 0x064B && cp <= 0x065F) return true;   // Arabic harakat
    if (cp == 0x0670) return true;
    return is_alpha_code_point(cp);
}

std::vector<std::string> word_tokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char32_t cp : decode_utf8(text)) {
        if (is_word_code_point(cp)) {
            append_utf8(current, cp);
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

} // namespace tfa
