#include "text/TextUtil.hpp"
#include <cctype>
#include <utility>

namespace textutil {

static bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f' ||
           (c >= 0x1c && c <= 0x1f);
}

// byte length of the whitespace character starting at s[i], 0 if none.
// covers ASCII plus the UTF-8 encoded Unicode spaces (NBSP, U+2000..U+200A, ...)
static size_t space_len(const std::string& s, size_t i) {
    const unsigned char c0 = static_cast<unsigned char>(s[i]);
    if (is_space(c0)) return 1;
    if (c0 < 0xC2 || i + 1 >= s.size()) return 0;

    const unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
    if (c0 == 0xC2) return (c1 == 0x85 || c1 == 0xA0) ? 2 : 0;
    if (i + 2 >= s.size()) return 0;

    const unsigned char c2 = static_cast<unsigned char>(s[i + 2]);
    if (c0 == 0xE1 && c1 == 0x9A && c2 == 0x80) return 3;                 // U+1680
    if (c0 == 0xE2 && c1 == 0x80) {
        if (c2 <= 0x8A || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF) return 3;  // U+2000..200A, 2028, 2029, 202F
        return 0;
    }
    if (c0 == 0xE2 && c1 == 0x81 && c2 == 0x9F) return 3;                 // U+205F
    if (c0 == 0xE3 && c1 == 0x80 && c2 == 0x80) return 3;                 // U+3000
    return 0;
}

// non-ASCII bytes count as word characters so UTF-8 letters glue to their word
static bool is_word(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

std::string clean_text(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (size_t i = 0; i < s.size();) {
        const size_t sp = space_len(s, i);
        if (sp > 0) {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
            i += sp;
            continue;
        }
        out.push_back(s[i] == ';' ? ',' : s[i]);
        prev_space = false;
        ++i;
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::string to_lower_ascii(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

std::vector<std::string> keyword_tokens(const std::string& raw) {
    std::string cleaned;
    cleaned.reserve(raw.size());
    for (size_t i = 0; i < raw.size();) {
        const size_t sp = space_len(raw, i);
        if (sp > 0) {
            cleaned.push_back(' ');
            i += sp;
        } else {
            cleaned.push_back(raw[i++]);
        }
    }
    cleaned = to_lower_ascii(std::move(cleaned));

    for (char& c : cleaned) {
        unsigned char uc = static_cast<unsigned char>(c);
        bool keep = is_word(uc) || is_space(uc) || c == ',' || c == ';' || c == '-';
        if (!keep) c = ' ';
    }

    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < cleaned.size()) {
        unsigned char c = static_cast<unsigned char>(cleaned[i]);
        if (!is_word(c)) {
            ++i;
            continue;
        }

        // one word = maximal run of word chars; it counts only if it is all a-z
        size_t j = i;
        bool letters_only = true;
        while (j < cleaned.size() && is_word(static_cast<unsigned char>(cleaned[j]))) {
            if (cleaned[j] < 'a' || cleaned[j] > 'z') letters_only = false;
            ++j;
        }
        if (letters_only && j - i >= 3) tokens.push_back(cleaned.substr(i, j - i));
        i = j;
    }
    return tokens;
}

}  // namespace textutil
