#include "geodetic/text.hpp"
#include <cctype>
#include <cstdint>

namespace geodetic {
namespace text {

namespace {

// Latin-1 Supplement, U+00C0..U+00FF. '\0' marks characters without ASCII base.
constexpr const char* latin1_base =
    "AAAAAAACEEEEIIII"   // C0-CF
    "DNOOOOO\0OUUUUYTs"  // D0-DF
    "aaaaaaaceeeeiiii"   // E0-EF
    "dnooooo\0ouuuuyty"; // F0-FF

// Latin Extended-A, U+0100..U+017F
constexpr const char* latin_ext_a_base =
    "AaAaAaCcCcCcCcDd"   // 100-10F
    "DdEeEeEeEeEeGgGg"   // 110-11F
    "GgGgHhHhIiIiIiIi"   // 120-12F
    "IiJjJjKkkLlLlLlL"   // 130-13F
    "lLlNnNnNnnNnOoOo"   // 140-14F
    "OoOoRrRrRrSsSsSs"   // 150-15F
    "SsTtTtTtUuUuUuUu"   // 160-16F
    "UuUuWwYyYZzZzZzs";  // 170-17F

bool is_word_char(unsigned char c) {
    return std::isalnum(c) != 0;
}

std::string fold(std::string_view s) {
    std::string out;
    for (char c : to_ascii(s)) {
        auto u = static_cast<unsigned char>(c);
        if (is_word_char(u)) {
            out += static_cast<char>(std::tolower(u));
        }
    }
    return out;
}

} // namespace

std::string to_ascii(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            out += static_cast<char>(c);
            continue;
        }
        // Two-byte sequences cover both Latin blocks
        if ((c & 0xE0) == 0xC0 && i + 1 < s.size()) {
            auto c2 = static_cast<unsigned char>(s[i + 1]);
            uint32_t cp = ((c & 0x1Fu) << 6) | (c2 & 0x3Fu);
            char base = '\0';
            if (cp >= 0xC0 && cp <= 0xFF) {
                base = latin1_base[cp - 0xC0];
            } else if (cp >= 0x100 && cp <= 0x17F) {
                base = latin_ext_a_base[cp - 0x100];
            }
            if (base != '\0') {
                out += base;
            } else {
                out.append(s.substr(i, 2));
            }
            ++i;
            continue;
        }
        out += static_cast<char>(c);
    }
    return out;
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool is_all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string to_like_pattern(std::string_view name) {
    std::string ascii = to_ascii(name);
    std::string pattern;
    bool wildcard = false;
    for (char c : ascii) {
        auto u = static_cast<unsigned char>(c);
        if (is_word_char(u)) {
            pattern += c;
            wildcard = false;
        } else if (!wildcard) {
            pattern += '%';
            wildcard = true;
        }
    }
    return pattern;
}

bool same_ignoring_punctuation(std::string_view name, std::string_view candidate) {
    return fold(name) == fold(candidate);
}

} // namespace text
} // namespace geodetic
