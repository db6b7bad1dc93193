#pragma once

#ifdef __cplusplus

#include <string>
#include <string_view>

namespace geodetic {
namespace text {

/// Replaces accented Latin letters (UTF-8) by their ASCII base letter,
/// e.g. "Réseau Géodésique Français" -> "Reseau Geodesique Francais".
std::string to_ascii(std::string_view s);

std::string to_lower(std::string_view s);

/// True if `s` is non-empty and made only of ASCII digits.
bool is_all_digits(std::string_view s);

/// Builds a LIKE pattern matching `name` regardless of case, accents and
/// punctuation: every run of characters other than letters and digits
/// becomes a '%' wildcard.
std::string to_like_pattern(std::string_view name);

/// Second pass after a LIKE search: true if `candidate` equals `name` once
/// both are folded to lower-case ASCII letters and digits. Rejects the extra
/// matches a '%' wildcard lets through ("NTF" vs "NTF Paris").
bool same_ignoring_punctuation(std::string_view name, std::string_view candidate);

} // namespace text
} // namespace geodetic

#endif // __cplusplus
