#pragma once

#include <algorithm>
#include <string>
#include <vector>

/*==================================================================================================
  Case folding (sort -f rule)
  Lower-case ASCII letters are mapped to upper case; every other byte, UTF-8 continuation bytes
  included, is kept and compared as an unsigned char.
==================================================================================================*/
inline unsigned char fold_char(unsigned char c) {
    return (c >= 'a' and c <= 'z') ? static_cast<unsigned char>(c - 'a' + 'A') : c;
}

inline std::string fold_case(std::string s) {
    for (auto& c : s) { c = static_cast<char>(fold_char(static_cast<unsigned char>(c))); }
    return s;
}

inline bool case_insensitive_less(const std::string& a, const std::string& b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) {
            return fold_char(static_cast<unsigned char>(x)) <
                   fold_char(static_cast<unsigned char>(y));
        });
}

// Stable: lines that fold to the same string keep their relative order
inline std::vector<std::string> sort_case_insensitive(std::vector<std::string> lines) {
    std::stable_sort(lines.begin(), lines.end(), case_insensitive_less);
    return lines;
}
