#pragma once

#include <string>

/*==================================================================================================
  Minimal UTF-8 codec
  Malformed sequences decode to U+FFFD, one replacement per offending byte.
==================================================================================================*/
const char32_t replacement_char = 0xFFFD;

std::u32string utf8_decode(const std::string& s);
std::string utf8_encode(const std::u32string& s);
std::string utf8_encode(char32_t c);

// Lower case for Latin-1, Latin Extended-A, basic Greek and Cyrillic; other characters unchanged
char32_t to_lower(char32_t c);
