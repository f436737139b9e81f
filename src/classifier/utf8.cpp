#include "utf8.hpp"

std::u32string utf8_decode(const std::string& s) {
    std::u32string result;
    std::size_t i = 0;
    while (i < s.size()) {
        unsigned char lead = s[i];
        int nb_cont;
        char32_t c;
        if (lead < 0x80) {
            nb_cont = 0;
            c = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            nb_cont = 1;
            c = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            nb_cont = 2;
            c = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            nb_cont = 3;
            c = lead & 0x07;
        } else {
            result.push_back(replacement_char);
            i++;
            continue;
        }

        bool valid = i + nb_cont < s.size();
        for (int k = 1; valid and k <= nb_cont; k++) {
            unsigned char cont = s[i + k];
            if ((cont & 0xC0) != 0x80) {
                valid = false;
            } else {
                c = (c << 6) | (cont & 0x3F);
            }
        }
        // reject overlong forms, surrogates and out-of-range values
        static const char32_t min_value[] = {0, 0x80, 0x800, 0x10000};
        if (valid and (c < min_value[nb_cont] or (c >= 0xD800 and c <= 0xDFFF) or c > 0x10FFFF)) {
            valid = false;
        }

        if (valid) {
            result.push_back(c);
            i += nb_cont + 1;
        } else {
            result.push_back(replacement_char);
            i++;
        }
    }
    return result;
}

std::string utf8_encode(char32_t c) {
    std::string result;
    if (c < 0x80) {
        result.push_back(static_cast<char>(c));
    } else if (c < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (c >> 6)));
        result.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (c >> 12)));
        result.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (c >> 18)));
        result.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
    return result;
}

std::string utf8_encode(const std::u32string& s) {
    std::string result;
    for (auto c : s) { result += utf8_encode(c); }
    return result;
}

char32_t to_lower(char32_t c) {
    if (c >= 'A' and c <= 'Z') { return c + 0x20; }
    if (c < 0xC0) { return c; }
    // Latin-1 supplement (0xD7 is the multiplication sign)
    if (c <= 0xDE) { return c == 0xD7 ? c : c + 0x20; }
    // Latin Extended-A: pairs upper/lower, with two shifts in alignment
    if ((c >= 0x100 and c <= 0x137) or (c >= 0x14A and c <= 0x177)) { return c | 1; }
    if ((c >= 0x139 and c <= 0x148) or (c >= 0x179 and c <= 0x17E)) {
        return (c % 2 == 1) ? c + 1 : c;
    }
    if (c == 0x178) { return 0xFF; }
    // Greek (0x3A2 is unassigned) and Cyrillic
    if (c >= 0x391 and c <= 0x3A9 and c != 0x3A2) { return c + 0x20; }
    if (c >= 0x400 and c <= 0x40F) { return c + 0x50; }
    if (c >= 0x410 and c <= 0x42F) { return c + 0x20; }
    return c;
}
