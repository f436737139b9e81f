#include "digraph.hpp"
#include "utf8.hpp"

std::string Token::to_string() const {
    switch (kind) {
        case Kind::Start:
            return "^";
        case Kind::End:
            return "$";
        default:
            return utf8_encode(ch);
    }
}

namespace {
    bool is_trailing_junk(char32_t c) {
        return c == '!' or c == '?' or c == ' ' or c == '\n' or c == '\r';
    }

    char32_t strip_circumflex(char32_t c) {
        switch (c) {
            case U'\u00E2':  // â
                return 'a';
            case U'\u00EA':  // ê
                return 'e';
            case U'\u00EE':  // î
                return 'i';
            case U'\u00F4':  // ô
                return 'o';
            default:
                return c;
        }
    }
}  // namespace

std::string normalize_word(const std::string& line) {
    auto chars = utf8_decode(line);
    while (!chars.empty() and is_trailing_junk(chars.back())) { chars.pop_back(); }
    for (auto& c : chars) { c = strip_circumflex(to_lower(c)); }
    return utf8_encode(chars);
}

DigraphSet digraphs_of(const std::string& word) {
    DigraphSet digraphs;
    if (word.empty()) { return digraphs; }

    Token last = Token::start();
    for (char32_t c : utf8_decode(word)) {
        Token current = Token::character(c);
        digraphs.insert({last, current});
        last = current;
    }
    digraphs.insert({last, Token::end()});
    return digraphs;
}
