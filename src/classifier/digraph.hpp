#pragma once

#include <functional>
#include <string>
#include <unordered_set>

/*==================================================================================================
  Tokens and digraphs
  Word boundaries are encoded as explicit tokens, so that common word starts and word ends are
  features of their own.
==================================================================================================*/
struct Token {
    enum class Kind { Start, End, Char };

    Kind kind;
    char32_t ch;

    static Token start() { return {Kind::Start, 0}; }
    static Token end() { return {Kind::End, 0}; }
    static Token character(char32_t c) { return {Kind::Char, c}; }

    bool operator==(const Token& other) const { return kind == other.kind and ch == other.ch; }
    bool operator!=(const Token& other) const { return !(*this == other); }

    // "^" for Start, "$" for End, the UTF-8 character otherwise
    std::string to_string() const;
};

struct Digraph {
    Token first;
    Token second;

    bool operator==(const Digraph& other) const {
        return first == other.first and second == other.second;
    }

    std::string to_string() const { return first.to_string() + second.to_string(); }
};

struct DigraphHash {
    std::size_t operator()(const Digraph& d) const {
        auto h = [](const Token& t) {
            return (static_cast<std::size_t>(t.ch) << 2) | static_cast<std::size_t>(t.kind);
        };
        return std::hash<std::size_t>()(h(d.first) * 0x9E3779B1u ^ h(d.second));
    }
};

using DigraphSet = std::unordered_set<Digraph, DigraphHash>;

// Strips trailing "!", "?", blanks and line ends, lower-cases, and drops circumflexes
// (â ê î ô become a e i o)
std::string normalize_word(const std::string& line);

// Digraphs of ^word$; the word must already be normalized
DigraphSet digraphs_of(const std::string& word);
