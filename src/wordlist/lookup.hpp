#pragma once

#include <cctype>
#include <string>
#include <vector>
#include "case_fold.hpp"

/*==================================================================================================
  Prefix lookup with the rules of `look -df`
  Only blanks and alphanumeric characters take part in the comparison, and case is folded. A
  prefix made only of other characters (e.g. ".") therefore matches every line. Bytes of
  multi-byte UTF-8 characters count as alphanumeric.
==================================================================================================*/
class LookupFilter {
    std::string key;

  public:
    static std::string dictionary_key(const std::string& s) {
        std::string result;
        for (unsigned char c : s) {
            if (std::isalnum(c) or c == ' ' or c == '\t' or c >= 0x80) {
                result.push_back(static_cast<char>(fold_char(c)));
            }
        }
        return result;
    }

    explicit LookupFilter(const std::string& prefix = ".") : key(dictionary_key(prefix)) {}

    bool matches_all() const { return key.empty(); }

    bool matches(const std::string& line) const {
        return dictionary_key(line).compare(0, key.size(), key) == 0;
    }

    std::vector<std::string> filter(const std::vector<std::string>& lines) const {
        if (matches_all()) { return lines; }
        std::vector<std::string> result;
        for (auto& line : lines) {
            if (matches(line)) { result.push_back(line); }
        }
        return result;
    }
};
