#pragma once

#include <iostream>
#include <string>
#include <vector>

using WordList = std::vector<std::string>;

/*==================================================================================================
  Reading word lists
==================================================================================================*/
// Number of lines in the file. A last line without a terminating newline counts, so that
// count_lines(path) == read_lines(path).size() always holds.
std::size_t count_lines(const std::string& path);

WordList read_lines(const std::string& path);
WordList read_lines(std::istream& is);

/*==================================================================================================
  Writing word lists
==================================================================================================*/
// Truncates the target; "-" means standard output
void write_lines(const std::string& path, const WordList& lines);
void write_lines(std::ostream& os, const WordList& lines);
