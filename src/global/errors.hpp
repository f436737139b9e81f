#pragma once

#include <stdexcept>
#include <string>

// Input or output file could not be read or written
struct IOError : public std::runtime_error {
    IOError(std::string s = "") : std::runtime_error(s) {}
};

struct FileNotFound : public IOError {
    FileNotFound(std::string path) : IOError("File not found: " + path), path(path) {}
    std::string path;
};

// Sample size out of range, or options that cannot be combined
struct InvalidArgument : public std::invalid_argument {
    InvalidArgument(std::string s = "") : std::invalid_argument(s) {}
};
