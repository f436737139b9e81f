#include "line_io.hpp"
#include <sys/stat.h>
#include <fstream>
#include "global/errors.hpp"
#include "global/logging.hpp"

namespace {
    bool file_exists(const std::string& path) {
        struct stat buffer;
        return stat(path.c_str(), &buffer) == 0;
    }

    std::ifstream open_input(const std::string& path) {
        if (!file_exists(path)) { throw FileNotFound(path); }
        std::ifstream is(path);
        if (!is) { throw IOError("Could not open " + path + " for reading"); }
        return is;
    }

    void check_read(const std::istream& is, const std::string& path) {
        if (is.bad()) { throw IOError("Error while reading " + path); }
    }
}  // namespace

std::size_t count_lines(const std::string& path) {
    auto is = open_input(path);
    std::size_t nb_lines{0};
    bool pending{false};  // characters seen since the last newline
    char buffer[1 << 16];
    while (is.read(buffer, sizeof(buffer)) or is.gcount() > 0) {
        for (std::streamsize i = 0; i < is.gcount(); i++) {
            if (buffer[i] == '\n') {
                nb_lines++;
                pending = false;
            } else {
                pending = true;
            }
        }
    }
    check_read(is, path);
    if (pending) { nb_lines++; }
    DEBUG("Counted {} lines in {}.", nb_lines, path);
    return nb_lines;
}

WordList read_lines(std::istream& is) {
    WordList result;
    std::string line;
    while (std::getline(is, line)) { result.push_back(line); }
    return result;
}

WordList read_lines(const std::string& path) {
    auto is = open_input(path);
    auto result = read_lines(is);
    check_read(is, path);
    DEBUG("Read {} lines from {}.", result.size(), path);
    return result;
}

void write_lines(std::ostream& os, const WordList& lines) {
    for (auto& line : lines) { os << line << '\n'; }
    os.flush();
}

void write_lines(const std::string& path, const WordList& lines) {
    if (path == "-") {
        write_lines(std::cout, lines);
        if (!std::cout) { throw IOError("Error while writing to standard output"); }
        return;
    }
    std::ofstream os(path, std::ios_base::trunc);
    if (!os) { throw IOError("Could not open " + path + " for writing"); }
    write_lines(os, lines);
    if (!os) { throw IOError("Error while writing " + path); }
    DEBUG("Wrote {} lines to {}.", lines.size(), path);
}
