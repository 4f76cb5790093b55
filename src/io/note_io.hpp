#ifndef CLINSCRUB_IO_NOTE_IO_HPP
#define CLINSCRUB_IO_NOTE_IO_HPP

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @file note_io.hpp
 * @brief Reads a note from a file or stdin and writes the result to a file or stdout.
 *
 * An empty path or "-" selects the standard stream.
 */

namespace clinscrub {
namespace io {

inline bool isStdStream(const std::string &path)
{
    return path.empty() || path == "-";
}

/**
 * @throw std::runtime_error if the file can't be opened or read.
 */
inline std::string readNote(const std::string &path)
{
    if (isStdStream(path)) {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        if (std::cin.bad()) {
            throw std::runtime_error("NoteIO: failed to read from STDIN");
        }
        return buffer.str();
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("NoteIO: failed to read input file: " + path);
    }
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("NoteIO: error while reading input file: " + path);
    }
    return contents;
}

/**
 * @throw std::runtime_error if the file can't be created or written.
 */
inline void writeNote(const std::string &path, const std::string &contents)
{
    if (isStdStream(path)) {
        std::cout.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        std::cout.flush();
        if (!std::cout) {
            throw std::runtime_error("NoteIO: failed to write to STDOUT");
        }
        return;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("NoteIO: failed to create output file: " + path);
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!out) {
        throw std::runtime_error("NoteIO: failed to write output file: " + path);
    }
}

} // namespace io
} // namespace clinscrub

#endif // CLINSCRUB_IO_NOTE_IO_HPP
