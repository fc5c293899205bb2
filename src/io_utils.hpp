#pragma once

#include <boost/iostreams/filtering_streambuf.hpp>

#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace io_utils {

/**
 * @brief Input file that transparently decompresses .gz and .xz sources
 *
 * Throws orthotree::DataNotFoundError when the path does not exist, is not a
 * regular file, or cannot be opened.
 */
class InputFile {
public:
    explicit InputFile(const std::string& path);

    InputFile(const InputFile&) = delete;
    InputFile& operator=(const InputFile&) = delete;

    std::istream& stream() { return *stream_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ifstream file_;
    std::unique_ptr<boost::iostreams::filtering_streambuf<boost::iostreams::input>> buffer_;
    std::unique_ptr<std::istream> stream_;
};

// Reads one line, dropping a trailing '\r' from CRLF files
bool readLine(std::istream& in, std::string& line);

// Reads the whole stream into a string
std::string readAll(std::istream& in);

/**
 * @brief Split a delimited line into fields
 *
 * Empty fields are preserved, so "a\t\tb" yields three fields. A field that
 * starts with a double quote runs to the matching closing quote; "" inside a
 * quoted field is an escaped quote.
 */
std::vector<std::string> splitFields(std::string_view line, char delimiter);

// Field delimiter implied by a file name: ',' for .csv, '\t' otherwise.
// Compression suffixes are ignored, so "x.csv.gz" is comma separated.
char delimiterForPath(const std::string& path);

std::string trim(std::string_view s);

// Trim whitespace, then strip one pair of matching surrounding quotes
std::string stripQuotes(std::string_view s);

std::string toLower(std::string_view s);

// Case-insensitive substring test; an empty needle always matches
bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

} // namespace io_utils
