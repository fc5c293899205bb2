#include "io_utils.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <boost/filesystem.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/lzma.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

namespace fs = boost::filesystem;

namespace io_utils {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

InputFile::InputFile(const std::string& path) : path_(path) {
    boost::system::error_code ec;
    if (!fs::exists(path, ec)) {
        throw orthotree::DataNotFoundError(path, "Input file not found");
    }
    if (!fs::is_regular_file(path, ec)) {
        throw orthotree::DataNotFoundError(path, "Input path is not a regular file");
    }

    file_.open(path, std::ios::binary);
    if (!file_) {
        throw orthotree::DataNotFoundError(path, "Cannot open input file");
    }

    buffer_ = std::make_unique<boost::iostreams::filtering_streambuf<boost::iostreams::input>>();
    if (endsWith(path, ".gz")) {
        logging::debug("Reading gzip-compressed input {}", path);
        buffer_->push(boost::iostreams::gzip_decompressor());
    } else if (endsWith(path, ".xz")) {
        logging::debug("Reading xz-compressed input {}", path);
        buffer_->push(boost::iostreams::lzma_decompressor());
    }
    buffer_->push(file_);
    stream_ = std::make_unique<std::istream>(buffer_.get());
}

bool readLine(std::istream& in, std::string& line) {
    if (!std::getline(in, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

std::string readAll(std::istream& in) {
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::vector<std::string> splitFields(std::string_view line, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    size_t i = 0;
    bool fieldStart = true;
    bool inQuotes = false;

    while (i < line.size()) {
        char c = line[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    i += 2;
                    continue;
                }
                inQuotes = false;
            } else {
                current += c;
            }
            ++i;
            continue;
        }

        if (c == delimiter) {
            fields.push_back(std::move(current));
            current.clear();
            fieldStart = true;
        } else if (c == '"' && fieldStart) {
            inQuotes = true;
            fieldStart = false;
        } else {
            current += c;
            fieldStart = false;
        }
        ++i;
    }
    fields.push_back(std::move(current));
    return fields;
}

char delimiterForPath(const std::string& path) {
    std::string name = path;
    for (const auto& ext : {".gz", ".xz"}) {
        if (endsWith(name, ext)) {
            name = name.substr(0, name.size() - std::char_traits<char>::length(ext));
            break;
        }
    }
    std::string lower = toLower(name);
    return endsWith(lower, ".csv") ? ',' : '\t';
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return std::string(s.substr(b, e - b));
}

std::string stripQuotes(std::string_view s) {
    std::string t = trim(s);
    if (t.size() >= 2 && (t.front() == '"' || t.front() == '\'') && t.back() == t.front()) {
        return trim(std::string_view(t).substr(1, t.size() - 2));
    }
    return t;
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

} // namespace io_utils
