#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace orthotree {

/**
 * @brief A required source file is missing or unusable at load time.
 *
 * Fatal for the engine: no query can be answered until a later load succeeds.
 */
class DataNotFoundError : public std::runtime_error {
public:
    DataNotFoundError(const std::string& path, const std::string& what)
        : std::runtime_error(what + ": " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Malformed input (table row or Newick string).
 *
 * Always recovered by the loaders: the row is skipped or the fallback tree is used.
 */
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& what, size_t position)
        : std::runtime_error(what + " (at " + std::to_string(position) + ")"), position_(position) {}

    size_t position() const { return position_; }

private:
    size_t position_;
};

} // namespace orthotree
