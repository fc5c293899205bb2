#pragma once

#include <boost/program_options.hpp>

#include <optional>
#include <string>

namespace orthotree {

struct EngineConfig {
    // Input files
    std::string tablePath;     // Orthogroup x species gene table
    std::string metadataPath;  // Species code -> scientific name table
    std::string treePath;      // Newick species tree

    // Parsing
    std::optional<char> tableDelimiter;  // derived from the table file name when unset
    char metadataDelimiter = '\t';
    size_t metadataHeaderLines = 3;

    // Queries
    size_t defaultMaxResults = 50;  // 0 = unlimited
};

/**
 * @brief Options shared by the command line and INI config files
 *
 * Keys: table, metadata, tree, delimiter, metadata-delimiter,
 * metadata-header-lines, max-results, threads.
 */
boost::program_options::options_description engineOptions();

/**
 * @brief Merge an INI config file into an existing variables map
 *
 * Values already stored (from the command line) take precedence.
 *
 * @throws DataNotFoundError if the file does not exist
 * @throws boost::program_options::error on unknown keys or bad values
 */
void storeConfigFile(const std::string& path, const boost::program_options::options_description& options,
                     boost::program_options::variables_map& vm);

// Build and validate an EngineConfig; throws std::invalid_argument on bad values
EngineConfig engineConfigFromVariables(const boost::program_options::variables_map& vm);

// "tab", "comma", "\t" or a single character
char parseDelimiter(const std::string& text);

} // namespace orthotree
