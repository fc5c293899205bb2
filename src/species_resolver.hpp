#pragma once

#include <absl/container/flat_hash_map.h>

#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace species {

struct SpeciesIdentity {
    std::string code;
    std::string canonicalName;
    bool isFallback = false;  // name was synthesized, not read from metadata
};

struct MappingOptions {
    char delimiter = '\t';
    // Leading lines to skip: two description lines and the column header
    size_t headerLines = 3;
};

// Name used for an empty species code
inline constexpr std::string_view kUnknownSpecies = "Unknown species";

/**
 * @brief Candidate genera for the first letter of a species code
 *
 * Empty for letters without an entry. This table is the only place the
 * letter -> genus hints live.
 */
const std::vector<std::string>& genusHints(char letter);

/**
 * @brief Deterministic name for a code with no metadata entry
 *
 * "<first genus> sp. (<code>)" when the uppercased first letter has genus
 * hints, "Species <code>" otherwise.
 */
std::string generateFallbackName(std::string_view code);

/**
 * @brief Species code -> canonical scientific name resolution
 *
 * Metadata entries are authoritative. Codes seen in the orthogroup table but
 * absent from metadata get synthesized names through enhance(); resolve()
 * answers for any input, synthesizing a name on the fly when needed.
 */
class SpeciesResolver {
public:
    SpeciesResolver() = default;

    /**
     * @brief Load the metadata table (column 0 full name, column 1 code)
     *
     * A missing file is not an error: a warning is logged and the resolver
     * works from generated names only.
     */
    static SpeciesResolver loadMapping(const std::string& path, const MappingOptions& options = {});

    static SpeciesResolver parseMapping(std::istream& in, const MappingOptions& options,
                                        const std::string& sourceName = "<stream>");

    // Adds or replaces a metadata entry; a replaced code keeps its original position
    void addMapping(const std::string& code, const std::string& fullName);

    /**
     * @brief Synthesize names for codes missing from metadata
     *
     * Tries a partial match against mapped codes (same first two letters,
     * case-insensitive, length within 2) before falling back to the genus
     * hints. Returns the number of names added.
     */
    size_t enhance(const std::vector<std::string>& codes);

    std::string resolve(std::string_view code) const;
    SpeciesIdentity identify(std::string_view code) const;

    std::optional<std::string> codeForName(std::string_view name) const;

    const std::vector<std::string>& mappedCodes() const { return codeOrder_; }
    size_t mappedCount() const { return codeOrder_.size(); }
    size_t fallbackCount() const { return enhanced_.size(); }

private:
    std::optional<SpeciesIdentity> lookupExact(const std::string& code) const;
    std::optional<std::string> partialMatch(const std::string& code) const;

    std::vector<std::string> codeOrder_;  // metadata codes in file order
    absl::flat_hash_map<std::string, std::string> nameByCode_;
    absl::flat_hash_map<std::string, std::string> codeByName_;
    absl::flat_hash_map<std::string, std::string> enhanced_;
};

} // namespace species
