#pragma once

#include "species_resolver.hpp"
#include "species_tree.hpp"

#include <absl/container/flat_hash_map.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orthogroups {
class OrthogroupTable;
}

namespace phylo {

struct LeafAnnotation {
    species::SpeciesIdentity identity;
    int64_t geneCount = 0;  // genome-wide gene count of the species
};

/**
 * @brief Per-leaf species identity and gene totals, kept beside the tree
 *
 * Indexed by node index; entries for internal nodes stay empty. Holds no
 * reference to the tree, so it may be copied or outlive it.
 */
class LeafBinding {
public:
    LeafBinding() = default;

    static LeafBinding bind(const SpeciesTree& tree, const orthogroups::OrthogroupTable& table,
                            const species::SpeciesResolver& resolver);

    const LeafAnnotation& annotation(int32_t node) const { return annotations_[node]; }
    const std::string& fullName(int32_t node) const { return annotations_[node].identity.canonicalName; }
    int64_t geneCount(int32_t node) const { return annotations_[node].geneCount; }

    // Node index of the leaf for a species code; surrounding quotes are ignored
    std::optional<int32_t> leafIndex(std::string_view code) const;

    size_t fallbackCount() const { return fallbackCount_; }

private:
    std::vector<LeafAnnotation> annotations_;
    absl::flat_hash_map<std::string, int32_t> leafByCode_;
    size_t fallbackCount_ = 0;
};

} // namespace phylo
