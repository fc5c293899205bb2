#pragma once

/**
 * @file engine.hpp
 * @brief Orthology resolution and phylogenetic search service
 *
 * The Engine owns every loaded structure (orthogroup table, species
 * resolver, species tree and its leaf binding) as one immutable Snapshot.
 * The snapshot is built on first use and replaced only by reload(); queries
 * run against whichever snapshot was current when they started.
 */

#include "config.hpp"
#include "leaf_binding.hpp"
#include "orthogroup_table.hpp"
#include "species_resolver.hpp"
#include "species_tree.hpp"
#include "tree_search.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orthotree {

struct Snapshot {
    std::unique_ptr<orthogroups::OrthogroupTable> table;
    species::SpeciesResolver resolver;
    phylo::SpeciesTree tree;
    phylo::LeafBinding binding;
    bool treeDegraded = false;
};

struct OrthologueRecord {
    std::string geneId;
    std::string speciesCode;
    std::string speciesName;
    std::string orthogroupId;
};

struct SpeciesCount {
    std::string speciesCode;
    std::string speciesName;
    size_t count = 0;
};

struct OrthologueSearchResult {
    bool success = false;
    std::string geneId;
    std::optional<std::string> orthogroupId;
    std::vector<OrthologueRecord> orthologues;   // excludes the query gene
    std::vector<SpeciesCount> countsBySpecies;   // every species, zeros included
    std::string newickTree;
    std::string message;
};

struct OrthogroupTreeResult {
    std::string orthogroupId;
    bool found = false;
    std::string newickTree;
    std::vector<std::string> speciesWithGenes;
};

struct EngineStatus {
    bool loaded = false;
    bool treeDegraded = false;
    size_t leafCount = 0;
    size_t orthogroupCount = 0;
    size_t speciesCount = 0;
    size_t indexedGeneCount = 0;
    size_t mappedSpeciesCount = 0;
    size_t fallbackSpeciesCount = 0;
    size_t geneConflicts = 0;
    size_t skippedRows = 0;
};

class Engine {
public:
    explicit Engine(EngineConfig config);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Build all state if it has not been built yet
     *
     * Concurrent callers wait for a single build.
     *
     * @throws DataNotFoundError if the orthogroup table is unavailable; nothing
     *         is installed and the next call tries again
     */
    void ensureLoaded();

    // Rebuild all state from the configured files and swap it in
    void reload();
    void reloadAll() { reload(); }

    // Current snapshot, loading it first if necessary
    std::shared_ptr<const Snapshot> snapshot();

    std::optional<std::string> findGeneOrthogroup(std::string_view geneId);
    orthogroups::SpeciesGenes getOrthogroupGenes(const std::string& orthogroupId);
    std::vector<std::string> getAllSpeciesCodes();
    std::string resolveSpeciesName(std::string_view code);
    species::SpeciesIdentity speciesIdentity(std::string_view code);

    std::vector<tree_search::SearchResult> searchTree(tree_search::SearchKind kind, std::string_view query);
    std::vector<tree_search::SearchResult> searchTree(tree_search::SearchKind kind, std::string_view query,
                                                      size_t maxResults);

    /**
     * @brief Orthologues of a gene in every species of its orthogroup
     *
     * A gene in no orthogroup gives success = false with an explanatory
     * message rather than an exception.
     */
    OrthologueSearchResult searchOrthologues(std::string_view geneId);

    OrthogroupTreeResult getOrthogroupTree(const std::string& orthogroupId);

    std::string newickTree();
    phylo::TreeStatistics treeStatistics();
    phylo::LeafSetComparison compareTree(const phylo::SpeciesTree& other);

    // Does not trigger a load
    EngineStatus status() const;

    const EngineConfig& config() const { return config_; }

private:
    std::shared_ptr<const Snapshot> buildSnapshot() const;
    std::shared_ptr<const Snapshot> current() const;
    void install(std::shared_ptr<const Snapshot> snapshot);

    EngineConfig config_;
    std::mutex loadMutex_;
    mutable std::mutex snapshotMutex_;
    std::shared_ptr<const Snapshot> snapshot_;
};

} // namespace orthotree
