#include "engine.hpp"
#include "errors.hpp"
#include "io_utils.hpp"
#include "logging.hpp"

#include <utility>

namespace orthotree {

Engine::Engine(EngineConfig config) : config_(std::move(config)) {}

std::shared_ptr<const Snapshot> Engine::buildSnapshot() const {
    TIME_OPERATION("Loading orthology data");
    if (config_.tablePath.empty()) {
        throw DataNotFoundError("<unset>", "No orthogroup table configured");
    }

    auto snapshot = std::make_shared<Snapshot>();

    orthogroups::TableOptions tableOptions;
    tableOptions.delimiter = config_.tableDelimiter;
    snapshot->table = orthogroups::OrthogroupTable::load(config_.tablePath, tableOptions);

    if (config_.metadataPath.empty()) {
        logging::warn("No species metadata configured; species names are generated from codes");
    } else {
        species::MappingOptions mappingOptions;
        mappingOptions.delimiter = config_.metadataDelimiter;
        mappingOptions.headerLines = config_.metadataHeaderLines;
        snapshot->resolver = species::SpeciesResolver::loadMapping(config_.metadataPath, mappingOptions);
    }
    snapshot->resolver.enhance(snapshot->table->getAllSpeciesCodes());

    auto loaded = phylo::loadTree(config_.treePath);
    snapshot->tree = std::move(loaded.tree);
    snapshot->treeDegraded = loaded.degraded;

    snapshot->binding = phylo::LeafBinding::bind(snapshot->tree, *snapshot->table, snapshot->resolver);

    logging::info("Engine ready: {} orthogroups, {} species, {} tree leaves{}", snapshot->table->size(),
                  snapshot->table->getAllSpeciesCodes().size(), snapshot->tree.leaves().size(),
                  snapshot->treeDegraded ? " (fallback tree)" : "");
    return snapshot;
}

std::shared_ptr<const Snapshot> Engine::current() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return snapshot_;
}

void Engine::install(std::shared_ptr<const Snapshot> snapshot) {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    snapshot_ = std::move(snapshot);
}

void Engine::ensureLoaded() {
    if (current()) return;
    std::lock_guard<std::mutex> lock(loadMutex_);
    if (current()) return;
    install(buildSnapshot());
}

void Engine::reload() {
    std::lock_guard<std::mutex> lock(loadMutex_);
    logging::info("Reloading all data");
    install(buildSnapshot());
}

std::shared_ptr<const Snapshot> Engine::snapshot() {
    ensureLoaded();
    return current();
}

std::optional<std::string> Engine::findGeneOrthogroup(std::string_view geneId) {
    return snapshot()->table->findGeneOrthogroup(geneId);
}

orthogroups::SpeciesGenes Engine::getOrthogroupGenes(const std::string& orthogroupId) {
    return snapshot()->table->getOrthogroupGenes(orthogroupId);
}

std::vector<std::string> Engine::getAllSpeciesCodes() {
    return snapshot()->table->getAllSpeciesCodes();
}

std::string Engine::resolveSpeciesName(std::string_view code) {
    return snapshot()->resolver.resolve(code);
}

species::SpeciesIdentity Engine::speciesIdentity(std::string_view code) {
    return snapshot()->resolver.identify(code);
}

std::vector<tree_search::SearchResult> Engine::searchTree(tree_search::SearchKind kind, std::string_view query) {
    return searchTree(kind, query, config_.defaultMaxResults);
}

std::vector<tree_search::SearchResult> Engine::searchTree(tree_search::SearchKind kind, std::string_view query,
                                                          size_t maxResults) {
    auto snap = snapshot();
    tree_search::TreeSearcher searcher(snap->tree, snap->binding, *snap->table);
    auto results = searcher.searchTree(kind, query, maxResults);
    logging::debug("{} search for '{}': {} results", tree_search::toString(kind), query, results.size());
    return results;
}

OrthologueSearchResult Engine::searchOrthologues(std::string_view rawGeneId) {
    auto snap = snapshot();
    OrthologueSearchResult result;
    result.geneId = io_utils::trim(rawGeneId);
    result.newickTree = snap->tree.newick();

    auto orthogroup = snap->table->findGeneOrthogroup(result.geneId);
    if (!orthogroup) {
        result.message = fmt::format("gene {} not found in any orthogroup", result.geneId);
        return result;
    }

    const auto* row = snap->table->findRow(*orthogroup);
    const auto& codes = snap->table->getAllSpeciesCodes();
    for (size_t c = 0; c < codes.size(); ++c) {
        const auto& genes = row->cells[c];
        std::string name = snap->resolver.resolve(codes[c]);
        for (const auto& gene : genes) {
            if (gene == result.geneId) continue;
            result.orthologues.push_back({gene, codes[c], name, *orthogroup});
        }
        result.countsBySpecies.push_back({codes[c], std::move(name), genes.size()});
    }

    result.success = true;
    result.orthogroupId = std::move(orthogroup);
    result.message = fmt::format("found {} orthologues", result.orthologues.size());
    return result;
}

OrthogroupTreeResult Engine::getOrthogroupTree(const std::string& orthogroupId) {
    auto snap = snapshot();
    OrthogroupTreeResult result;
    result.orthogroupId = io_utils::trim(orthogroupId);
    result.newickTree = snap->tree.newick();

    const auto* row = snap->table->findRow(result.orthogroupId);
    if (!row) return result;

    result.found = true;
    const auto& codes = snap->table->getAllSpeciesCodes();
    for (size_t c = 0; c < codes.size(); ++c) {
        if (!row->cells[c].empty()) {
            result.speciesWithGenes.push_back(codes[c]);
        }
    }
    return result;
}

std::string Engine::newickTree() {
    return snapshot()->tree.newick();
}

phylo::TreeStatistics Engine::treeStatistics() {
    return phylo::computeStatistics(snapshot()->tree);
}

phylo::LeafSetComparison Engine::compareTree(const phylo::SpeciesTree& other) {
    return phylo::compareLeafSets(snapshot()->tree, other);
}

EngineStatus Engine::status() const {
    EngineStatus status;
    auto snap = current();
    if (!snap) return status;

    status.loaded = true;
    status.treeDegraded = snap->treeDegraded;
    status.leafCount = snap->tree.leaves().size();
    status.orthogroupCount = snap->table->size();
    status.speciesCount = snap->table->getAllSpeciesCodes().size();
    status.indexedGeneCount = snap->table->indexedGeneCount();
    status.mappedSpeciesCount = snap->resolver.mappedCount();
    status.fallbackSpeciesCount = snap->resolver.fallbackCount();
    status.geneConflicts = snap->table->conflictCount();
    status.skippedRows = snap->table->skippedRowCount();
    return status;
}

} // namespace orthotree
