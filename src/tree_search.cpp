#include "tree_search.hpp"
#include "io_utils.hpp"
#include "logging.hpp"
#include "orthogroup_table.hpp"

#include <limits>
#include <utility>

namespace tree_search {

namespace {

size_t effectiveLimit(size_t maxResults) {
    return maxResults == 0 ? std::numeric_limits<size_t>::max() : maxResults;
}

} // namespace

std::optional<SearchKind> parseSearchKind(std::string_view kind) {
    std::string k = io_utils::toLower(io_utils::trim(kind));
    if (k == "gene") return SearchKind::Gene;
    if (k == "species") return SearchKind::Species;
    if (k == "clade") return SearchKind::Clade;
    if (k == "common_ancestor" || k == "common-ancestor") return SearchKind::CommonAncestor;
    return std::nullopt;
}

std::string_view toString(SearchKind kind) {
    switch (kind) {
        case SearchKind::Gene:           return "gene";
        case SearchKind::Species:        return "species";
        case SearchKind::Clade:          return "clade";
        case SearchKind::CommonAncestor: return "common_ancestor";
    }
    return "unknown";
}

std::string_view toString(NodeType type) {
    return type == NodeType::Leaf ? "leaf" : "internal";
}

TreeSearcher::TreeSearcher(const phylo::SpeciesTree& tree, const phylo::LeafBinding& binding,
                           const orthogroups::OrthogroupTable& table)
    : tree_(tree), binding_(binding), table_(table) {}

SearchResult TreeSearcher::leafResult(int32_t leaf, int64_t geneCount) const {
    SearchResult result;
    result.nodeName = binding_.fullName(leaf);
    result.nodeType = NodeType::Leaf;
    result.distanceToRoot = tree_.distanceToRoot(leaf);
    result.speciesCount = 1;
    result.geneCount = geneCount;
    result.cladeMembers = {result.nodeName};
    return result;
}

SearchResult TreeSearcher::cladeResult(int32_t node, std::string nodeName, size_t memberLimit) const {
    SearchResult result;
    result.nodeName = std::move(nodeName);
    result.nodeType = tree_.node(node).isLeaf() ? NodeType::Leaf : NodeType::Internal;
    result.distanceToRoot = tree_.distanceToRoot(node);
    result.supportValue = tree_.node(node).support;

    auto leaves = tree_.leavesUnder(node);
    result.speciesCount = leaves.size();
    for (int32_t leaf : leaves) {
        result.geneCount += binding_.geneCount(leaf);
        if (result.cladeMembers.size() < memberLimit) {
            result.cladeMembers.push_back(binding_.fullName(leaf));
        }
    }
    return result;
}

std::vector<SearchResult> TreeSearcher::searchByGene(std::string_view geneId, size_t maxResults) const {
    std::vector<SearchResult> results;
    auto orthogroup = table_.findGeneOrthogroup(geneId);
    if (!orthogroup) {
        logging::debug("Gene search: {} is not in any orthogroup", geneId);
        return results;
    }

    const size_t limit = effectiveLimit(maxResults);
    const auto* row = table_.findRow(*orthogroup);
    const auto& codes = table_.getAllSpeciesCodes();
    for (size_t c = 0; c < codes.size() && results.size() < limit; ++c) {
        const auto& genes = row->cells[c];
        if (genes.empty()) continue;
        auto leaf = binding_.leafIndex(codes[c]);
        if (!leaf) {
            logging::debug("Gene search: species {} has no leaf in the tree", codes[c]);
            continue;
        }
        results.push_back(leafResult(*leaf, static_cast<int64_t>(genes.size())));
    }
    return results;
}

std::vector<SearchResult> TreeSearcher::searchBySpecies(std::string_view query, size_t maxResults) const {
    std::vector<SearchResult> results;
    const size_t limit = effectiveLimit(maxResults);
    // A query that matches a name token also matches the full name
    for (int32_t leaf : tree_.leaves()) {
        if (results.size() >= limit) break;
        if (io_utils::containsIgnoreCase(tree_.node(leaf).name, query) ||
            io_utils::containsIgnoreCase(binding_.fullName(leaf), query)) {
            results.push_back(leafResult(leaf, binding_.geneCount(leaf)));
        }
    }
    return results;
}

std::vector<SearchResult> TreeSearcher::searchByClade(std::string_view query, size_t maxResults) const {
    std::vector<SearchResult> results;
    const size_t limit = effectiveLimit(maxResults);

    for (int32_t i = 0; i < static_cast<int32_t>(tree_.size()); ++i) {
        if (results.size() >= limit) break;
        const auto& node = tree_.node(i);
        if (node.isLeaf()) continue;

        std::string members;
        for (int32_t leaf : tree_.leavesUnder(i)) {
            if (!members.empty()) members += ' ';
            members += binding_.fullName(leaf);
        }
        if (!io_utils::containsIgnoreCase(members, query)) continue;

        std::string name = node.name.empty()
                               ? fmt::format("Clade with {} species", tree_.leafCountUnder(i))
                               : node.name;
        results.push_back(cladeResult(i, std::move(name), kMaxCladeMembers));
    }
    return results;
}

std::optional<int32_t> TreeSearcher::matchLeaf(const std::string& name) const {
    if (auto leaf = binding_.leafIndex(name)) return leaf;
    std::string lowered = io_utils::toLower(name);
    for (int32_t leaf : tree_.leaves()) {
        if (io_utils::toLower(tree_.node(leaf).name) == lowered) return leaf;
    }
    for (int32_t leaf : tree_.leaves()) {
        if (io_utils::containsIgnoreCase(binding_.fullName(leaf), name)) return leaf;
    }
    return std::nullopt;
}

std::vector<SearchResult> TreeSearcher::findCommonAncestor(const std::vector<std::string>& speciesNames) const {
    std::vector<std::string> names;
    std::vector<int32_t> targets;
    for (const auto& raw : speciesNames) {
        std::string name = io_utils::trim(raw);
        if (name.empty()) continue;
        names.push_back(name);
        if (auto leaf = matchLeaf(name)) {
            targets.push_back(*leaf);
        }
    }

    if (targets.size() < 2) {
        logging::debug("Common ancestor: only {} of {} names matched a leaf", targets.size(), names.size());
        return {};
    }

    auto ancestor = tree_.lowestCommonAncestor(targets);
    if (!ancestor) return {};

    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += ", ";
        joined += name;
    }
    return {cladeResult(*ancestor, "Common ancestor of " + joined, std::numeric_limits<size_t>::max())};
}

std::vector<SearchResult> TreeSearcher::searchTree(SearchKind kind, std::string_view query, size_t maxResults) const {
    switch (kind) {
        case SearchKind::Gene:
            return searchByGene(query, maxResults);
        case SearchKind::Species:
            return searchBySpecies(query, maxResults);
        case SearchKind::Clade:
            return searchByClade(query, maxResults);
        case SearchKind::CommonAncestor: {
            std::vector<std::string> names;
            for (auto& field : io_utils::splitFields(query, ',')) {
                names.push_back(io_utils::trim(field));
            }
            return findCommonAncestor(names);
        }
    }
    return {};
}

} // namespace tree_search
