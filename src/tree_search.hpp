#pragma once

#include "leaf_binding.hpp"
#include "species_tree.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orthogroups {
class OrthogroupTable;
}

namespace tree_search {

enum class SearchKind { Gene, Species, Clade, CommonAncestor };
enum class NodeType { Leaf, Internal };

// Accepts "gene", "species", "clade" and "common_ancestor"
std::optional<SearchKind> parseSearchKind(std::string_view kind);
std::string_view toString(SearchKind kind);
std::string_view toString(NodeType type);

// 0 means no limit
inline constexpr size_t kDefaultMaxResults = 50;

// Clade results list at most this many member names
inline constexpr size_t kMaxCladeMembers = 10;

struct SearchResult {
    std::string nodeName;
    NodeType nodeType = NodeType::Leaf;
    double distanceToRoot = 0.0;
    std::optional<double> supportValue;
    size_t speciesCount = 0;
    int64_t geneCount = 0;
    std::vector<std::string> cladeMembers;
};

/**
 * @brief Read-only structural queries over a bound species tree
 *
 * All searches are total: unknown genes, unmatched queries and unresolvable
 * species yield an empty result list.
 */
class TreeSearcher {
public:
    TreeSearcher(const phylo::SpeciesTree& tree, const phylo::LeafBinding& binding,
                 const orthogroups::OrthogroupTable& table);

    /**
     * @brief Leaves of the species that have genes in the gene's orthogroup
     *
     * Species follow table column order; gene_count is the number of genes the
     * species has in that orthogroup. Species without a tree leaf are skipped.
     */
    std::vector<SearchResult> searchByGene(std::string_view geneId, size_t maxResults = kDefaultMaxResults) const;

    // Case-insensitive match against leaf codes and resolved names; empty query matches all leaves
    std::vector<SearchResult> searchBySpecies(std::string_view query, size_t maxResults = kDefaultMaxResults) const;

    // Internal nodes whose space-joined descendant names contain the query
    std::vector<SearchResult> searchByClade(std::string_view query, size_t maxResults = kDefaultMaxResults) const;

    /**
     * @brief Lowest common ancestor of the leaves matching each name
     *
     * Each name picks the leaf whose species code equals it (ignoring case),
     * otherwise the first leaf (pre-order) whose full name contains it.
     * Fewer than two matched names give no result.
     */
    std::vector<SearchResult> findCommonAncestor(const std::vector<std::string>& speciesNames) const;

    // Dispatch by kind; for CommonAncestor the query is a comma-separated name list
    std::vector<SearchResult> searchTree(SearchKind kind, std::string_view query,
                                         size_t maxResults = kDefaultMaxResults) const;

private:
    SearchResult leafResult(int32_t leaf, int64_t geneCount) const;
    SearchResult cladeResult(int32_t node, std::string nodeName, size_t memberLimit) const;
    std::optional<int32_t> matchLeaf(const std::string& name) const;

    const phylo::SpeciesTree& tree_;
    const phylo::LeafBinding& binding_;
    const orthogroups::OrthogroupTable& table_;
};

} // namespace tree_search
