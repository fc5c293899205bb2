#pragma once

#include <absl/container/flat_hash_map.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace phylo {

struct TreeNode {
    std::string name;  // leaf species code or internal clade label
    int32_t parentIndex = -1;  // -1 means root
    std::vector<int32_t> childIndices;
    double branchLength = 0.0;
    std::optional<double> support;

    bool isLeaf() const { return childIndices.empty(); }
};

/**
 * @brief Immutable rooted species tree stored as a flat pre-order node array
 *
 * Node 0 is the root. Every subtree occupies a contiguous index range
 * [i, subtreeEnd(i)), so descendant queries are range scans.
 */
class SpeciesTree {
public:
    // Tree used when the configured tree cannot be read or parsed
    static constexpr std::string_view kFallbackNewick = "(A:1,B:1);";
    // Deeper clade nesting is rejected as a ParseError
    static constexpr size_t kMaxNestingDepth = 10000;

    SpeciesTree() = default;

    /**
     * @brief Parse a Newick string
     *
     * Supports nested clades, quoted labels, branch lengths, bracketed
     * comments and an optional trailing ';'. A numeric internal label is
     * read as a support value, any other internal label as the clade name.
     *
     * @throws orthotree::ParseError on malformed input
     */
    static SpeciesTree parse(std::string_view newick);

    static SpeciesTree fallback();

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }
    const TreeNode& node(int32_t index) const { return nodes_[index]; }
    const std::vector<TreeNode>& nodes() const { return nodes_; }

    // Source text the tree was parsed from
    const std::string& newick() const { return newick_; }

    // Leaf node indices in pre-order
    const std::vector<int32_t>& leaves() const { return leaves_; }
    std::vector<std::string> leafNames() const;
    std::optional<int32_t> findLeaf(std::string_view name) const;

    // Sum of branch lengths from the root to a node, excluding the root's own
    double distanceToRoot(int32_t index) const { return distance_[index]; }
    int32_t depth(int32_t index) const { return depth_[index]; }
    int32_t subtreeEnd(int32_t index) const { return subtreeEnd_[index]; }

    std::vector<int32_t> leavesUnder(int32_t index) const;
    size_t leafCountUnder(int32_t index) const { return leafCount_[index]; }

    // True when a == b or a lies on the path from b to the root
    bool isAncestor(int32_t a, int32_t b) const;

    std::optional<int32_t> lowestCommonAncestor(const std::vector<int32_t>& nodes) const;

private:
    class Parser;

    void finalize();

    std::string newick_;
    std::vector<TreeNode> nodes_;
    std::vector<double> distance_;
    std::vector<int32_t> depth_;
    std::vector<int32_t> subtreeEnd_;
    std::vector<size_t> leafCount_;
    std::vector<int32_t> leaves_;
    absl::flat_hash_map<std::string, int32_t> leafIndex_;
};

struct LoadedTree {
    SpeciesTree tree;
    bool degraded = false;  // fallback tree in use
};

/**
 * @brief Read and parse a Newick file
 *
 * Any read or parse failure is logged and answered with the fallback tree,
 * flagged as degraded.
 */
LoadedTree loadTree(const std::string& path);

struct TreeStatistics {
    size_t totalNodes = 0;
    size_t leafNodes = 0;
    size_t internalNodes = 0;
    double treeHeight = 0.0;  // largest root-to-leaf distance
    bool isBinary = true;
    double minBranchLength = 0.0;
    double maxBranchLength = 0.0;
    double meanBranchLength = 0.0;
    double totalTreeLength = 0.0;
    std::optional<double> minSupport;
    std::optional<double> maxSupport;
    std::optional<double> meanSupport;
    std::vector<std::string> leafNames;  // first few leaves in pre-order
};

TreeStatistics computeStatistics(const SpeciesTree& tree, size_t leafNameLimit = 10);

struct LeafSetComparison {
    std::vector<std::string> uniqueToFirst;
    std::vector<std::string> uniqueToSecond;
    std::vector<std::string> common;
    size_t firstLeafCount = 0;
    size_t secondLeafCount = 0;
};

// Sorted leaf-name set differences between two trees
LeafSetComparison compareLeafSets(const SpeciesTree& first, const SpeciesTree& second);

} // namespace phylo
