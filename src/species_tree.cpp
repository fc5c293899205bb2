#include "species_tree.hpp"
#include "errors.hpp"
#include "io_utils.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <limits>
#include <set>

namespace phylo {

// ============================================================================
// Newick parser - recursive descent, emits nodes in pre-order
// ============================================================================

class SpeciesTree::Parser {
public:
    Parser(const std::string& text, std::vector<TreeNode>& nodes) : s_(text), nodes_(nodes) {}

    void parse() {
        skipFiller();
        if (pos_ >= s_.size() || s_[pos_] == ';') {
            throw orthotree::ParseError("Empty Newick tree", pos_);
        }
        parseSubtree(-1, 0);
        skipFiller();
        if (pos_ < s_.size() && s_[pos_] == ';') {
            pos_++;
            skipFiller();
        }
        if (pos_ < s_.size()) {
            if (s_[pos_] == ')') {
                throw orthotree::ParseError("Unbalanced parentheses in Newick tree", pos_);
            }
            throw orthotree::ParseError("Unexpected characters after end of Newick tree", pos_);
        }
    }

private:
    // Whitespace and [bracketed comments]
    void skipFiller() {
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (std::isspace(static_cast<unsigned char>(c))) {
                pos_++;
            } else if (c == '[') {
                size_t close = s_.find(']', pos_);
                if (close == std::string::npos) {
                    throw orthotree::ParseError("Unterminated comment in Newick tree", pos_);
                }
                pos_ = close + 1;
            } else {
                break;
            }
        }
    }

    int32_t parseSubtree(int32_t parentIdx, size_t depth) {
        if (depth > SpeciesTree::kMaxNestingDepth) {
            throw orthotree::ParseError(
                fmt::format("Newick tree nested deeper than {} levels", SpeciesTree::kMaxNestingDepth), pos_);
        }
        int32_t nodeIdx = static_cast<int32_t>(nodes_.size());
        nodes_.emplace_back();
        nodes_[nodeIdx].parentIndex = parentIdx;

        skipFiller();
        if (pos_ < s_.size() && s_[pos_] == '(') {
            size_t open = pos_++;
            while (true) {
                int32_t childIdx = parseSubtree(nodeIdx, depth + 1);
                nodes_[nodeIdx].childIndices.push_back(childIdx);
                skipFiller();
                if (pos_ >= s_.size()) {
                    throw orthotree::ParseError("Unbalanced parentheses in Newick tree", open);
                }
                if (s_[pos_] == ',') {
                    pos_++;
                    continue;
                }
                if (s_[pos_] == ')') {
                    pos_++;
                    break;
                }
                throw orthotree::ParseError(fmt::format("Expected ',' or ')' but found '{}'", s_[pos_]), pos_);
            }
        }

        skipFiller();
        bool quoted = false;
        std::string label = parseLabel(quoted);
        skipFiller();

        if (pos_ < s_.size() && s_[pos_] == ':') {
            pos_++;
            skipFiller();
            nodes_[nodeIdx].branchLength = parseNumber();
            skipFiller();
        }

        TreeNode& node = nodes_[nodeIdx];
        if (node.isLeaf()) {
            node.name = quoted ? io_utils::trim(label) : label;
        } else if (!label.empty()) {
            std::optional<double> support;
            if (!quoted) support = asNumber(label);
            if (support) {
                node.support = support;
            } else {
                node.name = io_utils::trim(label);
            }
        }
        return nodeIdx;
    }

    std::string parseLabel(bool& quoted) {
        std::string label;
        if (pos_ < s_.size() && (s_[pos_] == '\'' || s_[pos_] == '"')) {
            char quote = s_[pos_];
            size_t open = pos_++;
            quoted = true;
            while (true) {
                if (pos_ >= s_.size()) {
                    throw orthotree::ParseError("Unterminated quoted label in Newick tree", open);
                }
                if (s_[pos_] == quote) {
                    // A doubled quote is a literal quote character
                    if (pos_ + 1 < s_.size() && s_[pos_ + 1] == quote) {
                        label += quote;
                        pos_ += 2;
                        continue;
                    }
                    pos_++;
                    break;
                }
                label += s_[pos_++];
            }
            return label;
        }

        size_t start = pos_;
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c == ':' || c == ',' || c == '(' || c == ')' || c == ';' || c == '[' ||
                std::isspace(static_cast<unsigned char>(c))) {
                break;
            }
            pos_++;
        }
        label = s_.substr(start, pos_ - start);
        return label;
    }

    double parseNumber() {
        const char* begin = s_.c_str() + pos_;
        char* end = nullptr;
        double value = std::strtod(begin, &end);
        if (end == begin) {
            throw orthotree::ParseError("Invalid branch length in Newick tree", pos_);
        }
        pos_ += static_cast<size_t>(end - begin);
        return value;
    }

    static std::optional<double> asNumber(const std::string& label) {
        if (label.empty()) return std::nullopt;
        char* end = nullptr;
        double value = std::strtod(label.c_str(), &end);
        if (end != label.c_str() + label.size()) return std::nullopt;
        return value;
    }

    const std::string& s_;
    std::vector<TreeNode>& nodes_;
    size_t pos_ = 0;
};

// ============================================================================
// SpeciesTree
// ============================================================================

SpeciesTree SpeciesTree::parse(std::string_view newick) {
    SpeciesTree tree;
    tree.newick_ = io_utils::trim(newick);
    Parser parser(tree.newick_, tree.nodes_);
    parser.parse();
    tree.finalize();
    logging::debug("Parsed species tree with {} nodes and {} leaves", tree.size(), tree.leaves_.size());
    return tree;
}

SpeciesTree SpeciesTree::fallback() {
    return parse(kFallbackNewick);
}

void SpeciesTree::finalize() {
    const size_t n = nodes_.size();
    distance_.assign(n, 0.0);
    depth_.assign(n, 0);
    subtreeEnd_.assign(n, 0);
    leafCount_.assign(n, 0);
    leaves_.clear();
    leafIndex_.clear();

    // Parents precede children in pre-order
    for (size_t i = 1; i < n; ++i) {
        int32_t parent = nodes_[i].parentIndex;
        distance_[i] = distance_[parent] + nodes_[i].branchLength;
        depth_[i] = depth_[parent] + 1;
    }

    for (size_t r = n; r-- > 0;) {
        const TreeNode& node = nodes_[r];
        if (node.isLeaf()) {
            subtreeEnd_[r] = static_cast<int32_t>(r + 1);
            leafCount_[r] = 1;
        } else {
            subtreeEnd_[r] = subtreeEnd_[node.childIndices.back()];
            for (int32_t child : node.childIndices) {
                leafCount_[r] += leafCount_[child];
            }
        }
    }

    size_t duplicates = 0;
    for (size_t i = 0; i < n; ++i) {
        if (!nodes_[i].isLeaf()) continue;
        leaves_.push_back(static_cast<int32_t>(i));
        const std::string& name = nodes_[i].name;
        if (name.empty()) continue;
        if (!leafIndex_.try_emplace(name, static_cast<int32_t>(i)).second) {
            duplicates++;
            logging::warn("Duplicate leaf name {} in species tree; using the first occurrence", name);
        }
    }
    if (duplicates > 0) {
        logging::warn("Species tree has {} duplicate leaf names", duplicates);
    }
}

std::vector<std::string> SpeciesTree::leafNames() const {
    std::vector<std::string> names;
    names.reserve(leaves_.size());
    for (int32_t leaf : leaves_) {
        names.push_back(nodes_[leaf].name);
    }
    return names;
}

std::optional<int32_t> SpeciesTree::findLeaf(std::string_view name) const {
    auto it = leafIndex_.find(io_utils::stripQuotes(name));
    if (it == leafIndex_.end()) return std::nullopt;
    return it->second;
}

std::vector<int32_t> SpeciesTree::leavesUnder(int32_t index) const {
    auto first = std::lower_bound(leaves_.begin(), leaves_.end(), index);
    auto last = std::lower_bound(first, leaves_.end(), subtreeEnd_[index]);
    return std::vector<int32_t>(first, last);
}

bool SpeciesTree::isAncestor(int32_t a, int32_t b) const {
    return a <= b && b < subtreeEnd_[a];
}

std::optional<int32_t> SpeciesTree::lowestCommonAncestor(const std::vector<int32_t>& nodes) const {
    if (nodes.empty()) return std::nullopt;
    int32_t lca = nodes.front();
    for (size_t i = 1; i < nodes.size(); ++i) {
        int32_t other = nodes[i];
        while (depth_[lca] > depth_[other]) lca = nodes_[lca].parentIndex;
        while (depth_[other] > depth_[lca]) other = nodes_[other].parentIndex;
        while (lca != other) {
            lca = nodes_[lca].parentIndex;
            other = nodes_[other].parentIndex;
        }
    }
    return lca;
}

LoadedTree loadTree(const std::string& path) {
    TIME_OPERATION("Loading species tree");
    LoadedTree loaded;
    if (path.empty()) {
        logging::warn("No species tree configured; using fallback tree {}", SpeciesTree::kFallbackNewick);
        loaded.tree = SpeciesTree::fallback();
        loaded.degraded = true;
        return loaded;
    }

    try {
        io_utils::InputFile input(path);
        std::string text = io_utils::readAll(input.stream());
        loaded.tree = SpeciesTree::parse(text);
        logging::info("Loaded species tree with {} leaves from {}", loaded.tree.leaves().size(), path);
    } catch (const orthotree::DataNotFoundError& e) {
        logging::warn("Cannot read species tree ({}); using fallback tree {}", e.what(),
                      SpeciesTree::kFallbackNewick);
        loaded.tree = SpeciesTree::fallback();
        loaded.degraded = true;
    } catch (const orthotree::ParseError& e) {
        logging::warn("Cannot parse species tree {}: {}; using fallback tree {}", path, e.what(),
                      SpeciesTree::kFallbackNewick);
        loaded.tree = SpeciesTree::fallback();
        loaded.degraded = true;
    }
    return loaded;
}

// ============================================================================
// Tree analysis
// ============================================================================

TreeStatistics computeStatistics(const SpeciesTree& tree, size_t leafNameLimit) {
    TreeStatistics stats;
    stats.totalNodes = tree.size();
    if (tree.empty()) return stats;

    stats.leafNodes = tree.leaves().size();
    stats.internalNodes = stats.totalNodes - stats.leafNodes;

    double minLength = std::numeric_limits<double>::max();
    double maxLength = std::numeric_limits<double>::lowest();
    size_t branches = 0;
    double supportSum = 0.0;
    size_t supportCount = 0;

    for (int32_t i = 0; i < static_cast<int32_t>(tree.size()); ++i) {
        const TreeNode& node = tree.node(i);
        if (node.isLeaf()) {
            stats.treeHeight = std::max(stats.treeHeight, tree.distanceToRoot(i));
        } else {
            if (node.childIndices.size() != 2) stats.isBinary = false;
            if (node.support) {
                double s = *node.support;
                stats.minSupport = stats.minSupport ? std::min(*stats.minSupport, s) : s;
                stats.maxSupport = stats.maxSupport ? std::max(*stats.maxSupport, s) : s;
                supportSum += s;
                supportCount++;
            }
        }
        if (i != 0) {
            minLength = std::min(minLength, node.branchLength);
            maxLength = std::max(maxLength, node.branchLength);
            stats.totalTreeLength += node.branchLength;
            branches++;
        }
    }

    if (branches > 0) {
        stats.minBranchLength = minLength;
        stats.maxBranchLength = maxLength;
        stats.meanBranchLength = stats.totalTreeLength / static_cast<double>(branches);
    }
    if (supportCount > 0) {
        stats.meanSupport = supportSum / static_cast<double>(supportCount);
    }

    for (int32_t leaf : tree.leaves()) {
        if (stats.leafNames.size() >= leafNameLimit) break;
        stats.leafNames.push_back(tree.node(leaf).name);
    }
    return stats;
}

LeafSetComparison compareLeafSets(const SpeciesTree& first, const SpeciesTree& second) {
    std::set<std::string> a;
    std::set<std::string> b;
    for (int32_t leaf : first.leaves()) a.insert(first.node(leaf).name);
    for (int32_t leaf : second.leaves()) b.insert(second.node(leaf).name);

    LeafSetComparison result;
    result.firstLeafCount = a.size();
    result.secondLeafCount = b.size();
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(result.uniqueToFirst));
    std::set_difference(b.begin(), b.end(), a.begin(), a.end(), std::back_inserter(result.uniqueToSecond));
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(result.common));
    return result;
}

} // namespace phylo
