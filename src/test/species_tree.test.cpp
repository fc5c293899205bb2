#include <boost/test/unit_test.hpp>

#include "test_fixtures.hpp"
#include "../errors.hpp"
#include "../species_tree.hpp"

using phylo::SpeciesTree;

BOOST_AUTO_TEST_SUITE(NewickParserTests)

BOOST_AUTO_TEST_CASE(test_preorder_layout) {
    auto tree = SpeciesTree::parse("(A:1,(B:1,C:1):1);");

    BOOST_TEST(tree.size() == 5u);
    BOOST_TEST((tree.leafNames() == std::vector<std::string>{"A", "B", "C"}));
    BOOST_TEST(tree.node(0).parentIndex == -1);
    BOOST_TEST(tree.node(2).parentIndex == 0);
    BOOST_TEST((tree.node(2).childIndices == std::vector<int32_t>{3, 4}));
    BOOST_TEST(tree.distanceToRoot(0) == 0.0);
    BOOST_TEST(tree.distanceToRoot(3) == 2.0);
    BOOST_TEST(tree.depth(4) == 2);
    BOOST_TEST(tree.newick() == "(A:1,(B:1,C:1):1);");
}

BOOST_AUTO_TEST_CASE(test_support_values_and_labels) {
    auto tree = SpeciesTree::parse("((A,B)95:0.5,(C,D)Rosids:0.2)root;");

    BOOST_TEST(tree.node(1).support.value_or(-1) == 95.0);
    BOOST_TEST(tree.node(1).name.empty());
    BOOST_TEST(tree.node(4).name == "Rosids");
    BOOST_TEST(!tree.node(4).support.has_value());
    BOOST_TEST(tree.node(0).name == "root");
}

BOOST_AUTO_TEST_CASE(test_quotes_comments_and_whitespace) {
    auto tree = SpeciesTree::parse(" ( 'Arabidopsis thaliana' : 1.5 [&&NHX:S=At], \"Os\":2e-1 ) \n");

    BOOST_TEST((tree.leafNames() == std::vector<std::string>{"Arabidopsis thaliana", "Os"}));
    BOOST_TEST(tree.distanceToRoot(1) == 1.5);
    BOOST_TEST(tree.distanceToRoot(2) == 0.2, boost::test_tools::tolerance(1e-12));
    BOOST_TEST(tree.findLeaf("Os").value_or(-1) == 2);
    BOOST_TEST(tree.findLeaf("'Os'").value_or(-1) == 2);
}

BOOST_AUTO_TEST_CASE(test_quoted_numeric_internal_label_is_a_name) {
    auto tree = SpeciesTree::parse("((A,B)'42');");
    BOOST_TEST(tree.node(1).name == "42");
    BOOST_TEST(!tree.node(1).support.has_value());
}

BOOST_AUTO_TEST_CASE(test_malformed_input) {
    for (const std::string bad : {"", "   ", ";", "((A,B);", "(A,B));", "(A,B", "(A,B)C;x", "(A:abc,B);",
                                  "('A,B);", "(A[comment,B);"}) {
        BOOST_TEST_MESSAGE("Parsing '" << bad << "'");
        BOOST_CHECK_THROW(SpeciesTree::parse(bad), orthotree::ParseError);
    }
}

BOOST_AUTO_TEST_CASE(test_nesting_depth_limit) {
    auto ladder = [](size_t levels) {
        return std::string(levels, '(') + "A" + std::string(levels, ')') + ";";
    };

    auto deepest = SpeciesTree::parse(ladder(SpeciesTree::kMaxNestingDepth));
    BOOST_TEST(deepest.leaves().size() == 1u);
    BOOST_TEST(deepest.depth(deepest.leaves().front()) == static_cast<int32_t>(SpeciesTree::kMaxNestingDepth));

    BOOST_CHECK_THROW(SpeciesTree::parse(ladder(SpeciesTree::kMaxNestingDepth + 1)), orthotree::ParseError);
    BOOST_CHECK_THROW(SpeciesTree::parse(ladder(50000)), orthotree::ParseError);
}

BOOST_AUTO_TEST_CASE(test_single_leaf_tree) {
    auto tree = SpeciesTree::parse("A;");
    BOOST_TEST(tree.size() == 1u);
    BOOST_TEST(tree.node(0).isLeaf());
    BOOST_TEST(tree.leafCountUnder(0) == 1u);
}

BOOST_AUTO_TEST_CASE(test_duplicate_leaf_names_first_wins) {
    auto tree = SpeciesTree::parse("(A,A,B);");
    BOOST_TEST(tree.leaves().size() == 3u);
    BOOST_TEST(tree.findLeaf("A").value_or(-1) == 1);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TreeStructureTests)

BOOST_AUTO_TEST_CASE(test_subtree_ranges) {
    auto tree = SpeciesTree::parse("(A:1,(B:1,C:1):1);");
    BOOST_TEST((tree.leavesUnder(2) == std::vector<int32_t>{3, 4}));
    BOOST_TEST((tree.leavesUnder(0) == std::vector<int32_t>{1, 3, 4}));
    BOOST_TEST((tree.leavesUnder(1) == std::vector<int32_t>{1}));
    BOOST_TEST(tree.leafCountUnder(0) == 3u);
    BOOST_TEST(tree.leafCountUnder(2) == 2u);
}

BOOST_AUTO_TEST_CASE(test_ancestry) {
    auto tree = SpeciesTree::parse("(A:1,(B:1,C:1):1);");
    BOOST_TEST(tree.isAncestor(0, 4));
    BOOST_TEST(tree.isAncestor(2, 4));
    BOOST_TEST(tree.isAncestor(3, 3));
    BOOST_TEST(!tree.isAncestor(1, 3));
    BOOST_TEST(!tree.isAncestor(4, 2));

    BOOST_TEST(tree.lowestCommonAncestor({3, 4}).value_or(-1) == 2);
    BOOST_TEST(tree.lowestCommonAncestor({1, 3}).value_or(-1) == 0);
    // One node is an ancestor of the other: the ancestor itself
    BOOST_TEST(tree.lowestCommonAncestor({2, 3}).value_or(-1) == 2);
    BOOST_TEST(tree.lowestCommonAncestor({4, 4}).value_or(-1) == 4);
    BOOST_TEST(!tree.lowestCommonAncestor({}).has_value());
}

BOOST_AUTO_TEST_CASE(test_statistics) {
    auto stats = phylo::computeStatistics(SpeciesTree::parse("((A:1,B:2)90:1,C:4)80;"));

    BOOST_TEST(stats.totalNodes == 5u);
    BOOST_TEST(stats.leafNodes == 3u);
    BOOST_TEST(stats.internalNodes == 2u);
    BOOST_TEST(stats.treeHeight == 4.0);
    BOOST_TEST(stats.isBinary);
    BOOST_TEST(stats.minBranchLength == 1.0);
    BOOST_TEST(stats.maxBranchLength == 4.0);
    BOOST_TEST(stats.totalTreeLength == 8.0);
    BOOST_TEST(stats.meanBranchLength == 2.0);
    BOOST_TEST(stats.minSupport.value_or(0) == 80.0);
    BOOST_TEST(stats.maxSupport.value_or(0) == 90.0);
    BOOST_TEST(stats.meanSupport.value_or(0) == 85.0);
    BOOST_TEST((stats.leafNames == std::vector<std::string>{"A", "B", "C"}));

    auto polytomy = phylo::computeStatistics(SpeciesTree::parse("(A,B,C);"));
    BOOST_TEST(!polytomy.isBinary);
    BOOST_TEST(!polytomy.meanSupport.has_value());
}

BOOST_AUTO_TEST_CASE(test_leaf_name_limit) {
    auto stats = phylo::computeStatistics(SpeciesTree::parse("(a,b,c,d,e,f,g,h,i,j,k,l);"));
    BOOST_TEST(stats.leafNodes == 12u);
    BOOST_TEST(stats.leafNames.size() == 10u);
}

BOOST_AUTO_TEST_CASE(test_compare_leaf_sets) {
    auto cmp = phylo::compareLeafSets(SpeciesTree::parse("(C,(A,B));"), SpeciesTree::parse("(B,(D,C));"));
    BOOST_TEST((cmp.uniqueToFirst == std::vector<std::string>{"A"}));
    BOOST_TEST((cmp.uniqueToSecond == std::vector<std::string>{"D"}));
    BOOST_TEST((cmp.common == std::vector<std::string>{"B", "C"}));
    BOOST_TEST(cmp.firstLeafCount == 3u);
    BOOST_TEST(cmp.secondLeafCount == 3u);
}

BOOST_AUTO_TEST_CASE(test_load_tree_falls_back) {
    test_fixtures::TempDir dir;

    auto missing = phylo::loadTree(dir.path("missing.nwk"));
    BOOST_TEST(missing.degraded);
    BOOST_TEST((missing.tree.leafNames() == std::vector<std::string>{"A", "B"}));
    BOOST_TEST(missing.tree.newick() == std::string(SpeciesTree::kFallbackNewick));

    auto broken = phylo::loadTree(dir.write("broken.nwk", "((At,Os);"));
    BOOST_TEST(broken.degraded);
    BOOST_TEST(broken.tree.leaves().size() == 2u);

    auto deep = phylo::loadTree(dir.write("deep.nwk", std::string(50000, '(') + "A" + std::string(50000, ')') + ";"));
    BOOST_TEST(deep.degraded);
    BOOST_TEST(deep.tree.newick() == std::string(SpeciesTree::kFallbackNewick));

    auto good = phylo::loadTree(dir.write("good.nwk", test_fixtures::kTree + "\n"));
    BOOST_TEST(!good.degraded);
    BOOST_TEST(good.tree.leaves().size() == 3u);
    BOOST_TEST(good.tree.newick() == test_fixtures::kTree);
}

BOOST_AUTO_TEST_SUITE_END()
