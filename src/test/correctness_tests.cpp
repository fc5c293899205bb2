/**
 * @file correctness_tests.cpp
 * @brief End-to-end tests of the orthology engine over files on disk
 *
 * Tests cover:
 * 1. Orthologue reports, including species with no genes in the orthogroup
 * 2. Lazy loading, retry after a missing table, and full reload
 * 3. Fallback tree and generated species names when sources are missing
 * 4. Configuration from the command line and INI files
 */

#define BOOST_TEST_MODULE OrthotreeCorrectnessTests
#include <boost/test/unit_test.hpp>

#include <memory>

#include "test_fixtures.hpp"
#include "../config.hpp"
#include "../engine.hpp"
#include "../errors.hpp"

using test_fixtures::TempDir;

namespace po = boost::program_options;

// ============================================================================
// Test Fixture - scenario files in a scratch directory
// ============================================================================

struct EngineFixture {
    TempDir dir;
    orthotree::EngineConfig config;

    EngineFixture() {
        config.tablePath = dir.write("Orthogroups.tsv", test_fixtures::kTable);
        config.metadataPath = dir.write("species.tsv", test_fixtures::kMetadata);
        config.treePath = dir.write("species.nwk", test_fixtures::kTree);
    }
};

BOOST_FIXTURE_TEST_SUITE(OrthologueReportTests, EngineFixture)

BOOST_AUTO_TEST_CASE(test_orthologues_include_zero_counts) {
    orthotree::Engine engine(config);
    auto result = engine.searchOrthologues("AT1");

    BOOST_REQUIRE(result.success);
    BOOST_TEST(result.orthogroupId.value_or("") == "OG001");
    BOOST_TEST(result.message == "found 2 orthologues");
    BOOST_TEST(result.newickTree == test_fixtures::kTree);

    BOOST_REQUIRE(result.orthologues.size() == 2u);
    BOOST_TEST(result.orthologues[0].geneId == "AT2");
    BOOST_TEST(result.orthologues[0].speciesName == "Arabidopsis thaliana");
    BOOST_TEST(result.orthologues[1].geneId == "OS1");
    BOOST_TEST(result.orthologues[1].speciesCode == "Os");
    BOOST_TEST(result.orthologues[1].orthogroupId == "OG001");

    BOOST_REQUIRE(result.countsBySpecies.size() == 3u);
    BOOST_TEST(result.countsBySpecies[0].count == 2u);
    BOOST_TEST(result.countsBySpecies[1].count == 1u);
    BOOST_TEST(result.countsBySpecies[2].speciesCode == "Zm");
    BOOST_TEST(result.countsBySpecies[2].speciesName == "Zea sp. (Zm)");
    BOOST_TEST(result.countsBySpecies[2].count == 0u);
}

BOOST_AUTO_TEST_CASE(test_unknown_gene_is_not_an_error) {
    orthotree::Engine engine(config);
    auto result = engine.searchOrthologues("  MISSING1 ");
    BOOST_TEST(!result.success);
    BOOST_TEST(result.geneId == "MISSING1");
    BOOST_TEST(result.message == "gene MISSING1 not found in any orthogroup");
    BOOST_TEST(result.orthologues.empty());
    BOOST_TEST(!result.orthogroupId.has_value());
}

BOOST_AUTO_TEST_CASE(test_orthogroup_queries) {
    orthotree::Engine engine(config);
    BOOST_TEST(engine.findGeneOrthogroup("AT1").value_or("") == "OG001");
    orthogroups::SpeciesGenes expected{{"At", {"AT1", "AT2"}}, {"Os", {"OS1"}}};
    BOOST_TEST((engine.getOrthogroupGenes("OG001") == expected));
    BOOST_TEST(engine.getOrthogroupGenes("OG404").empty());

    auto tree = engine.getOrthogroupTree("OG002");
    BOOST_TEST(tree.found);
    BOOST_TEST((tree.speciesWithGenes == std::vector<std::string>{"Os", "Zm"}));
    BOOST_TEST(tree.newickTree == test_fixtures::kTree);

    auto unknown = engine.getOrthogroupTree("OG404");
    BOOST_TEST(!unknown.found);
    BOOST_TEST(unknown.speciesWithGenes.empty());
}

BOOST_AUTO_TEST_CASE(test_species_names_and_search) {
    orthotree::Engine engine(config);
    BOOST_TEST(engine.resolveSpeciesName("Os") == "Oryza sativa");
    BOOST_TEST(engine.resolveSpeciesName("Osj") == "Oryza sativa (variant Osj)");
    BOOST_TEST(engine.speciesIdentity("Zm").isFallback);
    BOOST_TEST(!engine.resolveSpeciesName("never-seen").empty());

    auto leaves = engine.searchTree(tree_search::SearchKind::Species, "");
    BOOST_TEST(leaves.size() == 3u);
    auto byGene = engine.searchTree(tree_search::SearchKind::Gene, "ZM1");
    BOOST_REQUIRE(byGene.size() == 2u);
    BOOST_TEST(byGene[1].nodeName == "Zea sp. (Zm)");
    BOOST_TEST(byGene[1].geneCount == 2);
}

BOOST_AUTO_TEST_CASE(test_default_max_results) {
    config.defaultMaxResults = 1;
    orthotree::Engine engine(config);
    BOOST_TEST(engine.searchTree(tree_search::SearchKind::Species, "").size() == 1u);
    BOOST_TEST(engine.searchTree(tree_search::SearchKind::Species, "", 0).size() == 3u);
}

BOOST_AUTO_TEST_CASE(test_statistics_and_status) {
    orthotree::Engine engine(config);
    BOOST_TEST(!engine.status().loaded);

    auto stats = engine.treeStatistics();
    BOOST_TEST(stats.leafNodes == 3u);
    BOOST_TEST(stats.treeHeight == 3.0);

    auto status = engine.status();
    BOOST_TEST(status.loaded);
    BOOST_TEST(!status.treeDegraded);
    BOOST_TEST(status.leafCount == 3u);
    BOOST_TEST(status.orthogroupCount == 2u);
    BOOST_TEST(status.speciesCount == 3u);
    BOOST_TEST(status.indexedGeneCount == 5u);
    BOOST_TEST(status.mappedSpeciesCount == 2u);
    BOOST_TEST(status.fallbackSpeciesCount == 1u);
    BOOST_TEST(status.geneConflicts == 0u);
    BOOST_TEST(status.skippedRows == 0u);
}

BOOST_AUTO_TEST_CASE(test_compare_tree) {
    orthotree::Engine engine(config);
    auto cmp = engine.compareTree(phylo::SpeciesTree::parse("(Os,(Zm,Sb));"));
    BOOST_TEST((cmp.common == std::vector<std::string>{"Os", "Zm"}));
    BOOST_TEST((cmp.uniqueToFirst == std::vector<std::string>{"At"}));
    BOOST_TEST((cmp.uniqueToSecond == std::vector<std::string>{"Sb"}));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Loading lifecycle
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(EngineLifecycleTests, EngineFixture)

BOOST_AUTO_TEST_CASE(test_missing_table_is_retried) {
    config.tablePath = dir.path("late.tsv");
    orthotree::Engine engine(config);

    BOOST_CHECK_THROW(engine.ensureLoaded(), orthotree::DataNotFoundError);
    BOOST_CHECK_THROW(engine.findGeneOrthogroup("AT1"), orthotree::DataNotFoundError);
    BOOST_TEST(!engine.status().loaded);

    dir.write("late.tsv", test_fixtures::kTable);
    BOOST_TEST(engine.findGeneOrthogroup("AT1").value_or("") == "OG001");
    BOOST_TEST(engine.status().loaded);
}

BOOST_AUTO_TEST_CASE(test_missing_tree_uses_fallback) {
    config.treePath = dir.path("absent.nwk");
    orthotree::Engine engine(config);

    BOOST_TEST(engine.newickTree() == "(A:1,B:1);");
    auto status = engine.status();
    BOOST_TEST(status.treeDegraded);
    BOOST_TEST(status.leafCount == 2u);
    // Table queries are unaffected
    BOOST_TEST(engine.findGeneOrthogroup("ZM2").value_or("") == "OG002");
}

BOOST_AUTO_TEST_CASE(test_unparsable_tree_uses_fallback) {
    config.treePath = dir.write("broken.nwk", "((At:1,Os:2);");
    orthotree::Engine engine(config);
    engine.ensureLoaded();
    BOOST_TEST(engine.status().treeDegraded);
    BOOST_TEST(engine.searchTree(tree_search::SearchKind::Species, "").size() == 2u);
}

BOOST_AUTO_TEST_CASE(test_missing_metadata_is_not_fatal) {
    config.metadataPath = dir.path("absent.tsv");
    orthotree::Engine engine(config);
    BOOST_TEST(engine.resolveSpeciesName("Os") == "Oryza sp. (Os)");
    BOOST_TEST(engine.status().mappedSpeciesCount == 0u);
    BOOST_TEST(engine.status().fallbackSpeciesCount == 3u);
}

BOOST_AUTO_TEST_CASE(test_reload_swaps_snapshot) {
    orthotree::Engine engine(config);
    auto before = engine.snapshot();
    BOOST_TEST(!engine.findGeneOrthogroup("NEW1").has_value());

    dir.write("Orthogroups.tsv", test_fixtures::kTable + "OG003\tNEW1\t\t\n");
    // No reload yet: the loaded table is kept
    BOOST_TEST(!engine.findGeneOrthogroup("NEW1").has_value());

    engine.reload();
    BOOST_TEST(engine.findGeneOrthogroup("NEW1").value_or("") == "OG003");
    BOOST_TEST(engine.status().orthogroupCount == 3u);
    // Holders of the previous snapshot still see the old data
    BOOST_TEST(before->table->size() == 2u);
    BOOST_TEST(engine.snapshot() != before);
}

BOOST_AUTO_TEST_CASE(test_compressed_table) {
    config.tablePath = dir.writeGzip("Orthogroups.tsv.gz", test_fixtures::kTable);
    orthotree::Engine engine(config);
    BOOST_TEST(engine.findGeneOrthogroup("OS2").value_or("") == "OG002");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Configuration
// ============================================================================

BOOST_AUTO_TEST_SUITE(ConfigurationTests)

BOOST_AUTO_TEST_CASE(test_command_line_overrides_config_file) {
    TempDir dir;
    std::string ini = dir.write("orthotree.ini",
                                "table = /data/Orthogroups.tsv\n"
                                "tree = /data/species.nwk\n"
                                "max-results = 7\n"
                                "metadata-header-lines = 1\n");

    const char* argv[] = {"orthotree", "--max-results", "3", "--metadata", "meta.tsv"};
    auto options = orthotree::engineOptions();
    po::variables_map vm;
    po::store(po::parse_command_line(5, argv, options), vm);
    orthotree::storeConfigFile(ini, options, vm);
    po::notify(vm);

    auto config = orthotree::engineConfigFromVariables(vm);
    BOOST_TEST(config.tablePath == "/data/Orthogroups.tsv");
    BOOST_TEST(config.treePath == "/data/species.nwk");
    BOOST_TEST(config.metadataPath == "meta.tsv");
    BOOST_TEST(config.defaultMaxResults == 3u);
    BOOST_TEST(config.metadataHeaderLines == 1u);
    BOOST_TEST(!config.tableDelimiter.has_value());
    BOOST_TEST(config.metadataDelimiter == '\t');
}

BOOST_AUTO_TEST_CASE(test_config_errors) {
    TempDir dir;
    auto options = orthotree::engineOptions();
    po::variables_map vm;
    BOOST_CHECK_THROW(orthotree::storeConfigFile(dir.path("none.ini"), options, vm), orthotree::DataNotFoundError);

    std::string bad = dir.write("bad.ini", "colour = blue\n");
    BOOST_CHECK_THROW(orthotree::storeConfigFile(bad, options, vm), po::error);

    po::variables_map empty;
    po::store(po::parse_command_line(1, std::vector<const char*>{"orthotree"}.data(), options), empty);
    po::notify(empty);
    BOOST_CHECK_THROW(orthotree::engineConfigFromVariables(empty), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_delimiters) {
    BOOST_TEST(orthotree::parseDelimiter("tab") == '\t');
    BOOST_TEST(orthotree::parseDelimiter("\\t") == '\t');
    BOOST_TEST(orthotree::parseDelimiter("Comma") == ',');
    BOOST_TEST(orthotree::parseDelimiter(";") == ';');
    BOOST_CHECK_THROW(orthotree::parseDelimiter("ab"), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
