/**
 * @file main.cpp
 * @brief orthotree - orthology resolution and phylogenetic search
 *
 * Command-line front end for:
 * - Looking up the orthogroup of a gene and the genes of an orthogroup
 * - Resolving species codes to scientific names
 * - Searching the species tree by gene, species, clade or common ancestor
 * - Reporting all orthologues of a gene across species
 */

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/program_options.hpp>
#include <tbb/global_control.h>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "config.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "io_utils.hpp"
#include "logging.hpp"

namespace po = boost::program_options;

// ============================================================================
// Version and Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* PROGRAM_NAME = "orthotree";

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_UNAVAILABLE = 2;

// ANSI color codes for terminal output
namespace color {
    constexpr const char* reset = "\033[0m";
    constexpr const char* bold = "\033[1m";
    constexpr const char* red = "\033[31m";
    constexpr const char* cyan = "\033[36m";
}

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    std::string configFile;
    std::string command;
    std::vector<std::string> args;
    int threads = 1;
    int verbosity = 1;  // 0=quiet, 1=normal, 2=verbose
};

void printUsage() {
    std::cout << color::bold << PROGRAM_NAME << color::reset << " " << VERSION
              << " - orthology resolution and phylogenetic search\n\n";

    std::cout << color::bold << "USAGE:" << color::reset << "\n";
    std::cout << "  " << PROGRAM_NAME << " [OPTIONS] <command> [query...]\n\n";

    std::cout << color::bold << "COMMANDS:" << color::reset << "\n";
    std::cout << "  gene <geneId>              Orthogroup containing a gene\n";
    std::cout << "  orthogroup <id>            Genes per species of an orthogroup\n";
    std::cout << "  species <code>             Scientific name of a species code\n";
    std::cout << "  search <kind> <query>      Tree search; kind = gene|species|clade|common_ancestor\n";
    std::cout << "  orthologues <geneId>       Orthologues of a gene in every species\n";
    std::cout << "  orthogroup-tree <id>       Species tree and species with genes in an orthogroup\n";
    std::cout << "  stats                      Species tree statistics\n";
    std::cout << "  status                     Loaded data summary\n";
    std::cout << "  compare <other.nwk>        Compare leaf sets with another tree\n";
    std::cout << "  shell                      Read commands from stdin ('reload' rebuilds all data)\n\n";

    std::cout << color::bold << "EXAMPLES:" << color::reset << "\n";
    std::cout << "  " << PROGRAM_NAME << " -t Orthogroups.tsv -m species.tsv -n species.nwk gene AT1G01010\n";
    std::cout << "  " << PROGRAM_NAME << " -c orthotree.ini search common_ancestor \"Arabidopsis, Oryza\"\n\n";

    std::cout << color::bold << "OPTIONS:" << color::reset << "\n";
}

// ============================================================================
// Output
// ============================================================================

std::string formatSupport(const std::optional<double>& support) {
    return support ? fmt::format("{:g}", *support) : "-";
}

void printSearchResults(const std::vector<tree_search::SearchResult>& results, std::ostream& out) {
    out << "node_name\tnode_type\tdistance_to_root\tsupport\tspecies_count\tgene_count\tclade_members\n";
    for (const auto& r : results) {
        out << fmt::format("{}\t{}\t{:g}\t{}\t{}\t{}\t{}\n", r.nodeName, tree_search::toString(r.nodeType),
                           r.distanceToRoot, formatSupport(r.supportValue), r.speciesCount, r.geneCount,
                           boost::algorithm::join(r.cladeMembers, "; "));
    }
}

void printStatistics(const phylo::TreeStatistics& s, std::ostream& out) {
    out << "total_nodes\t" << s.totalNodes << "\n";
    out << "leaf_nodes\t" << s.leafNodes << "\n";
    out << "internal_nodes\t" << s.internalNodes << "\n";
    out << fmt::format("tree_height\t{:g}\n", s.treeHeight);
    out << "is_binary\t" << (s.isBinary ? "true" : "false") << "\n";
    out << fmt::format("branch_length\tmin={:g}\tmax={:g}\tmean={:g}\n", s.minBranchLength, s.maxBranchLength,
                       s.meanBranchLength);
    out << fmt::format("total_tree_length\t{:g}\n", s.totalTreeLength);
    out << fmt::format("support\tmin={}\tmax={}\tmean={}\n", formatSupport(s.minSupport),
                       formatSupport(s.maxSupport), formatSupport(s.meanSupport));
    out << "leaf_names\t" << boost::algorithm::join(s.leafNames, ", ") << "\n";
}

void printStatus(const orthotree::EngineStatus& s, std::ostream& out) {
    out << "loaded\t" << (s.loaded ? "true" : "false") << "\n";
    out << "tree_degraded\t" << (s.treeDegraded ? "true" : "false") << "\n";
    out << "leaf_count\t" << s.leafCount << "\n";
    out << "orthogroup_count\t" << s.orthogroupCount << "\n";
    out << "species_count\t" << s.speciesCount << "\n";
    out << "indexed_gene_count\t" << s.indexedGeneCount << "\n";
    out << "mapped_species_count\t" << s.mappedSpeciesCount << "\n";
    out << "fallback_species_count\t" << s.fallbackSpeciesCount << "\n";
    out << "gene_conflicts\t" << s.geneConflicts << "\n";
    out << "skipped_rows\t" << s.skippedRows << "\n";
}

// ============================================================================
// Commands
// ============================================================================

bool requireArgs(const std::vector<std::string>& words, size_t count, const std::string& usage) {
    if (words.size() < count + 1) {
        logging::err("Usage: {}", usage);
        return false;
    }
    return true;
}

std::string joinArgs(const std::vector<std::string>& words, size_t from) {
    std::vector<std::string> rest(words.begin() + static_cast<std::ptrdiff_t>(from), words.end());
    return boost::algorithm::join(rest, " ");
}

int runCommand(orthotree::Engine& engine, const std::vector<std::string>& words, std::ostream& out) {
    const std::string& command = words.front();

    if (command == "gene") {
        if (!requireArgs(words, 1, "gene <geneId>")) return EXIT_ERROR;
        auto orthogroup = engine.findGeneOrthogroup(words[1]);
        if (!orthogroup) {
            logging::warn("Gene {} not found in any orthogroup", words[1]);
            return EXIT_ERROR;
        }
        out << words[1] << "\t" << *orthogroup << "\n";
        return EXIT_OK;
    }

    if (command == "orthogroup") {
        if (!requireArgs(words, 1, "orthogroup <orthogroupId>")) return EXIT_ERROR;
        auto genes = engine.getOrthogroupGenes(words[1]);
        if (genes.empty()) {
            logging::warn("Orthogroup {} not found", words[1]);
            return EXIT_ERROR;
        }
        for (const auto& code : engine.getAllSpeciesCodes()) {
            auto it = genes.find(code);
            if (it == genes.end()) continue;
            out << code << "\t" << boost::algorithm::join(it->second, ", ") << "\n";
        }
        return EXIT_OK;
    }

    if (command == "species") {
        if (!requireArgs(words, 1, "species <code>")) return EXIT_ERROR;
        auto identity = engine.speciesIdentity(words[1]);
        out << words[1] << "\t" << identity.canonicalName << "\t"
            << (identity.isFallback ? "generated" : "metadata") << "\n";
        return EXIT_OK;
    }

    if (command == "search") {
        if (!requireArgs(words, 1, "search <gene|species|clade|common_ancestor> [query]")) return EXIT_ERROR;
        auto kind = tree_search::parseSearchKind(words[1]);
        if (!kind) {
            logging::err("Unknown search kind '{}'", words[1]);
            return EXIT_ERROR;
        }
        printSearchResults(engine.searchTree(*kind, joinArgs(words, 2)), out);
        return EXIT_OK;
    }

    if (command == "orthologues") {
        if (!requireArgs(words, 1, "orthologues <geneId>")) return EXIT_ERROR;
        auto result = engine.searchOrthologues(words[1]);
        if (!result.success) {
            logging::warn(result.message);
            return EXIT_ERROR;
        }
        out << "# " << result.geneId << "\t" << *result.orthogroupId << "\t" << result.message << "\n";
        for (const auto& o : result.orthologues) {
            out << "orthologue\t" << o.geneId << "\t" << o.speciesCode << "\t" << o.speciesName << "\n";
        }
        for (const auto& c : result.countsBySpecies) {
            out << "count\t" << c.speciesCode << "\t" << c.speciesName << "\t" << c.count << "\n";
        }
        out << "tree\t" << result.newickTree << "\n";
        return EXIT_OK;
    }

    if (command == "orthogroup-tree") {
        if (!requireArgs(words, 1, "orthogroup-tree <orthogroupId>")) return EXIT_ERROR;
        auto result = engine.getOrthogroupTree(words[1]);
        if (!result.found) {
            logging::warn("Orthogroup {} not found", result.orthogroupId);
            return EXIT_ERROR;
        }
        out << "orthogroup\t" << result.orthogroupId << "\n";
        out << "species\t" << boost::algorithm::join(result.speciesWithGenes, ", ") << "\n";
        out << "tree\t" << result.newickTree << "\n";
        return EXIT_OK;
    }

    if (command == "stats") {
        printStatistics(engine.treeStatistics(), out);
        return EXIT_OK;
    }

    if (command == "status") {
        engine.ensureLoaded();
        printStatus(engine.status(), out);
        return EXIT_OK;
    }

    if (command == "compare") {
        if (!requireArgs(words, 1, "compare <other.nwk>")) return EXIT_ERROR;
        io_utils::InputFile input(words[1]);
        auto other = phylo::SpeciesTree::parse(io_utils::readAll(input.stream()));
        auto cmp = engine.compareTree(other);
        out << "first_leaf_count\t" << cmp.firstLeafCount << "\n";
        out << "second_leaf_count\t" << cmp.secondLeafCount << "\n";
        out << "common\t" << boost::algorithm::join(cmp.common, ", ") << "\n";
        out << "unique_to_first\t" << boost::algorithm::join(cmp.uniqueToFirst, ", ") << "\n";
        out << "unique_to_second\t" << boost::algorithm::join(cmp.uniqueToSecond, ", ") << "\n";
        return EXIT_OK;
    }

    logging::err("Unknown command '{}'", command);
    return EXIT_ERROR;
}

// One command per line; errors are reported and the loop continues
int runShell(orthotree::Engine& engine, std::istream& in, std::ostream& out) {
    std::string line;
    int lastStatus = EXIT_OK;
    while (io_utils::readLine(in, line)) {
        std::string trimmed = io_utils::trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        std::vector<std::string> words;
        boost::algorithm::split(words, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);

        if (words[0] == "quit" || words[0] == "exit") break;
        try {
            if (words[0] == "reload") {
                engine.reloadAll();
                out << "reloaded\n";
                lastStatus = EXIT_OK;
            } else {
                lastStatus = runCommand(engine, words, out);
            }
        } catch (const orthotree::DataNotFoundError& e) {
            logging::err("Data unavailable: {}", e.what());
            lastStatus = EXIT_UNAVAILABLE;
        } catch (const std::exception& e) {
            logging::err("{}", e.what());
            lastStatus = EXIT_ERROR;
        }
        out.flush();
    }
    return lastStatus;
}

int main(int argc, char** argv) {
    Config cfg;

    // Define options
    po::options_description general("General");
    general.add_options()
        ("help,h", "Show this help message")
        ("version,V", "Show version")
        ("config,c", po::value<std::string>(&cfg.configFile), "INI config file (same keys as the long options)")
        ("verbose,v", po::bool_switch(), "Verbose output")
        ("quiet,q", po::bool_switch(), "Suppress non-essential output");

    po::options_description engineOpts = orthotree::engineOptions();

    po::options_description hidden("Hidden");
    hidden.add_options()
        ("command", po::value<std::string>(&cfg.command), "")
        ("args", po::value<std::vector<std::string>>(&cfg.args), "");

    po::positional_options_description pos;
    pos.add("command", 1).add("args", -1);

    po::options_description all;
    all.add(general).add(engineOpts).add(hidden);

    po::options_description visible;
    visible.add(general).add(engineOpts);

    // Parse
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
            .options(all).positional(pos).run(), vm);
        if (vm.count("config")) {
            orthotree::storeConfigFile(vm["config"].as<std::string>(), engineOpts, vm);
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << color::red << "Error: " << e.what() << color::reset << "\n\n";
        printUsage();
        std::cout << visible << "\n";
        return EXIT_ERROR;
    } catch (const orthotree::DataNotFoundError& e) {
        std::cerr << color::red << "Error: " << e.what() << color::reset << "\n";
        return EXIT_UNAVAILABLE;
    }

    // Handle help/version
    if (vm.count("help") || argc == 1) {
        printUsage();
        std::cout << visible << "\n";
        return EXIT_OK;
    }

    if (vm.count("version")) {
        std::cout << PROGRAM_NAME << " " << VERSION << "\n";
        return EXIT_OK;
    }

    if (cfg.command.empty()) {
        std::cerr << color::red << "Error: a command is required" << color::reset << "\n";
        return EXIT_ERROR;
    }

    // Verbosity
    if (vm["verbose"].as<bool>()) cfg.verbosity = 2;
    if (vm["quiet"].as<bool>()) cfg.verbosity = 0;
    logging::initSpdlog();
    logging::setLoggingLevel(cfg.verbosity == 2   ? logging::LogLevel::VERBOSE
                             : cfg.verbosity == 0 ? logging::LogLevel::QUIET
                                                  : logging::LogLevel::NORMAL);

    cfg.threads = vm["threads"].as<int>();
    if (cfg.threads < 1) {
        std::cerr << color::red << "Error: --threads must be at least 1" << color::reset << "\n";
        return EXIT_ERROR;
    }

    // Initialize threading
    tbb::global_control tbb_ctl(tbb::global_control::max_allowed_parallelism, cfg.threads);

    try {
        orthotree::Engine engine(orthotree::engineConfigFromVariables(vm));
        logging::debug("{}Table:{} {}  {}Metadata:{} {}  {}Tree:{} {}", color::cyan, color::reset,
                       engine.config().tablePath, color::cyan, color::reset, engine.config().metadataPath,
                       color::cyan, color::reset, engine.config().treePath);

        if (cfg.command == "shell") {
            return runShell(engine, std::cin, std::cout);
        }

        std::vector<std::string> words{cfg.command};
        words.insert(words.end(), cfg.args.begin(), cfg.args.end());
        return runCommand(engine, words, std::cout);

    } catch (const orthotree::DataNotFoundError& e) {
        logging::err("Data unavailable: {}", e.what());
        return EXIT_UNAVAILABLE;
    } catch (const std::exception& e) {
        logging::err("Fatal error: {}", e.what());
        return EXIT_ERROR;
    }
}
