#include "config.hpp"
#include "errors.hpp"
#include "io_utils.hpp"
#include "logging.hpp"

#include <boost/filesystem.hpp>

#include <fstream>
#include <stdexcept>

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace orthotree {

po::options_description engineOptions() {
    po::options_description data("Data Options");
    data.add_options()
        ("table,t", po::value<std::string>(), "Orthogroup table (tab or comma separated, .gz/.xz accepted)")
        ("metadata,m", po::value<std::string>(), "Species metadata table (full name, code)")
        ("tree,n", po::value<std::string>(), "Species tree in Newick format")
        ("delimiter", po::value<std::string>(), "Orthogroup table delimiter: tab|comma|<char>")
        ("metadata-delimiter", po::value<std::string>()->default_value("tab"), "Metadata table delimiter")
        ("metadata-header-lines", po::value<size_t>()->default_value(3),
            "Leading metadata lines to skip");

    po::options_description query("Query Options");
    query.add_options()
        ("max-results", po::value<size_t>()->default_value(50), "Maximum search results (0 = unlimited)")
        ("threads", po::value<int>()->default_value(1), "Number of threads used while loading");

    po::options_description all;
    all.add(data).add(query);
    return all;
}

void storeConfigFile(const std::string& path, const po::options_description& options, po::variables_map& vm) {
    if (!fs::is_regular_file(path)) {
        throw DataNotFoundError(path, "Config file not found");
    }
    std::ifstream in(path);
    if (!in) {
        throw DataNotFoundError(path, "Cannot open config file");
    }
    logging::debug("Reading configuration from {}", path);
    po::store(po::parse_config_file(in, options), vm);
}

char parseDelimiter(const std::string& text) {
    std::string t = io_utils::toLower(text);
    if (t == "tab" || t == "\\t" || t == "\t") return '\t';
    if (t == "comma" || t == ",") return ',';
    if (text.size() == 1) return text[0];
    throw std::invalid_argument("Invalid delimiter '" + text + "'");
}

EngineConfig engineConfigFromVariables(const po::variables_map& vm) {
    EngineConfig cfg;
    if (vm.count("table")) cfg.tablePath = vm["table"].as<std::string>();
    if (vm.count("metadata")) cfg.metadataPath = vm["metadata"].as<std::string>();
    if (vm.count("tree")) cfg.treePath = vm["tree"].as<std::string>();
    if (vm.count("delimiter")) cfg.tableDelimiter = parseDelimiter(vm["delimiter"].as<std::string>());
    if (vm.count("metadata-delimiter")) {
        cfg.metadataDelimiter = parseDelimiter(vm["metadata-delimiter"].as<std::string>());
    }
    if (vm.count("metadata-header-lines")) cfg.metadataHeaderLines = vm["metadata-header-lines"].as<size_t>();
    if (vm.count("max-results")) cfg.defaultMaxResults = vm["max-results"].as<size_t>();

    if (cfg.tablePath.empty()) {
        throw std::invalid_argument("An orthogroup table is required (--table)");
    }
    return cfg;
}

} // namespace orthotree
