#pragma once

#include <boost/filesystem.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <fstream>
#include <stdexcept>
#include <string>

namespace test_fixtures {

namespace fs = boost::filesystem;

// Orthogroups used across the suites: OG001 has no Zm genes, OG002 no At genes
inline const std::string kTable =
    "Orthogroup\tAt\tOs\tZm\n"
    "OG001\tAT1, AT2\tOS1\t\n"
    "OG002\t\tOS2\tZM1, ZM2\n";

// Two description lines and a column header precede the data
inline const std::string kMetadata =
    "# Species metadata\n"
    "# Columns: scientific name, code\n"
    "Species\tCode\n"
    "Arabidopsis thaliana\tAt\n"
    "Oryza sativa\tOs\n";

inline const std::string kTree = "((At:1,Os:2)90:1,Zm:3);";

/**
 * @brief Scratch directory removed with the fixture
 */
struct TempDir {
    fs::path root;

    TempDir() : root(fs::temp_directory_path() / fs::unique_path("orthotree-test-%%%%-%%%%-%%%%")) {
        fs::create_directories(root);
    }

    ~TempDir() {
        boost::system::error_code ec;
        fs::remove_all(root, ec);
    }

    std::string path(const std::string& name) const { return (root / name).string(); }

    std::string write(const std::string& name, const std::string& content) const {
        std::string p = path(name);
        std::ofstream out(p, std::ios::binary);
        if (!out) throw std::runtime_error("Cannot write test file " + p);
        out << content;
        return p;
    }

    std::string writeGzip(const std::string& name, const std::string& content) const {
        std::string p = path(name);
        std::ofstream file(p, std::ios::binary);
        if (!file) throw std::runtime_error("Cannot write test file " + p);
        boost::iostreams::filtering_ostream out;
        out.push(boost::iostreams::gzip_compressor());
        out.push(file);
        out << content;
        out.reset();
        return p;
    }
};

} // namespace test_fixtures
