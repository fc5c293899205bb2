#pragma once

/**
 * @file orthogroup_table.hpp
 * @brief Orthogroup × species gene table and the gene → orthogroup index
 *
 * The table is read once from an OrthoFinder-style delimited file:
 *
 *   Orthogroup  At              Os     Zm
 *   OG0000001   AT1G01, AT1G02  OS01
 *
 * The first column holds the orthogroup id, every further column is a species
 * code, and each cell is a comma-separated gene list (possibly empty). Rows are
 * stored with one gene list per species column, aligned with getAllSpeciesCodes().
 */

#include <absl/container/flat_hash_map.h>

#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace orthogroups {

using GeneList = std::vector<std::string>;

// Species code -> genes, only for species with at least one gene
using SpeciesGenes = std::map<std::string, GeneList>;

struct OrthogroupRow {
    std::string orthogroupId;
    std::vector<GeneList> cells;  // one entry per species column
};

struct TableOptions {
    // Field delimiter; derived from the file extension when unset
    std::optional<char> delimiter;
};

// Gene id -> row position in the table
using GeneIndex = absl::flat_hash_map<std::string, uint32_t>;

struct GeneIndexBuild {
    GeneIndex index;
    size_t geneMentions = 0;
    size_t conflicts = 0;  // genes seen under more than one orthogroup
};

/**
 * @brief Map every gene id of every cell to the row that holds it
 *
 * A gene appearing in several rows ends up mapped to the last one; each such
 * reassignment is counted and logged.
 */
GeneIndexBuild buildGeneIndex(const std::vector<OrthogroupRow>& rows);

// Split a cell on commas, trimming whitespace and dropping empty tokens
GeneList splitGenes(std::string_view cell);

class OrthogroupTable {
public:
    OrthogroupTable(std::vector<std::string> speciesCodes, std::vector<OrthogroupRow> rows);

    OrthogroupTable(const OrthogroupTable&) = delete;
    OrthogroupTable& operator=(const OrthogroupTable&) = delete;

    /**
     * @brief Load a table from disk (.gz and .xz are decompressed)
     *
     * @throws orthotree::DataNotFoundError if the file is missing, unreadable or has no header
     */
    static std::unique_ptr<OrthogroupTable> load(const std::string& path, const TableOptions& options = {});

    /**
     * @brief Parse a table from a stream; malformed rows are skipped and logged
     */
    static std::unique_ptr<OrthogroupTable> parse(std::istream& in, char delimiter,
                                                  const std::string& sourceName = "<stream>");

    /**
     * @brief Orthogroup containing a gene
     *
     * Index lookup first, then a full scan of all cells. A gene found by the
     * scan is added to the index so the next lookup is O(1).
     */
    std::optional<std::string> findGeneOrthogroup(std::string_view geneId) const;

    // Genes per species of one orthogroup; empty for unknown ids
    SpeciesGenes getOrthogroupGenes(const std::string& orthogroupId) const;

    const std::vector<std::string>& getAllSpeciesCodes() const { return speciesCodes_; }

    const OrthogroupRow* findRow(const std::string& orthogroupId) const;

    std::optional<size_t> speciesColumn(const std::string& speciesCode) const;

    // Genome-wide gene count of a species column (0 for unknown codes)
    int64_t speciesGeneTotal(const std::string& speciesCode) const;

    const std::vector<OrthogroupRow>& rows() const { return rows_; }
    size_t size() const { return rows_.size(); }
    size_t indexedGeneCount() const;
    size_t geneMentionCount() const { return geneMentions_; }
    size_t conflictCount() const { return conflicts_; }
    size_t skippedRowCount() const { return skippedRows_; }

private:
    std::optional<uint32_t> scanForGene(std::string_view geneId) const;

    std::vector<std::string> speciesCodes_;
    absl::flat_hash_map<std::string, size_t> speciesColumns_;
    std::vector<OrthogroupRow> rows_;
    absl::flat_hash_map<std::string, uint32_t> rowById_;
    std::vector<int64_t> speciesTotals_;

    mutable std::shared_mutex indexMutex_;
    mutable GeneIndex geneIndex_;

    size_t geneMentions_ = 0;
    size_t conflicts_ = 0;
    size_t skippedRows_ = 0;
};

} // namespace orthogroups
