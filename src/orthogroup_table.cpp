#include "orthogroup_table.hpp"
#include "errors.hpp"
#include "io_utils.hpp"
#include "logging.hpp"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include <mutex>
#include <utility>

namespace orthogroups {

namespace {

// Individual problems beyond this many are only logged at debug level
constexpr size_t kMaxReportedProblems = 10;

void reportProblem(size_t count, const std::string& message) {
    if (count <= kMaxReportedProblems) {
        logging::warn(message);
    } else {
        logging::debug(message);
    }
}

} // namespace

GeneList splitGenes(std::string_view cell) {
    GeneList genes;
    size_t start = 0;
    while (start <= cell.size()) {
        size_t comma = cell.find(',', start);
        if (comma == std::string_view::npos) comma = cell.size();
        std::string gene = io_utils::trim(cell.substr(start, comma - start));
        if (!gene.empty()) {
            genes.push_back(std::move(gene));
        }
        start = comma + 1;
    }
    return genes;
}

GeneIndexBuild buildGeneIndex(const std::vector<OrthogroupRow>& rows) {
    GeneIndexBuild build;
    for (uint32_t r = 0; r < rows.size(); ++r) {
        for (const auto& cell : rows[r].cells) {
            for (const auto& gene : cell) {
                build.geneMentions++;
                auto [it, inserted] = build.index.try_emplace(gene, r);
                if (!inserted && it->second != r) {
                    build.conflicts++;
                    reportProblem(build.conflicts,
                                  fmt::format("Gene {} appears in {} and {}; keeping {}", gene,
                                              rows[it->second].orthogroupId, rows[r].orthogroupId,
                                              rows[r].orthogroupId));
                    it->second = r;
                }
            }
        }
    }
    if (build.conflicts > 0) {
        logging::warn("{} genes are listed in more than one orthogroup; the last occurrence wins",
                      build.conflicts);
    }
    return build;
}

OrthogroupTable::OrthogroupTable(std::vector<std::string> speciesCodes, std::vector<OrthogroupRow> rows)
    : speciesCodes_(std::move(speciesCodes)) {
    for (size_t c = 0; c < speciesCodes_.size(); ++c) {
        if (!speciesColumns_.try_emplace(speciesCodes_[c], c).second) {
            logging::warn("Duplicate species column {}; lookups use the first one", speciesCodes_[c]);
        }
    }

    rows_.reserve(rows.size());
    for (auto& row : rows) {
        if (rowById_.contains(row.orthogroupId)) {
            skippedRows_++;
            reportProblem(skippedRows_, "Duplicate orthogroup " + row.orthogroupId + "; keeping the first row");
            continue;
        }
        row.cells.resize(speciesCodes_.size());
        rowById_.emplace(row.orthogroupId, static_cast<uint32_t>(rows_.size()));
        rows_.push_back(std::move(row));
    }

    GeneIndexBuild build = buildGeneIndex(rows_);
    geneIndex_ = std::move(build.index);
    geneMentions_ = build.geneMentions;
    conflicts_ = build.conflicts;

    // Columns are independent, so totals are summed one column per task
    speciesTotals_.assign(speciesCodes_.size(), 0);
    tbb::parallel_for(tbb::blocked_range<size_t>(0, speciesCodes_.size()),
                      [&](const tbb::blocked_range<size_t>& range) {
                          for (size_t c = range.begin(); c != range.end(); ++c) {
                              int64_t total = 0;
                              for (const auto& row : rows_) {
                                  total += static_cast<int64_t>(row.cells[c].size());
                              }
                              speciesTotals_[c] = total;
                          }
                      });
}

std::unique_ptr<OrthogroupTable> OrthogroupTable::load(const std::string& path, const TableOptions& options) {
    TIME_OPERATION("Loading orthogroup table");
    io_utils::InputFile input(path);
    char delimiter = options.delimiter.value_or(io_utils::delimiterForPath(path));
    auto table = parse(input.stream(), delimiter, path);
    if (input.stream().bad()) {
        throw orthotree::DataNotFoundError(path, "Error while reading orthogroup table");
    }
    return table;
}

std::unique_ptr<OrthogroupTable> OrthogroupTable::parse(std::istream& in, char delimiter,
                                                        const std::string& sourceName) {
    std::string line;
    std::vector<std::string> header;
    size_t lineNo = 0;
    while (io_utils::readLine(in, line)) {
        lineNo++;
        if (!io_utils::trim(line).empty()) {
            header = io_utils::splitFields(line, delimiter);
            break;
        }
    }
    if (header.empty()) {
        throw orthotree::DataNotFoundError(sourceName, "Orthogroup table has no header");
    }

    std::vector<std::string> species;
    species.reserve(header.size() - 1);
    for (size_t i = 1; i < header.size(); ++i) {
        species.push_back(io_utils::trim(header[i]));
    }

    std::vector<OrthogroupRow> rows;
    size_t skipped = 0;
    while (io_utils::readLine(in, line)) {
        lineNo++;
        if (io_utils::trim(line).empty()) continue;

        auto fields = io_utils::splitFields(line, delimiter);
        if (fields.size() != header.size()) {
            skipped++;
            reportProblem(skipped, fmt::format("{}:{}: expected {} fields, found {}; row skipped", sourceName,
                                               lineNo, header.size(), fields.size()));
            continue;
        }

        OrthogroupRow row;
        row.orthogroupId = io_utils::trim(fields[0]);
        if (row.orthogroupId.empty()) {
            skipped++;
            reportProblem(skipped, fmt::format("{}:{}: empty orthogroup id; row skipped", sourceName, lineNo));
            continue;
        }
        row.cells.reserve(species.size());
        for (size_t i = 1; i < fields.size(); ++i) {
            row.cells.push_back(splitGenes(fields[i]));
        }
        rows.push_back(std::move(row));
    }

    auto table = std::make_unique<OrthogroupTable>(std::move(species), std::move(rows));
    table->skippedRows_ += skipped;
    if (table->skippedRows_ > 0) {
        logging::warn("Skipped {} malformed or duplicate rows in {}", table->skippedRows_, sourceName);
    }
    logging::info("Loaded {} orthogroups across {} species ({} indexed genes) from {}", table->size(),
                  table->speciesCodes_.size(), table->geneIndex_.size(), sourceName);
    return table;
}

std::optional<uint32_t> OrthogroupTable::scanForGene(std::string_view geneId) const {
    for (uint32_t r = 0; r < rows_.size(); ++r) {
        for (const auto& cell : rows_[r].cells) {
            for (const auto& gene : cell) {
                if (gene == geneId) return r;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> OrthogroupTable::findGeneOrthogroup(std::string_view geneId) const {
    std::string key = io_utils::trim(geneId);
    if (key.empty()) return std::nullopt;

    {
        std::shared_lock lock(indexMutex_);
        auto it = geneIndex_.find(key);
        if (it != geneIndex_.end()) {
            return rows_[it->second].orthogroupId;
        }
    }

    auto row = scanForGene(key);
    if (!row) return std::nullopt;

    logging::debug("Gene {} found by table scan; adding it to the index", key);
    std::unique_lock lock(indexMutex_);
    auto it = geneIndex_.try_emplace(key, *row).first;
    return rows_[it->second].orthogroupId;
}

const OrthogroupRow* OrthogroupTable::findRow(const std::string& orthogroupId) const {
    auto it = rowById_.find(orthogroupId);
    return it == rowById_.end() ? nullptr : &rows_[it->second];
}

SpeciesGenes OrthogroupTable::getOrthogroupGenes(const std::string& orthogroupId) const {
    SpeciesGenes result;
    const OrthogroupRow* row = findRow(io_utils::trim(orthogroupId));
    if (!row) return result;
    for (size_t c = 0; c < speciesCodes_.size(); ++c) {
        if (!row->cells[c].empty()) {
            result.try_emplace(speciesCodes_[c], row->cells[c]);
        }
    }
    return result;
}

std::optional<size_t> OrthogroupTable::speciesColumn(const std::string& speciesCode) const {
    auto it = speciesColumns_.find(speciesCode);
    if (it == speciesColumns_.end()) return std::nullopt;
    return it->second;
}

int64_t OrthogroupTable::speciesGeneTotal(const std::string& speciesCode) const {
    auto column = speciesColumn(speciesCode);
    return column ? speciesTotals_[*column] : 0;
}

size_t OrthogroupTable::indexedGeneCount() const {
    std::shared_lock lock(indexMutex_);
    return geneIndex_.size();
}

} // namespace orthogroups
