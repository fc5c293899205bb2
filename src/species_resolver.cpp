#include "species_resolver.hpp"
#include "errors.hpp"
#include "io_utils.hpp"
#include "logging.hpp"

#include <cctype>
#include <utility>

namespace species {

namespace {

const absl::flat_hash_map<char, std::vector<std::string>>& genusTable() {
    static const absl::flat_hash_map<char, std::vector<std::string>> table = {
        {'A', {"Arabidopsis", "Aegilops", "Actinidia", "Amaranthus", "Acorus"}},
        {'B', {"Brassica", "Beta", "Bambusa"}},
        {'C', {"Citrus", "Cannabis", "Cucumis", "Coffea", "Camelina", "Capsella"}},
        {'D', {"Daucus"}},
        {'E', {"Eucalyptus"}},
        {'F', {"Fragaria"}},
        {'G', {"Glycine", "Gossypium"}},
        {'H', {"Helianthus", "Hordeum"}},
        {'L', {"Lotus", "Lupinus", "Lactuca", "Linum"}},
        {'M', {"Medicago", "Malus", "Musa", "Manihot"}},
        {'N', {"Nicotiana", "Nelumbo"}},
        {'O', {"Oryza", "Olea"}},
        {'P', {"Populus", "Pisum", "Prunus", "Panicum", "Phaseolus"}},
        {'Q', {"Quercus"}},
        {'R', {"Ricinus"}},
        {'S', {"Solanum", "Sorghum", "Setaria", "Sesamum"}},
        {'T', {"Triticum", "Theobroma", "Trifolium"}},
        {'V', {"Vigna", "Vitis"}},
        {'W', {"Wheat line"}},
        {'Z', {"Zea"}},
    };
    return table;
}

// Drops digits and brackets, as in "At(2)" -> "At"
std::string cleanCode(std::string_view code) {
    std::string out;
    out.reserve(code.size());
    for (char c : code) {
        if (std::isdigit(static_cast<unsigned char>(c))) continue;
        switch (c) {
            case '(': case ')': case '[': case ']': case '{': case '}':
                continue;
            default:
                out += c;
        }
    }
    return io_utils::trim(out);
}

bool samePrefixIgnoreCase(const std::string& a, const std::string& b, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

const std::vector<std::string>& genusHints(char letter) {
    static const std::vector<std::string> none;
    const auto& table = genusTable();
    auto it = table.find(static_cast<char>(std::toupper(static_cast<unsigned char>(letter))));
    return it == table.end() ? none : it->second;
}

std::string generateFallbackName(std::string_view code) {
    if (code.empty()) return std::string(kUnknownSpecies);
    const auto& genera = genusHints(code.front());
    if (genera.empty()) {
        return fmt::format("Species {}", code);
    }
    return fmt::format("{} sp. ({})", genera.front(), code);
}

SpeciesResolver SpeciesResolver::loadMapping(const std::string& path, const MappingOptions& options) {
    try {
        io_utils::InputFile input(path);
        return parseMapping(input.stream(), options, path);
    } catch (const orthotree::DataNotFoundError& e) {
        logging::warn("Species metadata unavailable ({}); using generated names only", e.what());
        return SpeciesResolver();
    }
}

SpeciesResolver SpeciesResolver::parseMapping(std::istream& in, const MappingOptions& options,
                                              const std::string& sourceName) {
    SpeciesResolver resolver;
    std::string line;
    size_t lineNo = 0;
    size_t skipped = 0;
    while (io_utils::readLine(in, line)) {
        lineNo++;
        if (lineNo <= options.headerLines) continue;
        if (io_utils::trim(line).empty()) continue;

        auto fields = io_utils::splitFields(line, options.delimiter);
        if (fields.size() < 2) {
            skipped++;
            logging::debug("{}:{}: fewer than two fields; row skipped", sourceName, lineNo);
            continue;
        }
        std::string name = io_utils::stripQuotes(fields[0]);
        std::string code = io_utils::stripQuotes(fields[1]);
        if (code.empty() || name.empty()) {
            skipped++;
            logging::debug("{}:{}: empty species code or name; row skipped", sourceName, lineNo);
            continue;
        }
        resolver.addMapping(code, name);
    }

    if (skipped > 0) {
        logging::warn("Skipped {} unusable rows in species metadata {}", skipped, sourceName);
    }
    logging::info("Loaded {} species names from {}", resolver.mappedCount(), sourceName);
    return resolver;
}

void SpeciesResolver::addMapping(const std::string& code, const std::string& fullName) {
    auto it = nameByCode_.find(code);
    if (it == nameByCode_.end()) {
        codeOrder_.push_back(code);
        nameByCode_.emplace(code, fullName);
    } else {
        logging::debug("Species code {} mapped again: {} replaces {}", code, fullName, it->second);
        auto previous = codeByName_.find(it->second);
        if (previous != codeByName_.end() && previous->second == code) {
            codeByName_.erase(previous);
        }
        it->second = fullName;
    }
    codeByName_[fullName] = code;
    enhanced_.erase(code);
}

std::optional<std::string> SpeciesResolver::partialMatch(const std::string& code) const {
    if (code.size() < 2) return std::nullopt;
    for (const auto& mapped : codeOrder_) {
        if (mapped.size() < 2) continue;
        size_t diff = mapped.size() > code.size() ? mapped.size() - code.size() : code.size() - mapped.size();
        if (diff > 2) continue;
        if (samePrefixIgnoreCase(mapped, code, 2)) {
            return nameByCode_.at(mapped);
        }
    }
    return std::nullopt;
}

size_t SpeciesResolver::enhance(const std::vector<std::string>& codes) {
    size_t added = 0;
    size_t partial = 0;
    for (const auto& raw : codes) {
        std::string code = io_utils::trim(raw);
        if (code.empty() || nameByCode_.contains(code) || enhanced_.contains(code)) continue;

        std::string name;
        if (auto match = partialMatch(code)) {
            name = fmt::format("{} (variant {})", *match, code);
            partial++;
        } else {
            name = generateFallbackName(code);
        }
        logging::debug("No metadata for species {}; using \"{}\"", code, name);
        enhanced_.emplace(code, std::move(name));
        added++;
    }
    if (added > 0) {
        logging::info("Generated names for {} species without metadata ({} partial matches)", added, partial);
    }
    return added;
}

std::optional<SpeciesIdentity> SpeciesResolver::lookupExact(const std::string& code) const {
    if (auto it = nameByCode_.find(code); it != nameByCode_.end()) {
        return SpeciesIdentity{code, it->second, false};
    }
    if (auto it = enhanced_.find(code); it != enhanced_.end()) {
        return SpeciesIdentity{code, it->second, true};
    }
    return std::nullopt;
}

SpeciesIdentity SpeciesResolver::identify(std::string_view rawCode) const {
    std::string code = io_utils::stripQuotes(rawCode);
    if (code.empty()) {
        return SpeciesIdentity{code, std::string(kUnknownSpecies), true};
    }

    if (auto identity = lookupExact(code)) {
        return *identity;
    }

    std::string cleaned = cleanCode(code);
    if (!cleaned.empty() && cleaned != code) {
        if (auto identity = lookupExact(cleaned)) {
            identity->code = code;
            return *identity;
        }
    }

    if (auto match = partialMatch(code)) {
        return SpeciesIdentity{code, fmt::format("{} (variant {})", *match, code), true};
    }

    if (!cleaned.empty()) {
        for (const auto& mapped : codeOrder_) {
            if (cleaned.compare(0, mapped.size(), mapped) == 0) {
                return SpeciesIdentity{code, nameByCode_.at(mapped), false};
            }
        }
    }

    return SpeciesIdentity{code, generateFallbackName(code), true};
}

std::string SpeciesResolver::resolve(std::string_view code) const {
    return identify(code).canonicalName;
}

std::optional<std::string> SpeciesResolver::codeForName(std::string_view name) const {
    auto it = codeByName_.find(io_utils::trim(name));
    if (it == codeByName_.end()) return std::nullopt;
    return it->second;
}

} // namespace species
