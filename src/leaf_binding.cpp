#include "leaf_binding.hpp"
#include "io_utils.hpp"
#include "logging.hpp"
#include "orthogroup_table.hpp"

namespace phylo {

LeafBinding LeafBinding::bind(const SpeciesTree& tree, const orthogroups::OrthogroupTable& table,
                              const species::SpeciesResolver& resolver) {
    LeafBinding binding;
    binding.annotations_.resize(tree.size());

    size_t withoutColumn = 0;
    for (int32_t leaf : tree.leaves()) {
        const std::string& code = tree.node(leaf).name;
        if (!code.empty()) {
            // Duplicate leaf names: the first leaf wins, as in the tree's own index
            binding.leafByCode_.try_emplace(code, leaf);
        }
        LeafAnnotation& annotation = binding.annotations_[leaf];
        annotation.identity = resolver.identify(code);
        if (annotation.identity.isFallback) {
            binding.fallbackCount_++;
        }
        if (table.speciesColumn(code)) {
            annotation.geneCount = table.speciesGeneTotal(code);
        } else {
            withoutColumn++;
            logging::debug("Tree leaf {} has no column in the orthogroup table", code);
        }
    }

    if (withoutColumn > 0) {
        logging::warn("{} of {} tree leaves have no column in the orthogroup table", withoutColumn,
                      tree.leaves().size());
    }
    logging::debug("Bound {} tree leaves ({} with generated names)", tree.leaves().size(),
                   binding.fallbackCount_);
    return binding;
}

std::optional<int32_t> LeafBinding::leafIndex(std::string_view code) const {
    auto it = leafByCode_.find(io_utils::stripQuotes(code));
    if (it == leafByCode_.end()) return std::nullopt;
    return it->second;
}

} // namespace phylo
