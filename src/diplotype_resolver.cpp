/**
 * Diplotype Resolver - Implementation
 */

#include "diplotype_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace pgx {

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string normalize_star_allele(const std::string& allele) {
    std::string trimmed = trim(allele);
    if (trimmed.empty()) return REFERENCE_ALLELE;
    if (trimmed[0] == '*') return trimmed;
    return "*" + trimmed;
}

std::optional<Resolution> resolve_diplotype(const std::vector<VariantRecord>& variants) {
    if (variants.empty()) return std::nullopt;

    // Homozygous alternate determines both chromosomes; first one wins
    for (const auto& v : variants) {
        if (v.is_homozygous_alt()) {
            std::string star = normalize_star_allele(v.star_allele);
            return Resolution{star, star, false};
        }
    }

    // Distinct heterozygous alleles in first-seen order
    std::vector<std::string> alleles;
    for (const auto& v : variants) {
        if (!v.is_heterozygous()) continue;

        std::string star = normalize_star_allele(v.star_allele);
        if (std::find(alleles.begin(), alleles.end(), star) == alleles.end()) {
            alleles.push_back(star);
        }
    }

    if (alleles.empty()) return std::nullopt;

    if (alleles.size() == 1) {
        return Resolution{REFERENCE_ALLELE, alleles[0], false};
    }

    // Diploid: at most two chromosomes
    return Resolution{alleles[0], alleles[1], alleles.size() > 2};
}

std::vector<VariantRecord> filter_actionable(const std::vector<VariantRecord>& variants) {
    std::vector<VariantRecord> result;
    std::copy_if(variants.begin(), variants.end(), std::back_inserter(result),
                 [](const VariantRecord& v) { return v.is_actionable(); });
    return result;
}

std::map<std::string, std::vector<VariantRecord>> group_by_gene(
    const std::vector<VariantRecord>& variants) {
    std::map<std::string, std::vector<VariantRecord>> groups;
    for (const auto& v : variants) {
        groups[v.gene].push_back(v);
    }
    return groups;
}

} // namespace pgx
