/**
 * Variant Record - Implementation
 */

#include "variant.hpp"

namespace pgx {

Zygosity classify_genotype(const std::optional<std::string>& genotype) {
    if (!genotype) return Zygosity::UNINFORMATIVE;

    const std::string& gt = *genotype;
    if (gt == "0/0") return Zygosity::HOM_REF;
    if (gt == "0/1" || gt == "1/0" || gt == "0|1" || gt == "1|0") return Zygosity::HET;
    if (gt == "1/1" || gt == "1|1") return Zygosity::HOM_ALT;
    return Zygosity::UNINFORMATIVE;
}

std::string zygosity_to_string(Zygosity zygosity) {
    switch (zygosity) {
        case Zygosity::HOM_REF: return "homozygous_reference";
        case Zygosity::HET: return "heterozygous";
        case Zygosity::HOM_ALT: return "homozygous_alternate";
        case Zygosity::UNINFORMATIVE: return "uninformative";
        default: return "unknown";
    }
}

std::optional<std::string> VariantRecord::get_info(const std::string& key) const {
    auto it = info.find(key);
    if (it != info.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace pgx
