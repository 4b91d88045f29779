/**
 * Variant Record
 *
 * One called genomic position from a variant-call file, carrying the
 * pharmacogene annotations (GENE, STAR) and the sample genotype.
 */

#ifndef PGX_VARIANT_HPP
#define PGX_VARIANT_HPP

#include <string>
#include <map>
#include <optional>

namespace pgx {

/**
 * Genotype classification of a single record
 */
enum class Zygosity {
    HOM_REF,        // 0/0
    HET,            // exactly one alternate copy
    HOM_ALT,        // 1/1 or 1|1
    UNINFORMATIVE   // missing or any other genotype string
};

/**
 * Classify a raw GT string
 */
Zygosity classify_genotype(const std::optional<std::string>& genotype);

/**
 * Get string representation of zygosity
 */
std::string zygosity_to_string(Zygosity zygosity);

/**
 * A parsed variant-call record. Treated as immutable once the parser
 * has produced it.
 */
struct VariantRecord {
    std::string chrom;
    int position = 0;                   // 1-based
    std::string rsid;                   // rs id, RS annotation, or raw ID column
    std::string ref;
    std::string alt;
    std::string filter;
    std::string gene;                   // INFO GENE=, empty if absent
    std::string star_allele;            // INFO STAR=, empty if absent
    std::optional<std::string> genotype;
    std::map<std::string, std::string> info;

    Zygosity zygosity() const { return classify_genotype(genotype); }
    bool is_heterozygous() const { return zygosity() == Zygosity::HET; }
    bool is_homozygous_alt() const { return zygosity() == Zygosity::HOM_ALT; }
    bool is_homozygous_ref() const { return zygosity() == Zygosity::HOM_REF; }

    /**
     * Heterozygous or homozygous-alternate with a gene annotation
     */
    bool is_actionable() const {
        return !gene.empty() && (is_heterozygous() || is_homozygous_alt());
    }

    /**
     * Get an INFO value
     */
    std::optional<std::string> get_info(const std::string& key) const;
};

} // namespace pgx

#endif // PGX_VARIANT_HPP
