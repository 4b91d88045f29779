/**
 * Phenotype Rule Table
 *
 * Static gene -> (diplotype -> metabolizer phenotype) tables following the
 * CPIC genotype-to-phenotype equivalences. Keys are authored in their
 * natural clinical order ("*1/*2"); lookup tries both allele orders.
 */

#ifndef PGX_PHENOTYPE_RULES_HPP
#define PGX_PHENOTYPE_RULES_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>

namespace pgx {

/**
 * Sentinel phenotype for an unknown gene or an unlisted diplotype
 */
inline const std::string UNKNOWN_PHENOTYPE = "UNKNOWN";

/**
 * True for the sentinel and any label beginning with it
 */
bool is_unknown_phenotype(const std::string& phenotype);

class PhenotypeRules {
public:
    /**
     * Phenotype for gene + two alleles, order-independent.
     * @return phenotype label, or UNKNOWN_PHENOTYPE; never throws
     */
    static std::string lookup(const std::string& gene,
                              const std::string& allele1,
                              const std::string& allele2);

    /**
     * Check if a gene has a rule table
     */
    static bool has_gene(const std::string& gene);

    /**
     * Genes with rule tables, sorted
     */
    static std::vector<std::string> genes();

    /**
     * Authored diplotype keys and labels for one gene (empty if unknown)
     */
    static const std::map<std::string, std::string>& rules_for(const std::string& gene);

private:
    static const std::map<std::string, std::map<std::string, std::string>>& table();
};

/**
 * Map a verbose phenotype label to a CPIC short code
 * ("IM – Intermediate Metabolizer" -> "IM", "Poor Function – …" -> "PM").
 * Absent, UNKNOWN or unmatched labels give "Unknown".
 */
std::string phenotype_short_code(const std::optional<std::string>& phenotype);

} // namespace pgx

#endif // PGX_PHENOTYPE_RULES_HPP
