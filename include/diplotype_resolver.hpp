/**
 * Diplotype Resolver
 *
 * Reduces the actionable records of ONE gene to exactly two star alleles.
 * Priority order:
 *   1. any homozygous-alternate record fills both slots with its allele
 *      (remaining heterozygous records for the gene are ignored)
 *   2. one distinct heterozygous allele X      -> *1/X
 *   3. two distinct heterozygous alleles X, Y  -> X/Y in encounter order
 *   4. more than two                           -> first two, flag set
 */

#ifndef PGX_DIPLOTYPE_RESOLVER_HPP
#define PGX_DIPLOTYPE_RESOLVER_HPP

#include "variant.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace pgx {

/**
 * Reference (wild-type) star allele
 */
inline const std::string REFERENCE_ALLELE = "*1";

/**
 * Resolver output for one gene
 */
struct Resolution {
    std::string allele1;
    std::string allele2;
    bool hard_limit_exceeded = false;   // >2 distinct het alleles seen

    std::string diplotype() const { return allele1 + "/" + allele2; }
};

/**
 * Ensure a star-allele name carries the '*' prefix; blank -> *1
 */
std::string normalize_star_allele(const std::string& allele);

/**
 * Resolve the records of a single gene
 * @param variants Records for one gene, in input order. Non-actionable
 *                 genotypes are skipped.
 * @return Resolution, or nullopt if no record is heterozygous or
 *         homozygous-alternate
 */
std::optional<Resolution> resolve_diplotype(const std::vector<VariantRecord>& variants);

/**
 * Keep heterozygous / homozygous-alternate records that name a gene
 */
std::vector<VariantRecord> filter_actionable(const std::vector<VariantRecord>& variants);

/**
 * Bucket records by gene symbol. Records keep their input order inside each
 * bucket; buckets iterate in gene-name order.
 */
std::map<std::string, std::vector<VariantRecord>> group_by_gene(
    const std::vector<VariantRecord>& variants);

} // namespace pgx

#endif // PGX_DIPLOTYPE_RESOLVER_HPP
