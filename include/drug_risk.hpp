/**
 * Drug Risk Evaluator
 *
 * Each supported drug is governed by one gene. The gene's phenotype is
 * matched by prefix against a per-drug rule list to pick a risk label,
 * which is then scored by build_risk_assessment().
 */

#ifndef PGX_DRUG_RISK_HPP
#define PGX_DRUG_RISK_HPP

#include "interpretation.hpp"
#include "risk_assessment.hpp"
#include <string>
#include <vector>
#include <set>
#include <map>
#include <optional>
#include <utility>

namespace pgx {

/**
 * Phenotype annotation used when the governing gene has no profile
 */
inline const std::string FALLBACK_PHENOTYPE = "*1/*1 assumed";

/**
 * Per-drug result, in request order
 */
struct DrugRiskResult {
    std::string drug;                       // uppercased
    std::optional<std::string> gene;        // nullopt if drug unsupported
    std::optional<std::string> phenotype;   // nullopt if drug unsupported
    RiskAssessment assessment;
};

/**
 * Ordered phenotype-prefix -> label rules; the first matching prefix wins
 */
using DrugRuleList = std::vector<std::pair<std::string, RiskLabel>>;

/**
 * Supported drug names (uppercase)
 */
const std::set<std::string>& supported_drugs();

/**
 * Check if a drug (uppercase) is supported
 */
bool is_supported_drug(const std::string& drug);

/**
 * Governing gene for a drug, nullopt if unsupported
 */
std::optional<std::string> governing_gene(const std::string& drug);

/**
 * Prefix rules for a drug (empty if unsupported)
 */
const DrugRuleList& drug_rules(const std::string& drug);

/**
 * Label for a drug + phenotype by prefix match, UNKNOWN if no prefix matches
 */
RiskLabel resolve_risk_label(const std::string& drug, const std::string& phenotype);

/**
 * Split on commas, trim, uppercase, drop empty tokens.
 * "CODEINE, warfarin , " -> {"CODEINE", "WARFARIN"}
 */
std::vector<std::string> parse_drug_list(const std::string& drugs);

/**
 * Evaluate one drug against the gene profiles
 */
DrugRiskResult evaluate_drug(const std::string& drug, const std::vector<GeneProfile>& profiles);

/**
 * Evaluate every drug in a comma-separated list
 * @return One result per non-empty token, in input order; empty for a
 *         blank list
 */
std::vector<DrugRiskResult> evaluate_drugs(const std::vector<GeneProfile>& profiles,
                                           const std::string& drugs);

} // namespace pgx

#endif // PGX_DRUG_RISK_HPP
