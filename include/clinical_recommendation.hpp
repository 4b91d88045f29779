/**
 * Clinical Recommendation Table
 *
 * Static CPIC-derived guidance keyed by drug and risk label. Every
 * supported drug has an entry for each of the five labels; anything else
 * maps to the specialist-review fallback.
 */

#ifndef PGX_CLINICAL_RECOMMENDATION_HPP
#define PGX_CLINICAL_RECOMMENDATION_HPP

#include "risk_assessment.hpp"
#include <string>

namespace pgx {

struct ClinicalRecommendation {
    std::string action;
    std::string recommendation;
    std::string monitoring;
};

/**
 * Fallback guidance for inconclusive results
 */
const ClinicalRecommendation& fallback_recommendation();

/**
 * Look up guidance
 * @param drug  Drug name (case-insensitive)
 * @param label Risk label
 * @return Matching entry, or fallback_recommendation()
 */
const ClinicalRecommendation& recommend(const std::string& drug, RiskLabel label);

/**
 * Same as above, with the label given as its display string
 */
const ClinicalRecommendation& recommend(const std::string& drug, const std::string& label);

} // namespace pgx

#endif // PGX_CLINICAL_RECOMMENDATION_HPP
