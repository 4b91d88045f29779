/**
 * Risk Assessment Scorer
 *
 * Derives severity and a confidence score from a risk label and the
 * provenance of the phenotype behind it.
 *
 * Confidence tiers:
 *   0.95  explicit rule match
 *   0.85  fallback safe (gene absent, *1/*1 assumed)
 *   0.50  phenotype unknown / unresolved
 *   0.40  drug not supported
 *
 * Severity: Safe -> none, Adjust Dosage / Ineffective -> moderate,
 * Toxic -> high, anything else -> low. Toxic PM results for the
 * (FLUOROURACIL, DPYD) and (AZATHIOPRINE, TPMT) pairs are critical.
 */

#ifndef PGX_RISK_ASSESSMENT_HPP
#define PGX_RISK_ASSESSMENT_HPP

#include <string>
#include <optional>

namespace pgx {

/**
 * Closed risk label vocabulary
 */
enum class RiskLabel {
    SAFE,
    ADJUST_DOSAGE,
    TOXIC,
    INEFFECTIVE,
    UNKNOWN
};

/**
 * Closed severity vocabulary, lowest first
 */
enum class Severity {
    NONE,
    LOW,
    MODERATE,
    HIGH,
    CRITICAL
};

constexpr double CONFIDENCE_EXPLICIT_RULE = 0.95;
constexpr double CONFIDENCE_FALLBACK_SAFE = 0.85;
constexpr double CONFIDENCE_UNKNOWN_PHENOTYPE = 0.50;
constexpr double CONFIDENCE_UNSUPPORTED = 0.40;

/**
 * "Safe", "Adjust Dosage", "Toxic", "Ineffective", "Unknown"
 */
std::string risk_label_to_string(RiskLabel label);

/**
 * Parse a risk label string (exact match); anything else is UNKNOWN
 */
RiskLabel parse_risk_label(const std::string& label);

/**
 * "none", "low", "moderate", "high", "critical"
 */
std::string severity_to_string(Severity severity);

/**
 * Scored outcome for one drug
 */
struct RiskAssessment {
    RiskLabel risk_label = RiskLabel::UNKNOWN;
    Severity severity = Severity::LOW;
    double confidence = CONFIDENCE_UNSUPPORTED;
};

/**
 * Score a risk label
 * @param drug           Uppercased drug name
 * @param gene           Governing gene, nullopt for unsupported drugs
 * @param label          Label chosen by the drug evaluator
 * @param phenotype      Phenotype used, nullopt if none
 * @param is_fallback    Gene absent and *1/*1 assumed
 * @param is_unsupported Drug not in the supported set
 */
RiskAssessment build_risk_assessment(const std::string& drug,
                                     const std::optional<std::string>& gene,
                                     RiskLabel label,
                                     const std::optional<std::string>& phenotype,
                                     bool is_fallback,
                                     bool is_unsupported);

/**
 * Confidence tier for the given provenance. Unsupported beats unknown
 * phenotype, which beats fallback.
 */
double resolve_confidence(const std::optional<std::string>& phenotype,
                          bool is_fallback,
                          bool is_unsupported);

/**
 * Severity with the critical drug/gene override applied first
 */
Severity resolve_severity(const std::string& drug,
                          const std::optional<std::string>& gene,
                          RiskLabel label,
                          const std::optional<std::string>& phenotype);

} // namespace pgx

#endif // PGX_RISK_ASSESSMENT_HPP
