/**
 * Risk Assessment Scorer - Implementation
 */

#include "risk_assessment.hpp"
#include "phenotype_rules.hpp"
#include <set>
#include <utility>

namespace pgx {

std::string risk_label_to_string(RiskLabel label) {
    switch (label) {
        case RiskLabel::SAFE: return "Safe";
        case RiskLabel::ADJUST_DOSAGE: return "Adjust Dosage";
        case RiskLabel::TOXIC: return "Toxic";
        case RiskLabel::INEFFECTIVE: return "Ineffective";
        case RiskLabel::UNKNOWN: return "Unknown";
        default: return "Unknown";
    }
}

RiskLabel parse_risk_label(const std::string& label) {
    if (label == "Safe") return RiskLabel::SAFE;
    if (label == "Adjust Dosage") return RiskLabel::ADJUST_DOSAGE;
    if (label == "Toxic") return RiskLabel::TOXIC;
    if (label == "Ineffective") return RiskLabel::INEFFECTIVE;
    return RiskLabel::UNKNOWN;
}

std::string severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::NONE: return "none";
        case Severity::LOW: return "low";
        case Severity::MODERATE: return "moderate";
        case Severity::HIGH: return "high";
        case Severity::CRITICAL: return "critical";
        default: return "low";
    }
}

double resolve_confidence(const std::optional<std::string>& phenotype,
                          bool is_fallback,
                          bool is_unsupported) {
    if (is_unsupported) return CONFIDENCE_UNSUPPORTED;
    if (!phenotype || is_unknown_phenotype(*phenotype)) return CONFIDENCE_UNKNOWN_PHENOTYPE;
    if (is_fallback) return CONFIDENCE_FALLBACK_SAFE;
    return CONFIDENCE_EXPLICIT_RULE;
}

Severity resolve_severity(const std::string& drug,
                          const std::optional<std::string>& gene,
                          RiskLabel label,
                          const std::optional<std::string>& phenotype) {
    // Life-threatening toxicity pairs (CPIC)
    static const std::set<std::pair<std::string, std::string>> critical_pairs = {
        {"FLUOROURACIL", "DPYD"},
        {"AZATHIOPRINE", "TPMT"},
    };

    if (label == RiskLabel::TOXIC && gene && phenotype &&
        phenotype->compare(0, 2, "PM") == 0 &&
        critical_pairs.count({drug, *gene})) {
        return Severity::CRITICAL;
    }

    switch (label) {
        case RiskLabel::SAFE: return Severity::NONE;
        case RiskLabel::ADJUST_DOSAGE: return Severity::MODERATE;
        case RiskLabel::INEFFECTIVE: return Severity::MODERATE;
        case RiskLabel::TOXIC: return Severity::HIGH;
        default: return Severity::LOW;
    }
}

RiskAssessment build_risk_assessment(const std::string& drug,
                                     const std::optional<std::string>& gene,
                                     RiskLabel label,
                                     const std::optional<std::string>& phenotype,
                                     bool is_fallback,
                                     bool is_unsupported) {
    RiskAssessment assessment;
    assessment.risk_label = label;
    assessment.confidence = resolve_confidence(phenotype, is_fallback, is_unsupported);
    assessment.severity = resolve_severity(drug, gene, label, phenotype);
    return assessment;
}

} // namespace pgx
