/**
 * Narrative Explanations - Implementation
 */

#include "explanation.hpp"
#include "pgx_annotator.hpp"
#include <sstream>
#include <stdexcept>

namespace pgx {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

std::string fact_or_unknown(const std::string& value) {
    std::string trimmed = trim(value);
    return trimmed.empty() ? "Unknown" : trimmed;
}

std::string format_facts(const ExplanationFacts& facts) {
    std::ostringstream oss;
    oss << "Drug: " << fact_or_unknown(facts.drug) << "\n"
        << "Governing gene: " << fact_or_unknown(facts.gene) << "\n"
        << "Patient diplotype: " << fact_or_unknown(facts.diplotype) << "\n"
        << "Phenotype: " << fact_or_unknown(facts.phenotype) << "\n"
        << "Risk label: " << fact_or_unknown(facts.risk_label) << "\n"
        << "Severity: " << fact_or_unknown(facts.severity) << "\n"
        << "Advised clinical action: " << fact_or_unknown(facts.action) << "\n";
    return oss.str();
}

// ============================================================================
// Template generator
// ============================================================================

std::string TemplateExplanationGenerator::summarize(const ExplanationFacts& facts) {
    std::string drug = fact_or_unknown(facts.drug);
    std::string gene = fact_or_unknown(facts.gene);
    std::string label = fact_or_unknown(facts.risk_label);

    std::ostringstream oss;
    if (gene == "Unknown") {
        oss << drug << " is not covered by the pharmacogenomic panel, so no gene-based "
            << "risk could be derived and the result is reported as " << label << ".";
    } else {
        oss << drug << " is governed by " << gene << ". "
            << "The patient carries the " << fact_or_unknown(facts.diplotype)
            << " diplotype, interpreted as " << fact_or_unknown(facts.phenotype) << ". "
            << "This gives a risk label of " << label
            << " with " << fact_or_unknown(facts.severity) << " severity.";
    }

    std::string action = trim(facts.action);
    if (!action.empty()) {
        oss << " Advised action: " << action << ".";
    }
    return oss.str();
}

// ============================================================================
// Safe invocation
// ============================================================================

std::string explain(ExplanationGenerator* generator, const ExplanationFacts& facts) {
    if (!generator) return EXPLANATION_PLACEHOLDER;

    try {
        std::string summary = trim(generator->summarize(facts));
        if (summary.empty()) {
            log(LogLevel::WARNING, "Explanation generator '" + generator->name() +
                "' returned an empty summary for " + facts.drug);
            return EXPLANATION_PLACEHOLDER;
        }
        return summary;
    } catch (const std::exception& e) {
        log(LogLevel::WARNING, "Explanation generator failed for " + facts.drug + ": " + e.what());
        return EXPLANATION_PLACEHOLDER;
    }
}

} // namespace pgx
