/**
 * Narrative Explanations
 *
 * A generator only narrates: every clinical value it sees has already
 * been computed by the deterministic pipeline and cannot be changed by it.
 * Generators may come from a plugin (see plugin.hpp) or use the built-in
 * template.
 */

#ifndef PGX_EXPLANATION_HPP
#define PGX_EXPLANATION_HPP

#include <string>

namespace pgx {

/**
 * Summary used whenever a generator is missing, throws or returns nothing
 */
inline const std::string EXPLANATION_PLACEHOLDER =
    "Explanation unavailable — pharmacogenomic profile and risk assessment "
    "are provided in the structured fields above.";

/**
 * Pre-computed facts handed to a generator
 */
struct ExplanationFacts {
    std::string drug;
    std::string gene;
    std::string diplotype;
    std::string phenotype;
    std::string risk_label;
    std::string severity;
    std::string action;
};

/**
 * Value for display, "Unknown" when blank
 */
std::string fact_or_unknown(const std::string& value);

/**
 * Render facts as a "Key: value" block, one per line
 */
std::string format_facts(const ExplanationFacts& facts);

/**
 * Abstract narrative generator
 */
class ExplanationGenerator {
public:
    virtual ~ExplanationGenerator() = default;

    /**
     * Generator name, for logging
     */
    virtual std::string name() const = 0;

    /**
     * Produce a short plain-language paragraph. May throw.
     */
    virtual std::string summarize(const ExplanationFacts& facts) = 0;
};

/**
 * Deterministic generator that fills a fixed sentence template
 */
class TemplateExplanationGenerator : public ExplanationGenerator {
public:
    std::string name() const override { return "template"; }
    std::string summarize(const ExplanationFacts& facts) override;
};

/**
 * Run a generator, never throwing
 * @param generator May be null
 * @return Trimmed summary, or EXPLANATION_PLACEHOLDER on any failure
 */
std::string explain(ExplanationGenerator* generator, const ExplanationFacts& facts);

} // namespace pgx

#endif // PGX_EXPLANATION_HPP
