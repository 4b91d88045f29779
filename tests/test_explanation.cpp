/**
 * Tests for explanation.hpp: fact formatting, the template generator,
 * and placeholder substitution on generator failure.
 */

#include <gtest/gtest.h>
#include "explanation.hpp"

#include <stdexcept>
#include <utility>

using namespace pgx;

namespace {

ExplanationFacts codeine_facts() {
    ExplanationFacts facts;
    facts.drug = "CODEINE";
    facts.gene = "CYP2D6";
    facts.diplotype = "*4/*4";
    facts.phenotype = "PM – Poor Metabolizer";
    facts.risk_label = "Ineffective";
    facts.severity = "moderate";
    facts.action = "Avoid codeine";
    return facts;
}

class FixedGenerator : public ExplanationGenerator {
public:
    explicit FixedGenerator(std::string text) : text_(std::move(text)) {}
    std::string name() const override { return "fixed"; }
    std::string summarize(const ExplanationFacts&) override { return text_; }
private:
    std::string text_;
};

class ThrowingGenerator : public ExplanationGenerator {
public:
    std::string name() const override { return "throwing"; }
    std::string summarize(const ExplanationFacts&) override {
        throw std::runtime_error("service unavailable");
    }
};

} // namespace

// ============================================================================
// Facts
// ============================================================================

TEST(FactOrUnknown, BlankBecomesUnknown) {
    EXPECT_EQ(fact_or_unknown(""), "Unknown");
    EXPECT_EQ(fact_or_unknown("  "), "Unknown");
    EXPECT_EQ(fact_or_unknown(" CYP2D6 "), "CYP2D6");
}

TEST(FormatFacts, OneLinePerFact) {
    std::string text = format_facts(codeine_facts());
    EXPECT_NE(text.find("Drug: CODEINE\n"), std::string::npos);
    EXPECT_NE(text.find("Governing gene: CYP2D6\n"), std::string::npos);
    EXPECT_NE(text.find("Patient diplotype: *4/*4\n"), std::string::npos);
    EXPECT_NE(text.find("Risk label: Ineffective\n"), std::string::npos);
    EXPECT_NE(text.find("Advised clinical action: Avoid codeine\n"), std::string::npos);
}

TEST(FormatFacts, MissingValuesAreUnknown) {
    ExplanationFacts facts;
    facts.drug = "ASPIRIN";
    std::string text = format_facts(facts);
    EXPECT_NE(text.find("Governing gene: Unknown\n"), std::string::npos);
    EXPECT_NE(text.find("Phenotype: Unknown\n"), std::string::npos);
}

// ============================================================================
// Template generator
// ============================================================================

TEST(TemplateExplanationGenerator, GovernedDrug) {
    TemplateExplanationGenerator generator;
    EXPECT_EQ(generator.name(), "template");
    EXPECT_EQ(generator.summarize(codeine_facts()),
              "CODEINE is governed by CYP2D6. The patient carries the *4/*4 diplotype, "
              "interpreted as PM – Poor Metabolizer. This gives a risk label of Ineffective "
              "with moderate severity. Advised action: Avoid codeine.");
}

TEST(TemplateExplanationGenerator, UncoveredDrug) {
    ExplanationFacts facts;
    facts.drug = "ASPIRIN";
    facts.risk_label = "Unknown";
    facts.severity = "low";
    TemplateExplanationGenerator generator;
    EXPECT_EQ(generator.summarize(facts),
              "ASPIRIN is not covered by the pharmacogenomic panel, so no gene-based risk "
              "could be derived and the result is reported as Unknown.");
}

// ============================================================================
// explain()
// ============================================================================

TEST(Explain, UsesGeneratorOutput) {
    FixedGenerator generator("  A short narrative.  ");
    EXPECT_EQ(explain(&generator, codeine_facts()), "A short narrative.");
}

TEST(Explain, NullGeneratorGivesPlaceholder) {
    EXPECT_EQ(explain(nullptr, codeine_facts()), EXPLANATION_PLACEHOLDER);
}

TEST(Explain, EmptySummaryGivesPlaceholder) {
    FixedGenerator generator(" \n ");
    EXPECT_EQ(explain(&generator, codeine_facts()), EXPLANATION_PLACEHOLDER);
}

TEST(Explain, ThrowingGeneratorGivesPlaceholder) {
    ThrowingGenerator generator;
    std::string summary;
    EXPECT_NO_THROW(summary = explain(&generator, codeine_facts()));
    EXPECT_EQ(summary, EXPLANATION_PLACEHOLDER);
}
