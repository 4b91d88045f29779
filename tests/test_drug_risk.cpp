/**
 * Tests for drug_risk.hpp: drug list parsing, rule tables, evaluation
 * tiers, and request ordering.
 */

#include <gtest/gtest.h>
#include "drug_risk.hpp"
#include "phenotype_rules.hpp"

#include <algorithm>

using namespace pgx;

static std::vector<GeneProfile> reference_panel() {
    std::vector<GeneProfile> profiles;
    for (const auto& gene : required_panel()) {
        profiles.emplace_back(gene, "*1", "*1", PhenotypeRules::lookup(gene, "*1", "*1"));
    }
    return profiles;
}

static std::vector<GeneProfile> with_profile(const std::string& gene, const std::string& a1,
                                             const std::string& a2) {
    auto profiles = reference_panel();
    for (auto& p : profiles) {
        if (p.gene == gene) {
            p = GeneProfile(gene, a1, a2, PhenotypeRules::lookup(gene, a1, a2));
        }
    }
    return profiles;
}

// ============================================================================
// Tables
// ============================================================================

TEST(DrugTables, SupportedDrugs) {
    std::set<std::string> expected = {"AZATHIOPRINE", "CLOPIDOGREL", "CODEINE",
                                      "FLUOROURACIL", "SIMVASTATIN", "WARFARIN"};
    EXPECT_EQ(supported_drugs(), expected);
    EXPECT_TRUE(is_supported_drug("CODEINE"));
    EXPECT_FALSE(is_supported_drug("codeine"));
    EXPECT_FALSE(is_supported_drug("ASPIRIN"));
}

TEST(DrugTables, GoverningGenes) {
    EXPECT_EQ(governing_gene("CODEINE").value(), "CYP2D6");
    EXPECT_EQ(governing_gene("WARFARIN").value(), "CYP2C9");
    EXPECT_EQ(governing_gene("CLOPIDOGREL").value(), "CYP2C19");
    EXPECT_EQ(governing_gene("SIMVASTATIN").value(), "SLCO1B1");
    EXPECT_EQ(governing_gene("AZATHIOPRINE").value(), "TPMT");
    EXPECT_EQ(governing_gene("FLUOROURACIL").value(), "DPYD");
    EXPECT_FALSE(governing_gene("ASPIRIN").has_value());
}

TEST(DrugTables, GoverningGenesAreInPanel) {
    const auto& panel = required_panel();
    for (const auto& drug : supported_drugs()) {
        auto gene = governing_gene(drug);
        ASSERT_TRUE(gene.has_value()) << drug;
        EXPECT_NE(std::find(panel.begin(), panel.end(), *gene), panel.end()) << drug;
    }
}

TEST(DrugTables, PrefixesAreDisjointPerDrug) {
    for (const auto& drug : supported_drugs()) {
        const auto& rules = drug_rules(drug);
        ASSERT_FALSE(rules.empty()) << drug;
        for (size_t i = 0; i < rules.size(); ++i) {
            for (size_t j = 0; j < rules.size(); ++j) {
                if (i == j) continue;
                const auto& a = rules[i].first;
                const auto& b = rules[j].first;
                EXPECT_NE(b.compare(0, a.size(), a), 0)
                    << drug << ": '" << a << "' is a prefix of '" << b << "'";
            }
        }
    }
}

TEST(DrugTables, TablePhenotypesMapToLabels) {
    for (const auto& drug : supported_drugs()) {
        std::string gene = *governing_gene(drug);
        for (const auto& [key, phenotype] : PhenotypeRules::rules_for(gene)) {
            RiskLabel label = resolve_risk_label(drug, phenotype);
            // Clopidogrel has no rule for ultrarapid metabolizers
            if (drug == "CLOPIDOGREL" && phenotype.rfind("UM", 0) == 0) {
                EXPECT_EQ(label, RiskLabel::UNKNOWN);
            } else {
                EXPECT_NE(label, RiskLabel::UNKNOWN) << drug << " " << key << " " << phenotype;
            }
        }
    }
}

TEST(DrugTables, UnsupportedDrugHasNoRules) {
    EXPECT_TRUE(drug_rules("ASPIRIN").empty());
    EXPECT_EQ(resolve_risk_label("ASPIRIN", "PM – Poor Metabolizer"), RiskLabel::UNKNOWN);
}

TEST(ResolveRiskLabel, PrefixMatching) {
    EXPECT_EQ(resolve_risk_label("CODEINE", "PM – Poor Metabolizer"), RiskLabel::INEFFECTIVE);
    EXPECT_EQ(resolve_risk_label("CODEINE", "UM – Ultrarapid Metabolizer"), RiskLabel::TOXIC);
    EXPECT_EQ(resolve_risk_label("CLOPIDOGREL", "RM – Rapid Metabolizer"), RiskLabel::SAFE);
    EXPECT_EQ(resolve_risk_label("WARFARIN", "PM – Poor Metabolizer"), RiskLabel::TOXIC);
    EXPECT_EQ(resolve_risk_label("SIMVASTATIN", "Poor Function – High Statin Myopathy Risk"),
              RiskLabel::TOXIC);
    EXPECT_EQ(resolve_risk_label("SIMVASTATIN", "NM – Normal Metabolizer"), RiskLabel::UNKNOWN);
    EXPECT_EQ(resolve_risk_label("WARFARIN", "UM – Ultrarapid Metabolizer"), RiskLabel::UNKNOWN);
}

// ============================================================================
// Drug list parsing
// ============================================================================

TEST(ParseDrugList, TrimsUppercasesAndDropsEmpty) {
    std::vector<std::string> expected = {"CODEINE", "WARFARIN"};
    EXPECT_EQ(parse_drug_list("CODEINE, warfarin"), expected);
    EXPECT_EQ(parse_drug_list(" codeine ,, Warfarin , "), expected);
}

TEST(ParseDrugList, BlankInput) {
    EXPECT_TRUE(parse_drug_list("").empty());
    EXPECT_TRUE(parse_drug_list("  ").empty());
    EXPECT_TRUE(parse_drug_list(",,,").empty());
}

TEST(ParseDrugList, KeepsDuplicatesAndOrder) {
    std::vector<std::string> expected = {"WARFARIN", "CODEINE", "WARFARIN"};
    EXPECT_EQ(parse_drug_list("warfarin,codeine,warfarin"), expected);
}

// ============================================================================
// Evaluation
// ============================================================================

TEST(EvaluateDrugs, BlankListEvaluatesNothing) {
    EXPECT_TRUE(evaluate_drugs(reference_panel(), "").empty());
    EXPECT_TRUE(evaluate_drugs(reference_panel(), " , ").empty());
}

TEST(EvaluateDrugs, UnsupportedDrug) {
    auto results = evaluate_drugs(reference_panel(), "aspirin");
    ASSERT_EQ(results.size(), 1u);
    const auto& r = results[0];
    EXPECT_EQ(r.drug, "ASPIRIN");
    EXPECT_FALSE(r.gene.has_value());
    EXPECT_FALSE(r.phenotype.has_value());
    EXPECT_EQ(r.assessment.risk_label, RiskLabel::UNKNOWN);
    EXPECT_DOUBLE_EQ(r.assessment.confidence, 0.40);
    EXPECT_EQ(r.assessment.severity, Severity::LOW);
}

TEST(EvaluateDrugs, MissingGeneProfileFallsBackToSafe) {
    auto results = evaluate_drugs({}, "CODEINE, warfarin");
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].drug, "CODEINE");
    EXPECT_EQ(results[1].drug, "WARFARIN");
    for (const auto& r : results) {
        EXPECT_EQ(r.assessment.risk_label, RiskLabel::SAFE);
        EXPECT_DOUBLE_EQ(r.assessment.confidence, 0.85);
        EXPECT_EQ(r.assessment.severity, Severity::NONE);
        EXPECT_EQ(r.phenotype.value(), FALLBACK_PHENOTYPE);
        EXPECT_TRUE(r.gene.has_value());
    }
}

TEST(EvaluateDrugs, UnknownPhenotype) {
    auto profiles = with_profile("CYP2C19", "*1", "*9");
    auto results = evaluate_drugs(profiles, "clopidogrel");
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].assessment.risk_label, RiskLabel::UNKNOWN);
    EXPECT_DOUBLE_EQ(results[0].assessment.confidence, 0.50);
    EXPECT_EQ(results[0].assessment.severity, Severity::LOW);
    EXPECT_EQ(results[0].phenotype.value(), UNKNOWN_PHENOTYPE);
}

TEST(EvaluateDrugs, ExplicitMatchReferencePanel) {
    auto results = evaluate_drugs(reference_panel(),
                                  "CODEINE,WARFARIN,CLOPIDOGREL,SIMVASTATIN,AZATHIOPRINE,FLUOROURACIL");
    ASSERT_EQ(results.size(), 6u);
    for (const auto& r : results) {
        EXPECT_EQ(r.assessment.risk_label, RiskLabel::SAFE) << r.drug;
        EXPECT_DOUBLE_EQ(r.assessment.confidence, 0.95) << r.drug;
        EXPECT_EQ(r.assessment.severity, Severity::NONE) << r.drug;
    }
}

TEST(EvaluateDrugs, PoorMetabolizerScenarios) {
    auto codeine = evaluate_drugs(with_profile("CYP2D6", "*4", "*4"), "codeine");
    EXPECT_EQ(codeine[0].assessment.risk_label, RiskLabel::INEFFECTIVE);
    EXPECT_EQ(codeine[0].assessment.severity, Severity::MODERATE);

    auto fluorouracil = evaluate_drugs(with_profile("DPYD", "*2A", "*2A"), "fluorouracil");
    EXPECT_EQ(fluorouracil[0].assessment.risk_label, RiskLabel::TOXIC);
    EXPECT_EQ(fluorouracil[0].assessment.severity, Severity::CRITICAL);
    EXPECT_DOUBLE_EQ(fluorouracil[0].assessment.confidence, 0.95);

    auto azathioprine = evaluate_drugs(with_profile("TPMT", "*3A", "*3A"), "azathioprine");
    EXPECT_EQ(azathioprine[0].assessment.severity, Severity::CRITICAL);

    auto warfarin = evaluate_drugs(with_profile("CYP2C9", "*3", "*3"), "warfarin");
    EXPECT_EQ(warfarin[0].assessment.risk_label, RiskLabel::TOXIC);
    EXPECT_EQ(warfarin[0].assessment.severity, Severity::HIGH);
}

TEST(EvaluateDrugs, UltrarapidCodeineIsToxicButNotCritical) {
    auto results = evaluate_drugs(with_profile("CYP2D6", "*1", "*1xN"), "CODEINE");
    EXPECT_EQ(results[0].assessment.risk_label, RiskLabel::TOXIC);
    EXPECT_EQ(results[0].assessment.severity, Severity::HIGH);
}

TEST(EvaluateDrugs, SimvastatinDecreasedFunction) {
    auto results = evaluate_drugs(with_profile("SLCO1B1", "*1", "*5"), "simvastatin");
    EXPECT_EQ(results[0].assessment.risk_label, RiskLabel::ADJUST_DOSAGE);
    EXPECT_EQ(results[0].assessment.severity, Severity::MODERATE);
    EXPECT_EQ(results[0].gene.value(), "SLCO1B1");
}

TEST(EvaluateDrugs, CriticalOnlyForNamedPairs) {
    std::vector<GeneProfile> profiles;
    for (const auto& gene : required_panel()) {
        profiles.emplace_back(gene, "*x", "*x", "PM – Poor Metabolizer");
    }
    for (const auto& r : evaluate_drugs(profiles,
             "CODEINE,WARFARIN,CLOPIDOGREL,AZATHIOPRINE,FLUOROURACIL")) {
        bool named = r.drug == "AZATHIOPRINE" || r.drug == "FLUOROURACIL";
        EXPECT_EQ(r.assessment.severity == Severity::CRITICAL, named) << r.drug;
    }
}

TEST(EvaluateDrugs, PreservesRequestOrderWithMixedSupport) {
    auto results = evaluate_drugs(reference_panel(), "ibuprofen, Codeine, tamoxifen");
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].drug, "IBUPROFEN");
    EXPECT_EQ(results[1].drug, "CODEINE");
    EXPECT_EQ(results[2].drug, "TAMOXIFEN");
    EXPECT_DOUBLE_EQ(results[0].assessment.confidence, 0.40);
    EXPECT_DOUBLE_EQ(results[1].assessment.confidence, 0.95);
}
