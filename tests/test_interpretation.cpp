/**
 * Tests for interpretation.hpp: panel completeness, sorting, backfill,
 * resolution scenarios, and hard-limit diagnostics.
 */

#include <gtest/gtest.h>
#include "interpretation.hpp"
#include "phenotype_rules.hpp"
#include "pgx_annotator.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace pgx;

static VariantRecord rec(const std::string& gene, const std::string& star, const std::string& gt) {
    VariantRecord v;
    v.chrom = "chr1";
    v.position = 1;
    v.gene = gene;
    v.star_allele = star;
    v.genotype = gt;
    return v;
}

static const GeneProfile& profile_for(const std::vector<GeneProfile>& profiles, const std::string& gene) {
    for (const auto& p : profiles) {
        if (p.gene == gene) return p;
    }
    throw std::runtime_error("missing profile for " + gene);
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

class InterpretationTest : public ::testing::Test {
protected:
    CollectingDiagnosticSink sink;

    std::vector<GeneProfile> run(const std::vector<VariantRecord>& variants) {
        return interpret(variants, &sink);
    }

    void expect_full_panel(const std::vector<GeneProfile>& profiles) {
        ASSERT_EQ(profiles.size(), required_panel().size());
        for (size_t i = 0; i < profiles.size(); ++i) {
            EXPECT_EQ(profiles[i].gene, required_panel()[i]);
        }
    }
};

// ============================================================================
// Panel completeness
// ============================================================================

TEST(RequiredPanel, SixSortedGenes) {
    std::vector<std::string> expected = {"CYP2C19", "CYP2C9", "CYP2D6", "DPYD", "SLCO1B1", "TPMT"};
    EXPECT_EQ(required_panel(), expected);
}

TEST_F(InterpretationTest, EmptyInputGivesReferencePanel) {
    auto profiles = run({});
    expect_full_panel(profiles);
    for (const auto& p : profiles) {
        EXPECT_EQ(p.diplotype(), "*1/*1") << p.gene;
        EXPECT_EQ(p.phenotype, PhenotypeRules::lookup(p.gene, "*1", "*1")) << p.gene;
    }
    EXPECT_TRUE(starts_with(profile_for(profiles, "CYP2D6").phenotype, "NM"));
    EXPECT_TRUE(sink.empty());
}

TEST_F(InterpretationTest, HomRefOnlyMatchesNoInput) {
    auto baseline = run({});
    auto profiles = run({rec("CYP2C19", "*2", "0/0"), rec("TPMT", "*3A", "0/0")});
    expect_full_panel(profiles);
    for (size_t i = 0; i < profiles.size(); ++i) {
        EXPECT_EQ(profiles[i].diplotype(), baseline[i].diplotype());
        EXPECT_EQ(profiles[i].phenotype, baseline[i].phenotype);
    }
}

TEST_F(InterpretationTest, NonPanelGenesAreIgnored) {
    auto profiles = run({rec("TP53", "*2", "0/1"), rec("BRCA1", "*5", "1/1")});
    expect_full_panel(profiles);
}

TEST_F(InterpretationTest, UninformativeRecordsAreIgnored) {
    VariantRecord missing = rec("CYP2C9", "*3", "");
    missing.genotype.reset();
    auto profiles = run({missing, rec("CYP2C9", "*2", "./.")});
    EXPECT_EQ(profile_for(profiles, "CYP2C9").diplotype(), "*1/*1");
}

// ============================================================================
// Scenarios
// ============================================================================

TEST_F(InterpretationTest, SingleHeterozygousCyp2c19) {
    auto profiles = run({rec("CYP2C19", "*2", "0/1")});
    expect_full_panel(profiles);
    const auto& p = profile_for(profiles, "CYP2C19");
    EXPECT_EQ(p.diplotype(), "*1/*2");
    EXPECT_TRUE(starts_with(p.phenotype, "IM"));
}

TEST_F(InterpretationTest, CompoundHeterozygousCyp2c9) {
    auto profiles = run({rec("CYP2C9", "*2", "0/1"), rec("CYP2C9", "*3", "0/1")});
    const auto& p = profile_for(profiles, "CYP2C9");
    EXPECT_NE(p.diplotype().find("*2"), std::string::npos);
    EXPECT_NE(p.diplotype().find("*3"), std::string::npos);
    EXPECT_TRUE(starts_with(p.phenotype, "PM"));
}

TEST_F(InterpretationTest, HomozygousAltWinsForCyp2d6) {
    auto profiles = run({rec("CYP2D6", "*4", "1/1"), rec("CYP2D6", "*6", "0/1")});
    const auto& p = profile_for(profiles, "CYP2D6");
    EXPECT_EQ(p.diplotype(), "*4/*4");
    EXPECT_TRUE(starts_with(p.phenotype, "PM"));
}

TEST_F(InterpretationTest, UnlistedDiplotypeIsUnknown) {
    auto profiles = run({rec("CYP2C19", "*9", "0/1")});
    const auto& p = profile_for(profiles, "CYP2C19");
    EXPECT_EQ(p.diplotype(), "*1/*9");
    EXPECT_EQ(p.phenotype, UNKNOWN_PHENOTYPE);
}

TEST_F(InterpretationTest, ResolvedOrderIsKept) {
    auto profiles = run({rec("CYP2C9", "*3", "0/1"), rec("CYP2C9", "*2", "0/1")});
    const auto& p = profile_for(profiles, "CYP2C9");
    EXPECT_EQ(p.allele1, "*3");
    EXPECT_EQ(p.allele2, "*2");
    EXPECT_EQ(p.phenotype, "PM – Poor Metabolizer");
}

TEST_F(InterpretationTest, MultipleGenesAtOnce) {
    auto profiles = run({
        rec("DPYD", "*2A", "1/1"),
        rec("SLCO1B1", "*5", "0/1"),
        rec("TPMT", "3A", "0/1"),
    });
    expect_full_panel(profiles);
    EXPECT_EQ(profile_for(profiles, "DPYD").diplotype(), "*2A/*2A");
    EXPECT_TRUE(starts_with(profile_for(profiles, "SLCO1B1").phenotype, "Decreased Function"));
    EXPECT_EQ(profile_for(profiles, "TPMT").diplotype(), "*1/*3A");
    EXPECT_EQ(profile_for(profiles, "CYP2C19").diplotype(), "*1/*1");
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST_F(InterpretationTest, HardLimitIsReportedNotFatal) {
    auto profiles = run({
        rec("TPMT", "*2", "0/1"),
        rec("TPMT", "*3A", "0/1"),
        rec("TPMT", "*3C", "0/1"),
    });
    expect_full_panel(profiles);
    EXPECT_EQ(profile_for(profiles, "TPMT").diplotype(), "*2/*3A");
    EXPECT_EQ(profile_for(profiles, "TPMT").phenotype, "PM – Poor Metabolizer");

    auto messages = sink.messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].rfind("TPMT: ", 0), 0u);
    EXPECT_NE(messages[0].find("*2/*3A"), std::string::npos);
}

TEST(Interpretation, DefaultSinkDoesNotThrow) {
    std::vector<VariantRecord> variants;
    for (const char* star : {"*2", "*3", "*17"}) {
        VariantRecord v;
        v.gene = "CYP2C19";
        v.star_allele = star;
        v.genotype = "0/1";
        variants.push_back(v);
    }
    std::vector<GeneProfile> profiles;
    EXPECT_NO_THROW(profiles = interpret(variants));
    EXPECT_EQ(profiles.size(), 6u);
}

TEST(Interpretation, ConcurrentRunsWithLoggingSink) {
    std::vector<VariantRecord> variants;
    for (const char* star : {"*2", "*3", "*17"}) {
        VariantRecord v;
        v.gene = "CYP2C19";
        v.star_allele = star;
        v.genotype = "0/1";
        variants.push_back(v);
    }

    LogLevel saved = get_log_level();
    set_log_level(LogLevel::WARNING);

    std::atomic<int> bad_results{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&variants, &bad_results, t] {
            for (int i = 0; i < 50; ++i) {
                // Flip the threshold while other threads are logging
                if (t == 0) set_log_level(i % 2 ? LogLevel::WARNING : LogLevel::ERROR);
                auto profiles = interpret(variants);
                if (profiles.size() != 6 || profiles[0].diplotype() != "*2/*3") {
                    ++bad_results;
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    set_log_level(saved);
    EXPECT_EQ(bad_results.load(), 0);
}

TEST(Interpretation, ConcurrentRunsWithCollectingSink) {
    std::vector<VariantRecord> variants = {
        rec("TPMT", "*2", "0/1"),
        rec("TPMT", "*3A", "0/1"),
        rec("TPMT", "*3C", "0/1"),
    };

    CollectingDiagnosticSink shared;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&variants, &shared] {
            for (int i = 0; i < 25; ++i) {
                interpret(variants, &shared);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(shared.messages().size(), 100u);
}
