/**
 * Phenotype Rule Table - Implementation
 *
 * Star-allele activity summary:
 *   *1                       fully functional reference allele
 *   *2, *3, *4, *5, *6 ...   loss of function (gene-specific)
 *   *17 (CYP2C19), *1xN/*2xN (CYP2D6 duplication)   gain of function
 */

#include "phenotype_rules.hpp"
#include <utility>

namespace pgx {

namespace {

const std::string NM = "NM – Normal Metabolizer";
const std::string IM = "IM – Intermediate Metabolizer";
const std::string PM = "PM – Poor Metabolizer";
const std::string RM = "RM – Rapid Metabolizer";
const std::string UM = "UM – Ultrarapid Metabolizer";

const std::string SLCO1B1_NORMAL    = "Normal Function";
const std::string SLCO1B1_DECREASED = "Decreased Function – Increased Statin Myopathy Risk";
const std::string SLCO1B1_POOR      = "Poor Function – High Statin Myopathy Risk";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

bool is_unknown_phenotype(const std::string& phenotype) {
    return starts_with(phenotype, UNKNOWN_PHENOTYPE);
}

const std::map<std::string, std::map<std::string, std::string>>& PhenotypeRules::table() {
    static const std::map<std::string, std::map<std::string, std::string>> rules = {
        // CYP2C19: clopidogrel, PPIs, SSRIs. LoF *2 *3, GoF *17
        {"CYP2C19", {
            {"*1/*1",   NM},
            {"*1/*2",   IM},
            {"*1/*3",   IM},
            {"*2/*2",   PM},
            {"*2/*3",   PM},
            {"*3/*3",   PM},
            {"*1/*17",  RM},
            {"*2/*17",  IM},    // one LoF offsets one GoF
            {"*17/*17", UM},
        }},

        // CYP2D6: codeine, tamoxifen. LoF *3 *4 *5 *6, GoF xN duplication
        {"CYP2D6", {
            {"*1/*1",   NM},
            {"*1/*2",   NM},
            {"*2/*2",   NM},
            {"*1/*4",   IM},
            {"*1/*5",   IM},
            {"*1/*6",   IM},
            {"*4/*4",   PM},
            {"*4/*5",   PM},
            {"*5/*5",   PM},
            {"*3/*4",   PM},
            {"*4/*6",   PM},
            {"*1/*1xN", UM},
            {"*1/*2xN", UM},
        }},

        // CYP2C9: warfarin, NSAIDs, phenytoin. LoF *2 *3
        {"CYP2C9", {
            {"*1/*1", NM},
            {"*1/*2", IM},
            {"*1/*3", IM},
            {"*2/*2", IM},
            {"*2/*3", PM},
            {"*3/*3", PM},
        }},

        // SLCO1B1: hepatic statin uptake. *5 (rs4149056), *15 reduce transport
        {"SLCO1B1", {
            {"*1/*1",   SLCO1B1_NORMAL},
            {"*1/*5",   SLCO1B1_DECREASED},
            {"*1/*15",  SLCO1B1_DECREASED},
            {"*5/*5",   SLCO1B1_POOR},
            {"*5/*15",  SLCO1B1_POOR},
            {"*15/*15", SLCO1B1_POOR},
        }},

        // TPMT: thiopurines. LoF *2 *3A *3B *3C
        {"TPMT", {
            {"*1/*1",   NM},
            {"*1/*2",   IM},
            {"*1/*3A",  IM},
            {"*1/*3B",  IM},
            {"*1/*3C",  IM},
            {"*2/*3A",  PM},
            {"*3A/*3A", PM},
            {"*3A/*3C", PM},
            {"*3C/*3C", PM},
        }},

        // DPYD: fluoropyrimidines. LoF *2A (splice), *13 (c.1679T>G)
        {"DPYD", {
            {"*1/*1",   NM},
            {"*1/*2A",  IM},
            {"*1/*13",  IM},
            {"*2A/*2A", PM},
            {"*2A/*13", PM},
            {"*13/*13", PM},
        }},
    };
    return rules;
}

std::string PhenotypeRules::lookup(const std::string& gene,
                                   const std::string& allele1,
                                   const std::string& allele2) {
    const auto& rules = table();
    auto gene_it = rules.find(gene);
    if (gene_it == rules.end()) {
        return UNKNOWN_PHENOTYPE;
    }

    const auto& diplotypes = gene_it->second;
    auto it = diplotypes.find(allele1 + "/" + allele2);
    if (it != diplotypes.end()) return it->second;

    it = diplotypes.find(allele2 + "/" + allele1);
    if (it != diplotypes.end()) return it->second;

    return UNKNOWN_PHENOTYPE;
}

bool PhenotypeRules::has_gene(const std::string& gene) {
    return table().count(gene) > 0;
}

std::vector<std::string> PhenotypeRules::genes() {
    std::vector<std::string> result;
    for (const auto& entry : table()) {
        result.push_back(entry.first);
    }
    return result;
}

const std::map<std::string, std::string>& PhenotypeRules::rules_for(const std::string& gene) {
    static const std::map<std::string, std::string> empty;
    auto it = table().find(gene);
    return it != table().end() ? it->second : empty;
}

std::string phenotype_short_code(const std::optional<std::string>& phenotype) {
    if (!phenotype || is_unknown_phenotype(*phenotype)) return "Unknown";

    // Checked in order; the first matching prefix wins
    static const std::vector<std::pair<std::string, std::string>> codes = {
        {"NM", "NM"},
        {"IM", "IM"},
        {"PM", "PM"},
        {"RM", "RM"},
        {"UM", "UM"},
        {"Normal Function", "NM"},
        {"Decreased Function", "IM"},
        {"Poor Function", "PM"},
    };

    for (const auto& [prefix, code] : codes) {
        if (starts_with(*phenotype, prefix)) return code;
    }
    return "Unknown";
}

} // namespace pgx
