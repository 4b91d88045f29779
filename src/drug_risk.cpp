/**
 * Drug Risk Evaluator - Implementation
 */

#include "drug_risk.hpp"
#include "phenotype_rules.hpp"
#include "pgx_annotator.hpp"
#include <algorithm>
#include <cctype>

namespace pgx {

namespace {

struct DrugDefinition {
    std::string gene;
    DrugRuleList rules;
};

// Prefix sets are kept disjoint within each drug so match order cannot matter
const std::map<std::string, DrugDefinition>& drug_table() {
    static const std::map<std::string, DrugDefinition> table = {
        {"CODEINE", {"CYP2D6", {
            {"PM", RiskLabel::INEFFECTIVE},
            {"IM", RiskLabel::ADJUST_DOSAGE},
            {"NM", RiskLabel::SAFE},
            {"RM", RiskLabel::TOXIC},
            {"UM", RiskLabel::TOXIC},
        }}},
        {"WARFARIN", {"CYP2C9", {
            {"PM", RiskLabel::TOXIC},
            {"IM", RiskLabel::ADJUST_DOSAGE},
            {"NM", RiskLabel::SAFE},
        }}},
        {"CLOPIDOGREL", {"CYP2C19", {
            {"PM", RiskLabel::INEFFECTIVE},
            {"IM", RiskLabel::ADJUST_DOSAGE},
            {"NM", RiskLabel::SAFE},
            {"RM", RiskLabel::SAFE},
        }}},
        {"SIMVASTATIN", {"SLCO1B1", {
            {"Poor Function", RiskLabel::TOXIC},
            {"Decreased Function", RiskLabel::ADJUST_DOSAGE},
            {"Normal Function", RiskLabel::SAFE},
        }}},
        {"AZATHIOPRINE", {"TPMT", {
            {"PM", RiskLabel::TOXIC},
            {"IM", RiskLabel::ADJUST_DOSAGE},
            {"NM", RiskLabel::SAFE},
        }}},
        {"FLUOROURACIL", {"DPYD", {
            {"PM", RiskLabel::TOXIC},
            {"IM", RiskLabel::ADJUST_DOSAGE},
            {"NM", RiskLabel::SAFE},
        }}},
    };
    return table;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

const std::set<std::string>& supported_drugs() {
    static const std::set<std::string> drugs = [] {
        std::set<std::string> names;
        for (const auto& entry : drug_table()) {
            names.insert(entry.first);
        }
        return names;
    }();
    return drugs;
}

bool is_supported_drug(const std::string& drug) {
    return drug_table().count(drug) > 0;
}

std::optional<std::string> governing_gene(const std::string& drug) {
    auto it = drug_table().find(drug);
    if (it == drug_table().end()) return std::nullopt;
    return it->second.gene;
}

const DrugRuleList& drug_rules(const std::string& drug) {
    static const DrugRuleList empty;
    auto it = drug_table().find(drug);
    return it != drug_table().end() ? it->second.rules : empty;
}

RiskLabel resolve_risk_label(const std::string& drug, const std::string& phenotype) {
    for (const auto& [prefix, label] : drug_rules(drug)) {
        if (phenotype.compare(0, prefix.size(), prefix) == 0) {
            return label;
        }
    }
    return RiskLabel::UNKNOWN;
}

std::vector<std::string> parse_drug_list(const std::string& drugs) {
    std::vector<std::string> result;

    size_t start = 0;
    while (start <= drugs.size()) {
        size_t comma = drugs.find(',', start);
        if (comma == std::string::npos) comma = drugs.size();

        std::string token = trim(drugs.substr(start, comma - start));
        std::transform(token.begin(), token.end(), token.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (!token.empty()) {
            result.push_back(std::move(token));
        }
        start = comma + 1;
    }

    return result;
}

DrugRiskResult evaluate_drug(const std::string& drug, const std::vector<GeneProfile>& profiles) {
    DrugRiskResult result;
    result.drug = drug;

    auto gene = governing_gene(drug);
    if (!gene) {
        log(LogLevel::DEBUG, "Unsupported drug: " + drug);
        result.assessment = build_risk_assessment(drug, std::nullopt, RiskLabel::UNKNOWN,
                                                  std::nullopt, false, true);
        return result;
    }
    result.gene = gene;

    auto profile = std::find_if(profiles.begin(), profiles.end(),
                                [&gene](const GeneProfile& p) { return p.gene == *gene; });

    if (profile == profiles.end()) {
        result.phenotype = FALLBACK_PHENOTYPE;
        result.assessment = build_risk_assessment(drug, gene, RiskLabel::SAFE,
                                                  result.phenotype, true, false);
        return result;
    }

    result.phenotype = profile->phenotype;

    if (is_unknown_phenotype(profile->phenotype)) {
        result.assessment = build_risk_assessment(drug, gene, RiskLabel::UNKNOWN,
                                                  result.phenotype, false, false);
        return result;
    }

    RiskLabel label = resolve_risk_label(drug, profile->phenotype);
    result.assessment = build_risk_assessment(drug, gene, label, result.phenotype, false, false);
    return result;
}

std::vector<DrugRiskResult> evaluate_drugs(const std::vector<GeneProfile>& profiles,
                                           const std::string& drugs) {
    std::vector<DrugRiskResult> results;
    for (const auto& drug : parse_drug_list(drugs)) {
        results.push_back(evaluate_drug(drug, profiles));
    }
    return results;
}

} // namespace pgx
