/**
 * Clinical Recommendation Table - Implementation
 */

#include "clinical_recommendation.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

namespace pgx {

namespace {

const char* const UNKNOWN_ACTION = "Seek specialist review";
const char* const UNKNOWN_RECOMMENDATION =
    "Pharmacogenomic result is inconclusive. Consult clinical pharmacologist.";
const char* const UNKNOWN_MONITORING = "Monitor clinically and consider repeat genotyping.";

using RecommendationKey = std::pair<std::string, RiskLabel>;

const std::map<RecommendationKey, ClinicalRecommendation>& recommendation_table() {
    static const std::map<RecommendationKey, ClinicalRecommendation> table = {
        // CODEINE (CYP2D6): prodrug, activated to morphine
        {{"CODEINE", RiskLabel::SAFE}, {
            "Proceed with standard dosing",
            "Codeine can be used at standard doses. No dose adjustment required.",
            "Standard pain reassessment at follow-up."}},
        {{"CODEINE", RiskLabel::ADJUST_DOSAGE}, {
            "Consider dose reduction or alternative",
            "Reduced CYP2D6 activity may lower morphine conversion. Start at 50% of standard dose "
            "or switch to a non-codeine analgesic.",
            "Monitor analgesic efficacy and sedation. Reassess within 48 hours."}},
        {{"CODEINE", RiskLabel::INEFFECTIVE}, {
            "Avoid codeine — use alternative analgesic",
            "CYP2D6 Poor Metabolizer: codeine cannot be converted to active morphine. "
            "Drug will be ineffective.",
            "Switch to a non-opioid analgesic (e.g., ibuprofen, paracetamol) or a "
            "non-CYP2D6-dependent opioid (e.g., oxycodone)."}},
        {{"CODEINE", RiskLabel::TOXIC}, {
            "Contraindicated — use alternative analgesic immediately",
            "CYP2D6 Ultrarapid Metabolizer: rapid conversion to morphine creates risk of "
            "respiratory depression and death at standard doses.",
            "Do not use codeine. Use a non-CYP2D6-dependent analgesic. Monitor for opioid "
            "toxicity signs if already administered."}},
        {{"CODEINE", RiskLabel::UNKNOWN}, {
            UNKNOWN_ACTION, UNKNOWN_RECOMMENDATION, UNKNOWN_MONITORING}},

        // WARFARIN (CYP2C9): S-warfarin clearance
        {{"WARFARIN", RiskLabel::SAFE}, {
            "Proceed with standard initiation protocol",
            "CYP2C9 Normal Metabolizer. Use standard warfarin initiation dose per local protocol.",
            "Monitor INR at day 3, day 7, then weekly until stable."}},
        {{"WARFARIN", RiskLabel::ADJUST_DOSAGE}, {
            "Reduce initial warfarin dose by 25–50%",
            "Reduced CYP2C9 activity will slow warfarin clearance. Initiate at 25–50% of "
            "standard dose to avoid supratherapeutic INR.",
            "Increase INR monitoring frequency: days 3, 5, 7, 10. Target INR 2.0–3.0."}},
        {{"WARFARIN", RiskLabel::TOXIC}, {
            "Significantly reduce dose or consider alternative anticoagulant",
            "CYP2C9 Poor Metabolizer: severely impaired warfarin clearance. Risk of major "
            "bleeding at standard doses. Reduce initial dose by ≥50% or switch to a DOAC.",
            "Daily INR monitoring until stable. Watch for bleeding signs. Consider "
            "haematology review."}},
        {{"WARFARIN", RiskLabel::INEFFECTIVE}, {
            "Proceed with standard dosing",
            "No evidence of reduced warfarin efficacy from CYP2C9 status alone.",
            "Standard INR monitoring."}},
        {{"WARFARIN", RiskLabel::UNKNOWN}, {
            UNKNOWN_ACTION, UNKNOWN_RECOMMENDATION, UNKNOWN_MONITORING}},

        // CLOPIDOGREL (CYP2C19): prodrug, no active metabolite in PM
        {{"CLOPIDOGREL", RiskLabel::SAFE}, {
            "Proceed with standard clopidogrel therapy",
            "CYP2C19 Normal/Rapid Metabolizer. Standard clopidogrel dose provides adequate "
            "platelet inhibition.",
            "Routine cardiovascular monitoring per indication."}},
        {{"CLOPIDOGREL", RiskLabel::ADJUST_DOSAGE}, {
            "Consider prasugrel or ticagrelor as alternative",
            "Reduced CYP2C19 activity may lead to suboptimal platelet inhibition. Consider "
            "switching to prasugrel or ticagrelor if clinically indicated.",
            "Platelet function testing recommended if clopidogrel is continued."}},
        {{"CLOPIDOGREL", RiskLabel::INEFFECTIVE}, {
            "Avoid clopidogrel — use prasugrel or ticagrelor",
            "CYP2C19 Poor Metabolizer: clopidogrel cannot be adequately activated. Risk of "
            "stent thrombosis or adverse cardiovascular events.",
            "Switch to prasugrel 10 mg/day or ticagrelor 90 mg twice daily per cardiology "
            "guidance."}},
        {{"CLOPIDOGREL", RiskLabel::TOXIC}, {
            "Proceed with standard dosing",
            "No toxicity risk identified from CYP2C19 status for clopidogrel.",
            "Standard monitoring."}},
        {{"CLOPIDOGREL", RiskLabel::UNKNOWN}, {
            UNKNOWN_ACTION, UNKNOWN_RECOMMENDATION, UNKNOWN_MONITORING}},

        // SIMVASTATIN (SLCO1B1): hepatic uptake transporter
        {{"SIMVASTATIN", RiskLabel::SAFE}, {
            "Proceed with standard simvastatin dosing",
            "SLCO1B1 Normal Function. Standard simvastatin dose is appropriate.",
            "Annual CK monitoring. Report unexplained muscle pain immediately."}},
        {{"SIMVASTATIN", RiskLabel::ADJUST_DOSAGE}, {
            "Reduce simvastatin dose or switch statin",
            "Decreased SLCO1B1 function increases simvastatin plasma exposure. Use ≤20 mg/day "
            "or switch to a lower-risk statin (pravastatin, rosuvastatin).",
            "CK levels at baseline and 3 months. Counsel patient on myopathy symptoms."}},
        {{"SIMVASTATIN", RiskLabel::TOXIC}, {
            "Avoid simvastatin — switch to pravastatin or rosuvastatin",
            "SLCO1B1 Poor Function: high risk of simvastatin-induced myopathy and "
            "rhabdomyolysis at standard doses.",
            "Switch to pravastatin 40 mg or rosuvastatin 20 mg. Baseline CK. Urgent review if "
            "muscle symptoms develop."}},
        {{"SIMVASTATIN", RiskLabel::INEFFECTIVE}, {
            "Proceed with standard dosing",
            "No efficacy concern identified from SLCO1B1 status.",
            "Standard monitoring."}},
        {{"SIMVASTATIN", RiskLabel::UNKNOWN}, {
            UNKNOWN_ACTION, UNKNOWN_RECOMMENDATION, UNKNOWN_MONITORING}},

        // AZATHIOPRINE (TPMT): thiopurine inactivation
        {{"AZATHIOPRINE", RiskLabel::SAFE}, {
            "Proceed with standard azathioprine dosing",
            "TPMT Normal Metabolizer. Standard dose is appropriate.",
            "CBC monthly for 3 months, then every 3 months. LFTs at baseline."}},
        {{"AZATHIOPRINE", RiskLabel::ADJUST_DOSAGE}, {
            "Reduce azathioprine dose by 30–70%",
            "Reduced TPMT activity increases thiopurine metabolite accumulation. Reduce dose by "
            "30–70% and titrate to clinical response.",
            "CBC weekly for first 4 weeks, then monthly. Monitor for leukopenia."}},
        {{"AZATHIOPRINE", RiskLabel::TOXIC}, {
            "Contraindicated — use alternative immunosuppressant",
            "TPMT Poor Metabolizer: azathioprine at any standard dose will cause "
            "life-threatening myelosuppression.",
            "Do not use azathioprine. Consider mycophenolate mofetil or another non-thiopurine "
            "agent. Haematology review required."}},
        {{"AZATHIOPRINE", RiskLabel::INEFFECTIVE}, {
            "Proceed with standard dosing",
            "No efficacy concern from TPMT status alone.",
            "Standard CBC monitoring."}},
        {{"AZATHIOPRINE", RiskLabel::UNKNOWN}, {
            UNKNOWN_ACTION, UNKNOWN_RECOMMENDATION, UNKNOWN_MONITORING}},

        // FLUOROURACIL (DPYD): 5-FU catabolism
        {{"FLUOROURACIL", RiskLabel::SAFE}, {
            "Proceed with standard 5-FU dosing",
            "DPYD Normal Metabolizer. Standard 5-FU dose and schedule are appropriate.",
            "Standard oncology monitoring: CBC, mucositis assessment, hand-foot syndrome review."}},
        {{"FLUOROURACIL", RiskLabel::ADJUST_DOSAGE}, {
            "Reduce 5-FU starting dose by 25–50%",
            "Reduced DPYD activity will impair 5-FU clearance. Reduce starting dose by "
            "25–50% and escalate only if tolerated.",
            "Close toxicity monitoring: CBC weekly, mucositis, diarrhoea, and neurotoxicity "
            "assessment each cycle."}},
        {{"FLUOROURACIL", RiskLabel::TOXIC}, {
            "Contraindicated at standard dose — oncology review required",
            "DPYD Poor Metabolizer: 5-FU cannot be adequately cleared. Standard doses will cause "
            "severe or fatal toxicity (mucositis, neutropenia, neurotoxicity).",
            "Do not administer standard 5-FU. Consider capecitabine dose reduction per DPYD "
            "guidelines or switch to an alternative regimen. Urgent oncology and clinical "
            "pharmacology review."}},
        {{"FLUOROURACIL", RiskLabel::INEFFECTIVE}, {
            "Proceed with standard dosing",
            "No efficacy concern from DPYD status alone.",
            "Standard oncology monitoring."}},
        {{"FLUOROURACIL", RiskLabel::UNKNOWN}, {
            UNKNOWN_ACTION, UNKNOWN_RECOMMENDATION, UNKNOWN_MONITORING}},
    };
    return table;
}

} // namespace

const ClinicalRecommendation& fallback_recommendation() {
    static const ClinicalRecommendation fallback = {
        UNKNOWN_ACTION, UNKNOWN_RECOMMENDATION, UNKNOWN_MONITORING
    };
    return fallback;
}

const ClinicalRecommendation& recommend(const std::string& drug, RiskLabel label) {
    std::string key = drug;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    const auto& table = recommendation_table();
    auto it = table.find({key, label});
    return it != table.end() ? it->second : fallback_recommendation();
}

const ClinicalRecommendation& recommend(const std::string& drug, const std::string& label) {
    // Unrecognized strings parse to UNKNOWN, whose rows carry the fallback text
    return recommend(drug, parse_risk_label(label));
}

} // namespace pgx
