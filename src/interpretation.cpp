/**
 * Interpretation Orchestrator - Implementation
 */

#include "interpretation.hpp"
#include "diplotype_resolver.hpp"
#include "phenotype_rules.hpp"
#include "pgx_annotator.hpp"
#include <algorithm>
#include <map>

namespace pgx {

const std::vector<std::string>& required_panel() {
    static const std::vector<std::string> panel = {
        "CYP2C19", "CYP2C9", "CYP2D6", "DPYD", "SLCO1B1", "TPMT"
    };
    return panel;
}

// ============================================================================
// Diagnostic sinks
// ============================================================================

void LoggingDiagnosticSink::warn(const std::string& gene, const std::string& message) {
    log(LogLevel::WARNING, gene + ": " + message);
}

void CollectingDiagnosticSink::warn(const std::string& gene, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(gene + ": " + message);
}

std::vector<std::string> CollectingDiagnosticSink::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

bool CollectingDiagnosticSink::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.empty();
}

// ============================================================================
// Interpretation
// ============================================================================

std::vector<GeneProfile> interpret(const std::vector<VariantRecord>& variants,
                                   DiagnosticSink* sink) {
    LoggingDiagnosticSink default_sink;
    DiagnosticSink& diagnostics = sink ? *sink : default_sink;

    const auto& panel = required_panel();
    auto groups = group_by_gene(filter_actionable(variants));

    std::map<std::string, GeneProfile> resolved;
    for (const auto& [gene, records] : groups) {
        if (std::find(panel.begin(), panel.end(), gene) == panel.end()) {
            log(LogLevel::DEBUG, "Skipping " + std::to_string(records.size()) +
                " variant(s) for non-panel gene " + gene);
            continue;
        }

        auto resolution = resolve_diplotype(records);
        if (!resolution) continue;

        if (resolution->hard_limit_exceeded) {
            diagnostics.warn(gene, "more than two heterozygous alleles; only the first two (" +
                             resolution->diplotype() + ") were used. Check VCF annotation quality.");
        }

        std::string phenotype = PhenotypeRules::lookup(gene, resolution->allele1, resolution->allele2);
        resolved[gene] = GeneProfile(gene, resolution->allele1, resolution->allele2, phenotype);

        log(LogLevel::DEBUG, gene + " resolved to " + resolution->diplotype() + " (" + phenotype + ")");
    }

    // Genes without actionable variants are assumed wild-type
    for (const auto& gene : panel) {
        if (resolved.count(gene)) continue;
        std::string phenotype = PhenotypeRules::lookup(gene, REFERENCE_ALLELE, REFERENCE_ALLELE);
        resolved[gene] = GeneProfile(gene, REFERENCE_ALLELE, REFERENCE_ALLELE, phenotype);
    }

    std::vector<GeneProfile> profiles;
    profiles.reserve(resolved.size());
    for (auto& entry : resolved) {
        profiles.push_back(std::move(entry.second));
    }
    std::sort(profiles.begin(), profiles.end(),
              [](const GeneProfile& a, const GeneProfile& b) { return a.gene < b.gene; });

    return profiles;
}

} // namespace pgx
