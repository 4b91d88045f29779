/**
 * Interpretation Orchestrator
 *
 * Runs filter -> group -> resolve -> phenotype lookup for every gene and
 * backfills the required panel, so callers always receive exactly one
 * GeneProfile per panel gene, sorted by gene symbol. A gene with no
 * actionable variants is reported as *1/*1 rather than left out.
 */

#ifndef PGX_INTERPRETATION_HPP
#define PGX_INTERPRETATION_HPP

#include "variant.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <utility>

namespace pgx {

/**
 * Interpretation result for one gene
 */
struct GeneProfile {
    std::string gene;
    std::string allele1 = "*1";
    std::string allele2 = "*1";
    std::string phenotype;

    GeneProfile() = default;
    GeneProfile(std::string gene_, std::string allele1_, std::string allele2_, std::string phenotype_)
        : gene(std::move(gene_)), allele1(std::move(allele1_)),
          allele2(std::move(allele2_)), phenotype(std::move(phenotype_)) {}

    /**
     * allele1/allele2 in resolved order (not re-sorted)
     */
    std::string diplotype() const { return allele1 + "/" + allele2; }
};

/**
 * The six genes always reported, sorted
 */
const std::vector<std::string>& required_panel();

/**
 * Receiver for non-fatal interpretation diagnostics
 */
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;

    /**
     * Report a recoverable anomaly for a gene
     */
    virtual void warn(const std::string& gene, const std::string& message) = 0;
};

/**
 * Forwards diagnostics to the process log at WARNING level
 */
class LoggingDiagnosticSink : public DiagnosticSink {
public:
    void warn(const std::string& gene, const std::string& message) override;
};

/**
 * Keeps diagnostics in memory
 */
class CollectingDiagnosticSink : public DiagnosticSink {
public:
    void warn(const std::string& gene, const std::string& message) override;

    std::vector<std::string> messages() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
};

/**
 * Interpret a full variant list
 * @param variants Raw records (may include 0/0 or missing genotypes)
 * @param sink     Receives hard-limit warnings; nullptr uses the log
 * @return One profile per required-panel gene, sorted by gene symbol
 */
std::vector<GeneProfile> interpret(const std::vector<VariantRecord>& variants,
                                   DiagnosticSink* sink = nullptr);

} // namespace pgx

#endif // PGX_INTERPRETATION_HPP
