/**
 * PGx Annotator - Pharmacogenomic Risk Reports
 *
 * Reads a VCF annotated with GENE and STAR INFO keys, resolves star-allele
 * diplotypes and phenotypes for a fixed six-gene panel, and reports
 * per-drug risk with CPIC-derived guidance.
 *
 * Pipeline:
 *   validate -> parse (vcf_parser) -> interpret (interpretation)
 *   -> evaluate drugs (drug_risk) -> assemble DrugReport
 */

#ifndef PGX_ANNOTATOR_HPP
#define PGX_ANNOTATOR_HPP

#include "vcf_parser.hpp"
#include "interpretation.hpp"
#include "drug_risk.hpp"
#include "risk_assessment.hpp"
#include "clinical_recommendation.hpp"
#include "explanation.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <chrono>
#include <cstdint>

namespace pgx {

// ============================================================================
// Configuration
// ============================================================================

constexpr std::uintmax_t DEFAULT_MAX_FILE_SIZE = 5 * 1024 * 1024;

/**
 * Settings collected from the command line
 */
struct AnalysisOptions {
    std::string vcf_path;
    std::string drugs;                  // Comma-separated drug list
    std::string output_path;            // Empty or "-" = stdout
    std::string output_format = "tsv";
    bool include_profiles = false;      // Also emit gene profile table
    std::string patient_id;             // Empty = random UUID per run
    std::uintmax_t max_file_size = DEFAULT_MAX_FILE_SIZE;
    bool strict = false;                // Parse errors / empty drug list are fatal
    std::string narrator_path;          // Narrator plugin shared library
    std::string narrator_config;        // key1=value1;key2=value2
    bool debug = false;
};

/**
 * Check an input VCF before parsing
 * @throws std::invalid_argument if missing, empty, not .vcf/.vcf.gz, or
 *         larger than max_bytes
 */
void validate_input_file(const std::string& path, std::uintmax_t max_bytes = DEFAULT_MAX_FILE_SIZE);

/**
 * Random RFC 4122 version 4 UUID, lowercase
 */
std::string generate_patient_id();

/**
 * ISO-8601 UTC with milliseconds, e.g. 2024-05-01T09:30:00.123Z
 */
std::string format_timestamp(std::chrono::system_clock::time_point time);

// ============================================================================
// Reports
// ============================================================================

/**
 * Actionable variant of the governing gene
 */
struct DetectedVariant {
    std::string rsid;
    std::string star_allele;
    std::string genotype;
};

struct PharmacogenomicProfile {
    std::optional<std::string> primary_gene;    // nullopt for unsupported drugs
    std::optional<std::string> diplotype;
    std::string phenotype = "Unknown";          // Short code (NM, IM, PM, RM, UM, Unknown)
    std::vector<DetectedVariant> detected_variants;
};

struct QualityMetrics {
    bool vcf_parsing_success = true;
    size_t parse_error_count = 0;
    std::vector<std::string> warnings;
};

/**
 * Complete result for one requested drug
 */
struct DrugReport {
    std::string patient_id;
    std::string drug;
    std::string timestamp;
    RiskAssessment risk;
    PharmacogenomicProfile profile;
    ClinicalRecommendation recommendation;
    std::string explanation;
    QualityMetrics quality;
};

/**
 * Everything produced by one analysis run
 */
struct AnalysisResult {
    std::vector<GeneProfile> gene_profiles;
    std::vector<DrugReport> reports;        // In drug request order
    QualityMetrics quality;
};

/**
 * Build the pharmacogenomic profile block of a report
 * @param gene       Governing gene, nullopt for unsupported drugs
 * @param profiles   Interpreted gene profiles
 * @param variants   Full parsed variant list
 */
PharmacogenomicProfile build_profile(const std::optional<std::string>& gene,
                                     const std::vector<GeneProfile>& profiles,
                                     const std::vector<VariantRecord>& variants);

// ============================================================================
// Analyzer
// ============================================================================

class Analyzer {
public:
    explicit Analyzer(AnalysisOptions options = AnalysisOptions());

    // Prevent copying
    Analyzer(const Analyzer&) = delete;
    Analyzer& operator=(const Analyzer&) = delete;

    /**
     * Replace the narrative generator (default: TemplateExplanationGenerator).
     * Null disables narratives; reports then carry the placeholder text.
     */
    void set_generator(std::shared_ptr<ExplanationGenerator> generator);

    /**
     * Validate, parse and analyze a VCF file
     * @throws std::invalid_argument on validation failure
     * @throws std::runtime_error on I/O failure
     */
    AnalysisResult analyze(const std::string& vcf_path, const std::string& drugs);

    /**
     * Analyze an already parsed VCF
     * @throws std::invalid_argument in strict mode on parse errors or an
     *         empty drug list
     */
    AnalysisResult analyze_parsed(const VcfParseResult& parsed, const std::string& drugs);

    const AnalysisOptions& options() const { return options_; }

private:
    AnalysisOptions options_;
    std::shared_ptr<ExplanationGenerator> generator_;
};

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
void set_log_level(LogLevel level);
LogLevel get_log_level();
void log(LogLevel level, const std::string& message);

} // namespace pgx

#endif // PGX_ANNOTATOR_HPP
