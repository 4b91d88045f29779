/**
 * PGx Annotator - Analyzer and process-wide utilities
 */

#include "pgx_annotator.hpp"
#include "phenotype_rules.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <random>
#include <atomic>
#include <utility>
#include <stdexcept>
#include <sys/stat.h>

namespace pgx {

// ============================================================================
// Logging
// ============================================================================

static std::atomic<LogLevel> g_log_level{LogLevel::INFO};

void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

LogLevel get_log_level() {
    return g_log_level.load();
}

void log(LogLevel level, const std::string& message) {
    if (level < g_log_level.load()) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time_t_now, &local);

    const char* level_str;
    switch (level) {
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
        default:                level_str = "UNKNOWN"; break;
    }

    // Whole line in a single write
    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
         << " - " << level_str << " - " << message << "\n";
    std::cerr << line.str() << std::flush;
}

// ============================================================================
// Input validation and run identifiers
// ============================================================================

void validate_input_file(const std::string& path, std::uintmax_t max_bytes) {
    if (path.empty()) {
        throw std::invalid_argument("No input VCF file given");
    }

    bool plain = path.size() > 4 && path.compare(path.size() - 4, 4, ".vcf") == 0;
    bool gz = path.size() > 7 && path.compare(path.size() - 7, 7, ".vcf.gz") == 0;
    if (!plain && !gz) {
        throw std::invalid_argument("Input file must be a .vcf or .vcf.gz file: " + path);
    }

    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        throw std::invalid_argument("Input file not found: " + path);
    }

    auto size = static_cast<std::uintmax_t>(st.st_size);
    if (size == 0) {
        throw std::invalid_argument("Input file is empty: " + path);
    }
    if (size > max_bytes) {
        throw std::invalid_argument("Input file exceeds " + std::to_string(max_bytes) +
                                    " byte limit (" + std::to_string(size) + " bytes): " + path);
    }
}

std::string generate_patient_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> byte_dist(0, 255);

    unsigned char bytes[16];
    for (auto& b : bytes) {
        b = static_cast<unsigned char>(byte_dist(rng));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    auto time_t_value = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;
    if (millis < 0) millis += 1000;

    std::tm utc{};
    gmtime_r(&time_t_value, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

// ============================================================================
// Report assembly
// ============================================================================

PharmacogenomicProfile build_profile(const std::optional<std::string>& gene,
                                     const std::vector<GeneProfile>& profiles,
                                     const std::vector<VariantRecord>& variants) {
    PharmacogenomicProfile profile;
    if (!gene) return profile;

    profile.primary_gene = gene;

    std::optional<std::string> phenotype;
    for (const auto& gp : profiles) {
        if (gp.gene == *gene) {
            profile.diplotype = gp.diplotype();
            phenotype = gp.phenotype;
            break;
        }
    }
    profile.phenotype = phenotype_short_code(phenotype);

    for (const auto& v : variants) {
        if (v.gene != *gene) continue;
        if (!v.is_heterozygous() && !v.is_homozygous_alt()) continue;
        profile.detected_variants.push_back({v.rsid, v.star_allele, v.genotype.value_or("")});
    }

    return profile;
}

Analyzer::Analyzer(AnalysisOptions options)
    : options_(std::move(options)),
      generator_(std::make_shared<TemplateExplanationGenerator>()) {}

void Analyzer::set_generator(std::shared_ptr<ExplanationGenerator> generator) {
    generator_ = std::move(generator);
}

AnalysisResult Analyzer::analyze(const std::string& vcf_path, const std::string& drugs) {
    validate_input_file(vcf_path, options_.max_file_size);

    log(LogLevel::INFO, "Parsing " + vcf_path);
    VcfParser parser;
    VcfParseResult parsed = parser.parse_file(vcf_path);

    return analyze_parsed(parsed, drugs);
}

AnalysisResult Analyzer::analyze_parsed(const VcfParseResult& parsed, const std::string& drugs) {
    if (options_.strict) {
        if (!parsed.is_success()) {
            throw std::invalid_argument("VCF has " + std::to_string(parsed.errors.size()) +
                                        " parse error(s); first: " + parsed.errors.front());
        }
        if (parse_drug_list(drugs).empty()) {
            throw std::invalid_argument("No drugs requested");
        }
    }

    for (const auto& error : parsed.errors) {
        log(LogLevel::WARNING, "VCF: " + error);
    }

    AnalysisResult result;
    result.quality.vcf_parsing_success = parsed.is_success();
    result.quality.parse_error_count = parsed.errors.size();

    CollectingDiagnosticSink diagnostics;
    result.gene_profiles = interpret(parsed.variants, &diagnostics);
    result.quality.warnings = diagnostics.messages();
    for (const auto& warning : result.quality.warnings) {
        log(LogLevel::WARNING, warning);
    }

    std::string patient_id = options_.patient_id.empty() ? generate_patient_id() : options_.patient_id;
    std::string timestamp = format_timestamp(std::chrono::system_clock::now());

    for (const auto& risk : evaluate_drugs(result.gene_profiles, drugs)) {
        DrugReport report;
        report.patient_id = patient_id;
        report.drug = risk.drug;
        report.timestamp = timestamp;
        report.risk = risk.assessment;
        report.profile = build_profile(risk.gene, result.gene_profiles, parsed.variants);
        report.recommendation = recommend(risk.drug, risk.assessment.risk_label);
        report.quality = result.quality;

        ExplanationFacts facts;
        facts.drug = risk.drug;
        facts.gene = risk.gene.value_or("");
        facts.diplotype = report.profile.diplotype.value_or("");
        facts.phenotype = risk.phenotype.value_or("");
        facts.risk_label = risk_label_to_string(risk.assessment.risk_label);
        facts.severity = severity_to_string(risk.assessment.severity);
        facts.action = report.recommendation.action;
        report.explanation = explain(generator_.get(), facts);

        result.reports.push_back(std::move(report));
    }

    log(LogLevel::INFO, "Analyzed " + std::to_string(result.reports.size()) + " drug(s) across " +
        std::to_string(result.gene_profiles.size()) + " genes");

    return result;
}

} // namespace pgx
