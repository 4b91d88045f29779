/**
 * Output Writer - Report Output Formats
 *
 * Supports TSV (default) and JSON. Output goes to stdout for an empty
 * path or "-", and is gzip-compressed when the path ends in .gz.
 */

#ifndef PGX_OUTPUT_WRITER_HPP
#define PGX_OUTPUT_WRITER_HPP

#include "pgx_annotator.hpp"
#include <string>
#include <vector>
#include <memory>
#include <fstream>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>
#include <zlib.h>

namespace pgx {

/**
 * Output format types
 */
enum class OutputFormat {
    TSV,    // Tab-separated values (default)
    JSON    // JSON array of report objects
};

/**
 * Parse output format from string
 */
inline OutputFormat parse_output_format(const std::string& format) {
    std::string lower = format;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(lower[i])));
    }

    if (lower == "json") return OutputFormat::JSON;
    return OutputFormat::TSV;
}

/**
 * Confidence score with two decimals
 */
inline std::string format_confidence(double confidence) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << confidence;
    return oss.str();
}

/**
 * Abstract base class for report writers
 */
class ReportWriter {
public:
    explicit ReportWriter(const std::string& output_path)
        : output_path_(output_path), gz_file_(nullptr),
          use_stdout_(output_path.empty() || output_path == "-" || output_path == "STDOUT") {

        if (use_stdout_) {
            return;
        } else if (ends_with_gz(output_path_)) {
            gz_file_ = gzopen(output_path_.c_str(), "wb");
            if (!gz_file_) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        } else {
            output_.open(output_path_);
            if (!output_.is_open()) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        }
    }

    virtual ~ReportWriter() {
        close();
    }

    // Prevent copying
    ReportWriter(const ReportWriter&) = delete;
    ReportWriter& operator=(const ReportWriter&) = delete;

    virtual void write_header() = 0;
    virtual void write_report(const DrugReport& report) = 0;
    virtual void write_footer() = 0;

    /**
     * Queue gene profiles for output. Call before write_header(); the
     * profiles are written by write_footer().
     */
    void set_gene_profiles(const std::vector<GeneProfile>& profiles) {
        gene_profiles_ = profiles;
        include_profiles_ = true;
    }

    void write_reports(const std::vector<DrugReport>& reports) {
        for (const auto& report : reports) {
            write_report(report);
        }
    }

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (output_.is_open()) {
            output_.close();
        }
        if (use_stdout_) {
            std::cout.flush();
        }
    }

    size_t report_count() const { return report_count_; }

protected:
    std::vector<GeneProfile> gene_profiles_;
    bool include_profiles_ = false;
    size_t report_count_ = 0;

    void write_string(const std::string& s) {
        if (use_stdout_) {
            std::cout << s;
        } else if (gz_file_) {
            if (!s.empty() &&
                gzwrite(gz_file_, s.c_str(), static_cast<unsigned int>(s.size())) == 0) {
                throw std::runtime_error("Error writing output file: " + output_path_);
            }
        } else {
            output_ << s;
            if (!output_) {
                throw std::runtime_error("Error writing output file: " + output_path_);
            }
        }
    }

private:
    std::string output_path_;
    std::ofstream output_;
    gzFile gz_file_;
    bool use_stdout_;
};

/**
 * TSV output writer (default format)
 *
 * One row per drug. Empty values are written as "-". Detected variants
 * are packed as rsid:star:genotype, separated by ';'.
 */
class TsvReportWriter : public ReportWriter {
public:
    explicit TsvReportWriter(const std::string& output_path)
        : ReportWriter(output_path) {}

    void write_header() override {
        write_string("#patient_id\tdrug\ttimestamp\trisk_label\tconfidence_score\tseverity\t"
                     "primary_gene\tdiplotype\tphenotype\tdetected_variants\t"
                     "action\trecommendation\tmonitoring\texplanation\tvcf_parsing_success\n");
    }

    void write_report(const DrugReport& report) override {
        std::string variants;
        for (const auto& v : report.profile.detected_variants) {
            if (!variants.empty()) variants += ";";
            variants += v.rsid + ":" + v.star_allele + ":" + v.genotype;
        }

        std::ostringstream row;
        row << field(report.patient_id) << "\t"
            << field(report.drug) << "\t"
            << field(report.timestamp) << "\t"
            << risk_label_to_string(report.risk.risk_label) << "\t"
            << format_confidence(report.risk.confidence) << "\t"
            << severity_to_string(report.risk.severity) << "\t"
            << field(report.profile.primary_gene.value_or("")) << "\t"
            << field(report.profile.diplotype.value_or("")) << "\t"
            << field(report.profile.phenotype) << "\t"
            << field(variants) << "\t"
            << field(report.recommendation.action) << "\t"
            << field(report.recommendation.recommendation) << "\t"
            << field(report.recommendation.monitoring) << "\t"
            << field(report.explanation) << "\t"
            << (report.quality.vcf_parsing_success ? "true" : "false") << "\n";

        write_string(row.str());
        report_count_++;
    }

    void write_footer() override {
        if (!include_profiles_) return;

        std::ostringstream table;
        table << "\n#gene\tdiplotype\tphenotype\n";
        for (const auto& p : gene_profiles_) {
            table << field(p.gene) << "\t" << field(p.diplotype()) << "\t"
                  << field(p.phenotype) << "\n";
        }
        write_string(table.str());
    }

    /**
     * "-" for empty values; tabs and newlines become spaces
     */
    static std::string field(const std::string& value) {
        if (value.empty()) return "-";
        std::string result = value;
        for (auto& c : result) {
            if (c == '\t' || c == '\n' || c == '\r') c = ' ';
        }
        return result;
    }
};

/**
 * JSON output writer
 *
 * Writes an array of report objects. When gene profiles are queued the
 * top level becomes {"reports": [...], "gene_profiles": [...]}.
 */
class JsonReportWriter : public ReportWriter {
public:
    explicit JsonReportWriter(const std::string& output_path)
        : ReportWriter(output_path) {}

    void write_header() override {
        write_string(include_profiles_ ? "{\n\"reports\": [\n" : "[\n");
    }

    void write_report(const DrugReport& report) override {
        if (report_count_ > 0) {
            write_string(",\n");
        }

        std::ostringstream json;
        json << "  {\n";
        json << "    \"patient_id\": \"" << escape_json(report.patient_id) << "\",\n";
        json << "    \"drug\": \"" << escape_json(report.drug) << "\",\n";
        json << "    \"timestamp\": \"" << escape_json(report.timestamp) << "\",\n";

        json << "    \"risk_assessment\": {\n";
        json << "      \"risk_label\": \"" << risk_label_to_string(report.risk.risk_label) << "\",\n";
        json << "      \"confidence_score\": " << format_confidence(report.risk.confidence) << ",\n";
        json << "      \"severity\": \"" << severity_to_string(report.risk.severity) << "\"\n";
        json << "    },\n";

        const auto& profile = report.profile;
        json << "    \"pharmacogenomic_profile\": {\n";
        json << "      \"primary_gene\": " << optional_string(profile.primary_gene) << ",\n";
        json << "      \"diplotype\": " << optional_string(profile.diplotype) << ",\n";
        json << "      \"phenotype\": \"" << escape_json(profile.phenotype) << "\",\n";
        json << "      \"detected_variants\": [";
        for (size_t i = 0; i < profile.detected_variants.size(); ++i) {
            const auto& v = profile.detected_variants[i];
            json << (i > 0 ? ",\n" : "\n");
            json << "        {\"rsid\": \"" << escape_json(v.rsid)
                 << "\", \"star_allele\": \"" << escape_json(v.star_allele)
                 << "\", \"genotype\": \"" << escape_json(v.genotype) << "\"}";
        }
        json << (profile.detected_variants.empty() ? "]\n" : "\n      ]\n");
        json << "    },\n";

        json << "    \"clinical_recommendation\": {\n";
        json << "      \"action\": \"" << escape_json(report.recommendation.action) << "\",\n";
        json << "      \"recommendation\": \"" << escape_json(report.recommendation.recommendation) << "\",\n";
        json << "      \"monitoring\": \"" << escape_json(report.recommendation.monitoring) << "\"\n";
        json << "    },\n";

        json << "    \"llm_generated_explanation\": {\n";
        json << "      \"summary\": \"" << escape_json(report.explanation) << "\"\n";
        json << "    },\n";

        json << "    \"quality_metrics\": {\n";
        json << "      \"vcf_parsing_success\": " << (report.quality.vcf_parsing_success ? "true" : "false") << ",\n";
        json << "      \"parse_error_count\": " << report.quality.parse_error_count << ",\n";
        json << "      \"warnings\": [";
        for (size_t i = 0; i < report.quality.warnings.size(); ++i) {
            if (i > 0) json << ", ";
            json << "\"" << escape_json(report.quality.warnings[i]) << "\"";
        }
        json << "]\n";
        json << "    }\n";
        json << "  }";

        write_string(json.str());
        report_count_++;
    }

    void write_footer() override {
        if (!include_profiles_) {
            write_string(report_count_ > 0 ? "\n]\n" : "]\n");
            return;
        }

        std::ostringstream json;
        json << (report_count_ > 0 ? "\n],\n" : "],\n");
        json << "\"gene_profiles\": [";
        for (size_t i = 0; i < gene_profiles_.size(); ++i) {
            const auto& p = gene_profiles_[i];
            json << (i > 0 ? ",\n" : "\n");
            json << "  {\"gene\": \"" << escape_json(p.gene)
                 << "\", \"diplotype\": \"" << escape_json(p.diplotype())
                 << "\", \"phenotype\": \"" << escape_json(p.phenotype) << "\"}";
        }
        json << (gene_profiles_.empty() ? "]\n}\n" : "\n]\n}\n");
        write_string(json.str());
    }

    static std::string escape_json(const std::string& s) {
        std::string result;
        result.reserve(s.size());
        for (char c : s) {
            switch (c) {
                case '"': result += "\\\""; break;
                case '\\': result += "\\\\"; break;
                case '\b': result += "\\b"; break;
                case '\f': result += "\\f"; break;
                case '\n': result += "\\n"; break;
                case '\r': result += "\\r"; break;
                case '\t': result += "\\t"; break;
                default: result += c; break;
            }
        }
        return result;
    }

private:
    static std::string optional_string(const std::optional<std::string>& value) {
        return value ? "\"" + escape_json(*value) + "\"" : "null";
    }
};

/**
 * Create a writer for the given format
 */
inline std::unique_ptr<ReportWriter> create_report_writer(
    const std::string& output_path,
    OutputFormat format) {

    if (format == OutputFormat::JSON) {
        return std::make_unique<JsonReportWriter>(output_path);
    }
    return std::make_unique<TsvReportWriter>(output_path);
}

} // namespace pgx

#endif // PGX_OUTPUT_WRITER_HPP
