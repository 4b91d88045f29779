/**
 * VCF Parser - Implementation
 */

#include "vcf_parser.hpp"
#include "pgx_annotator.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <limits>
#include <memory>
#include <stdexcept>
#include <sys/stat.h>
#include <zlib.h>

namespace pgx {

namespace {

// Diagnostics quote at most this many characters of the offending line
constexpr size_t kErrorSnippetLength = 50;

std::string snippet(const std::string& line) {
    return line.substr(0, std::min(kErrorSnippetLength, line.size()));
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

// ============================================================================
// Utility Functions
// ============================================================================

const std::set<std::string>& target_genes() {
    static const std::set<std::string> genes = {
        "CYP2D6", "CYP2C19", "CYP2C9", "SLCO1B1", "TPMT", "DPYD"
    };
    return genes;
}

std::vector<std::string> split_line(const std::string& line, char delim) {
    std::vector<std::string> result;
    size_t start = 0;
    size_t pos = line.find(delim);
    while (pos != std::string::npos) {
        result.emplace_back(line, start, pos - start);
        start = pos + 1;
        pos = line.find(delim, start);
    }
    result.emplace_back(line, start);
    return result;
}

std::map<std::string, std::string> parse_info_field(const std::string& info) {
    std::map<std::string, std::string> result;
    if (info.empty() || info == ".") return result;

    for (const auto& token : split_line(info, ';')) {
        if (token.empty()) continue;

        size_t eq = token.find('=');
        if (eq == std::string::npos) {
            result[token] = "true";
        } else {
            result[token.substr(0, eq)] = token.substr(eq + 1);
        }
    }

    return result;
}

std::optional<std::string> extract_genotype(const std::string& format, const std::string& sample) {
    auto keys = split_line(format, ':');
    auto values = split_line(sample, ':');

    for (size_t i = 0; i < keys.size(); ++i) {
        if (keys[i] == "GT" && i < values.size()) {
            return values[i];
        }
    }
    return std::nullopt;
}

std::optional<int> parse_position(const std::string& token) {
    if (token.empty() || std::isspace(static_cast<unsigned char>(token[0]))) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        long value = std::stol(token, &consumed);
        if (consumed != token.size()) return std::nullopt;
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool file_exists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0);
}

// ============================================================================
// VcfParseResult
// ============================================================================

std::vector<VariantRecord> VcfParseResult::variants_for_gene(const std::string& gene) const {
    std::vector<VariantRecord> result;
    std::string wanted = to_upper(gene);
    for (const auto& v : variants) {
        if (to_upper(v.gene) == wanted) {
            result.push_back(v);
        }
    }
    return result;
}

// ============================================================================
// VcfParser
// ============================================================================

VcfParseResult VcfParser::parse(std::istream& input) const {
    return parse_lines([&input](std::string& line) -> bool {
        if (!std::getline(input, line)) {
            if (input.bad()) {
                throw std::runtime_error("Read error while parsing VCF stream");
            }
            return false;
        }
        while (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return true;
    });
}

VcfParseResult VcfParser::parse_file(const std::string& path) const {
    if (ends_with_gz(path)) {
        std::unique_ptr<gzFile_s, decltype(&gzclose)> gz(gzopen(path.c_str(), "rb"), &gzclose);
        if (!gz) {
            throw std::runtime_error("Cannot open gzipped VCF file: " + path);
        }
        log(LogLevel::DEBUG, "Reading gzipped VCF file: " + path);

        std::vector<char> buffer(65536);
        auto read_line = [&gz, &buffer, &path](std::string& line) -> bool {
            line.clear();
            while (true) {
                if (gzgets(gz.get(), buffer.data(), static_cast<int>(buffer.size())) == nullptr) {
                    int errnum = Z_OK;
                    const char* msg = gzerror(gz.get(), &errnum);
                    if (errnum != Z_OK && errnum != Z_STREAM_END) {
                        throw std::runtime_error("Read error in " + path + ": " + msg);
                    }
                    if (line.empty()) return false;
                    break;
                }
                line += buffer.data();
                // Long lines arrive in several chunks
                if (!line.empty() && line.back() == '\n') break;
            }
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
                line.pop_back();
            }
            return true;
        };

        return parse_lines(read_line);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open VCF file: " + path);
    }
    return parse(file);
}

VcfParseResult VcfParser::parse_lines(const LineReader& read_line) const {
    VcfParseResult result;
    const auto& genes = target_genes();

    std::string line;
    while (read_line(line)) {
        if (starts_with(line, "##")) {
            parse_meta_line(line, result);
        } else if (starts_with(line, "#CHROM")) {
            parse_header_line(line, result);
        } else if (!is_blank(line)) {
            result.data_lines++;
            auto variant = parse_data_line(line, result.errors);
            if (variant && genes.count(variant->gene)) {
                result.variants.push_back(std::move(*variant));
            }
        }
    }

    log(LogLevel::DEBUG, "Parsed " + std::to_string(result.data_lines) + " data lines, kept " +
        std::to_string(result.variants.size()) + " panel variants, " +
        std::to_string(result.errors.size()) + " errors");

    return result;
}

void VcfParser::parse_meta_line(const std::string& line, VcfParseResult& result) const {
    // ##fileformat=VCFv4.2, ##reference=GRCh38; everything else is ignored
    static const char* const captured[] = {"fileformat", "reference"};

    for (const char* key : captured) {
        std::string prefix = std::string("##") + key;
        if (!starts_with(line, prefix)) continue;

        size_t eq = line.find('=');
        if (eq != std::string::npos) {
            result.metadata[key] = line.substr(eq + 1);
        }
        return;
    }
}

void VcfParser::parse_header_line(const std::string& line, VcfParseResult& result) const {
    result.columns = split_line(line.substr(1), '\t');
    if (result.columns.size() > 9) {
        result.sample_name = result.columns[9];
    }
}

std::optional<VariantRecord> VcfParser::parse_data_line(
    const std::string& line,
    std::vector<std::string>& errors) const {

    auto cols = split_line(line, '\t');
    if (cols.size() < 8) {
        errors.push_back("Malformed line (too few columns): " + snippet(line));
        return std::nullopt;
    }

    auto pos = parse_position(cols[1]);
    if (!pos) {
        errors.push_back("Could not parse position in line: " + snippet(line));
        return std::nullopt;
    }

    VariantRecord record;
    record.chrom = cols[0];
    record.position = *pos;
    record.ref = cols[3];
    record.alt = cols[4];
    record.filter = cols[6];
    record.info = parse_info_field(cols[7]);

    record.gene = record.get_info("GENE").value_or("");
    record.star_allele = record.get_info("STAR").value_or("");

    const std::string& id = cols[2];
    record.rsid = starts_with(id, "rs") ? id : record.get_info("RS").value_or(id);

    if (cols.size() > 9) {
        record.genotype = extract_genotype(cols[8], cols[9]);
    }

    return record;
}

} // namespace pgx
