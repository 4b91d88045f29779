/**
 * VCF Parser
 *
 * Reads variant-call text (VCF 4.x) into VariantRecords restricted to the
 * pharmacogene panel. Malformed data lines are recorded as diagnostics and
 * skipped; only stream-level I/O failures are thrown.
 */

#ifndef PGX_VCF_PARSER_HPP
#define PGX_VCF_PARSER_HPP

#include "variant.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <istream>
#include <functional>
#include <optional>

namespace pgx {

/**
 * Genes retained by the parser. Records annotated with any other gene are
 * dropped without an error.
 */
const std::set<std::string>& target_genes();

/**
 * Output of a single parse
 */
struct VcfParseResult {
    std::vector<VariantRecord> variants;
    std::map<std::string, std::string> metadata;   // fileformat, reference
    std::vector<std::string> errors;

    std::vector<std::string> columns;               // #CHROM header, without '#'
    std::string sample_name;                        // 10th header column, if any
    size_t data_lines = 0;                          // data lines seen (kept or not)

    bool is_success() const { return errors.empty(); }

    /**
     * Records for one gene (case-insensitive match)
     */
    std::vector<VariantRecord> variants_for_gene(const std::string& gene) const;
};

/**
 * Line-oriented VCF parser
 */
class VcfParser {
public:
    /**
     * Line source: fills the string and returns true, or returns false at end
     * of input. Throws std::runtime_error on read failure.
     */
    using LineReader = std::function<bool(std::string&)>;

    VcfParser() = default;

    /**
     * Parse from an open stream
     * @throws std::runtime_error if the stream reports a read error
     */
    VcfParseResult parse(std::istream& input) const;

    /**
     * Parse a .vcf or .vcf.gz file
     * @throws std::runtime_error if the file cannot be opened or read
     */
    VcfParseResult parse_file(const std::string& path) const;

    /**
     * Parse from an arbitrary line source
     */
    VcfParseResult parse_lines(const LineReader& read_line) const;

private:
    void parse_meta_line(const std::string& line, VcfParseResult& result) const;
    void parse_header_line(const std::string& line, VcfParseResult& result) const;
    std::optional<VariantRecord> parse_data_line(const std::string& line,
                                                 std::vector<std::string>& errors) const;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * Split a line into fields by delimiter (empty fields preserved)
 */
std::vector<std::string> split_line(const std::string& line, char delim = '\t');

/**
 * Parse an INFO column: "K=V;FLAG;K2=V2". Bare flags map to "true";
 * "." or empty gives an empty map.
 */
std::map<std::string, std::string> parse_info_field(const std::string& info);

/**
 * Read the GT value from FORMAT/sample columns
 * @return GT value, or nullopt if GT is absent from either column
 */
std::optional<std::string> extract_genotype(const std::string& format, const std::string& sample);

/**
 * Strict integer parse of a POS column (whole token must be digits,
 * optional sign)
 */
std::optional<int> parse_position(const std::string& token);

/**
 * Check if a file exists
 */
bool file_exists(const std::string& path);

/**
 * Helper to check if path ends with .gz
 */
inline bool ends_with_gz(const std::string& path) {
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

} // namespace pgx

#endif // PGX_VCF_PARSER_HPP
