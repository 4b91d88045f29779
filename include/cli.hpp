/**
 * Command-line front end
 */

#ifndef PGX_CLI_HPP
#define PGX_CLI_HPP

#include "pgx_annotator.hpp"
#include <string>
#include <vector>
#include <utility>
#include <ostream>

namespace pgx {

/**
 * Parsed command line
 */
struct CliArguments {
    AnalysisOptions options;
    bool show_help = false;
};

/**
 * Parse arguments (without the program name)
 * @throws std::invalid_argument on unknown options, missing values, an
 *         unsupported --format, a bad --max-file-size, or missing --vcf
 */
CliArguments parse_arguments(const std::vector<std::string>& args);

/**
 * Split PATH[:CONFIG] at the first ':'
 */
std::pair<std::string, std::string> split_plugin_argument(const std::string& arg);

void print_usage(std::ostream& out, const std::string& program_name);

/**
 * Load the narrator (if any), analyze, and write reports
 * @return Process exit code
 * @throws std::invalid_argument on input validation failure
 * @throws std::runtime_error on I/O or plugin failure
 */
int run_analysis(const AnalysisOptions& options);

} // namespace pgx

#endif // PGX_CLI_HPP
