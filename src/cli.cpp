/**
 * Command-line front end - Implementation
 */

#include "cli.hpp"
#include "output_writer.hpp"
#include "plugin.hpp"
#include <stdexcept>

namespace pgx {

namespace {

std::uintmax_t parse_size(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("--max-file-size must be a positive integer, got '" + value + "'");
    }
    std::uintmax_t size = 0;
    try {
        size = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("--max-file-size is out of range: " + value);
    }
    if (size == 0) {
        throw std::invalid_argument("--max-file-size must be a positive integer, got '" + value + "'");
    }
    return size;
}

} // namespace

std::pair<std::string, std::string> split_plugin_argument(const std::string& arg) {
    size_t colon = arg.find(':');
    if (colon == std::string::npos) {
        return {arg, ""};
    }
    return {arg.substr(0, colon), arg.substr(colon + 1)};
}

CliArguments parse_arguments(const std::vector<std::string>& args) {
    CliArguments cli;
    AnalysisOptions& options = cli.options;

    auto value_of = [&args](size_t& i) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Option " + args[i] + " requires a value");
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            cli.show_help = true;
            return cli;
        } else if (arg == "--vcf") {
            options.vcf_path = value_of(i);
        } else if (arg == "--drugs") {
            options.drugs = value_of(i);
        } else if (arg == "-o" || arg == "--output") {
            options.output_path = value_of(i);
        } else if (arg == "--format") {
            options.output_format = value_of(i);
            if (options.output_format != "tsv" && options.output_format != "json") {
                throw std::invalid_argument("Unsupported output format: " + options.output_format +
                                            " (expected tsv or json)");
            }
        } else if (arg == "--profiles") {
            options.include_profiles = true;
        } else if (arg == "--patient-id") {
            options.patient_id = value_of(i);
        } else if (arg == "--max-file-size") {
            options.max_file_size = parse_size(value_of(i));
        } else if (arg == "--strict") {
            options.strict = true;
        } else if (arg == "--narrator") {
            auto [path, config] = split_plugin_argument(value_of(i));
            options.narrator_path = path;
            options.narrator_config = config;
        } else if (arg == "--debug") {
            options.debug = true;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (options.vcf_path.empty()) {
        throw std::invalid_argument("--vcf is required");
    }

    return cli;
}

void print_usage(std::ostream& out, const std::string& program_name) {
    out << "PGx Annotator - Pharmacogenomic Drug Risk Reports\n"
        << "==================================================\n\n"
        << "Usage: " << program_name << " --vcf FILE --drugs LIST [OPTIONS]\n\n"
        << "Input:\n"
        << "  --vcf FILE              VCF with GENE/STAR INFO keys (.vcf or .vcf.gz)\n"
        << "  --drugs LIST            Comma-separated drugs, e.g. CODEINE,WARFARIN\n"
        << "  --max-file-size BYTES   Reject larger inputs (default: 5242880)\n"
        << "  --strict                Fail on VCF parse errors or an empty drug list\n\n"
        << "Output Options:\n"
        << "  -o, --output FILE       Output file (default: stdout; .gz compresses)\n"
        << "  --format tsv|json       Output format (default: tsv)\n"
        << "  --profiles              Also write the six-gene profile table\n"
        << "  --patient-id ID         Patient id (default: random UUID)\n\n"
        << "Narrative:\n"
        << "  --narrator PATH[:CONFIG]\n"
        << "                          Load narrator plugin from shared library\n"
        << "                          CONFIG: key1=value1;key2=value2\n\n"
        << "Other Options:\n"
        << "  -h, --help              Show this help message\n"
        << "  --debug                 Enable debug logging\n\n"
        << "Supported drugs: CODEINE WARFARIN CLOPIDOGREL SIMVASTATIN AZATHIOPRINE FLUOROURACIL\n\n"
        << "Examples:\n"
        << "  " << program_name << " --vcf patient.vcf --drugs CODEINE,CLOPIDOGREL\n"
        << "  " << program_name << " --vcf patient.vcf.gz --drugs WARFARIN --format json \\\n"
        << "      --profiles -o report.json\n"
        << std::endl;
}

int run_analysis(const AnalysisOptions& options) {
    if (options.debug) {
        set_log_level(LogLevel::DEBUG);
    }

    // Declared before the analyzer so plugin code outlives any generator it made
    PluginLoader loader;
    Analyzer analyzer(options);

    if (!options.narrator_path.empty()) {
        if (!loader.load_plugin(options.narrator_path, options.narrator_config)) {
            throw std::runtime_error(loader.get_last_error());
        }
        auto generator = loader.create_generator();
        if (generator) {
            analyzer.set_generator(generator);
        } else {
            log(LogLevel::WARNING, "Narrator plugin provided no generator; using built-in template");
        }
    }

    AnalysisResult result = analyzer.analyze(options.vcf_path, options.drugs);

    auto writer = create_report_writer(options.output_path, parse_output_format(options.output_format));
    if (options.include_profiles) {
        writer->set_gene_profiles(result.gene_profiles);
    }
    writer->write_header();
    writer->write_reports(result.reports);
    writer->write_footer();
    writer->close();

    log(LogLevel::INFO, "Wrote " + std::to_string(writer->report_count()) + " report(s)");
    return 0;
}

} // namespace pgx
