/**
 * PGx Annotator - Main Entry Point
 *
 * Reads a star-allele annotated VCF and reports pharmacogenomic risk for
 * the requested drugs.
 */

#include "cli.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    pgx::CliArguments cli;
    try {
        cli = pgx::parse_arguments(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n" << std::endl;
        pgx::print_usage(std::cerr, argv[0]);
        return 2;
    }

    if (cli.show_help) {
        pgx::print_usage(std::cout, argv[0]);
        return 0;
    }

    try {
        return pgx::run_analysis(cli.options);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
