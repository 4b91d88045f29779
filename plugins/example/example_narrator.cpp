/**
 * Example Narrator Plugin
 *
 * This is a template for creating custom narrative generators.
 * Built by CMake as the example_narrator module, or by hand with:
 *   g++ -std=c++17 -shared -fPIC -I../../include example_narrator.cpp \
 *       -L<build> -lpgx_core -o example_narrator.so
 *
 * Options:
 *   style=brief|detailed   (default: brief)
 *   prefix=TEXT            prepended to every summary
 *   max_length=N           cut summaries longer than N characters (N < 4 = off)
 */

#include "plugin.hpp"
#include <sstream>
#include <stdexcept>

namespace pgx {

/**
 * Example generator - one or two sentences built from the facts
 */
class ExampleGenerator : public ExplanationGenerator {
public:
    ExampleGenerator(const std::string& style, const std::string& prefix, size_t max_length)
        : style_(style), prefix_(prefix), max_length_(max_length) {}

    std::string name() const override { return "example"; }

    std::string summarize(const ExplanationFacts& facts) override {
        std::ostringstream oss;
        if (!prefix_.empty()) {
            oss << prefix_ << " ";
        }

        oss << fact_or_unknown(facts.drug) << ": " << fact_or_unknown(facts.risk_label)
            << " (" << fact_or_unknown(facts.gene) << " "
            << fact_or_unknown(facts.diplotype) << ").";

        if (style_ == "detailed") {
            oss << " Phenotype " << fact_or_unknown(facts.phenotype)
                << ", severity " << fact_or_unknown(facts.severity)
                << ". " << fact_or_unknown(facts.action) << ".";
        }

        std::string summary = oss.str();
        if (max_length_ > 3 && summary.size() > max_length_) {
            summary = summary.substr(0, max_length_ - 3) + "...";
        }
        return summary;
    }

private:
    std::string style_;
    std::string prefix_;
    size_t max_length_;
};

/**
 * Example plugin implementation
 */
class ExampleNarratorPlugin : public NarratorPlugin {
public:
    PluginInfo get_info() const override {
        PluginInfo info;
        info.name = "example";
        info.version = "1.0.0";
        info.description = "one-line risk summary per drug";
        return info;
    }

    bool initialize(const PluginConfig& config) override {
        auto style = config.options.find("style");
        style_ = style != config.options.end() ? style->second : "brief";

        auto prefix = config.options.find("prefix");
        if (prefix != config.options.end()) {
            prefix_ = prefix->second;
        }

        // std::stoul throws on non-numeric input; the loader reports it
        auto max_length = config.options.find("max_length");
        if (max_length != config.options.end()) {
            size_t consumed = 0;
            max_length_ = std::stoul(max_length->second, &consumed);
            if (consumed != max_length->second.size()) {
                throw std::invalid_argument("max_length must be a number: " + max_length->second);
            }
        }
        return true;
    }

    std::shared_ptr<ExplanationGenerator> create_generator() override {
        return std::make_shared<ExampleGenerator>(style_, prefix_, max_length_);
    }

    std::string validate_config(const PluginConfig& config) const override {
        auto style = config.options.find("style");
        if (style != config.options.end() &&
            style->second != "brief" && style->second != "detailed") {
            return "style must be 'brief' or 'detailed', got '" + style->second + "'";
        }
        return "";
    }

private:
    std::string style_ = "brief";
    std::string prefix_;
    size_t max_length_ = 0;
};

// Export the plugin factory functions
PGX_PLUGIN_EXPORT(ExampleNarratorPlugin)

} // namespace pgx
