/**
 * Narrator Plugin Interface
 *
 * A narrator turns the facts of one drug report into a short readable
 * summary. The built-in TemplateExplanationGenerator covers the default case; a
 * plugin can wrap a language model client or a site-specific template
 * behind the same ExplanationGenerator interface.
 */

#ifndef PGX_PLUGIN_HPP
#define PGX_PLUGIN_HPP

#include "explanation.hpp"
#include <string>
#include <vector>
#include <memory>
#include <map>

namespace pgx {

/**
 * Narrator identity, logged when the plugin loads
 */
struct PluginInfo {
    std::string name;
    std::string version;
    std::string description;
};

/**
 * Options given after the colon of --narrator PATH:CONFIG
 */
struct PluginConfig {
    std::map<std::string, std::string> options;
};

/**
 * Parse "key1=value1;key2=value2". Pairs without '=' are ignored.
 */
std::map<std::string, std::string> parse_plugin_options(const std::string& config);

/**
 * A shared library that supplies the ExplanationGenerator used for the
 * per-drug summary. It must export:
 *   extern "C" NarratorPlugin* create_plugin();
 *   extern "C" void destroy_plugin(NarratorPlugin* plugin);
 * PGX_PLUGIN_EXPORT below writes both.
 *
 * The loader calls validate_config(), then initialize(), then
 * create_generator() once per run. Any of them may throw; the loader
 * reports the failure and unloads the library.
 */
class NarratorPlugin {
public:
    virtual ~NarratorPlugin() = default;

    virtual PluginInfo get_info() const = 0;

    /**
     * Check options before anything is set up.
     * @return Empty string if valid, error message otherwise
     */
    virtual std::string validate_config(const PluginConfig& config) const {
        (void)config;
        return "";
    }

    /**
     * Apply options. Return false (or throw) to refuse the configuration.
     */
    virtual bool initialize(const PluginConfig& config) = 0;

    /**
     * The generator must not outlive the PluginLoader that loaded the plugin.
     */
    virtual std::shared_ptr<ExplanationGenerator> create_generator() = 0;
};

/**
 * Plugin factory function types
 */
typedef NarratorPlugin* (*CreatePluginFunc)();
typedef void (*DestroyPluginFunc)(NarratorPlugin*);

/**
 * Plugin loader - handles dynamic loading of plugins
 */
class PluginLoader {
public:
    PluginLoader() = default;
    ~PluginLoader();

    // Prevent copying
    PluginLoader(const PluginLoader&) = delete;
    PluginLoader& operator=(const PluginLoader&) = delete;

    /**
     * Load a plugin from a shared library
     * @param path Path to .so/.dylib file
     * @param config Configuration string
     * @return true if loaded successfully
     */
    bool load_plugin(const std::string& path, const std::string& config = "");

    /**
     * Get all loaded plugins
     */
    std::vector<NarratorPlugin*> get_plugins() const;

    /**
     * Generator of the most recently loaded plugin, null if none loaded or
     * creation failed
     */
    std::shared_ptr<ExplanationGenerator> create_generator();

    /**
     * Get plugin count
     */
    size_t plugin_count() const { return plugins_.size(); }

    /**
     * Get error message from last operation
     */
    std::string get_last_error() const { return last_error_; }

private:
    struct LoadedPlugin {
        void* handle;
        NarratorPlugin* plugin;
        DestroyPluginFunc destroy_func;
        std::string path;
    };

    std::vector<LoadedPlugin> plugins_;
    std::string last_error_;

    void unload_plugin(LoadedPlugin& p);
};

/**
 * Helper macro for plugin implementation
 */
#define PGX_PLUGIN_EXPORT(PluginClass) \
    extern "C" { \
        pgx::NarratorPlugin* create_plugin() { return new PluginClass(); } \
        void destroy_plugin(pgx::NarratorPlugin* plugin) { delete plugin; } \
    }

} // namespace pgx

#endif // PGX_PLUGIN_HPP
