/**
 * Plugin Loader Implementation
 *
 * Handles dynamic loading of narrator plugins using dlopen/dlsym.
 */

#include "plugin.hpp"
#include "pgx_annotator.hpp"
#include <dlfcn.h>
#include <sstream>

namespace pgx {

std::map<std::string, std::string> parse_plugin_options(const std::string& config) {
    std::map<std::string, std::string> options;

    std::istringstream iss(config);
    std::string pair;
    while (std::getline(iss, pair, ';')) {
        size_t eq = pair.find('=');
        if (eq != std::string::npos) {
            options[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
    }

    return options;
}

PluginLoader::~PluginLoader() {
    // Unload all plugins in reverse order
    for (auto it = plugins_.rbegin(); it != plugins_.rend(); ++it) {
        unload_plugin(*it);
    }
    plugins_.clear();
}

bool PluginLoader::load_plugin(const std::string& path, const std::string& config) {
    // Clear any previous error
    last_error_.clear();
    dlerror();

    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* err = dlerror();
        last_error_ = "Failed to load plugin: " + std::string(err ? err : path);
        log(LogLevel::ERROR, last_error_);
        return false;
    }

    CreatePluginFunc create_func = reinterpret_cast<CreatePluginFunc>(
        dlsym(handle, "create_plugin")
    );
    if (!create_func) {
        last_error_ = "Plugin missing create_plugin function: " + path;
        log(LogLevel::ERROR, last_error_);
        dlclose(handle);
        return false;
    }

    DestroyPluginFunc destroy_func = reinterpret_cast<DestroyPluginFunc>(
        dlsym(handle, "destroy_plugin")
    );
    if (!destroy_func) {
        last_error_ = "Plugin missing destroy_plugin function: " + path;
        log(LogLevel::ERROR, last_error_);
        dlclose(handle);
        return false;
    }

    NarratorPlugin* plugin = nullptr;
    try {
        plugin = create_func();
    } catch (const std::exception& e) {
        last_error_ = "Plugin creation failed: " + std::string(e.what());
        log(LogLevel::ERROR, last_error_);
        dlclose(handle);
        return false;
    }

    if (!plugin) {
        last_error_ = "Plugin creation returned null: " + path;
        log(LogLevel::ERROR, last_error_);
        dlclose(handle);
        return false;
    }

    PluginConfig plugin_config;
    plugin_config.options = parse_plugin_options(config);

    try {
        std::string validation_error = plugin->validate_config(plugin_config);
        if (!validation_error.empty()) {
            last_error_ = "Plugin configuration invalid: " + validation_error;
        } else if (!plugin->initialize(plugin_config)) {
            last_error_ = "Plugin initialization failed: " + path;
        }
    } catch (const std::exception& e) {
        last_error_ = "Plugin initialization failed: " + std::string(e.what());
    }

    if (!last_error_.empty()) {
        log(LogLevel::ERROR, last_error_);
        destroy_func(plugin);
        dlclose(handle);
        return false;
    }

    LoadedPlugin lp;
    lp.handle = handle;
    lp.plugin = plugin;
    lp.destroy_func = destroy_func;
    lp.path = path;
    plugins_.push_back(lp);

    auto info = plugin->get_info();
    std::string message = "Loaded narrator plugin: " + info.name + " v" + info.version;
    if (!info.description.empty()) {
        message += " (" + info.description + ")";
    }
    log(LogLevel::INFO, message);

    return true;
}

std::vector<NarratorPlugin*> PluginLoader::get_plugins() const {
    std::vector<NarratorPlugin*> result;
    for (const auto& lp : plugins_) {
        result.push_back(lp.plugin);
    }
    return result;
}

std::shared_ptr<ExplanationGenerator> PluginLoader::create_generator() {
    if (plugins_.empty()) return nullptr;

    auto& lp = plugins_.back();
    try {
        auto generator = lp.plugin->create_generator();
        if (!generator) {
            last_error_ = "Plugin returned no generator: " + lp.path;
            log(LogLevel::ERROR, last_error_);
        }
        return generator;
    } catch (const std::exception& e) {
        last_error_ = "Plugin generator creation failed: " + std::string(e.what());
        log(LogLevel::ERROR, last_error_);
        return nullptr;
    }
}

void PluginLoader::unload_plugin(LoadedPlugin& p) {
    if (p.plugin && p.destroy_func) {
        p.destroy_func(p.plugin);
    }
    if (p.handle) {
        dlclose(p.handle);
    }
    p.plugin = nullptr;
    p.handle = nullptr;
}

} // namespace pgx
