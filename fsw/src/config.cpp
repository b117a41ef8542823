#include "kestrel/config.hpp"

#include <sstream>

#include <yaml-cpp/yaml.h>

namespace kestrel {

ConfigPaths default_config_paths() {
    ConfigPaths paths;
    paths.controller_gains = "configs/controller_gains.yaml";
    paths.safety           = "configs/safety.yaml";
    paths.experiment       = "configs/experiment.yaml";
    return paths;
}

Config Config::load_yaml(const std::string& path, const std::string& section) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot read " + path + ": " + e.what());
    }

    const YAML::Node node = root[section];
    if (!node || !node.IsMap()) {
        throw ConfigError("section '" + section + "' missing in " + path);
    }

    Config cfg;
    for (const auto& kv : node) {
        if (!kv.second.IsScalar()) {
            continue;  // nested tables are not part of the flat parameter set
        }
        const std::string key = kv.first.as<std::string>();
        try {
            cfg.set(key, kv.second.as<double>());
        } catch (const YAML::BadConversion&) {
            throw ConfigError(section + "/" + key + " in " + path + " is not numeric");
        }
    }
    return cfg;
}

double Config::get(const std::string& key) const {
    const auto it = values_.find(key);
    if (it == values_.end()) {
        throw ConfigError("missing required parameter '" + key + "'");
    }
    return it->second;
}

double Config::get_or(const std::string& key, double fallback) const {
    const auto it = values_.find(key);
    return it == values_.end() ? fallback : it->second;
}

double Config::require_range(const std::string& key, double lo, double hi) const {
    const double v = get(key);
    if (!(v >= lo && v <= hi)) {
        std::ostringstream os;
        os << "parameter '" << key << "' = " << v << " outside [" << lo << ", " << hi << "]";
        throw ConfigError(os.str());
    }
    return v;
}

double Config::optional_range(const std::string& key, double fallback, double lo, double hi) const {
    if (!has(key)) {
        return fallback;
    }
    return require_range(key, lo, hi);
}

} // namespace kestrel
