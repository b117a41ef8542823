#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace kestrel {

// Missing or out-of-range parameter. Raised before any control tick runs.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct ConfigPaths {
    std::string controller_gains;
    std::string safety;
    std::string experiment;
};

ConfigPaths default_config_paths();

// Flat mapping of named numeric parameters. Unknown keys are carried but never read.
class Config {
public:
    Config() = default;

    // Scalar children of one top-level YAML section, e.g. "pid_gain".
    static Config load_yaml(const std::string& path, const std::string& section);

    void set(const std::string& key, double value) { values_[key] = value; }
    bool has(const std::string& key) const { return values_.count(key) != 0; }

    double get(const std::string& key) const;
    double get_or(const std::string& key, double fallback) const;

    // Value of a required key that must lie in [lo, hi].
    double require_range(const std::string& key, double lo, double hi) const;

    // Value of an optional key; if present it must lie in [lo, hi].
    double optional_range(const std::string& key, double fallback, double lo, double hi) const;

    const std::map<std::string, double>& values() const { return values_; }

private:
    std::map<std::string, double> values_;
};

} // namespace kestrel
