#pragma once

#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using SettingsMap = std::map<std::string, std::optional<std::string>>;

// ---------------------------------------------------------------------------
// SettingsLookup: external key/value source consulted once per scoring call.
// Unknown keys map to nullopt. Implementations may throw; callers do not
// catch.
// ---------------------------------------------------------------------------
class SettingsLookup {
public:
    virtual ~SettingsLookup() = default;
    virtual SettingsMap get_settings_by_keys(const std::vector<std::string>& keys) const = 0;
};

class InMemorySettingsLookup : public SettingsLookup {
public:
    InMemorySettingsLookup() = default;
    explicit InMemorySettingsLookup(std::map<std::string, std::string> values)
        : values_(std::move(values)) {}

    void set(const std::string& key, const std::string& value) { values_[key] = value; }

    SettingsMap get_settings_by_keys(const std::vector<std::string>& keys) const override {
        SettingsMap out;
        for (const auto& key : keys) {
            auto it = values_.find(key);
            if (it == values_.end()) out[key] = std::nullopt;
            else out[key] = it->second;
        }
        return out;
    }

private:
    std::map<std::string, std::string> values_;
};

// KEY=VALUE per line. Blank lines and lines starting with '#' are skipped;
// whitespace around key and value is trimmed.
class KeyValueFileSettingsLookup : public SettingsLookup {
public:
    explicit KeyValueFileSettingsLookup(std::string path) : path_(std::move(path)) {}

    SettingsMap get_settings_by_keys(const std::vector<std::string>& keys) const override {
        std::ifstream in(path_);
        if (!in.is_open()) {
            throw std::runtime_error("Cannot open settings file: " + path_);
        }
        std::map<std::string, std::string> values;
        std::string line;
        while (std::getline(in, line)) {
            auto trimmed = trim(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;
            auto eq = trimmed.find('=');
            if (eq == std::string::npos) continue;
            values[trim(trimmed.substr(0, eq))] = trim(trimmed.substr(eq + 1));
        }
        return InMemorySettingsLookup(std::move(values)).get_settings_by_keys(keys);
    }

private:
    std::string path_;

    static std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        auto b = s.find_first_not_of(ws);
        if (b == std::string::npos) return "";
        auto e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }
};

// ---------------------------------------------------------------------------
// Numeric setting helpers
// ---------------------------------------------------------------------------
namespace settings {

struct NumberDomain {
    std::optional<double> min;
    std::optional<double> max;
    bool integer = false;
};

// Blank or unparseable strings yield nullopt. The whole trimmed string must
// parse as a finite number.
inline std::optional<double> parse_optional_number(const std::optional<std::string>& raw) {
    if (!raw) return std::nullopt;
    const std::string& s = *raw;
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::nullopt;
    auto e = s.find_last_not_of(" \t\r\n");
    std::string trimmed = s.substr(b, e - b + 1);

    char* end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

// A value outside its domain falls back to `fallback` rather than being
// pinned to the boundary.
inline double normalize_number(double value, double fallback, const NumberDomain& domain) {
    if (!std::isfinite(value)) return fallback;
    if (domain.integer && std::floor(value) != value) return fallback;
    if (domain.min && value < *domain.min) return fallback;
    if (domain.max && value > *domain.max) return fallback;
    return value;
}

// One row of a settings table: where a knob comes from, which field it
// lands in, and which domain it must satisfy.
template <typename Settings, typename Overrides>
struct NumberField {
    const char* setting_key;  // nullptr: caller override only
    double Settings::*value;
    std::optional<double> Overrides::*override_value;
    NumberDomain domain;
};

template <typename Settings, typename Overrides, size_t N>
std::vector<std::string> setting_keys(const NumberField<Settings, Overrides> (&fields)[N]) {
    std::vector<std::string> keys;
    for (const auto& f : fields) {
        if (f.setting_key) keys.emplace_back(f.setting_key);
    }
    return keys;
}

// Later layers win: apply `layer` on top of `base`.
template <typename Settings, typename Overrides, size_t N>
void merge_overrides(Overrides& base, const Overrides& layer,
                     const NumberField<Settings, Overrides> (&fields)[N]) {
    for (const auto& f : fields) {
        if (layer.*(f.override_value)) base.*(f.override_value) = layer.*(f.override_value);
    }
}

template <typename Settings, typename Overrides, size_t N>
Overrides overrides_from_lookup(const SettingsLookup* lookup,
                                const NumberField<Settings, Overrides> (&fields)[N]) {
    Overrides out{};
    if (!lookup) return out;
    auto map = lookup->get_settings_by_keys(setting_keys(fields));
    for (const auto& f : fields) {
        if (!f.setting_key) continue;
        auto it = map.find(f.setting_key);
        if (it == map.end()) continue;
        auto parsed = parse_optional_number(it->second);
        if (parsed) out.*(f.override_value) = *parsed;
    }
    return out;
}

// Defaults <- merged overrides, validated once per field.
template <typename Settings, typename Overrides, size_t N>
Settings resolve(const Overrides& merged, const NumberField<Settings, Overrides> (&fields)[N]) {
    const Settings defaults{};
    Settings out{};
    for (const auto& f : fields) {
        double fallback = defaults.*(f.value);
        double candidate = (merged.*(f.override_value)).value_or(fallback);
        out.*(f.value) = normalize_number(candidate, fallback, f.domain);
    }
    return out;
}

}  // namespace settings
