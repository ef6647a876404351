#pragma once
#include <string>
#include <map>
#include <vector>
#include <memory>
#include <cstdint>

namespace config {

// Configuration value types
enum class ConfigType {
    STRING,
    UINT,
    BOOL
};

// Configuration value wrapper. Values read from files are strings and are
// parsed on access; typed setters keep their type.
class ConfigValue {
public:
    ConfigValue() : type_(ConfigType::STRING) {}
    ConfigValue(const std::string& value) : type_(ConfigType::STRING), string_value_(value) {}
    ConfigValue(const char* value) : type_(ConfigType::STRING), string_value_(value) {}
    ConfigValue(uint64_t value) : type_(ConfigType::UINT), uint_value_(value) {}
    ConfigValue(bool value) : type_(ConfigType::BOOL), bool_value_(value) {}

    std::string as_string() const;

    // Throws std::invalid_argument for strings that are not plain decimal
    // unsigned integers, std::out_of_range when they exceed 64 bits.
    uint64_t as_uint64() const;

    // Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
    bool as_bool() const;

    ConfigType get_type() const { return type_; }

private:
    ConfigType type_;
    std::string string_value_;
    uint64_t uint_value_{0};
    bool bool_value_{false};
};

// Environment variable bound to a section/key pair
struct EnvBinding {
    std::string env_var;
    std::string section;
    std::string key;
};

// Process configuration manager (INI files + environment overlay)
class ProcessConfigManager {
public:
    ProcessConfigManager() = default;
    ~ProcessConfigManager() = default;

    // Configuration loading
    bool load_config(const std::string& config_file);
    bool load_config_from_string(const std::string& config_content);

    // Copies every set environment variable in bindings over the file values.
    // Returns the number of overrides applied.
    size_t apply_env_overrides(const std::vector<EnvBinding>& bindings);

    // Value access
    ConfigValue get_value(const std::string& section, const std::string& key, const ConfigValue& default_value) const;

    std::string get_string(const std::string& section, const std::string& key, const std::string& default_value = "") const;
    bool get_bool(const std::string& section, const std::string& key, bool default_value = false) const;

    // Falls back to default_value (and records a validation error) when the
    // stored value does not parse.
    uint64_t get_uint64(const std::string& section, const std::string& key, uint64_t default_value = 0) const;

    // Section access
    std::vector<std::string> get_sections() const;
    std::vector<std::string> get_keys(const std::string& section) const;
    bool has_section(const std::string& section) const;
    bool has_key(const std::string& section, const std::string& key) const;

    // Value setting
    void set_value(const std::string& section, const std::string& key, const ConfigValue& value);
    void set_string(const std::string& section, const std::string& key, const std::string& value);
    void set_uint64(const std::string& section, const std::string& key, uint64_t value);
    void set_bool(const std::string& section, const std::string& key, bool value);

    // Configuration validation
    bool validate_config() const;
    std::vector<std::string> get_validation_errors() const;

    // Utility methods
    std::string get_log_file() const;
    std::string get_log_level() const;

private:
    std::map<std::string, std::map<std::string, ConfigValue>> config_data_;
    mutable std::vector<std::string> validation_errors_;

    // Parsing helpers
    static std::string trim(const std::string& str);
    bool is_section_line(const std::string& line) const;
    bool is_key_value_line(const std::string& line) const;
    std::string extract_section_name(const std::string& line) const;
    std::pair<std::string, std::string> extract_key_value(const std::string& line) const;

    std::string read_file(const std::string& filename) const;
};

// Environment bindings for the [matching], [logging] and [rollup] sections
const std::vector<EnvBinding>& default_env_bindings();

} // namespace config
