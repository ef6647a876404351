#include "process_config_manager.hpp"
#include "../logging/log_helper.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace config {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string ConfigValue::as_string() const {
    switch (type_) {
        case ConfigType::STRING: return string_value_;
        case ConfigType::UINT: return std::to_string(uint_value_);
        case ConfigType::BOOL: return bool_value_ ? "true" : "false";
        default: return "";
    }
}

uint64_t ConfigValue::as_uint64() const {
    switch (type_) {
        case ConfigType::UINT: return uint_value_;
        case ConfigType::BOOL: return bool_value_ ? 1 : 0;
        case ConfigType::STRING: {
            if (string_value_.empty()) {
                throw std::invalid_argument("empty value");
            }
            uint64_t result = 0;
            for (char c : string_value_) {
                if (c < '0' || c > '9') {
                    throw std::invalid_argument("not an unsigned integer: '" + string_value_ + "'");
                }
                const uint64_t digit = static_cast<uint64_t>(c - '0');
                if (result > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
                    throw std::out_of_range("value exceeds 64 bits: '" + string_value_ + "'");
                }
                result = result * 10 + digit;
            }
            return result;
        }
        default: return 0;
    }
}

bool ConfigValue::as_bool() const {
    switch (type_) {
        case ConfigType::BOOL: return bool_value_;
        case ConfigType::UINT: return uint_value_ != 0;
        case ConfigType::STRING: {
            const std::string lowered = to_lower(string_value_);
            return lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on";
        }
        default: return false;
    }
}

bool ProcessConfigManager::load_config(const std::string& config_file) {
    try {
        std::string content = read_file(config_file);
        bool ok = load_config_from_string(content);
        LOG_INFO_COMP("CONFIG", "Loaded " + config_file + " (" +
                      std::to_string(config_data_.size()) + " sections)");
        return ok;
    } catch (const std::exception& e) {
        LOG_ERROR_COMP("CONFIG", "Error loading config file " + config_file + ": " + e.what());
        return false;
    }
}

bool ProcessConfigManager::load_config_from_string(const std::string& config_content) {
    config_data_.clear();
    validation_errors_.clear();

    std::istringstream stream(config_content);
    std::string line;
    std::string current_section;

    while (std::getline(stream, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (is_section_line(line)) {
            current_section = extract_section_name(line);
            config_data_[current_section];
        } else if (is_key_value_line(line)) {
            if (current_section.empty()) {
                validation_errors_.push_back("Key-value pair found outside of section: " + line);
                continue;
            }

            auto [key, value] = extract_key_value(line);
            if (key.empty()) {
                validation_errors_.push_back("Empty key in section [" + current_section + "]");
                continue;
            }
            config_data_[current_section][key] = ConfigValue(value);
        } else {
            validation_errors_.push_back("Unrecognised line: " + line);
        }
    }

    return validation_errors_.empty();
}

size_t ProcessConfigManager::apply_env_overrides(const std::vector<EnvBinding>& bindings) {
    size_t applied = 0;
    for (const auto& binding : bindings) {
        const char* value = std::getenv(binding.env_var.c_str());
        if (value == nullptr) {
            continue;
        }
        set_string(binding.section, binding.key, trim(value));
        LOG_INFO_COMP("CONFIG", binding.env_var + " overrides [" + binding.section + "] " + binding.key);
        ++applied;
    }
    return applied;
}

ConfigValue ProcessConfigManager::get_value(const std::string& section, const std::string& key, const ConfigValue& default_value) const {
    auto section_it = config_data_.find(section);
    if (section_it == config_data_.end()) {
        return default_value;
    }

    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return default_value;
    }

    return key_it->second;
}

std::string ProcessConfigManager::get_string(const std::string& section, const std::string& key, const std::string& default_value) const {
    return get_value(section, key, ConfigValue(default_value)).as_string();
}

bool ProcessConfigManager::get_bool(const std::string& section, const std::string& key, bool default_value) const {
    return get_value(section, key, ConfigValue(default_value)).as_bool();
}

uint64_t ProcessConfigManager::get_uint64(const std::string& section, const std::string& key, uint64_t default_value) const {
    try {
        return get_value(section, key, ConfigValue(default_value)).as_uint64();
    } catch (const std::exception& e) {
        validation_errors_.push_back("[" + section + "] " + key + ": " + e.what());
        LOG_WARN_COMP("CONFIG", "Invalid [" + section + "] " + key + " (" + e.what() +
                      "), using default " + std::to_string(default_value));
        return default_value;
    }
}

std::vector<std::string> ProcessConfigManager::get_sections() const {
    std::vector<std::string> sections;
    for (const auto& [section, _] : config_data_) {
        sections.push_back(section);
    }
    return sections;
}

std::vector<std::string> ProcessConfigManager::get_keys(const std::string& section) const {
    std::vector<std::string> keys;
    auto section_it = config_data_.find(section);
    if (section_it != config_data_.end()) {
        for (const auto& [key, _] : section_it->second) {
            keys.push_back(key);
        }
    }
    return keys;
}

bool ProcessConfigManager::has_section(const std::string& section) const {
    return config_data_.find(section) != config_data_.end();
}

bool ProcessConfigManager::has_key(const std::string& section, const std::string& key) const {
    auto section_it = config_data_.find(section);
    if (section_it == config_data_.end()) {
        return false;
    }
    return section_it->second.find(key) != section_it->second.end();
}

void ProcessConfigManager::set_value(const std::string& section, const std::string& key, const ConfigValue& value) {
    config_data_[section][key] = value;
}

void ProcessConfigManager::set_string(const std::string& section, const std::string& key, const std::string& value) {
    set_value(section, key, ConfigValue(value));
}

void ProcessConfigManager::set_uint64(const std::string& section, const std::string& key, uint64_t value) {
    set_value(section, key, ConfigValue(value));
}

void ProcessConfigManager::set_bool(const std::string& section, const std::string& key, bool value) {
    set_value(section, key, ConfigValue(value));
}

bool ProcessConfigManager::validate_config() const {
    for (const auto& [section, keys] : config_data_) {
        if (section.empty()) {
            validation_errors_.push_back("Empty section name");
        }
    }
    return validation_errors_.empty();
}

std::vector<std::string> ProcessConfigManager::get_validation_errors() const {
    return validation_errors_;
}

std::string ProcessConfigManager::get_log_file() const {
    return get_string("logging", "file", "");
}

std::string ProcessConfigManager::get_log_level() const {
    return get_string("logging", "level", "INFO");
}

std::string ProcessConfigManager::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool ProcessConfigManager::is_section_line(const std::string& line) const {
    return line.length() >= 3 && line[0] == '[' && line[line.length() - 1] == ']';
}

bool ProcessConfigManager::is_key_value_line(const std::string& line) const {
    return line.find('=') != std::string::npos;
}

std::string ProcessConfigManager::extract_section_name(const std::string& line) const {
    return trim(line.substr(1, line.length() - 2));
}

std::pair<std::string, std::string> ProcessConfigManager::extract_key_value(const std::string& line) const {
    size_t eq_pos = line.find('=');
    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1));
    return {key, value};
}

std::string ProcessConfigManager::read_file(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

const std::vector<EnvBinding>& default_env_bindings() {
    static const std::vector<EnvBinding> bindings = {
        {"MATCHER_MAX_TRADES_PER_BATCH", "matching", "max_trades_per_batch"},
        {"MATCHER_MIN_TRADE_AMOUNT", "matching", "min_trade_amount"},
        {"MATCHER_MAKER_FEE_BPS", "matching", "maker_fee_bps"},
        {"MATCHER_TAKER_FEE_BPS", "matching", "taker_fee_bps"},
        {"MATCHER_FEE_MODE", "matching", "fee_mode"},
        {"MATCHER_PROCESSING_MODE", "matching", "processing_mode"},
        {"LOG_LEVEL", "logging", "level"},
        {"ROLLUP_HTTP_SERVER_URL", "rollup", "url"},
    };
    return bindings;
}

} // namespace config
