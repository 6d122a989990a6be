#pragma once

#include "norflash/storage/flash_emulator.hpp"
#include "norflash/utils/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace norflash {

/**
 * @brief Configuration store for the flash emulator and its tools
 *
 * Values live in a two-level section/key tree and are loaded from and saved
 * to JSON. Loading merges over the defaults, so a file only needs the keys
 * it changes. Typed views (FlashConfig, LoggingConfig) read the tree with
 * the same defaults.
 */
class Configuration {
public:
    using ConfigValue = std::variant<bool, int64_t, double, std::string>;
    using ConfigSection = std::unordered_map<std::string, ConfigValue>;
    using ConfigTree = std::unordered_map<std::string, ConfigSection>;

    Configuration();
    ~Configuration();

    // File operations
    Result<void> loadFromFile(const std::string& filename);
    Result<void> saveToFile(const std::string& filename) const;
    Result<void> loadFromString(const std::string& config_data);
    std::string saveToString() const;

    // Value access
    template<typename T>
    T getValue(const std::string& section, const std::string& key, const T& default_value = T{}) const;

    template<typename T>
    void setValue(const std::string& section, const std::string& key, const T& value);

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;

    // Section management
    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& values);
    void removeSection(const std::string& section);
    std::vector<std::string> getSectionNames() const;

    // Validation
    struct ValidationRule {
        std::string section;
        std::string key;
        std::string type; // "bool", "int", "float", "string"
        std::optional<int64_t> min_value;
        std::optional<int64_t> max_value;
        std::vector<std::string> allowed_values;
        bool required = false;
    };

    void addValidationRule(const ValidationRule& rule);
    bool validate(std::vector<std::string>& errors) const;

    // Default configurations
    void setDefaults();

    struct FlashConfig {
        std::string image_path = "flash.bin";
        size_t capacity = 4 * 1024 * 1024;  // 4MB
        size_t read_size = 1;
        size_t write_size = 1;
        size_t erase_size = 4096;           // 4KB sectors
        std::string erase_tracking = "strict";
        bool truncate_oversized_image = false;
    };

    struct LoggingConfig {
        std::string level = "info";
        std::string file = "";
        bool console = true;
    };

    // Typed configuration accessors
    FlashConfig getFlashConfig() const;
    LoggingConfig getLoggingConfig() const;

    void setFlashConfig(const FlashConfig& config);
    void setLoggingConfig(const LoggingConfig& config);

    // Validates the tree and converts the flash section for FlashEmulator::open
    Result<storage::FlashEmulator::Config> toEmulatorConfig() const;

private:
    ConfigTree config_tree_;
    std::vector<ValidationRule> validation_rules_;

    void setupDefaultValidationRules();
    bool checkRule(const ValidationRule& rule, std::vector<std::string>& errors) const;

    template<typename T>
    T convertValue(const ConfigValue& value) const;
};

template<>
std::string Configuration::convertValue<std::string>(const ConfigValue& value) const;
template<>
bool Configuration::convertValue<bool>(const ConfigValue& value) const;
template<>
int64_t Configuration::convertValue<int64_t>(const ConfigValue& value) const;
template<>
double Configuration::convertValue<double>(const ConfigValue& value) const;

// Template implementations
template<typename T>
T Configuration::getValue(const std::string& section, const std::string& key, const T& default_value) const {
    auto section_it = config_tree_.find(section);
    if (section_it == config_tree_.end()) {
        return default_value;
    }

    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return default_value;
    }

    return convertValue<T>(key_it->second);
}

template<typename T>
void Configuration::setValue(const std::string& section, const std::string& key, const T& value) {
    config_tree_[section][key] = value;
}

} // namespace norflash
