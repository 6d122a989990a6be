#include "norflash/config/configuration.hpp"
#include "norflash/utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace norflash {

using json = nlohmann::json;

Configuration::Configuration() {
    setDefaults();
    setupDefaultValidationRules();
}

Configuration::~Configuration() = default;

Result<void> Configuration::loadFromFile(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        return unexpected(make_error(ErrorCode::CONFIG_FILE_NOT_FOUND,
                                     "Configuration file not found: " + filename));
    }

    std::ifstream file(filename);
    if (!file.is_open()) {
        return unexpected(make_error(ErrorCode::CONFIG_FILE_NOT_FOUND,
                                     "Cannot open configuration file: " + filename));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    RETURN_IF_ERROR(loadFromString(content));

    LOG_DEBUG("Loaded configuration from {}", filename);
    return {};
}

Result<void> Configuration::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return unexpected(make_error(ErrorCode::OPERATION_FAILED,
                                     "Cannot open configuration file for writing: " + filename));
    }

    file << saveToString() << "\n";
    if (!file.good()) {
        return unexpected(make_error(ErrorCode::OPERATION_FAILED,
                                     "Failed to write configuration file: " + filename));
    }
    return {};
}

Result<void> Configuration::loadFromString(const std::string& config_data) {
    json config_json;
    try {
        config_json = json::parse(config_data);
    } catch (const json::parse_error& e) {
        return unexpected(make_error(ErrorCode::CONFIG_INVALID_FORMAT,
                                     std::string("Invalid JSON: ") + e.what()));
    }

    if (!config_json.is_object()) {
        return unexpected(make_error(ErrorCode::CONFIG_INVALID_FORMAT,
                                     "Configuration root must be a JSON object"));
    }

    // Parse into a copy so a bad document leaves the current tree untouched
    ConfigTree parsed = config_tree_;
    for (const auto& section_item : config_json.items()) {
        const std::string& section_name = section_item.key();
        const json& section = section_item.value();
        if (!section.is_object()) {
            return unexpected(make_error(ErrorCode::CONFIG_INVALID_FORMAT,
                                         "Section '" + section_name + "' must be a JSON object"));
        }

        for (const auto& item : section.items()) {
            const std::string& key = item.key();
            const json& value = item.value();
            auto& slot = parsed[section_name][key];
            if (value.is_boolean()) {
                slot = value.get<bool>();
            } else if (value.is_number_integer()) {
                slot = value.get<int64_t>();
            } else if (value.is_number_float()) {
                slot = value.get<double>();
            } else if (value.is_string()) {
                slot = value.get<std::string>();
            } else {
                return unexpected(make_error(ErrorCode::CONFIG_INVALID_FORMAT,
                    "Value '" + section_name + "." + key + "' must be a bool, number or string"));
            }
        }
    }

    config_tree_ = std::move(parsed);
    return {};
}

std::string Configuration::saveToString() const {
    json config = json::object();

    for (const auto& [section_name, section] : config_tree_) {
        json& section_json = config[section_name];
        section_json = json::object();
        for (const auto& [key, value] : section) {
            std::visit([&section_json, &key](auto&& arg) { section_json[key] = arg; }, value);
        }
    }

    return config.dump(2);
}

bool Configuration::hasSection(const std::string& section) const {
    return config_tree_.find(section) != config_tree_.end();
}

bool Configuration::hasKey(const std::string& section, const std::string& key) const {
    auto section_it = config_tree_.find(section);
    if (section_it == config_tree_.end()) {
        return false;
    }
    return section_it->second.find(key) != section_it->second.end();
}

Configuration::ConfigSection Configuration::getSection(const std::string& section) const {
    auto section_it = config_tree_.find(section);
    if (section_it != config_tree_.end()) {
        return section_it->second;
    }
    return ConfigSection{};
}

void Configuration::setSection(const std::string& section, const ConfigSection& values) {
    config_tree_[section] = values;
}

void Configuration::removeSection(const std::string& section) {
    config_tree_.erase(section);
}

std::vector<std::string> Configuration::getSectionNames() const {
    std::vector<std::string> names;
    names.reserve(config_tree_.size());
    for (const auto& pair : config_tree_) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void Configuration::addValidationRule(const ValidationRule& rule) {
    validation_rules_.push_back(rule);
}

bool Configuration::checkRule(const ValidationRule& rule, std::vector<std::string>& errors) const {
    const std::string name = rule.section + "." + rule.key;

    auto section_it = config_tree_.find(rule.section);
    if (section_it == config_tree_.end() || section_it->second.find(rule.key) == section_it->second.end()) {
        if (rule.required) {
            errors.push_back(name + " is required");
            return false;
        }
        return true;
    }

    const ConfigValue& value = section_it->second.at(rule.key);
    bool type_ok = true;
    if (rule.type == "bool") {
        type_ok = std::holds_alternative<bool>(value);
    } else if (rule.type == "int") {
        type_ok = std::holds_alternative<int64_t>(value);
    } else if (rule.type == "float") {
        type_ok = std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value);
    } else if (rule.type == "string") {
        type_ok = std::holds_alternative<std::string>(value);
    }
    if (!type_ok) {
        errors.push_back(name + " must be of type " + rule.type);
        return false;
    }

    bool ok = true;
    if (rule.type == "int") {
        const int64_t number = std::get<int64_t>(value);
        if (rule.min_value && number < *rule.min_value) {
            errors.push_back(name + " must be at least " + std::to_string(*rule.min_value));
            ok = false;
        }
        if (rule.max_value && number > *rule.max_value) {
            errors.push_back(name + " must be at most " + std::to_string(*rule.max_value));
            ok = false;
        }
    }

    if (!rule.allowed_values.empty()) {
        const std::string text = convertValue<std::string>(value);
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), text) == rule.allowed_values.end()) {
            std::ostringstream allowed;
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                allowed << (i ? ", " : "") << rule.allowed_values[i];
            }
            errors.push_back(name + " must be one of: " + allowed.str() + " (got '" + text + "')");
            ok = false;
        }
    }

    return ok;
}

bool Configuration::validate(std::vector<std::string>& errors) const {
    errors.clear();

    bool rules_ok = true;
    for (const auto& rule : validation_rules_) {
        rules_ok = checkRule(rule, errors) && rules_ok;
    }

    // Geometry rules span several keys, only meaningful once each key is sane
    if (rules_ok) {
        const auto flash = getFlashConfig();
        storage::FlashGeometry geometry{flash.capacity, flash.read_size, flash.write_size, flash.erase_size};
        auto geometry_result = geometry.validate();
        if (!geometry_result) {
            errors.push_back("flash: " + geometry_result.error().message());
        }
    }

    return errors.empty();
}

void Configuration::setupDefaultValidationRules() {
    validation_rules_.clear();

    ValidationRule capacity{"flash", "capacity", "int"};
    capacity.min_value = 0;
    capacity.required = true;
    addValidationRule(capacity);

    for (const char* key : {"read_size", "write_size", "erase_size"}) {
        ValidationRule granularity{"flash", key, "int"};
        granularity.min_value = 1;
        granularity.required = true;
        addValidationRule(granularity);
    }

    ValidationRule image{"flash", "image_path", "string"};
    image.required = true;
    addValidationRule(image);

    ValidationRule tracking{"flash", "erase_tracking", "string"};
    tracking.allowed_values = {"strict", "content"};
    addValidationRule(tracking);

    addValidationRule(ValidationRule{"flash", "truncate_oversized_image", "bool"});

    ValidationRule level{"logging", "level", "string"};
    level.allowed_values = {"trace", "debug", "info", "warn", "error", "off"};
    addValidationRule(level);

    addValidationRule(ValidationRule{"logging", "file", "string"});
    addValidationRule(ValidationRule{"logging", "console", "bool"});
}

void Configuration::setDefaults() {
    config_tree_.clear();
    setFlashConfig(FlashConfig{});
    setLoggingConfig(LoggingConfig{});
}

Configuration::FlashConfig Configuration::getFlashConfig() const {
    const FlashConfig defaults;
    FlashConfig config;
    config.image_path = getValue<std::string>("flash", "image_path", defaults.image_path);
    config.capacity = static_cast<size_t>(getValue<int64_t>("flash", "capacity", static_cast<int64_t>(defaults.capacity)));
    config.read_size = static_cast<size_t>(getValue<int64_t>("flash", "read_size", static_cast<int64_t>(defaults.read_size)));
    config.write_size = static_cast<size_t>(getValue<int64_t>("flash", "write_size", static_cast<int64_t>(defaults.write_size)));
    config.erase_size = static_cast<size_t>(getValue<int64_t>("flash", "erase_size", static_cast<int64_t>(defaults.erase_size)));
    config.erase_tracking = getValue<std::string>("flash", "erase_tracking", defaults.erase_tracking);
    config.truncate_oversized_image = getValue<bool>("flash", "truncate_oversized_image", defaults.truncate_oversized_image);
    return config;
}

Configuration::LoggingConfig Configuration::getLoggingConfig() const {
    const LoggingConfig defaults;
    LoggingConfig config;
    config.level = getValue<std::string>("logging", "level", defaults.level);
    config.file = getValue<std::string>("logging", "file", defaults.file);
    config.console = getValue<bool>("logging", "console", defaults.console);
    return config;
}

void Configuration::setFlashConfig(const FlashConfig& config) {
    setValue("flash", "image_path", config.image_path);
    setValue("flash", "capacity", static_cast<int64_t>(config.capacity));
    setValue("flash", "read_size", static_cast<int64_t>(config.read_size));
    setValue("flash", "write_size", static_cast<int64_t>(config.write_size));
    setValue("flash", "erase_size", static_cast<int64_t>(config.erase_size));
    setValue("flash", "erase_tracking", config.erase_tracking);
    setValue("flash", "truncate_oversized_image", config.truncate_oversized_image);
}

void Configuration::setLoggingConfig(const LoggingConfig& config) {
    setValue("logging", "level", config.level);
    setValue("logging", "file", config.file);
    setValue("logging", "console", config.console);
}

Result<storage::FlashEmulator::Config> Configuration::toEmulatorConfig() const {
    for (const auto& rule : validation_rules_) {
        if (rule.required && !hasKey(rule.section, rule.key)) {
            return unexpected(make_error(ErrorCode::CONFIG_MISSING_FIELD,
                "Missing required configuration value " + rule.section + "." + rule.key));
        }
    }

    std::vector<std::string> errors;
    if (!validate(errors)) {
        std::ostringstream message;
        message << "Invalid configuration:";
        for (const auto& error : errors) {
            message << " " << error << ";";
        }
        return unexpected(make_error(ErrorCode::CONFIG_INVALID_VALUE, message.str()));
    }

    const auto flash = getFlashConfig();
    ASSIGN_OR_RETURN(auto tracking, storage::erase_tracking_from_string(flash.erase_tracking));

    storage::FlashEmulator::Config config;
    config.image_path = flash.image_path;
    config.geometry = storage::FlashGeometry{flash.capacity, flash.read_size, flash.write_size, flash.erase_size};
    config.erase_tracking = tracking;
    config.truncate_oversized_image = flash.truncate_oversized_image;
    return config;
}

// Template method specializations
template<>
std::string Configuration::convertValue<std::string>(const ConfigValue& value) const {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else {
            return std::to_string(arg);
        }
    }, value);
}

template<>
bool Configuration::convertValue<bool>(const ConfigValue& value) const {
    return std::visit([](auto&& arg) -> bool {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
            return arg;
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::string lower = arg;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
        } else {
            return arg != 0;
        }
    }, value);
}

template<>
int64_t Configuration::convertValue<int64_t>(const ConfigValue& value) const {
    return std::visit([](auto&& arg) -> int64_t {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, int64_t>) {
            return arg;
        } else if constexpr (std::is_same_v<T, double>) {
            return static_cast<int64_t>(arg);
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? 1 : 0;
        } else {
            // Accepts decimal and 0x-prefixed hex; unparsable text reads as 0
            try {
                return static_cast<int64_t>(std::stoll(arg, nullptr, 0));
            } catch (const std::logic_error&) {
                return 0;
            }
        }
    }, value);
}

template<>
double Configuration::convertValue<double>(const ConfigValue& value) const {
    return std::visit([](auto&& arg) -> double {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            try {
                return std::stod(arg);
            } catch (const std::logic_error&) {
                return 0.0;
            }
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? 1.0 : 0.0;
        } else {
            return static_cast<double>(arg);
        }
    }, value);
}

} // namespace norflash
