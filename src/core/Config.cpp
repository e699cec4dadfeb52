#include "core/Config.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>

#include "utils/StringUtils.hpp"

Config::Config()
{
    SetString("application.name", "GDS Layer Viewer");
    SetInt("window.width", 1280);
    SetInt("window.height", 720);
}

Config::~Config() = default;

void Config::SetString(const std::string& key, const std::string& value)
{
    m_values_[key] = value;
}

void Config::SetInt(const std::string& key, int value)
{
    m_values_[key] = value;
}

void Config::SetFloat(const std::string& key, float value)
{
    m_values_[key] = value;
}

void Config::SetBool(const std::string& key, bool value)
{
    m_values_[key] = value;
}

std::string Config::GetString(const std::string& key, const std::string& default_value) const
{
    auto it = m_values_.find(key);
    if (it == m_values_.end()) {
        return default_value;
    }
    if (std::holds_alternative<std::string>(it->second)) {
        return std::get<std::string>(it->second);
    }
    return std::visit(
        [](const auto& val_in) -> std::string {
            std::stringstream ss;
            if constexpr (std::is_same_v<std::decay_t<decltype(val_in)>, bool>) {
                ss << (val_in ? "true" : "false");
            } else {
                ss << val_in;
            }
            return ss.str();
        },
        it->second);
}

int Config::GetInt(const std::string& key, int default_value) const
{
    auto it = m_values_.find(key);
    if (it != m_values_.end()) {
        try {
            if (std::holds_alternative<int>(it->second)) {
                return std::get<int>(it->second);
            }
            if (std::holds_alternative<std::string>(it->second)) {
                return std::stoi(std::get<std::string>(it->second));
            }
        } catch (const std::exception& e) {
            std::cerr << "Config Warning: Value of '" << key << "' is not an integer (" << e.what() << ")" << std::endl;
        }
    }
    return default_value;
}

float Config::GetFloat(const std::string& key, float default_value) const
{
    auto it = m_values_.find(key);
    if (it != m_values_.end()) {
        try {
            if (std::holds_alternative<float>(it->second)) {
                return std::get<float>(it->second);
            }
            if (std::holds_alternative<int>(it->second)) {  // Promote int to float
                return static_cast<float>(std::get<int>(it->second));
            }
            if (std::holds_alternative<std::string>(it->second)) {
                return std::stof(std::get<std::string>(it->second));
            }
        } catch (const std::exception& e) {
            std::cerr << "Config Warning: Value of '" << key << "' is not a number (" << e.what() << ")" << std::endl;
        }
    }
    return default_value;
}

bool Config::GetBool(const std::string& key, bool default_value) const
{
    auto it = m_values_.find(key);
    if (it != m_values_.end()) {
        if (std::holds_alternative<bool>(it->second)) {
            return std::get<bool>(it->second);
        }
        if (std::holds_alternative<int>(it->second)) {
            return std::get<int>(it->second) != 0;
        }
        if (std::holds_alternative<std::string>(it->second)) {
            std::string const kValue = string_utils::ToLower(std::get<std::string>(it->second));
            if (kValue == "true" || kValue == "1") {
                return true;
            }
            if (kValue == "false" || kValue == "0") {
                return false;
            }
        }
    }
    return default_value;
}

bool Config::HasKey(const std::string& key) const
{
    return m_values_.find(key) != m_values_.end();
}

std::vector<std::string> Config::GetKeys() const
{
    std::vector<std::string> keys;
    keys.reserve(m_values_.size());
    for (const auto& pair : m_values_) {
        keys.push_back(pair.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

bool Config::SaveToFile(const std::string& filename) const
{
    std::ofstream config_file(filename);
    if (!config_file.is_open()) {
        std::cerr << "Config::SaveToFile Error: Could not open '" << filename << "' for writing" << std::endl;
        return false;
    }

    // Sorted so saved files diff cleanly
    for (const std::string& key : GetKeys()) {
        config_file << key << "=";
        std::visit(
            [&config_file](const auto& value) {
                if constexpr (std::is_same_v<std::decay_t<decltype(value)>, bool>) {
                    config_file << (value ? "true" : "false");
                } else {
                    config_file << value;
                }
            },
            m_values_.at(key));
        config_file << "\n";
    }
    return static_cast<bool>(config_file);
}

bool Config::LoadFromFile(const std::string& filename)
{
    std::ifstream config_file(filename);
    if (!config_file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(config_file, line)) {
        std::string const kTrimmedLine = string_utils::Trim(line);
        if (kTrimmedLine.empty() || kTrimmedLine[0] == '#' || kTrimmedLine[0] == ';') {
            continue;
        }
        size_t const kDelimiterPos = kTrimmedLine.find('=');
        if (kDelimiterPos == std::string::npos) {
            std::cerr << "Config Warning: Ignoring malformed line in '" << filename << "': " << kTrimmedLine << std::endl;
            continue;
        }

        std::string const kKey = string_utils::Trim(kTrimmedLine.substr(0, kDelimiterPos));
        std::string const kValueStr = string_utils::Trim(kTrimmedLine.substr(kDelimiterPos + 1));
        if (kKey.empty()) {
            continue;
        }

        std::string const kLowerValue = string_utils::ToLower(kValueStr);
        if (kLowerValue == "true") {
            SetBool(kKey, true);
            continue;
        }
        if (kLowerValue == "false") {
            SetBool(kKey, false);
            continue;
        }

        try {
            size_t processed_chars = 0;
            int const kIntVal = std::stoi(kValueStr, &processed_chars);
            if (processed_chars == kValueStr.length()) {
                SetInt(kKey, kIntVal);
                continue;
            }
        } catch (const std::exception&) {
            // Not an integer; try the next type
        }
        try {
            size_t processed_chars = 0;
            float const kFloatVal = std::stof(kValueStr, &processed_chars);
            if (processed_chars == kValueStr.length()) {
                SetFloat(kKey, kFloatVal);
                continue;
            }
        } catch (const std::exception&) {
            // Not a number; stored as string
        }
        SetString(kKey, kValueStr);
    }
    return true;
}
