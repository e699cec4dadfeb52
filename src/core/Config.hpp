#pragma once

#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Typed key/value settings store backed by a "key=value" text file.
class Config
{
public:
    Config();
    ~Config();

    void SetString(const std::string& key, const std::string& value);
    void SetInt(const std::string& key, int value);
    void SetFloat(const std::string& key, float value);
    void SetBool(const std::string& key, bool value);

    std::string GetString(const std::string& key, const std::string& default_value = "") const;
    int GetInt(const std::string& key, int default_value = 0) const;
    float GetFloat(const std::string& key, float default_value = 0.0F) const;
    bool GetBool(const std::string& key, bool default_value = false) const;

    bool HasKey(const std::string& key) const;
    std::vector<std::string> GetKeys() const;

    // Lines starting with '#' or ';' are comments. Values are typed as bool, int, float, then string.
    // Returns false when the file cannot be opened; keys already set are kept.
    bool LoadFromFile(const std::string& filename);
    bool SaveToFile(const std::string& filename) const;

private:
    using ConfigValue = std::variant<std::string, int, float, bool>;
    std::unordered_map<std::string, ConfigValue> m_values_;
};
