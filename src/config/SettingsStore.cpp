/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "config/SettingsStore.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <fstream>
#include <limits>

namespace CityScale {

namespace {

bool mergeDocument(const JsonValue& root, const std::string& source,
                   std::map<std::string, std::map<std::string, SettingsStore::SettingValue>>& settings) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + source);
        return false;
    }

    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        const JsonObject* categoryObj = categoryValue.tryAsObject();
        if (categoryObj == nullptr) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *categoryObj) {
            if (value.isBool()) {
                settings[categoryName][key] = value.asBool();
            } else if (value.isNumber()) {
                double numValue = value.asNumber();
                bool integral = std::floor(numValue) == numValue &&
                                std::abs(numValue) <= std::numeric_limits<int>::max();
                if (integral) {
                    settings[categoryName][key] = static_cast<int>(numValue);
                } else {
                    settings[categoryName][key] = static_cast<float>(numValue);
                }
            } else if (value.isString()) {
                settings[categoryName][key] = value.asString();
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
            }
        }
    }
    return true;
}

} // namespace

bool SettingsStore::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    if (!mergeDocument(reader.getRoot(), filepath, m_settings)) {
        return false;
    }
    SETTINGS_INFO("Loaded settings from file: " + filepath);
    return true;
}

bool SettingsStore::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings: " + reader.getLastError());
        return false;
    }
    return mergeDocument(reader.getRoot(), "<memory>", m_settings);
}

bool SettingsStore::saveToFile(const std::string& filepath) const {
    JsonObject root;
    for (const auto& [categoryName, categorySettings] : m_settings) {
        JsonObject category;
        for (const auto& [key, value] : categorySettings) {
            category[key] = std::visit([](const auto& arg) { return JsonValue(arg); }, value);
        }
        root[categoryName] = JsonValue(std::move(category));
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }
    file << JsonValue(std::move(root)).toString() << "\n";
    if (!file.good()) {
        SETTINGS_ERROR("Failed writing settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

const SettingsStore::SettingValue* SettingsStore::find(const std::string& category,
                                                        const std::string& key) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return nullptr;
    }
    auto keyIt = categoryIt->second.find(key);
    return keyIt == categoryIt->second.end() ? nullptr : &keyIt->second;
}

bool SettingsStore::has(const std::string& category, const std::string& key) const {
    return find(category, key) != nullptr;
}

bool SettingsStore::remove(const std::string& category, const std::string& key) {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }
    bool removed = categoryIt->second.erase(key) > 0;
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return removed;
}

std::vector<std::string> SettingsStore::getCategories() const {
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [name, _] : m_settings) {
        categories.push_back(name);
    }
    return categories;
}

std::vector<std::string> SettingsStore::getKeys(const std::string& category) const {
    std::vector<std::string> keys;
    auto categoryIt = m_settings.find(category);
    if (categoryIt != m_settings.end()) {
        for (const auto& [key, _] : categoryIt->second) {
            keys.push_back(key);
        }
    }
    return keys;
}

} // namespace CityScale
