/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_STORE_HPP
#define SETTINGS_STORE_HPP

#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace CityScale {

/**
 * @brief Category/key settings table with JSON persistence
 *
 * Owned by whoever assembles the simulation; the store is never global.
 *
 * Usage:
 *   SettingsStore settings;
 *   settings.loadFromFile("res/cityscale.json");
 *   float radius = settings.get<float>("zones", "active_radius", 150.0f);
 *   settings.set("hydration", "batch_size", 250);
 *   settings.saveToFile("res/cityscale.json");
 */
class SettingsStore {
public:
    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Merges settings from a JSON file into the store
     * @return false if the file is missing, malformed, or not an object
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Merges settings from a JSON document held in memory
     */
    bool loadFromString(const std::string& json);

    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value
     *
     * Integer values are widened when a float is requested, so "150" and
     * "150.0" in a settings file read the same. Any other type mismatch
     * returns defaultValue.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll() { m_settings.clear(); }

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::map<std::string, SettingValue>;
    std::map<std::string, CategorySettings> m_settings;

    const SettingValue* find(const std::string& category, const std::string& key) const;
};

template<typename T>
T SettingsStore::get(const std::string& category, const std::string& key, T defaultValue) const {
    const SettingValue* value = find(category, key);
    if (value == nullptr) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, float>) {
        if (const int* asInt = std::get_if<int>(value)) {
            return static_cast<float>(*asInt);
        }
    }

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(value)) {
            return *typed;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsStore::set(const std::string& category, const std::string& key, const T& value) {
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        m_settings[category][key] = value;
        return true;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        m_settings[category][key] = std::string(value);
        return true;
    } else {
        return false;
    }
}

} // namespace CityScale

#endif // SETTINGS_STORE_HPP
