/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <boost/container/flat_map.hpp>
#include <functional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace LatticeEngine {

/**
 * @brief Engine settings grouped by category, persisted as JSON
 *
 * Settings are read and written on the thread that drives the frame loop.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   float width = settings.get<float>("simulation", "chunk_width", 256.0f);
 *   settings.set("host", "target_fps", 144);
 *   settings.saveToFile("res/settings.json");
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Merges the settings of a JSON file into the current ones
     * @return false if the file is missing or malformed; settings are then unchanged
     */
    bool loadFromFile(const std::string& filepath);

    // Same as loadFromFile, for JSON text already in memory
    bool loadFromString(const std::string& json);

    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Typed lookup
     *
     * Returns defaultValue if the setting is missing or holds another type.
     * Integer settings also read as float, since "256" and "256.0" load
     * differently from JSON.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Stores a value and notifies listeners
     * @return false for unsupported types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    /**
     * @param category Category to watch, empty for all
     * @return Id for unregisterChangeListener
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

    using CategorySettings = boost::container::flat_map<std::string, SettingValue>;
    using SettingsTable = boost::container::flat_map<std::string, CategorySettings>;

private:

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };

    const SettingValue* find(const std::string& category, const std::string& key) const;
    void merge(SettingsTable&& loaded);
    void notifyListeners(const std::string& category, const std::string& key,
                         const SettingValue& newValue);

    SettingsTable m_settings;
    std::vector<ListenerInfo> m_listeners;
    size_t m_nextCallbackId = 0;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    const SettingValue* value = find(category, key);
    if (!value) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, float>) {
        if (const auto* asInt = std::get_if<int>(value)) {
            return static_cast<float>(*asInt);
        }
    }
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const auto* typed = std::get_if<T>(value)) {
            return *typed;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    m_settings[category][key] = settingValue;
    notifyListeners(category, key, settingValue);
    return true;
}

} // namespace LatticeEngine

#endif // SETTINGS_MANAGER_HPP
