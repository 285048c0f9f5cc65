/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>

namespace LatticeEngine {

namespace {

// Converts a parsed JSON document into categories, rejecting it as a whole
bool readCategories(const JsonValue& root, SettingsManager::SettingsTable& out) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root is not a JSON object");
        return false;
    }

    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARNING(std::format("Category '{}' is not an object, skipping", categoryName));
            continue;
        }

        for (const auto& [key, value] : categoryValue.asObject()) {
            if (value.isBool()) {
                out[categoryName][key] = value.asBool();
            } else if (value.isNumber()) {
                const double number = value.asNumber();
                if (std::floor(number) == number && std::fabs(number) < 2147483648.0) {
                    out[categoryName][key] = static_cast<int>(number);
                } else {
                    out[categoryName][key] = static_cast<float>(number);
                }
            } else if (value.isString()) {
                out[categoryName][key] = value.asString();
            } else {
                SETTINGS_WARNING(std::format("Unsupported value type for setting '{}.{}', skipping",
                                             categoryName, key));
            }
        }
    }
    return true;
}

} // namespace

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR(std::format("Failed to load settings from file: {} - {}", filepath,
                                   reader.getLastError()));
        return false;
    }

    SettingsTable loaded;
    if (!readCategories(reader.getRoot(), loaded)) {
        SETTINGS_ERROR(std::format("Rejected settings file: {}", filepath));
        return false;
    }

    merge(std::move(loaded));
    SETTINGS_INFO(std::format("Loaded settings from file: {}", filepath));
    return true;
}

bool SettingsManager::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR(std::format("Failed to parse settings: {}", reader.getLastError()));
        return false;
    }

    SettingsTable loaded;
    if (!readCategories(reader.getRoot(), loaded)) {
        return false;
    }

    merge(std::move(loaded));
    return true;
}

void SettingsManager::merge(SettingsTable&& loaded) {
    // Loaded values overwrite, everything else is kept; listeners hear each one
    for (auto& [category, values] : loaded) {
        for (auto& [key, value] : values) {
            m_settings[category][key] = value;
            notifyListeners(category, key, value);
        }
    }
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonObject root;
    for (const auto& [categoryName, categorySettings] : m_settings) {
        JsonObject category;
        for (const auto& [key, value] : categorySettings) {
            category[key] = std::visit(
                [](const auto& arg) {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, float>) {
                        return JsonValue(static_cast<double>(arg));
                    } else {
                        return JsonValue(arg);
                    }
                },
                value);
        }
        root[categoryName] = JsonValue(std::move(category));
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR(std::format("Failed to open settings file for writing: {}", filepath));
        return false;
    }
    file << JsonValue(std::move(root)).toString() << '\n';
    if (!file) {
        SETTINGS_ERROR(std::format("Failed to write settings file: {}", filepath));
        return false;
    }

    SETTINGS_INFO(std::format("Saved settings to file: {}", filepath));
    return true;
}

const SettingsManager::SettingValue* SettingsManager::find(const std::string& category,
                                                           const std::string& key) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return nullptr;
    }
    auto keyIt = categoryIt->second.find(key);
    return keyIt != categoryIt->second.end() ? &keyIt->second : nullptr;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    return find(category, key) != nullptr;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    return m_settings.erase(category) != 0;
}

void SettingsManager::clearAll() {
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    const size_t id = m_nextCallbackId++;
    m_listeners.push_back({id, category, std::move(callback)});
    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
                       [callbackId](const ListenerInfo& info) { return info.id == callbackId; }),
        m_listeners.end());
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    return keys;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key,
                                      const SettingValue& newValue) {
    // Copy: a listener may register or unregister listeners
    const auto listeners = m_listeners;
    for (const auto& listener : listeners) {
        if (listener.category.empty() || listener.category == category) {
            listener.callback(category, key, newValue);
        }
    }
}

} // namespace LatticeEngine
