#pragma once

#include <expected>
#include <filesystem>
#include <fstream>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>

namespace GeoHex {

/**
 * @brief Configuration error codes
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError
};

const char* ConfigErrorToString(ConfigError error);

/**
 * @brief JSON-based configuration store
 *
 * Values are addressed with dot-separated keys ("analyzer.base_url").
 * glm::ivec2 values are stored as two-element JSON arrays.
 */
class Config {
public:
    static Config& Instance();

    // Delete copy/move for singleton
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from JSON file
     *
     * A missing file is created from the defaults first. The root must be
     * a JSON object; on failure the current values are left untouched.
     */
    std::expected<void, ConfigError> Load(const std::filesystem::path& filepath);

    /**
     * @brief Replace the configuration with the given JSON text
     */
    std::expected<void, ConfigError> LoadFromString(std::string_view jsonText);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    std::expected<void, ConfigError> Save(const std::filesystem::path& filepath = "");

    /**
     * @brief Reload configuration from disk
     */
    std::expected<void, ConfigError> Reload();

    /**
     * @brief Get a configuration value with type safety
     * @param key Dot-separated key path (e.g., "region.min_radius_km")
     * @param defaultValue Value returned when the key is missing or mistyped
     */
    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     *
     * Ignored (with a warning) when the key path runs through a scalar.
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    bool Has(std::string_view key) const;

    /**
     * @brief Drop all values (tests start from an empty store)
     */
    void Clear();

    nlohmann::json GetJson() const;

    /**
     * @brief Default configuration document
     */
    static nlohmann::json DefaultJson();

    /**
     * @brief Create default configuration file
     */
    static bool CreateDefault(const std::filesystem::path& filepath);

private:
    Config() = default;
    ~Config() = default;

    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;
    mutable std::shared_mutex m_mutex;

    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    std::shared_lock lock(m_mutex);
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        if constexpr (std::is_same_v<T, glm::ivec2>) {
            if (node->is_array() && node->size() >= 2) {
                return glm::ivec2((*node)[0].get<int>(), (*node)[1].get<int>());
            }
        } else {
            return node->get<T>();
        }
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
    return defaultValue;
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    std::unique_lock lock(m_mutex);
    auto* node = NavigateToKey(key, true);
    if (node) {
        if constexpr (std::is_same_v<T, glm::ivec2>) {
            *node = nlohmann::json::array({value.x, value.y});
        } else {
            *node = value;
        }
    }
}

} // namespace GeoHex
