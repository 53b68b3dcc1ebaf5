#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <iomanip>
#include <iterator>
#include <mutex>

namespace GeoHex {

namespace {

// "region.min_radius_km" -> "/region/min_radius_km"
nlohmann::json::json_pointer ToPointer(std::string_view key) {
    std::string path = "/";
    for (char c : key) {
        switch (c) {
            case '.': path += '/'; break;
            case '~': path += "~0"; break;
            case '/': path += "~1"; break;
            default:  path += c; break;
        }
    }
    return nlohmann::json::json_pointer(path);
}

std::expected<nlohmann::json, ConfigError> ParseDocument(std::string_view text, const std::string& source) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        GEOHEX_LOG_ERROR("[Config] Failed to parse {}: {}", source, e.what());
        return std::unexpected(ConfigError::ParseError);
    }
    if (!document.is_object()) {
        GEOHEX_LOG_ERROR("[Config] Root of {} must be an object, got {}", source, document.type_name());
        return std::unexpected(ConfigError::ParseError);
    }
    return document;
}

bool WriteDocument(const std::filesystem::path& path, const nlohmann::json& document) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            GEOHEX_LOG_ERROR("[Config] Cannot create directory {}: {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        GEOHEX_LOG_ERROR("[Config] Cannot open {} for writing", path.string());
        return false;
    }
    file << std::setw(4) << document << '\n';
    return static_cast<bool>(file.flush());
}

} // namespace

const char* ConfigErrorToString(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::ParseError:   return "parse error";
        case ConfigError::WriteError:   return "write error";
    }
    return "unknown";
}

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::expected<void, ConfigError> Config::Load(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        GEOHEX_LOG_WARN("[Config] {} does not exist, writing defaults", filepath.string());
        if (!CreateDefault(filepath)) {
            return std::unexpected(ConfigError::FileNotFound);
        }
    }

    std::ifstream file(filepath);
    if (!file) {
        GEOHEX_LOG_ERROR("[Config] Cannot open {}", filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }
    const std::string text{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

    auto document = ParseDocument(text, filepath.string());
    if (!document) {
        return std::unexpected(document.error());
    }

    std::unique_lock lock(m_mutex);
    m_data = std::move(*document);
    m_filepath = filepath;
    GEOHEX_LOG_INFO("[Config] Loaded {}", filepath.string());
    return {};
}

std::expected<void, ConfigError> Config::LoadFromString(std::string_view jsonText) {
    auto document = ParseDocument(jsonText, "configuration text");
    if (!document) {
        return std::unexpected(document.error());
    }

    std::unique_lock lock(m_mutex);
    m_data = std::move(*document);
    return {};
}

std::expected<void, ConfigError> Config::Save(const std::filesystem::path& filepath) {
    std::shared_lock lock(m_mutex);
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        GEOHEX_LOG_ERROR("[Config] No path to save to");
        return std::unexpected(ConfigError::WriteError);
    }

    if (!WriteDocument(path, m_data)) {
        return std::unexpected(ConfigError::WriteError);
    }
    GEOHEX_LOG_INFO("[Config] Saved {}", path.string());
    return {};
}

std::expected<void, ConfigError> Config::Reload() {
    std::filesystem::path path;
    {
        std::shared_lock lock(m_mutex);
        path = m_filepath;
    }
    if (path.empty()) {
        GEOHEX_LOG_WARN("[Config] Nothing loaded yet, cannot reload");
        return std::unexpected(ConfigError::FileNotFound);
    }
    return Load(path);
}

bool Config::Has(std::string_view key) const {
    std::shared_lock lock(m_mutex);
    return NavigateToKey(key) != nullptr;
}

void Config::Clear() {
    std::unique_lock lock(m_mutex);
    m_data = nlohmann::json::object();
    m_filepath.clear();
}

nlohmann::json Config::GetJson() const {
    std::shared_lock lock(m_mutex);
    return m_data;
}

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    const auto pointer = ToPointer(key);
    if (!create) {
        return m_data.contains(pointer) ? &m_data.at(pointer) : nullptr;
    }

    try {
        return &m_data[pointer];
    } catch (const nlohmann::json::exception& e) {
        // a scalar sits where an object is needed
        GEOHEX_LOG_WARN("[Config] Cannot set '{}': {}", key, e.what());
        return nullptr;
    }
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const auto pointer = ToPointer(key);
    return m_data.contains(pointer) ? &m_data.at(pointer) : nullptr;
}

nlohmann::json Config::DefaultJson() {
    return {
        {"analyzer", {
            {"base_url", "http://localhost:5000"},
            {"timeout_seconds", 30},
            {"user_agent", "GeoHex-Dashboard/1.0"}
        }},
        {"region", {
            {"default_latitude", 36.447451},
            {"default_longitude", 4.228459},
            {"default_radius_km", 2.0},
            {"min_radius_km", 0.5},
            {"max_radius_km", 10.0}
        }},
        {"marker", {
            {"icon_url", "images/marker-icon.png"},
            {"icon_retina_url", "images/marker-icon-2x.png"},
            {"shadow_url", "images/marker-shadow.png"},
            {"icon_size", {25, 41}},
            {"icon_anchor", {12, 41}},
            {"popup_anchor", {1, -34}},
            {"shadow_size", {41, 41}}
        }},
        {"logging", {
            {"file", ""},
            {"level", "info"}
        }}
    };
}

bool Config::CreateDefault(const std::filesystem::path& filepath) {
    if (!WriteDocument(filepath, DefaultJson())) {
        return false;
    }
    GEOHEX_LOG_INFO("[Config] Wrote default configuration to {}", filepath.string());
    return true;
}

} // namespace GeoHex
