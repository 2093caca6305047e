#include "config/Config.hpp"
#include "core/Logger.hpp"

#include <iomanip>
#include <vector>

namespace Forge {

const char* ConfigErrorToString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound: return "File not found";
        case ConfigError::ParseError:   return "JSON parse error";
        case ConfigError::WriteError:   return "Write error";
        default: return "Unknown error";
    }
}

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::expected<void, ConfigError> Config::Load(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        FORGE_LOG_WARN("Config file not found: {}. Creating default.", filepath.string());
        CreateDefault(filepath);
    }

    std::unique_lock lock(m_mutex);
    m_filepath = filepath;

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            FORGE_LOG_ERROR("Failed to open config file: {}", filepath.string());
            return std::unexpected(ConfigError::FileNotFound);
        }

        m_data = nlohmann::json::parse(file);
        FORGE_LOG_INFO("Loaded configuration from: {}", filepath.string());
        return {};
    } catch (const nlohmann::json::exception& e) {
        FORGE_LOG_ERROR("Failed to parse config file: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> Config::LoadFromString(std::string_view jsonText) {
    std::unique_lock lock(m_mutex);
    try {
        m_data = nlohmann::json::parse(jsonText);
        return {};
    } catch (const nlohmann::json::exception& e) {
        FORGE_LOG_ERROR("Failed to parse config text: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> Config::Save(const std::filesystem::path& filepath) {
    std::shared_lock lock(m_mutex);
    const auto& path = filepath.empty() ? m_filepath : filepath;

    if (path.empty()) {
        FORGE_LOG_ERROR("No config file path set, cannot save");
        return std::unexpected(ConfigError::WriteError);
    }

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            FORGE_LOG_ERROR("Failed to open config file for writing: {}", path.string());
            return std::unexpected(ConfigError::WriteError);
        }

        file << std::setw(4) << m_data << std::endl;
        FORGE_LOG_INFO("Saved configuration to: {}", path.string());
        return {};
    } catch (const std::exception& e) {
        FORGE_LOG_ERROR("Failed to save config file: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

std::expected<void, ConfigError> Config::Reload() {
    std::filesystem::path path;
    {
        std::shared_lock lock(m_mutex);
        path = m_filepath;
    }
    if (path.empty()) {
        FORGE_LOG_WARN("No config file path set, cannot reload");
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

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));

    nlohmann::json* current = &m_data;
    for (const auto& p : parts) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(p)) {
            if (!create) {
                return nullptr;
            }
            (*current)[p] = nlohmann::json::object();
        }
        current = &(*current)[p];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));

    const nlohmann::json* current = &m_data;
    for (const auto& p : parts) {
        if (!current->is_object() || !current->contains(p)) {
            return nullptr;
        }
        current = &(*current)[p];
    }
    return current;
}

nlohmann::json Config::DefaultDocument() {
    nlohmann::json config;

    config["logging"]["file"] = "";
    config["logging"]["level"] = "info";
    config["logging"]["console"] = true;

    config["data"]["abilities"] = "data/abilities.json";
    config["data"]["talents"] = "data/talents.json";

    config["jobs"]["worker_threads"] = 0;

    config["hash_index"]["log_collisions"] = true;

    return config;
}

void Config::CreateDefault(const std::filesystem::path& filepath) {
    if (filepath.has_parent_path()) {
        std::filesystem::create_directories(filepath.parent_path());
    }

    std::ofstream file(filepath);
    if (file.is_open()) {
        file << std::setw(4) << DefaultDocument() << std::endl;
        FORGE_LOG_INFO("Created default configuration file: {}", filepath.string());
    } else {
        FORGE_LOG_ERROR("Could not create default configuration file: {}", filepath.string());
    }
}

// ============================================================================
// Settings views
// ============================================================================

LoggingSettings LoggingSettings::FromConfig(const Config& config) {
    LoggingSettings settings;
    settings.file = config.Get<std::string>("logging.file", settings.file);
    settings.level = config.Get<std::string>("logging.level", settings.level);
    settings.console = config.Get<bool>("logging.console", settings.console);
    return settings;
}

DataSettings DataSettings::FromConfig(const Config& config) {
    DataSettings settings;
    settings.abilities = config.Get<std::string>("data.abilities", settings.abilities);
    settings.talents = config.Get<std::string>("data.talents", settings.talents);
    return settings;
}

RuntimeSettings RuntimeSettings::FromConfig(const Config& config) {
    RuntimeSettings settings;
    const auto workerThreads = config.Get<int64_t>("jobs.worker_threads", settings.workerThreads);
    if (workerThreads < 0) {
        FORGE_LOG_WARN("Ignoring negative jobs.worker_threads ({}), using automatic count", workerThreads);
    } else if (workerThreads > kMaxWorkerThreads) {
        FORGE_LOG_WARN("jobs.worker_threads {} exceeds the limit, using {}", workerThreads, kMaxWorkerThreads);
        settings.workerThreads = kMaxWorkerThreads;
    } else {
        settings.workerThreads = static_cast<uint32_t>(workerThreads);
    }
    settings.logHashCollisions = config.Get<bool>("hash_index.log_collisions", settings.logHashCollisions);
    return settings;
}

} // namespace Forge
