#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>
#include <expected>
#include <mutex>
#include <shared_mutex>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace Forge {

/**
 * @brief Error types for settings file operations
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError
};

[[nodiscard]] const char* ConfigErrorToString(ConfigError error) noexcept;

/**
 * @brief JSON-based settings store for the ability engine and its tools
 *
 * Keys are dot-separated paths into the document ("logging.level").
 * Typed reads fall back to the supplied default when the key is missing
 * or holds a value of the wrong type.
 */
class Config {
public:
    static Config& Instance();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from JSON file
     *
     * A missing file is created with default contents first.
     */
    std::expected<void, ConfigError> Load(const std::filesystem::path& filepath);

    /**
     * @brief Replace the current document with a parsed JSON string
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

    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    template<typename T>
    void Set(std::string_view key, const T& value);

    bool Has(std::string_view key) const;

    /**
     * @brief Drop the document and forget the backing file
     */
    void Clear();

    /**
     * @brief Document written by CreateDefault()
     */
    static nlohmann::json DefaultDocument();

    /**
     * @brief Create default configuration file
     */
    static void CreateDefault(const std::filesystem::path& filepath);

private:
    Config() = default;
    ~Config() = default;

    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;
    mutable std::shared_mutex m_mutex;

    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;
};

template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    std::shared_lock lock(m_mutex);
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        return node->get<T>();
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    std::unique_lock lock(m_mutex);
    auto* node = NavigateToKey(key, true);
    if (node) {
        *node = value;
    }
}

/**
 * @brief Logging settings ("logging.*")
 */
struct LoggingSettings {
    std::string file;
    std::string level = "info";
    bool console = true;

    static LoggingSettings FromConfig(const Config& config);
};

/**
 * @brief Data file locations ("data.*")
 */
struct DataSettings {
    std::string abilities = "data/abilities.json";
    std::string talents = "data/talents.json";

    static DataSettings FromConfig(const Config& config);
};

/**
 * @brief Startup tuning ("jobs.*", "hash_index.*")
 */
struct RuntimeSettings {
    static constexpr uint32_t kMaxWorkerThreads = 256;

    uint32_t workerThreads = 0;   // 0 = automatic; negative values fall back to 0
    bool logHashCollisions = true;

    static RuntimeSettings FromConfig(const Config& config);
};

} // namespace Forge
