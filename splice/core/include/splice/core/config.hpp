/**
 * @file config.hpp
 * @brief JSON-backed configuration store
 *
 * Keys use dotted paths ("export.width"). Values live in a single
 * nlohmann::json document guarded by a mutex, so the store can be read
 * from the export worker while the editing thread changes it.
 */

#pragma once

#include <splice/core/result.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace spl {

/**
 * @brief Validation callback
 * @return false to reject the value
 */
using ConfigValidator = std::function<bool(const std::string& key, const nlohmann::json& value)>;

/// Called after a key changed
using ConfigChangeListener = std::function<void(const std::string& key,
                                                const nlohmann::json& oldValue,
                                                const nlohmann::json& newValue)>;

class Config {
public:
    Config() = default;
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /// Process-wide instance used by the applications
    static Config& getInstance();

    /**
     * @brief Load configuration from a JSON file
     * @param merge true merges into the current document (RFC 7386), false replaces it
     * @return FileOpenFailed or ParseError on failure; the store is untouched then
     */
    Result<void> loadFromFile(const std::string& configFile, bool merge = true);

    /// Load configuration from a JSON object
    Result<void> loadFromJson(const nlohmann::json& json, bool merge = true);

    /// Write the document to a file
    Result<void> saveToFile(const std::string& configFile, bool pretty = true) const;

    /**
     * @brief Read a value
     *
     * Missing keys and type mismatches return defaultValue (mismatches
     * are logged as warnings).
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const;

    /**
     * @brief Write a value, creating intermediate objects
     * @return false when the validator rejected the value
     */
    template<typename T>
    bool set(const std::string& key, const T& value, bool validate = true);

    bool has(const std::string& key) const;
    bool remove(const std::string& key);

    nlohmann::json toJson() const;

    void setValidator(ConfigValidator validator);

    size_t addChangeListener(ConfigChangeListener listener);
    void removeChangeListener(size_t listenerId);

    /// Top-level keys, or the keys below prefix (returned fully qualified)
    std::vector<std::string> getKeys(const std::string& prefix = "") const;

    void clear();

    /// Replace the document with the built-in defaults
    void loadDefaults();

    /// Built-in defaults document
    static nlohmann::json defaults();

private:
    const nlohmann::json* find(const std::string& key) const;
    nlohmann::json& getOrCreate(const std::string& key);

    nlohmann::json m_config = nlohmann::json::object();
    mutable std::mutex m_mutex;
    ConfigValidator m_validator;
    std::map<size_t, ConfigChangeListener> m_listeners;
    size_t m_nextListenerId = 1;
};

/**
 * @brief Typed view over the configuration keys the editor reads
 */
struct EditorSettings {
    // history.*
    size_t undoLimit = 100;                 ///< 0 = unbounded

    // export.*
    int exportWidth = 1920;
    int exportHeight = 1080;
    int exportFpsNum = 30;
    int exportFpsDen = 1;
    std::string exportQuality = "high";     ///< low | medium | high
    size_t etaWindow = 30;                  ///< frames in the ETA moving average
    int maxConsecutiveFrameFailures = 3;
    std::string exportVideoCodec = "libx264";

    // log.*
    std::string logLevel = "info";
    std::string logFile;

    static EditorSettings fromConfig(const Config& config);
};

} // namespace spl
