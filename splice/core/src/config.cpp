/**
 * @file config.cpp
 * @brief JSON-backed configuration store
 */

#include <splice/core/config.hpp>
#include <splice/core/logger.hpp>

#include <fstream>
#include <sstream>

namespace spl {

namespace {

std::vector<std::string> splitKey(const std::string& key) {
    std::vector<std::string> segments;
    std::stringstream ss(key);
    std::string segment;
    while (std::getline(ss, segment, '.')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

} // anonymous namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Result<void> Config::loadFromFile(const std::string& configFile, bool merge) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open config file: {}", configFile);
        return Err(ErrorCode::FileOpenFailed, "Failed to open config file: " + configFile);
    }

    nlohmann::json parsed;
    try {
        file >> parsed;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to parse config file: {} - {}", configFile, e.what());
        return Err(ErrorCode::ParseError,
                   "Failed to parse config file " + configFile + ": " + e.what());
    }

    auto result = loadFromJson(parsed, merge);
    if (result) {
        LOG_INFO("Configuration loaded from file: {}", configFile);
    }
    return result;
}

Result<void> Config::loadFromJson(const nlohmann::json& json, bool merge) {
    if (!json.is_object()) {
        return Err(ErrorCode::InvalidArgument, "Configuration root must be an object");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (merge && m_config.is_object()) {
        m_config.merge_patch(json);
    } else {
        m_config = json;
    }
    return Ok();
}

Result<void> Config::saveToFile(const std::string& configFile, bool pretty) const {
    std::string text;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        text = pretty ? m_config.dump(4) : m_config.dump();
    }

    std::ofstream file(configFile);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open config file for writing: {}", configFile);
        return Err(ErrorCode::FileOpenFailed, "Failed to open config file for writing: " + configFile);
    }
    file << text;
    if (!file) {
        return Err(ErrorCode::WriteError, "Failed to write config file: " + configFile);
    }

    LOG_INFO("Configuration saved to file: {}", configFile);
    return Ok();
}

template<typename T>
T Config::get(const std::string& key, const T& defaultValue) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    const nlohmann::json* value = find(key);
    if (!value || value->is_null()) {
        return defaultValue;
    }

    try {
        return value->get<T>();
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Failed to get config key '{}', using default value: {}", key, e.what());
        return defaultValue;
    }
}

template<typename T>
bool Config::set(const std::string& key, const T& value, bool validate) {
    nlohmann::json newValue = value;
    nlohmann::json oldValue;
    std::vector<ConfigChangeListener> listeners;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (validate && m_validator && !m_validator(key, newValue)) {
            LOG_WARN("Config validation failed for key: {}", key);
            return false;
        }

        if (const nlohmann::json* existing = find(key)) {
            oldValue = *existing;
        }
        getOrCreate(key) = newValue;

        for (const auto& [id, listener] : m_listeners) {
            listeners.push_back(listener);
        }
    }

    // Listeners run outside the lock so they may read the config back
    for (const auto& listener : listeners) {
        try {
            listener(key, oldValue, newValue);
        } catch (const std::exception& e) {
            LOG_ERROR("Config change listener threw exception: {}", e.what());
        }
    }

    return true;
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return find(key) != nullptr;
}

bool Config::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto segments = splitKey(key);
    if (segments.empty()) {
        return false;
    }

    nlohmann::json* current = &m_config;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!current->is_object() || !current->contains(segments[i])) {
            return false;
        }
        current = &(*current)[segments[i]];
    }

    if (current->is_object() && current->contains(segments.back())) {
        current->erase(segments.back());
        LOG_DEBUG("Config key removed: {}", key);
        return true;
    }
    return false;
}

nlohmann::json Config::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

void Config::setValidator(ConfigValidator validator) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_validator = std::move(validator);
}

size_t Config::addChangeListener(ConfigChangeListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t id = m_nextListenerId++;
    m_listeners[id] = std::move(listener);
    return id;
}

void Config::removeChangeListener(size_t listenerId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listeners.erase(listenerId);
}

std::vector<std::string> Config::getKeys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> keys;

    const nlohmann::json* node = prefix.empty() ? &m_config : find(prefix);
    if (!node || !node->is_object()) {
        return keys;
    }

    for (auto it = node->begin(); it != node->end(); ++it) {
        keys.push_back(prefix.empty() ? it.key() : prefix + "." + it.key());
    }
    return keys;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = nlohmann::json::object();
}

void Config::loadDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = defaults();
    LOG_DEBUG("Default configuration loaded");
}

nlohmann::json Config::defaults() {
    return {
        {"history", {
            {"undoLimit", 100}
        }},
        {"export", {
            {"width", 1920},
            {"height", 1080},
            {"fps", {{"num", 30}, {"den", 1}}},
            {"quality", "high"},
            {"videoCodec", "libx264"},
            {"etaWindow", 30},
            {"maxConsecutiveFrameFailures", 3}
        }},
        {"log", {
            {"level", "info"},
            {"file", ""}
        }}
    };
}

const nlohmann::json* Config::find(const std::string& key) const {
    const nlohmann::json* current = &m_config;
    for (const auto& seg : splitKey(key)) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(seg);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

nlohmann::json& Config::getOrCreate(const std::string& key) {
    nlohmann::json* current = &m_config;
    for (const auto& seg : splitKey(key)) {
        if (!current->is_object()) {
            *current = nlohmann::json::object();
        }
        current = &(*current)[seg];
    }
    return *current;
}

EditorSettings EditorSettings::fromConfig(const Config& config) {
    EditorSettings s;

    int undoLimit = config.get<int>("history.undoLimit", static_cast<int>(s.undoLimit));
    s.undoLimit = undoLimit < 0 ? 0 : static_cast<size_t>(undoLimit);

    s.exportWidth = config.get<int>("export.width", s.exportWidth);
    s.exportHeight = config.get<int>("export.height", s.exportHeight);
    s.exportFpsNum = config.get<int>("export.fps.num", s.exportFpsNum);
    s.exportFpsDen = config.get<int>("export.fps.den", s.exportFpsDen);
    s.exportQuality = config.get<std::string>("export.quality", s.exportQuality);
    s.exportVideoCodec = config.get<std::string>("export.videoCodec", s.exportVideoCodec);

    int window = config.get<int>("export.etaWindow", static_cast<int>(s.etaWindow));
    s.etaWindow = window < 1 ? 1 : static_cast<size_t>(window);

    s.maxConsecutiveFrameFailures = config.get<int>("export.maxConsecutiveFrameFailures",
                                                    s.maxConsecutiveFrameFailures);
    if (s.maxConsecutiveFrameFailures < 1) {
        s.maxConsecutiveFrameFailures = 1;
    }

    s.logLevel = config.get<std::string>("log.level", s.logLevel);
    s.logFile = config.get<std::string>("log.file", s.logFile);
    return s;
}

// Explicit instantiations for the value types the editor stores
template int Config::get<int>(const std::string&, const int&) const;
template int64_t Config::get<int64_t>(const std::string&, const int64_t&) const;
template double Config::get<double>(const std::string&, const double&) const;
template bool Config::get<bool>(const std::string&, const bool&) const;
template std::string Config::get<std::string>(const std::string&, const std::string&) const;

template bool Config::set<int>(const std::string&, const int&, bool);
template bool Config::set<int64_t>(const std::string&, const int64_t&, bool);
template bool Config::set<double>(const std::string&, const double&, bool);
template bool Config::set<bool>(const std::string&, const bool&, bool);
template bool Config::set<std::string>(const std::string&, const std::string&, bool);

} // namespace spl
