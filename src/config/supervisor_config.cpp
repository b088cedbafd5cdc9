#include "config/supervisor_config.h"
#include "core/env_config.h"
#include <fstream>
#include <iostream>
#include <sstream>

SupervisorConfig& SupervisorConfig::getInstance() {
    static SupervisorConfig instance;
    return instance;
}

SupervisorConfig::SupervisorConfig() : config_json_(defaultConfig()) {}

Json::Value SupervisorConfig::defaultConfig() {
    Json::Value config(Json::objectValue);

    ServerConfig server;
    config["server"]["host"] = server.host;
    config["server"]["port"] = server.port;
    config["server"]["thread_num"] = server.thread_num;

    LockConfig lock;
    config["lock"]["file"] = lock.file;

    PortsConfig ports;
    config["ports"]["max_attempts"] = ports.max_attempts;
    config["ports"]["replacement_grace_ms"] = ports.replacement_grace_ms;

    ShutdownConfig shutdown;
    config["shutdown"]["connection_close_timeout_ms"] = shutdown.connection_close_timeout_ms;

    HealthConfig health;
    config["health"]["interval_ms"] = health.interval_ms;
    config["health"]["auto_launch_browser"] = health.auto_launch_browser;
    config["health"]["prune_unreachable_sessions"] = health.prune_unreachable_sessions;

    SessionsConfig sessions;
    config["sessions"]["port_range_start"] = sessions.port_range_start;
    config["sessions"]["port_range_end"] = sessions.port_range_end;
    config["sessions"]["browser_executable"] = sessions.browser_executable;
    config["sessions"]["app_url"] = sessions.app_url;
    config["sessions"]["launch_timeout_ms"] = sessions.launch_timeout_ms;
    config["sessions"]["headless"] = sessions.headless;
    config["sessions"]["user_data_root"] = sessions.user_data_root;

    LoggingConfig logging;
    config["logging"]["log_dir"] = logging.log_dir;
    config["logging"]["log_level"] = logging.log_level;
    config["logging"]["max_files"] = logging.max_files;

    return config;
}

bool SupervisorConfig::loadConfig(const std::string& configPath) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_path_ = configPath;
    }

    try {
        if (!std::filesystem::exists(configPath)) {
            std::cerr << "[SupervisorConfig] Config file not found: " << configPath << std::endl;
            std::cerr << "[SupervisorConfig] Initializing with default configuration" << std::endl;

            {
                std::lock_guard<std::mutex> lock(mutex_);
                config_json_ = defaultConfig();
                loaded_ = true;
            }

            // Save default config to file (outside lock to avoid deadlock)
            saveConfig(configPath);
            return true;
        }

        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream file(configPath);
        if (!file.is_open()) {
            std::cerr << "[SupervisorConfig] Error: Failed to open config file: " << configPath << std::endl;
            config_json_ = defaultConfig();
            loaded_ = false;
            return false;
        }

        Json::CharReaderBuilder builder;
        Json::Value parsed;
        std::string errors;
        if (!Json::parseFromStream(builder, file, &parsed, &errors)) {
            std::cerr << "[SupervisorConfig] Failed to parse config file: " << errors << std::endl;
            config_json_ = defaultConfig();
            loaded_ = false;
            return false;
        }

        std::string problem;
        if (!validateConfig(parsed, problem)) {
            std::cerr << "[SupervisorConfig] Invalid config (" << problem << "), using defaults" << std::endl;
            config_json_ = defaultConfig();
            loaded_ = false;
            return false;
        }

        if (mergeMissing(parsed, defaultConfig())) {
            std::cerr << "[SupervisorConfig] Filled missing keys with defaults" << std::endl;
        }
        config_json_ = parsed;
        loaded_ = true;
        std::cerr << "[SupervisorConfig] Successfully loaded config from: " << configPath << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[SupervisorConfig] Exception loading config: " << e.what() << std::endl;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            config_json_ = defaultConfig();
            loaded_ = false;
        }
        return false;
    }
}

bool SupervisorConfig::saveConfig(const std::string& configPath) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string path = configPath.empty() ? config_path_ : configPath;
    if (path.empty()) {
        std::cerr << "[SupervisorConfig] Error: No config path specified" << std::endl;
        return false;
    }

    try {
        std::filesystem::path filePath(path);
        if (filePath.has_parent_path()) {
            std::filesystem::create_directories(filePath.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            std::cerr << "[SupervisorConfig] Error: Failed to open file for writing: " << path << std::endl;
            return false;
        }

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(config_json_, &file);
        file.close();

        if (configPath.empty()) {
            config_path_ = path;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[SupervisorConfig] Exception saving config: " << e.what() << std::endl;
        return false;
    }
}

void SupervisorConfig::applyEnvironmentOverrides() {
    auto port = EnvConfig::getPortOverride();
    std::string browser = EnvConfig::getString(EnvConfig::kBrowserVariable, "");

    std::lock_guard<std::mutex> lock(mutex_);
    if (port) {
        std::cerr << "[SupervisorConfig] " << EnvConfig::kPortVariable << " overrides server.port: " << *port << std::endl;
        config_json_["server"]["port"] = *port;
    }
    if (!browser.empty()) {
        config_json_["sessions"]["browser_executable"] = browser;
    }
}

bool SupervisorConfig::validateConfig(const Json::Value& json, std::string& error) {
    if (!json.isObject()) {
        error = "root is not an object";
        return false;
    }

    const char* sections[] = {"server", "lock", "ports", "shutdown", "health", "sessions", "logging"};
    for (const char* section : sections) {
        if (json.isMember(section) && !json[section].isObject()) {
            error = std::string(section) + " is not an object";
            return false;
        }
    }

    auto checkInt = [&](const char* section, const char* key, int min, int max) {
        if (!json.isMember(section) || !json[section].isMember(key)) {
            return true;
        }
        const Json::Value& v = json[section][key];
        if (!v.isInt() || v.asInt() < min || v.asInt() > max) {
            std::ostringstream ss;
            ss << section << "." << key << " must be an integer in [" << min << ", " << max << "]";
            error = ss.str();
            return false;
        }
        return true;
    };
    auto checkType = [&](const char* section, const char* key, bool want_bool) {
        if (!json.isMember(section) || !json[section].isMember(key)) {
            return true;
        }
        const Json::Value& v = json[section][key];
        if (want_bool ? !v.isBool() : !v.isString()) {
            error = std::string(section) + "." + key + (want_bool ? " must be a boolean" : " must be a string");
            return false;
        }
        return true;
    };

    if (!checkInt("server", "port", 1, 65535) || !checkInt("server", "thread_num", 0, 256) ||
        !checkType("server", "host", false) || !checkType("lock", "file", false) ||
        !checkInt("ports", "max_attempts", 1, 65535) ||
        !checkInt("ports", "replacement_grace_ms", 0, 600000) ||
        !checkInt("shutdown", "connection_close_timeout_ms", 0, 600000) ||
        !checkInt("health", "interval_ms", 100, 86400000) ||
        !checkType("health", "auto_launch_browser", true) ||
        !checkType("health", "prune_unreachable_sessions", true) ||
        !checkInt("sessions", "port_range_start", 1, 65535) ||
        !checkInt("sessions", "port_range_end", 1, 65535) ||
        !checkType("sessions", "browser_executable", false) ||
        !checkType("sessions", "app_url", false) ||
        !checkInt("sessions", "launch_timeout_ms", 100, 600000) ||
        !checkType("sessions", "headless", true) ||
        !checkType("sessions", "user_data_root", false) ||
        !checkType("logging", "log_dir", false) || !checkType("logging", "log_level", false) ||
        !checkInt("logging", "max_files", 1, 100)) {
        return false;
    }

    int start = json.isMember("sessions") ? json["sessions"].get("port_range_start", 9222).asInt() : 9222;
    int end = json.isMember("sessions") ? json["sessions"].get("port_range_end", 9232).asInt() : 9232;
    if (start > end) {
        error = "sessions.port_range_start is greater than sessions.port_range_end";
        return false;
    }
    return true;
}

bool SupervisorConfig::mergeMissing(Json::Value& target, const Json::Value& defaults) {
    bool changed = false;
    for (const auto& key : defaults.getMemberNames()) {
        if (!target.isMember(key)) {
            target[key] = defaults[key];
            changed = true;
        } else if (defaults[key].isObject() && target[key].isObject()) {
            changed = mergeMissing(target[key], defaults[key]) || changed;
        }
    }
    return changed;
}

SupervisorConfig::ServerConfig SupervisorConfig::getServerConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ServerConfig config;
    const Json::Value& s = config_json_["server"];
    config.host = s.get("host", config.host).asString();
    config.port = s.get("port", config.port).asInt();
    config.thread_num = s.get("thread_num", config.thread_num).asInt();
    return config;
}

SupervisorConfig::LockConfig SupervisorConfig::getLockConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LockConfig config;
    config.file = config_json_["lock"].get("file", config.file).asString();
    return config;
}

SupervisorConfig::PortsConfig SupervisorConfig::getPortsConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PortsConfig config;
    const Json::Value& p = config_json_["ports"];
    config.max_attempts = p.get("max_attempts", config.max_attempts).asInt();
    config.replacement_grace_ms = p.get("replacement_grace_ms", config.replacement_grace_ms).asInt();
    return config;
}

SupervisorConfig::ShutdownConfig SupervisorConfig::getShutdownConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ShutdownConfig config;
    config.connection_close_timeout_ms =
        config_json_["shutdown"].get("connection_close_timeout_ms", config.connection_close_timeout_ms).asInt();
    return config;
}

SupervisorConfig::HealthConfig SupervisorConfig::getHealthConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    HealthConfig config;
    const Json::Value& h = config_json_["health"];
    config.interval_ms = h.get("interval_ms", config.interval_ms).asInt();
    config.auto_launch_browser = h.get("auto_launch_browser", config.auto_launch_browser).asBool();
    config.prune_unreachable_sessions =
        h.get("prune_unreachable_sessions", config.prune_unreachable_sessions).asBool();
    return config;
}

SupervisorConfig::SessionsConfig SupervisorConfig::getSessionsConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionsConfig config;
    const Json::Value& s = config_json_["sessions"];
    config.port_range_start = s.get("port_range_start", config.port_range_start).asInt();
    config.port_range_end = s.get("port_range_end", config.port_range_end).asInt();
    config.browser_executable = s.get("browser_executable", config.browser_executable).asString();
    config.app_url = s.get("app_url", config.app_url).asString();
    config.launch_timeout_ms = s.get("launch_timeout_ms", config.launch_timeout_ms).asInt();
    config.headless = s.get("headless", config.headless).asBool();
    config.user_data_root = s.get("user_data_root", config.user_data_root).asString();
    return config;
}

SupervisorConfig::LoggingConfig SupervisorConfig::getLoggingConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LoggingConfig config;
    const Json::Value& l = config_json_["logging"];
    config.log_dir = l.get("log_dir", config.log_dir).asString();
    config.log_level = l.get("log_level", config.log_level).asString();
    config.max_files = l.get("max_files", config.max_files).asInt();
    return config;
}

void SupervisorConfig::setServerPort(int port) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_json_["server"]["port"] = port;
}

Json::Value SupervisorConfig::getConfigJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_json_;
}

Json::Value SupervisorConfig::getConfigSection(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const Json::Value* current = &config_json_;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!current->isObject() || !current->isMember(part)) {
            return Json::Value();
        }
        current = &(*current)[part];
    }
    return *current;
}

std::string SupervisorConfig::getConfigPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_path_;
}

void SupervisorConfig::resetToDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_json_ = defaultConfig();
    loaded_ = false;
}

bool SupervisorConfig::isLoaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
}
