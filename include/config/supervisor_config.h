#pragma once

#include <string>
#include <mutex>
#include <filesystem>
#include <json/json.h>

/**
 * @brief Supervisor Configuration Manager
 *
 * Manages configuration loaded from <config_dir>/config.json.
 * Missing keys are filled from defaults; a missing file is created with
 * defaults. Environment overrides (CONTINUUM_PORT, CONTINUUM_BROWSER) are
 * applied on top by applyEnvironmentOverrides().
 *
 * Thread-safe singleton pattern
 */
class SupervisorConfig {
public:
    struct ServerConfig {
        std::string host = "0.0.0.0";
        int port = 9000;
        int thread_num = 2;
    };

    struct LockConfig {
        std::string file = "supervisor.lock";
    };

    struct PortsConfig {
        int max_attempts = 100;
        int replacement_grace_ms = 5000;
    };

    struct ShutdownConfig {
        int connection_close_timeout_ms = 3000;
    };

    struct HealthConfig {
        int interval_ms = 30000;
        bool auto_launch_browser = false;
        bool prune_unreachable_sessions = true;
    };

    struct SessionsConfig {
        int port_range_start = 9222;
        int port_range_end = 9232;
        std::string browser_executable;
        /// Empty: http://localhost:<service port>
        std::string app_url;
        int launch_timeout_ms = 10000;
        bool headless = false;
        std::string user_data_root = "/tmp";
    };

    struct LoggingConfig {
        std::string log_dir = "logs";
        std::string log_level = "info";
        int max_files = 5;
    };

    /**
     * @brief Get singleton instance
     */
    static SupervisorConfig& getInstance();

    /**
     * @brief Load configuration from file
     * @param configPath Path to config.json file
     * @return true if loaded successfully; false means defaults are in use
     */
    bool loadConfig(const std::string& configPath);

    /**
     * @brief Save configuration to file
     * @param configPath Path to config.json file (optional, uses current path if empty)
     * @return true if saved successfully
     */
    bool saveConfig(const std::string& configPath = "");

    /**
     * @brief Apply CONTINUUM_PORT and CONTINUUM_BROWSER
     */
    void applyEnvironmentOverrides();

    ServerConfig getServerConfig() const;
    LockConfig getLockConfig() const;
    PortsConfig getPortsConfig() const;
    ShutdownConfig getShutdownConfig() const;
    HealthConfig getHealthConfig() const;
    SessionsConfig getSessionsConfig() const;
    LoggingConfig getLoggingConfig() const;

    /**
     * @brief Override the service port (CLI --port)
     */
    void setServerPort(int port);

    /**
     * @brief Get full configuration as JSON
     */
    Json::Value getConfigJson() const;

    /**
     * @brief Get configuration section as JSON
     * @param path JSON path (e.g., "server", "sessions.port_range_start")
     * @return JSON value if found, null otherwise
     */
    Json::Value getConfigSection(const std::string& path) const;

    /**
     * @brief Get config file path
     */
    std::string getConfigPath() const;

    /**
     * @brief Reset configuration to default values
     */
    void resetToDefaults();

    /**
     * @brief Check if configuration is loaded
     */
    bool isLoaded() const;

    /**
     * @brief Default configuration document
     */
    static Json::Value defaultConfig();

    /**
     * @brief Check types and ranges of a configuration document
     * @param error Set to the first problem found
     */
    static bool validateConfig(const Json::Value& json, std::string& error);

private:
    SupervisorConfig();
    ~SupervisorConfig() = default;
    SupervisorConfig(const SupervisorConfig&) = delete;
    SupervisorConfig& operator=(const SupervisorConfig&) = delete;

    /**
     * @brief Copy keys present in defaults but absent in target
     * @return true if anything was added
     */
    static bool mergeMissing(Json::Value& target, const Json::Value& defaults);

    std::string config_path_;
    mutable std::mutex mutex_;
    Json::Value config_json_;
    bool loaded_ = false;
};
