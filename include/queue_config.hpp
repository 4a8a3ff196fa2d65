/**
 * @file queue_config.hpp
 * @brief Configuration management for the SFTPMail transfer queue.
 *
 * Defines the configuration class for the queue root, the SFTP connection, the PGP
 * transform and email alerts, together with the timestamped log files the queue writes to.
 *
 * @note Configuration is loaded from a JSON file. Relative log paths are resolved against
 * the queue root.
 */

#ifndef QUEUE_CONFIG_HPP
#define QUEUE_CONFIG_HPP

#include <string>
#include <json/json.h>

/**
 * @brief Configuration class for the transfer queue.
 *
 * Loads and manages settings from a JSON configuration file, providing defaults.
 */
class QueueConfig {
public:
    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is invalid or inaccessible.
     */
    explicit QueueConfig(const std::string& configFile);

    /**
     * @brief Constructs a configuration instance from an already parsed JSON document.
     *
     * @param configJson Parsed configuration.
     * @throws std::runtime_error If the document is not a JSON object.
     */
    explicit QueueConfig(const Json::Value& configJson);

    /**
     * @brief Logs a message to the configured log file.
     *
     * @param message Message to log.
     * @note Creates the log file directory if needed.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to the configured error log file.
     *
     * @param message Error message to log.
     * @note Creates the error log file directory if needed.
     */
    void logError(const std::string& message) const;

    std::string root;           ///< Queue root holding Inbox, Outbox, Sent and Awaiting.
    bool autoSetup;             ///< Create missing queue directories instead of failing.
    std::string logFile;        ///< Path to the log file.
    std::string errorLogFile;   ///< Path to the error log file.
    Json::Value sftpConfig;     ///< SFTP connection properties.
    Json::Value pgpConfig;      ///< PGP transform settings, null when encryption is not configured.
    Json::Value emailConfig;    ///< Email alert settings, null when alerts are not configured.

private:
    void load(const Json::Value& configJson);
    void appendLine(const std::string& file, const std::string& entry) const;
};

#endif // QUEUE_CONFIG_HPP
