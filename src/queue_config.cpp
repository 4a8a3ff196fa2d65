#include "queue_config.hpp"
#include <fstream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <print>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    return timeBuf;
}

std::string resolveAgainst(const std::string& root, const std::string& path) {
    fs::path p(path);
    if (p.is_absolute()) {
        return p.string();
    }
    return (fs::path(root) / p).string();
}

} // namespace

QueueConfig::QueueConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        throw std::runtime_error(std::format("Failed to parse config file: {} ({})", configFile,
                                             reader.getFormattedErrorMessages()));
    }
    load(configJson);
}

QueueConfig::QueueConfig(const Json::Value& configJson) {
    load(configJson);
}

void QueueConfig::load(const Json::Value& configJson) {
    if (!configJson.isObject()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    root = configJson.get("root", fs::current_path().string()).asString();
    autoSetup = configJson.get("auto_setup", false).asBool();
    logFile = resolveAgainst(root, configJson.get("log_file", "sftpmail.log").asString());
    errorLogFile = resolveAgainst(root, configJson.get("error_log_file", "errors.log").asString());

    sftpConfig = configJson["sftp"];
    pgpConfig = configJson["pgp"];
    emailConfig = configJson["email"];
}

void QueueConfig::appendLine(const std::string& file, const std::string& entry) const {
    std::error_code ec;
    auto parent = fs::path(file).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    std::ofstream log(file, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", file);
    }
}

void QueueConfig::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", currentTimestamp(), message);
    std::println("{}", logEntry);
    appendLine(logFile, logEntry);
}

void QueueConfig::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", currentTimestamp(), message);
    std::println(stderr, "{}", logEntry);
    appendLine(errorLogFile, logEntry);
}
