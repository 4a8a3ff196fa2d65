#include "queue_api.hpp"
#include <format>

namespace {

QueueError configurationError(const std::string& configFile, const std::exception& e) {
    return QueueError{ErrorKind::Configuration, configFile, e.what()};
}

std::expected<TransferQueue, QueueError> openQueue(const std::string& configFile, bool allowSetup) {
    try {
        QueueConfig config(configFile);
        config.autoSetup = config.autoSetup || allowSetup;
        return TransferQueue(config);
    } catch (const std::exception& e) {
        return std::unexpected(configurationError(configFile, e));
    }
}

} // namespace

std::expected<TransferReport, QueueError> QueueAPI::send(const std::string& configFile,
                                                         const std::string& remoteDestination,
                                                         CryptoMode mode, bool allowSetup) {
    auto queue = openQueue(configFile, allowSetup);
    if (!queue) {
        return std::unexpected(queue.error());
    }
    return queue->sendTo(remoteDestination, mode);
}

std::expected<TransferReport, QueueError> QueueAPI::receive(const std::string& configFile,
                                                            const std::string& remoteSource,
                                                            CryptoMode mode, bool allowSetup) {
    auto queue = openQueue(configFile, allowSetup);
    if (!queue) {
        return std::unexpected(queue.error());
    }
    return queue->receiveFrom(remoteSource, mode);
}

std::expected<std::vector<QueueDirectory>, QueueError> QueueAPI::setup(const std::string& configFile) {
    try {
        QueueConfig config(configFile);
        auto created = runSetup(config.root);
        if (!created) {
            config.logError(created.error().describe());
            return created;
        }
        for (auto dir : *created) {
            config.logMessage(std::format("Created queue directory: {}", queuePath(config.root, dir).string()));
        }
        return created;
    } catch (const std::exception& e) {
        return std::unexpected(configurationError(configFile, e));
    }
}

std::expected<std::vector<std::string>, QueueError> QueueAPI::importKeys(const std::string& configFile,
                                                                        const std::vector<std::string>& keyFiles) {
    try {
        QueueConfig config(configFile);
        if (config.pgpConfig.empty()) {
            return std::unexpected(QueueError{ErrorKind::Configuration, configFile, "no 'pgp' section configured"});
        }
        PGPTransform pgp(config.pgpConfig);
        auto imported = pgp.importKeys(keyFiles);
        if (!imported) {
            config.logError(imported.error());
            return std::unexpected(QueueError{ErrorKind::Configuration, "", imported.error()});
        }
        for (const auto& fingerprint : *imported) {
            config.logMessage(std::format("Imported key {}", fingerprint));
        }
        return *imported;
    } catch (const std::exception& e) {
        return std::unexpected(configurationError(configFile, e));
    }
}

std::expected<void, QueueError> QueueAPI::testAlert(const std::string& configFile) {
    try {
        QueueConfig config(configFile);
        if (config.emailConfig.empty()) {
            return std::unexpected(QueueError{ErrorKind::Configuration, configFile, "no 'email' section configured"});
        }
        EmailNotificationStrategy email(config.emailConfig);
        auto verified = email.verifyCredentials();
        if (!verified) {
            config.logError(verified.error().describe());
            return verified;
        }
        auto sent = email.notify({}, email.defaultSubject(),
                                 std::format("Test alert from the transfer queue at {}", config.root));
        if (!sent) {
            config.logError(sent.error());
            return std::unexpected(QueueError{ErrorKind::Configuration, configFile, sent.error()});
        }
        config.logMessage("Test alert sent");
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(configurationError(configFile, e));
    }
}
