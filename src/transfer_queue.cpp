#include "transfer_queue.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace {

std::expected<void, std::string> writeFile(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return std::unexpected(std::format("Failed to open {} for writing", path.string()));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        return std::unexpected(std::format("Failed to write {}", path.string()));
    }
    return {};
}

bool pathExists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

} // namespace

TransferQueue::TransferQueue(const QueueConfig& config)
    : config(config), store(std::make_unique<SFTPRemoteStore>(config.sftpConfig)) {
    if (!config.pgpConfig.empty()) {
        transform = std::make_unique<PGPTransform>(config.pgpConfig);
    }
    if (!config.emailConfig.empty()) {
        notifier = std::make_unique<EmailNotificationStrategy>(config.emailConfig);
    }
}

TransferQueue::TransferQueue(const QueueConfig& config,
                             std::unique_ptr<RemoteFileStore> store,
                             std::unique_ptr<CryptoTransform> transform,
                             std::unique_ptr<NotificationStrategy> notifier)
    : config(config), store(std::move(store)), transform(std::move(transform)), notifier(std::move(notifier)) {
    if (!this->store) {
        throw std::runtime_error("Transfer queue requires a remote file store");
    }
}

std::expected<void, QueueError> TransferQueue::ensureSetup() {
    auto setup = checkSetup(config.root);
    if (setup || !config.autoSetup) {
        return setup;
    }

    auto created = runSetup(config.root);
    if (!created) {
        return std::unexpected(created.error());
    }
    for (auto d : *created) {
        config.logMessage(std::format("Created queue directory: {}", dir(d).string()));
    }
    return {};
}

std::expected<void, QueueError> TransferQueue::prepare(CryptoMode mode) {
    auto setup = ensureSetup();
    if (!setup) {
        return setup;
    }

    switch (mode) {
    case CryptoMode::None:
        return {};
    case CryptoMode::PGP:
        if (!transform) {
            return std::unexpected(QueueError{ErrorKind::Configuration, "",
                                              "PGP mode requested but no PGP transform is configured"});
        }
        return {};
    }
    return {};
}

std::expected<TransferReport, QueueError> TransferQueue::sendTo(const std::string& remoteDestination, CryptoMode mode) {
    auto ready = prepare(mode);
    if (!ready) {
        config.logError(ready.error().describe());
        return std::unexpected(ready.error());
    }

    // Snapshot: files dropped into Outbox from here on wait for the next call.
    fs::path outboxDir = dir(QueueDirectory::Outbox);
    std::vector<fs::path> outbox;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(outboxDir, ec)) {
        std::error_code typeEc;
        if (entry.is_regular_file(typeEc)) {
            outbox.push_back(entry.path());
        }
    }
    if (ec) {
        QueueError error{ErrorKind::Transfer, outboxDir.string(), std::format("failed to list Outbox: {}", ec.message())};
        config.logError(error.describe());
        return std::unexpected(error);
    }
    std::ranges::sort(outbox);

    TransferReport report;
    if (outbox.empty()) {
        config.logMessage("Outbox is empty, nothing to send");
        return report;
    }

    ConnectionScope connection(*store);
    if (!connection.status()) {
        config.logError(connection.status().error().describe());
        return std::unexpected(connection.status().error());
    }

    config.logMessage(std::format("Sending {} file(s) to {} (encryption: {})", outbox.size(), remoteDestination,
                                  cryptoModeName(mode)));
    for (const auto& file : outbox) {
        auto sent = sendFile(file, remoteDestination, mode);
        if (sent) {
            report.completed.push_back(*sent);
        } else {
            report.failures.push_back(sent.error());
        }
    }

    reportFailures("send", report);
    config.logMessage(std::format("Send to {} finished: {} sent, {} failed", remoteDestination,
                                  report.completed.size(), report.failures.size()));
    return report;
}

std::expected<fs::path, QueueError> TransferQueue::sendFile(const fs::path& outboxFile, const std::string& remoteDestination,
                                                            CryptoMode mode) {
    const std::string name = outboxFile.filename().string();
    fs::path awaiting = nonConflictingName(dir(QueueDirectory::Awaiting), name);

    // Once moved, the Outbox name is free again and the file cannot be picked up twice.
    std::error_code ec;
    fs::rename(outboxFile, awaiting, ec);
    if (ec) {
        return std::unexpected(QueueError{ErrorKind::Transfer, outboxFile.string(),
                                          std::format("failed to move to Awaiting: {}", ec.message())});
    }

    auto fail = [&](const std::string& cause) -> std::unexpected<QueueError> {
        std::string message = cause;
        auto restored = rollback(awaiting, name);
        if (!restored) {
            message += std::format("; {}", restored.error());
        }
        return std::unexpected(QueueError{ErrorKind::Transfer, outboxFile.string(), message});
    };

    fs::path artifact;
    std::string remotePath = joinRemotePath(remoteDestination, name);
    std::expected<void, std::string> uploaded;
    try {
        fs::path upload = awaiting;
        switch (mode) {
        case CryptoMode::None:
            break;
        case CryptoMode::PGP: {
            auto encrypted = encryptToArtifact(awaiting);
            if (!encrypted) {
                return fail(encrypted.error().message);
            }
            artifact = upload = *encrypted;
            break;
        }
        }
        uploaded = store->upload(upload.string(), remotePath);
    } catch (const std::exception& e) {
        uploaded = std::unexpected(std::format("upload interrupted: {}", e.what()));
    }

    if (!artifact.empty()) {
        fs::remove(artifact, ec);
        if (ec) {
            config.logError(std::format("Failed to remove encrypted artifact {}: {}", artifact.string(), ec.message()));
        }
    }

    if (!uploaded) {
        return fail(std::format("upload to {} failed: {}", remotePath, uploaded.error()));
    }

    fs::path sent = nonConflictingName(dir(QueueDirectory::Sent), name);
    fs::rename(awaiting, sent, ec);
    if (ec) {
        // Already delivered: leave it in Awaiting rather than queueing a duplicate send.
        return std::unexpected(QueueError{ErrorKind::Transfer, awaiting.string(),
                                          std::format("uploaded to {} but could not be moved to Sent: {}", remotePath,
                                                      ec.message())});
    }

    config.logMessage(std::format("Sent {} to {}", name, remotePath));
    return sent;
}

std::expected<fs::path, QueueError> TransferQueue::encryptToArtifact(const fs::path& awaitingFile) {
    auto contents = transform->encrypt({awaitingFile.string()});
    if (!contents) {
        return std::unexpected(QueueError{ErrorKind::Transfer, awaitingFile.string(),
                                          std::format("encryption failed: {}", contents.error())});
    }
    if (contents->size() != 1) {
        return std::unexpected(QueueError{ErrorKind::Transfer, awaitingFile.string(),
                                          "encryption returned an unexpected number of results"});
    }

    fs::path artifact = nonConflictingName(dir(QueueDirectory::Awaiting), awaitingFile.filename().string() + ".encrypted");
    auto written = writeFile(artifact, contents->front());
    if (!written) {
        std::error_code ec;
        fs::remove(artifact, ec);
        return std::unexpected(QueueError{ErrorKind::Transfer, artifact.string(), written.error()});
    }
    return artifact;
}

std::expected<void, std::string> TransferQueue::rollback(const fs::path& awaitingFile, const std::string& originalName) {
    fs::path target = dir(QueueDirectory::Outbox) / originalName;
    if (pathExists(target)) {
        target = nonConflictingName(dir(QueueDirectory::Outbox), originalName);
        config.logError(std::format("{} was queued again while sending, restoring as {}", originalName,
                                    target.filename().string()));
    }

    std::error_code ec;
    fs::rename(awaitingFile, target, ec);
    if (ec) {
        auto error = std::format("could not return {} to Outbox: {}", awaitingFile.string(), ec.message());
        config.logError(error);
        return std::unexpected(error);
    }
    config.logMessage(std::format("Returned {} to Outbox", target.filename().string()));
    return {};
}

std::expected<TransferReport, QueueError> TransferQueue::receiveFrom(const std::string& remoteSource, CryptoMode mode) {
    auto ready = prepare(mode);
    if (!ready) {
        config.logError(ready.error().describe());
        return std::unexpected(ready.error());
    }

    ConnectionScope connection(*store);
    if (!connection.status()) {
        config.logError(connection.status().error().describe());
        return std::unexpected(connection.status().error());
    }

    std::expected<std::vector<std::string>, std::string> names;
    try {
        names = store->list(remoteSource);
    } catch (const std::exception& e) {
        names = std::unexpected(std::format("listing interrupted: {}", e.what()));
    }
    if (!names) {
        QueueError error{ErrorKind::Transfer, remoteSource, names.error()};
        config.logError(error.describe());
        return std::unexpected(error);
    }
    std::ranges::sort(*names);
    config.logMessage(std::format("Receiving {} file(s) from {} (decryption: {})", names->size(), remoteSource,
                                  cryptoModeName(mode)));

    TransferReport report;
    std::vector<std::pair<fs::path, std::string>> downloaded;
    for (const auto& name : *names) {
        std::string remotePath = joinRemotePath(remoteSource, name);
        if (!isFlatFileName(name)) {
            report.failures.push_back(QueueError{ErrorKind::Transfer, remotePath,
                                                 "remote name is not a plain file name, skipped"});
            continue;
        }
        fs::path local = nonConflictingName(dir(QueueDirectory::Awaiting), name);

        std::expected<void, std::string> fetched;
        try {
            fetched = store->download(remotePath, local.string(), true);
        } catch (const std::exception& e) {
            fetched = std::unexpected(std::format("download interrupted: {}", e.what()));
        }
        if (fetched && !pathExists(local)) {
            fetched = std::unexpected(std::format("{} was not written", local.string()));
        }
        if (!fetched) {
            std::error_code ec;
            fs::remove(local, ec);
            report.failures.push_back(QueueError{ErrorKind::Transfer, remotePath,
                                                 std::format("download failed: {}", fetched.error())});
            continue;
        }
        downloaded.emplace_back(local, name);
        config.logMessage(std::format("Downloaded {} to {}", remotePath, local.string()));

        // The remote copy goes only after the local one is on disk.
        std::expected<void, std::string> removed;
        try {
            removed = store->remove(remotePath);
        } catch (const std::exception& e) {
            removed = std::unexpected(std::format("removal interrupted: {}", e.what()));
        }
        if (!removed) {
            report.failures.push_back(QueueError{ErrorKind::Transfer, remotePath,
                                                 std::format("downloaded to {} but the remote copy could not be removed: {}",
                                                             local.string(), removed.error())});
        }
    }

    for (const auto& [awaiting, name] : downloaded) {
        auto delivered = deliver(awaiting, name, mode);
        if (delivered) {
            report.completed.push_back(*delivered);
        } else {
            report.failures.push_back(delivered.error());
        }
    }

    reportFailures("receive", report);
    config.logMessage(std::format("Receive from {} finished: {} delivered, {} failed", remoteSource,
                                  report.completed.size(), report.failures.size()));
    return report;
}

std::expected<fs::path, QueueError> TransferQueue::deliver(const fs::path& awaitingFile, const std::string& remoteName,
                                                           CryptoMode mode) {
    fs::path target = nonConflictingName(dir(QueueDirectory::Inbox), remoteName);
    std::error_code ec;

    switch (mode) {
    case CryptoMode::None:
        fs::rename(awaitingFile, target, ec);
        if (ec) {
            return std::unexpected(QueueError{ErrorKind::Transfer, awaitingFile.string(),
                                              std::format("failed to move to Inbox: {}", ec.message())});
        }
        break;
    case CryptoMode::PGP: {
        auto contents = transform->decrypt({awaitingFile.string()});
        if (!contents || contents->size() != 1) {
            return std::unexpected(QueueError{ErrorKind::Transfer, awaitingFile.string(),
                                              std::format("decryption failed: {}",
                                                          contents ? "unexpected number of results" : contents.error())});
        }
        auto written = writeFile(target, contents->front());
        if (!written) {
            fs::remove(target, ec);
            return std::unexpected(QueueError{ErrorKind::Transfer, target.string(), written.error()});
        }
        fs::remove(awaitingFile, ec);
        if (ec) {
            config.logError(std::format("Failed to remove {} after decryption: {}", awaitingFile.string(), ec.message()));
        }
        break;
    }
    }

    config.logMessage(std::format("Delivered {} to {}", remoteName, target.string()));
    return target;
}

void TransferQueue::reportFailures(const std::string& operation, const TransferReport& report) {
    if (report.failures.empty()) {
        return;
    }

    std::string body = std::format("{} file(s) failed during {} in {}:\n", report.failures.size(), operation, config.root);
    for (const auto& failure : report.failures) {
        config.logError(failure.describe());
        body += std::format("- {}\n", failure.describe());
    }

    if (notifier) {
        auto sent = notifier->notify(notifier->defaultRecipients(), notifier->defaultSubject(), body);
        if (!sent) {
            config.logError(std::format("Failed to send alert: {}", sent.error()));
        }
    }
}
