/**
 * @file transfer_queue.hpp
 * @brief Defines the folder-based transfer queue of SFTPMail.
 *
 * The queue moves files through four local directories while they are exchanged with a
 * remote store:
 *
 *   send:    Outbox -> Awaiting -> Sent       (Awaiting -> Outbox on failure)
 *   receive: remote -> Awaiting -> Inbox      (partial downloads removed on failure)
 *
 * A failure of one file is recorded in the returned report and does not stop the batch.
 * Missing directories, a missing transform and connection failures abort the call.
 *
 * @note The queue does no locking. Two calls against the same root must not run
 * concurrently; callers serialize access themselves. Timeouts and cancellation belong to
 * the remote store and surface here as ordinary transfer errors.
 */

#ifndef TRANSFER_QUEUE_HPP
#define TRANSFER_QUEUE_HPP

#include <string>
#include <vector>
#include <memory>
#include <expected>
#include <filesystem>
#include "queue_config.hpp"
#include "queue_error.hpp"
#include "queue_layout.hpp"
#include "remote_store.hpp"
#include "crypto_transform.hpp"
#include "notification.hpp"

namespace fs = std::filesystem;

/**
 * @brief Outcome of a send or receive batch.
 */
struct TransferReport {
    std::vector<fs::path> completed;  ///< Sent paths (send) or Inbox paths (receive).
    std::vector<QueueError> failures; ///< One entry per failed file.

    bool ok() const { return failures.empty(); }
};

/**
 * @brief Main transfer queue class.
 *
 * Owns the lifecycle of files inside the queue directories once a call begins and
 * delegates the remote work to the injected store.
 */
class TransferQueue {
public:
    /**
     * @brief Constructs a queue with strategies built from the configuration.
     *
     * The SFTP store is always built; the PGP transform and email notifier only when their
     * configuration sections are present.
     *
     * @param config Queue configuration.
     * @throws std::runtime_error If a configured section is invalid.
     */
    explicit TransferQueue(const QueueConfig& config);

    /**
     * @brief Constructs a queue with injected collaborators.
     *
     * @param config Queue configuration (root, setup policy, logging).
     * @param store Remote file store, required.
     * @param transform Cryptographic transform, may be null when PGP mode is never used.
     * @param notifier Alert sink, may be null.
     * @throws std::runtime_error If store is null.
     */
    TransferQueue(const QueueConfig& config,
                  std::unique_ptr<RemoteFileStore> store,
                  std::unique_ptr<CryptoTransform> transform = nullptr,
                  std::unique_ptr<NotificationStrategy> notifier = nullptr);

    /**
     * @brief Sends every file currently in Outbox to a remote directory.
     *
     * The Outbox listing is taken once at the start. Each file is moved to Awaiting,
     * optionally encrypted into a transient artifact, uploaded as remoteDestination/<name>
     * and then moved to Sent. On failure it goes back to Outbox under its original name.
     *
     * @param remoteDestination Remote directory.
     * @param mode CryptoMode::PGP encrypts before upload.
     * @return std::expected<TransferReport, QueueError> Per-file outcome, or a fatal error.
     */
    std::expected<TransferReport, QueueError> sendTo(const std::string& remoteDestination,
                                                     CryptoMode mode = CryptoMode::None);

    /**
     * @brief Fetches every file in a remote directory into Inbox.
     *
     * Files are downloaded into Awaiting and removed remotely only once the local copy is on
     * disk. After the downloads the batch is decrypted or copied into Inbox.
     *
     * @param remoteSource Remote directory.
     * @param mode CryptoMode::PGP decrypts into Inbox.
     * @return std::expected<TransferReport, QueueError> Inbox paths and per-file failures, or a fatal error.
     */
    std::expected<TransferReport, QueueError> receiveFrom(const std::string& remoteSource,
                                                          CryptoMode mode = CryptoMode::None);

    /**
     * @brief Checks the queue directories, creating them when auto setup is enabled.
     *
     * @return std::expected<void, QueueError> Success or a SetupError.
     */
    std::expected<void, QueueError> ensureSetup();

private:
    /**
     * @brief Runs the checks shared by send and receive before any file is touched.
     */
    std::expected<void, QueueError> prepare(CryptoMode mode);

    /**
     * @brief Sends a single Outbox file; returns its Sent path.
     */
    std::expected<fs::path, QueueError> sendFile(const fs::path& outboxFile, const std::string& remoteDestination,
                                                 CryptoMode mode);

    /**
     * @brief Writes an encrypted copy of an Awaiting file next to it.
     */
    std::expected<fs::path, QueueError> encryptToArtifact(const fs::path& awaitingFile);

    /**
     * @brief Moves an Awaiting file back to Outbox under its original name.
     *
     * Falls back to a non-conflicting name when the original one was taken again meanwhile.
     */
    std::expected<void, std::string> rollback(const fs::path& awaitingFile, const std::string& originalName);

    /**
     * @brief Delivers one downloaded Awaiting file into Inbox.
     */
    std::expected<fs::path, QueueError> deliver(const fs::path& awaitingFile, const std::string& remoteName,
                                                CryptoMode mode);

    /**
     * @brief Logs per-file failures and raises one alert for the batch.
     */
    void reportFailures(const std::string& operation, const TransferReport& report);

    fs::path dir(QueueDirectory d) const { return queuePath(config.root, d); }

    QueueConfig config; ///< Queue configuration.
    std::unique_ptr<RemoteFileStore> store; ///< Remote file store.
    std::unique_ptr<CryptoTransform> transform; ///< Cryptographic transform, may be null.
    std::unique_ptr<NotificationStrategy> notifier; ///< Alert sink, may be null.
};

#endif // TRANSFER_QUEUE_HPP
