/**
 * @file queue_api.hpp
 * @brief High-level API for interacting with the SFTPMail transfer queue.
 *
 * Provides a simplified interface for sending, receiving, setting up the queue directories
 * and managing keys, abstracting the construction of the queue and its collaborators from
 * a JSON configuration file.
 */

#ifndef QUEUE_API_HPP
#define QUEUE_API_HPP

#include <string>
#include <vector>
#include <expected>
#include "transfer_queue.hpp"

/**
 * @brief API for managing the transfer queue.
 *
 * Serves as the entry point for the command line front end and external applications.
 * Configuration problems are reported as ConfigurationError values instead of exceptions.
 */
class QueueAPI {
public:
    /**
     * @brief Sends every Outbox file to a remote directory.
     *
     * @param configFile Path to the JSON configuration file.
     * @param remoteDestination Remote directory.
     * @param mode Encrypt with PGP or send as is.
     * @param allowSetup Create missing queue directories instead of failing.
     * @return std::expected<TransferReport, QueueError> Batch report or a fatal error.
     */
    static std::expected<TransferReport, QueueError> send(const std::string& configFile,
                                                          const std::string& remoteDestination,
                                                          CryptoMode mode = CryptoMode::None,
                                                          bool allowSetup = false);

    /**
     * @brief Receives every file of a remote directory into Inbox.
     *
     * @param configFile Path to the JSON configuration file.
     * @param remoteSource Remote directory.
     * @param mode Decrypt with PGP or deliver as is.
     * @param allowSetup Create missing queue directories instead of failing.
     * @return std::expected<TransferReport, QueueError> Batch report or a fatal error.
     */
    static std::expected<TransferReport, QueueError> receive(const std::string& configFile,
                                                             const std::string& remoteSource,
                                                             CryptoMode mode = CryptoMode::None,
                                                             bool allowSetup = false);

    /**
     * @brief Creates the missing queue directories under the configured root.
     *
     * @param configFile Path to the JSON configuration file.
     * @return std::expected<std::vector<QueueDirectory>, QueueError> Directories created.
     */
    static std::expected<std::vector<QueueDirectory>, QueueError> setup(const std::string& configFile);

    /**
     * @brief Imports key files into the configured GnuPG keyring.
     *
     * @param configFile Path to the JSON configuration file.
     * @param keyFiles Key files to import.
     * @return std::expected<std::vector<std::string>, QueueError> Fingerprints of the imported keys.
     */
    static std::expected<std::vector<std::string>, QueueError> importKeys(const std::string& configFile,
                                                                         const std::vector<std::string>& keyFiles);

    /**
     * @brief Verifies the email credentials and sends a test alert.
     *
     * @param configFile Path to the JSON configuration file.
     * @return std::expected<void, QueueError> Success or the failure.
     */
    static std::expected<void, QueueError> testAlert(const std::string& configFile);
};

#endif // QUEUE_API_HPP
