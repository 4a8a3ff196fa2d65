/**
 * @file queue_error.hpp
 * @brief Error type shared by the SFTPMail queue components.
 *
 * Operations of the transfer queue report failures as std::expected values carrying a
 * QueueError, which records the kind of failure, the affected path and a message.
 */

#ifndef QUEUE_ERROR_HPP
#define QUEUE_ERROR_HPP

#include <string>

/**
 * @brief Category of a queue failure.
 */
enum class ErrorKind {
    Setup,          ///< Required queue directories are missing.
    Configuration,  ///< Missing connection parameters or a required transform.
    Transfer,       ///< Upload, download or transform failure for a specific file.
    Authentication  ///< Remote login or host verification failure.
};

/**
 * @brief Describes a single failure of a queue operation.
 */
struct QueueError {
    ErrorKind kind;      ///< Failure category.
    std::string path;    ///< Affected local or remote path, empty when not applicable.
    std::string message; ///< Underlying cause.

    /**
     * @brief Renders the error as a single log line.
     *
     * @return std::string e.g. "TransferError: Outbox/a.txt: upload failed".
     */
    std::string describe() const;
};

/**
 * @brief Returns the display name of an error kind ("SetupError", "TransferError", ...).
 */
std::string errorKindName(ErrorKind kind);

#endif // QUEUE_ERROR_HPP
