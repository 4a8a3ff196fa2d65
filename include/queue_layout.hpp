/**
 * @file queue_layout.hpp
 * @brief Queue directory layout helpers for SFTPMail.
 *
 * The queue lives in four flat directories under a configured root: Inbox, Outbox,
 * Sent and Awaiting. Directory listing is the only source of truth; there is no index file.
 *
 * @note Name derivation does not reserve the name it returns. Between selection and
 * creation another process may claim the same name; callers must serialize access
 * to a queue root themselves.
 */

#ifndef QUEUE_LAYOUT_HPP
#define QUEUE_LAYOUT_HPP

#include <array>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>
#include "queue_error.hpp"

namespace fs = std::filesystem;

/**
 * @brief The four well-known queue directories.
 */
enum class QueueDirectory {
    Inbox,
    Outbox,
    Sent,
    Awaiting
};

/**
 * @brief Returns the on-disk name of a queue directory.
 *
 * @param dir Queue directory.
 * @return std::string "Inbox", "Outbox", "Sent" or "Awaiting".
 */
std::string directoryName(QueueDirectory dir);

/**
 * @brief Returns all queue directories in setup order (Inbox, Outbox, Sent, Awaiting).
 */
constexpr std::array<QueueDirectory, 4> requiredDirectories() {
    return {QueueDirectory::Inbox, QueueDirectory::Outbox, QueueDirectory::Sent, QueueDirectory::Awaiting};
}

/**
 * @brief Resolves a queue directory under the given root.
 */
fs::path queuePath(const fs::path& root, QueueDirectory dir);

/**
 * @brief Lists the required directories that are missing under root.
 *
 * @param root Queue root directory.
 * @return std::vector<QueueDirectory> Missing directories, in setup order.
 */
std::vector<QueueDirectory> findMissingDirectories(const fs::path& root);

/**
 * @brief Verifies that every queue directory exists under root.
 *
 * @param root Queue root directory.
 * @return std::expected<void, QueueError> Success, or a SetupError naming the missing directories.
 */
std::expected<void, QueueError> checkSetup(const fs::path& root);

/**
 * @brief Creates the missing queue directories under root.
 *
 * Existing directories and their content are left untouched.
 *
 * @param root Queue root directory.
 * @return std::expected<std::vector<QueueDirectory>, QueueError> Directories created, or a SetupError.
 */
std::expected<std::vector<QueueDirectory>, QueueError> runSetup(const fs::path& root);

/**
 * @brief Derives a file path in dir that does not collide with an existing entry.
 *
 * If dir/fileName is free it is returned as is. Otherwise "_N" is inserted before the
 * last extension segment ("report.csv" -> "report_1.csv", "notes" -> "notes_1") for
 * N = 1, 2, ... until a free name is found. The original name is the base of every
 * candidate, so the result is deterministic for a given directory state.
 *
 * @param dir Destination directory.
 * @param fileName Candidate file name.
 * @return fs::path Free path inside dir.
 */
fs::path nonConflictingName(const fs::path& dir, const std::string& fileName);

/**
 * @brief Reports whether name is a single path component that stays inside its directory.
 *
 * Rejects empty names, "." and "..", and names containing a '/' or '\\' separator or a NUL.
 */
bool isFlatFileName(const std::string& name);

/**
 * @brief Builds the N-th suffixed variant of a file name ("a.tar.gz", 2 -> "a.tar_2.gz").
 */
std::string suffixedName(const std::string& fileName, int counter);

#endif // QUEUE_LAYOUT_HPP
