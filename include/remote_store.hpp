/**
 * @file remote_store.hpp
 * @brief Defines the remote file store used by the SFTPMail transfer queue.
 *
 * Provides the interface the queue uses to list, upload, download and remove remote files,
 * a scoped connection helper, and an SFTP implementation built on libssh.
 *
 * @note Requires libssh for SFTP transfers. Install via vcpkg on Windows, Homebrew on macOS,
 * or apt on Linux.
 */

#ifndef REMOTE_STORE_HPP
#define REMOTE_STORE_HPP

#include <string>
#include <vector>
#include <expected>
#include <json/json.h>
#include "queue_error.hpp"

struct ssh_session_struct;
struct sftp_session_struct;

/**
 * @brief Interface for remote file stores.
 *
 * All file operations run inside a connection opened by connect() and closed by
 * disconnect(). Use ConnectionScope to guarantee the close on every exit path.
 */
class RemoteFileStore {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~RemoteFileStore() = default;

    /**
     * @brief Opens the connection and authenticates.
     *
     * @return std::expected<void, QueueError> Success, an AuthenticationError on login or host
     * key failure, or a TransferError when the server cannot be reached.
     */
    virtual std::expected<void, QueueError> connect() = 0;

    /**
     * @brief Closes the connection. Safe to call when not connected.
     */
    virtual void disconnect() = 0;

    /**
     * @brief Reports whether a connection is currently open.
     */
    virtual bool isConnected() const = 0;

    /**
     * @brief Lists the regular files in a remote directory.
     *
     * @param remotePath Remote directory path.
     * @return std::expected<std::vector<std::string>, std::string> File names or an error message.
     */
    virtual std::expected<std::vector<std::string>, std::string> list(const std::string& remotePath) = 0;

    /**
     * @brief Uploads a local file.
     *
     * @param localFile Path to the local file.
     * @param remotePath Full remote file path.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> upload(const std::string& localFile, const std::string& remotePath) = 0;

    /**
     * @brief Downloads a remote file.
     *
     * @param remotePath Full remote file path.
     * @param localFile Destination path, created or truncated.
     * @param preserveMtime Copy the remote modification time onto the local file.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> download(const std::string& remotePath, const std::string& localFile,
                                                      bool preserveMtime) = 0;

    /**
     * @brief Removes a remote file.
     *
     * @param remotePath Full remote file path.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> remove(const std::string& remotePath) = 0;
};

/**
 * @brief Holds a remote store connection for the lifetime of a scope.
 *
 * Connects on construction and disconnects on destruction, including when the scope is
 * left by an exception. Check status() before using the store.
 */
class ConnectionScope {
public:
    explicit ConnectionScope(RemoteFileStore& store);
    ~ConnectionScope();

    ConnectionScope(const ConnectionScope&) = delete;
    ConnectionScope& operator=(const ConnectionScope&) = delete;

    /**
     * @brief Outcome of the connect attempt.
     */
    const std::expected<void, QueueError>& status() const { return status_; }

private:
    RemoteFileStore& store_;
    std::expected<void, QueueError> status_;
};

/**
 * @brief Joins a remote directory and a file name with a single '/'.
 */
std::string joinRemotePath(const std::string& dir, const std::string& name);

/**
 * @brief SFTP remote file store.
 *
 * Implements the remote store over SFTP using libssh.
 */
class SFTPRemoteStore : public RemoteFileStore {
public:
    /**
     * @brief Constructs an SFTP store.
     *
     * @param config JSON connection properties: host (required), port, user, password,
     * private_key, private_key_pass, known_hosts, default_path, timeout.
     * @throws std::runtime_error If host is missing.
     */
    explicit SFTPRemoteStore(const Json::Value& config);

    ~SFTPRemoteStore() override;

    SFTPRemoteStore(const SFTPRemoteStore&) = delete;
    SFTPRemoteStore& operator=(const SFTPRemoteStore&) = delete;

    /**
     * @brief Opens the SSH session, verifies the host key and authenticates.
     *
     * Host verification runs only when known_hosts is configured. Authentication tries the
     * private key, then the password, then the SSH agent.
     *
     * @return std::expected<void, QueueError> Success, a ConfigurationError or an AuthenticationError.
     */
    std::expected<void, QueueError> connect() override;

    /**
     * @brief Frees the SFTP channel and the SSH session.
     */
    void disconnect() override;

    bool isConnected() const override;

    /**
     * @brief Lists the names of the regular files in a remote directory.
     */
    std::expected<std::vector<std::string>, std::string> list(const std::string& remotePath) override;

    /**
     * @brief Streams a local file to the remote path, truncating an existing file.
     */
    std::expected<void, std::string> upload(const std::string& localFile, const std::string& remotePath) override;

    /**
     * @brief Streams a remote file to a local path.
     *
     * With preserveMtime the remote modification time is applied to the local file.
     */
    std::expected<void, std::string> download(const std::string& remotePath, const std::string& localFile,
                                              bool preserveMtime) override;

    /**
     * @brief Unlinks a remote file.
     */
    std::expected<void, std::string> remove(const std::string& remotePath) override;

private:
    /**
     * @brief Applies default_path to relative remote paths.
     */
    std::string resolve(const std::string& remotePath) const;

    std::string sftpError() const;

    std::string host_; ///< SFTP host address.
    std::string user_; ///< SFTP username.
    std::string password_; ///< SFTP password.
    std::string privateKey_; ///< Private key file.
    std::string privateKeyPass_; ///< Passphrase of the private key.
    std::string knownHosts_; ///< Known hosts file used for host verification.
    std::string defaultPath_; ///< Base directory for relative remote paths.
    int port_; ///< SFTP port (e.g., 22).
    long timeout_; ///< Connection timeout in seconds, 0 for the libssh default.

    ssh_session_struct* ssh_ = nullptr; ///< libssh session, null when disconnected.
    sftp_session_struct* sftp_ = nullptr; ///< SFTP channel on top of ssh_.
};

#endif // REMOTE_STORE_HPP
