#include "remote_store.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <fcntl.h>

namespace fs = std::filesystem;

ConnectionScope::ConnectionScope(RemoteFileStore& store)
    : store_(store), status_(store.connect()) {}

ConnectionScope::~ConnectionScope() {
    store_.disconnect();
}

std::string joinRemotePath(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

SFTPRemoteStore::SFTPRemoteStore(const Json::Value& config)
    : host_(config.get("host", "").asString()),
      user_(config.get("user", "").asString()),
      password_(config.get("password", "").asString()),
      privateKey_(config.get("private_key", "").asString()),
      privateKeyPass_(config.get("private_key_pass", "").asString()),
      knownHosts_(config.get("known_hosts", "").asString()),
      defaultPath_(config.get("default_path", "").asString()),
      port_(config.get("port", 22).asInt()),
      timeout_(config.get("timeout", 0).asInt()) {
    if (host_.empty()) {
        throw std::runtime_error("SFTP configuration is missing the required 'host' property");
    }
}

SFTPRemoteStore::~SFTPRemoteStore() {
    disconnect();
}

std::expected<void, QueueError> SFTPRemoteStore::connect() {
    if (isConnected()) {
        return {};
    }

    ssh_ = ssh_new();
    if (!ssh_) {
        return std::unexpected(QueueError{ErrorKind::Transfer, host_, "Failed to create SSH session"});
    }
    ssh_options_set(ssh_, SSH_OPTIONS_HOST, host_.c_str());
    ssh_options_set(ssh_, SSH_OPTIONS_PORT, &port_);
    if (!user_.empty()) {
        ssh_options_set(ssh_, SSH_OPTIONS_USER, user_.c_str());
    }
    if (timeout_ > 0) {
        ssh_options_set(ssh_, SSH_OPTIONS_TIMEOUT, &timeout_);
    }
    if (!knownHosts_.empty()) {
        ssh_options_set(ssh_, SSH_OPTIONS_KNOWNHOSTS, knownHosts_.c_str());
    }

    if (ssh_connect(ssh_) != SSH_OK) {
        auto error = QueueError{ErrorKind::Transfer, host_, std::format("SSH connection failed: {}", ssh_get_error(ssh_))};
        disconnect();
        return std::unexpected(error);
    }

    if (!knownHosts_.empty() && ssh_session_is_known_server(ssh_) != SSH_KNOWN_HOSTS_OK) {
        disconnect();
        return std::unexpected(QueueError{ErrorKind::Authentication, host_,
                                          std::format("Host key not found in {}", knownHosts_)});
    }

    int auth = SSH_AUTH_DENIED;
    if (!privateKey_.empty()) {
        ssh_key key = nullptr;
        const char* passphrase = privateKeyPass_.empty() ? nullptr : privateKeyPass_.c_str();
        if (ssh_pki_import_privkey_file(privateKey_.c_str(), passphrase, nullptr, nullptr, &key) != SSH_OK) {
            disconnect();
            return std::unexpected(QueueError{ErrorKind::Authentication, privateKey_, "Failed to load private key"});
        }
        auth = ssh_userauth_publickey(ssh_, nullptr, key);
        ssh_key_free(key);
    } else if (!password_.empty()) {
        auth = ssh_userauth_password(ssh_, nullptr, password_.c_str());
    } else {
        auth = ssh_userauth_publickey_auto(ssh_, nullptr, nullptr);
    }
    if (auth != SSH_AUTH_SUCCESS) {
        auto error = QueueError{ErrorKind::Authentication, host_,
                                std::format("SSH authentication failed: {}", ssh_get_error(ssh_))};
        disconnect();
        return std::unexpected(error);
    }

    sftp_ = sftp_new(ssh_);
    if (!sftp_ || sftp_init(sftp_) != SSH_OK) {
        disconnect();
        return std::unexpected(QueueError{ErrorKind::Transfer, host_, "SFTP initialization failed"});
    }
    return {};
}

void SFTPRemoteStore::disconnect() {
    if (sftp_) {
        sftp_free(sftp_);
        sftp_ = nullptr;
    }
    if (ssh_) {
        if (ssh_is_connected(ssh_)) {
            ssh_disconnect(ssh_);
        }
        ssh_free(ssh_);
        ssh_ = nullptr;
    }
}

bool SFTPRemoteStore::isConnected() const {
    return sftp_ != nullptr;
}

std::string SFTPRemoteStore::resolve(const std::string& remotePath) const {
    if (defaultPath_.empty() || (!remotePath.empty() && remotePath.front() == '/')) {
        return remotePath;
    }
    return joinRemotePath(defaultPath_, remotePath);
}

std::string SFTPRemoteStore::sftpError() const {
    return std::format("{} (sftp error {})", ssh_get_error(ssh_), sftp_get_error(sftp_));
}

std::expected<std::vector<std::string>, std::string> SFTPRemoteStore::list(const std::string& remotePath) {
    if (!isConnected()) {
        return std::unexpected("Not connected");
    }
    std::string path = resolve(remotePath);
    sftp_dir dir = sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        return std::unexpected(std::format("Failed to open remote directory {}: {}", path, sftpError()));
    }

    std::vector<std::string> names;
    while (sftp_attributes attributes = sftp_readdir(sftp_, dir)) {
        if (attributes->type == SSH_FILEXFER_TYPE_REGULAR) {
            names.emplace_back(attributes->name);
        }
        sftp_attributes_free(attributes);
    }

    if (!sftp_dir_eof(dir)) {
        auto error = std::format("Failed to list remote directory {}: {}", path, sftpError());
        sftp_closedir(dir);
        return std::unexpected(error);
    }
    sftp_closedir(dir);
    return names;
}

std::expected<void, std::string> SFTPRemoteStore::upload(const std::string& localFile, const std::string& remotePath) {
    if (!isConnected()) {
        return std::unexpected("Not connected");
    }

    std::ifstream input_file(localFile, std::ios::binary);
    if (!input_file) {
        return std::unexpected(std::format("Failed to open local file: {}", localFile));
    }

    std::string remote_file = resolve(remotePath);
    sftp_file file = sftp_open(sftp_, remote_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (!file) {
        return std::unexpected(std::format("Failed to open remote file {}: {}", remote_file, sftpError()));
    }

    char buf[8192];
    while (input_file) {
        input_file.read(buf, sizeof(buf));
        auto count = input_file.gcount();
        if (count > 0 && sftp_write(file, buf, static_cast<size_t>(count)) != count) {
            auto error = std::format("Failed to write remote file {}: {}", remote_file, sftpError());
            sftp_close(file);
            return std::unexpected(error);
        }
    }
    if (input_file.bad()) {
        sftp_close(file);
        return std::unexpected(std::format("Failed to read local file: {}", localFile));
    }

    if (sftp_close(file) != SSH_OK) {
        return std::unexpected(std::format("Failed to close remote file {}: {}", remote_file, sftpError()));
    }
    return {};
}

std::expected<void, std::string> SFTPRemoteStore::download(const std::string& remotePath, const std::string& localFile,
                                                           bool preserveMtime) {
    if (!isConnected()) {
        return std::unexpected("Not connected");
    }

    std::string remote_file = resolve(remotePath);
    sftp_file file = sftp_open(sftp_, remote_file.c_str(), O_RDONLY, 0);
    if (!file) {
        return std::unexpected(std::format("Failed to open remote file {}: {}", remote_file, sftpError()));
    }

    std::ofstream output_file(localFile, std::ios::binary | std::ios::trunc);
    if (!output_file) {
        sftp_close(file);
        return std::unexpected(std::format("Failed to open local file for writing: {}", localFile));
    }

    char buf[8192];
    ssize_t count = 0;
    while ((count = sftp_read(file, buf, sizeof(buf))) > 0) {
        output_file.write(buf, count);
        if (!output_file) {
            sftp_close(file);
            return std::unexpected(std::format("Failed to write local file: {}", localFile));
        }
    }
    if (count < 0) {
        auto error = std::format("Failed to read remote file {}: {}", remote_file, sftpError());
        sftp_close(file);
        return std::unexpected(error);
    }
    sftp_close(file);

    output_file.close();
    if (!output_file) {
        return std::unexpected(std::format("Failed to flush local file: {}", localFile));
    }

    if (preserveMtime) {
        sftp_attributes attributes = sftp_stat(sftp_, remote_file.c_str());
        if (!attributes) {
            return std::unexpected(std::format("Failed to stat remote file {}: {}", remote_file, sftpError()));
        }
        auto mtime = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(attributes->mtime));
        sftp_attributes_free(attributes);

        std::error_code ec;
        fs::last_write_time(localFile, std::chrono::file_clock::from_sys(mtime), ec);
        if (ec) {
            return std::unexpected(std::format("Failed to set modification time on {}: {}", localFile, ec.message()));
        }
    }
    return {};
}

std::expected<void, std::string> SFTPRemoteStore::remove(const std::string& remotePath) {
    if (!isConnected()) {
        return std::unexpected("Not connected");
    }
    std::string remote_file = resolve(remotePath);
    if (sftp_unlink(sftp_, remote_file.c_str()) != SSH_OK) {
        return std::unexpected(std::format("Failed to remove remote file {}: {}", remote_file, sftpError()));
    }
    return {};
}
