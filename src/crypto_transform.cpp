#include "crypto_transform.hpp"
#include <gpgme.h>
#include <algorithm>
#include <cstdio>
#include <format>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace {

struct ContextDeleter {
    void operator()(gpgme_ctx_t ctx) const { gpgme_release(ctx); }
};
struct DataDeleter {
    void operator()(gpgme_data_t data) const { gpgme_data_release(data); }
};
struct KeyDeleter {
    void operator()(gpgme_key_t key) const { gpgme_key_unref(key); }
};

using ContextPtr = std::unique_ptr<std::remove_pointer_t<gpgme_ctx_t>, ContextDeleter>;
using DataPtr = std::unique_ptr<std::remove_pointer_t<gpgme_data_t>, DataDeleter>;
using KeyPtr = std::unique_ptr<std::remove_pointer_t<gpgme_key_t>, KeyDeleter>;

bool failed(gpgme_error_t err) {
    return gpgme_err_code(err) != GPG_ERR_NO_ERROR;
}

std::expected<std::string, std::string> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(std::format("Failed to open file: {}", path));
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

std::expected<std::string, std::string> readData(gpgme_data_t data) {
    if (gpgme_data_seek(data, 0, SEEK_SET) != 0) {
        return std::unexpected("Failed to rewind GPGME output buffer");
    }
    std::string content;
    char buf[8192];
    ssize_t count = 0;
    while ((count = gpgme_data_read(data, buf, sizeof(buf))) > 0) {
        content.append(buf, static_cast<size_t>(count));
    }
    if (count < 0) {
        return std::unexpected("Failed to read GPGME output buffer");
    }
    return content;
}

std::vector<std::string> readComments(const Json::Value& value) {
    std::vector<std::string> result;
    if (value.isString()) {
        result.push_back(value.asString());
    } else if (value.isArray()) {
        for (const auto& comment : value) {
            result.push_back(comment.asString());
        }
    }
    return result;
}

// Context bound to the configured engine and home directory.
std::expected<ContextPtr, std::string> newContext(const std::string& gpgBinary, const std::string& gpgHome) {
    gpgme_ctx_t raw = nullptr;
    gpgme_error_t err = gpgme_new(&raw);
    if (failed(err)) {
        return std::unexpected(std::format("Failed to create GPGME context: {}", gpgme_strerror(err)));
    }
    ContextPtr ctx(raw);

    err = gpgme_set_protocol(ctx.get(), GPGME_PROTOCOL_OpenPGP);
    if (failed(err)) {
        return std::unexpected(std::format("OpenPGP protocol unavailable: {}", gpgme_strerror(err)));
    }
    err = gpgme_ctx_set_engine_info(ctx.get(), GPGME_PROTOCOL_OpenPGP,
                                    gpgBinary.empty() ? nullptr : gpgBinary.c_str(),
                                    gpgHome.empty() ? nullptr : gpgHome.c_str());
    if (failed(err)) {
        return std::unexpected(std::format("Failed to configure GnuPG engine ({}): {}", gpgHome, gpgme_strerror(err)));
    }
    gpgme_set_armor(ctx.get(), 1);
    return ctx;
}

} // namespace

std::string cryptoModeName(CryptoMode mode) {
    switch (mode) {
    case CryptoMode::None:
        return "none";
    case CryptoMode::PGP:
        return "pgp";
    }
    return {};
}

PGPTransform::PGPTransform(const Json::Value& config)
    : recipientFp(config.get("recipient_fp", "").asString()),
      signFp(config.get("sign_fp", "").asString()),
      gpgHome(config.get("gpg_home", "GnuPG").asString()),
      gpgBinary(config.get("gpg_binary", "").asString()),
      alwaysTrust(config.get("always_trust", true).asBool()),
      comments(readComments(config["default_comment"])) {
    if (recipientFp.empty()) {
        throw std::runtime_error("PGP configuration is missing the required 'recipient_fp' property");
    }
    if (!gpgme_check_version(nullptr)) {
        throw std::runtime_error("Failed to initialise GPGME");
    }
}

std::expected<std::vector<std::string>, std::string> PGPTransform::encrypt(const std::vector<std::string>& paths) {
    auto ctx = newContext(gpgBinary, gpgHome);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }

    gpgme_key_t rawKey = nullptr;
    gpgme_error_t err = gpgme_get_key(ctx->get(), recipientFp.c_str(), &rawKey, 0);
    if (failed(err)) {
        return std::unexpected(std::format("Recipient key {} not found: {}", recipientFp, gpgme_strerror(err)));
    }
    KeyPtr recipientKey(rawKey);

    KeyPtr signKey;
    if (!signFp.empty()) {
        err = gpgme_get_key(ctx->get(), signFp.c_str(), &rawKey, 1);
        if (failed(err)) {
            return std::unexpected(std::format("Signing key {} not found: {}", signFp, gpgme_strerror(err)));
        }
        signKey.reset(rawKey);
        gpgme_signers_clear(ctx->get());
        err = gpgme_signers_add(ctx->get(), signKey.get());
        if (failed(err)) {
            return std::unexpected(std::format("Failed to add signing key {}: {}", signFp, gpgme_strerror(err)));
        }
    }

    gpgme_key_t recipients[] = {recipientKey.get(), nullptr};
    auto flags = alwaysTrust ? GPGME_ENCRYPT_ALWAYS_TRUST : static_cast<gpgme_encrypt_flags_t>(0);

    std::vector<std::string> results;
    for (const auto& path : paths) {
        gpgme_data_t rawPlain = nullptr;
        err = gpgme_data_new_from_file(&rawPlain, path.c_str(), 1);
        if (failed(err)) {
            return std::unexpected(std::format("File: {} could not be read: {}", path, gpgme_strerror(err)));
        }
        DataPtr plain(rawPlain);

        gpgme_data_t rawCipher = nullptr;
        err = gpgme_data_new(&rawCipher);
        if (failed(err)) {
            return std::unexpected(std::format("Failed to allocate output buffer: {}", gpgme_strerror(err)));
        }
        DataPtr cipher(rawCipher);

        if (signKey) {
            err = gpgme_op_encrypt_sign(ctx->get(), recipients, flags, plain.get(), cipher.get());
        } else {
            err = gpgme_op_encrypt(ctx->get(), recipients, flags, plain.get(), cipher.get());
        }
        if (failed(err)) {
            return std::unexpected(std::format("File: {} was not encrypted correctly: {}", path, gpgme_strerror(err)));
        }

        auto content = readData(cipher.get());
        if (!content) {
            return std::unexpected(std::format("File: {}: {}", path, content.error()));
        }
        std::erase(*content, '\r');
        *content = addComment(*content, comments);
        results.push_back(std::move(*content));
    }
    return results;
}

std::expected<std::vector<std::string>, std::string> PGPTransform::decrypt(const std::vector<std::string>& paths) {
    std::vector<std::string> results;
    ContextPtr ctx;
    for (const auto& path : paths) {
        auto content = readFile(path);
        if (!content) {
            return std::unexpected(content.error());
        }
        if (!isPGPMessage(*content)) {
            results.push_back(std::move(*content));
            continue;
        }

        if (!ctx) {
            auto created = newContext(gpgBinary, gpgHome);
            if (!created) {
                return std::unexpected(created.error());
            }
            ctx = std::move(*created);
        }

        gpgme_data_t rawCipher = nullptr;
        gpgme_error_t err = gpgme_data_new_from_mem(&rawCipher, content->data(), content->size(), 1);
        if (failed(err)) {
            return std::unexpected(std::format("File: {} could not be buffered: {}", path, gpgme_strerror(err)));
        }
        DataPtr cipher(rawCipher);

        gpgme_data_t rawPlain = nullptr;
        err = gpgme_data_new(&rawPlain);
        if (failed(err)) {
            return std::unexpected(std::format("Failed to allocate output buffer: {}", gpgme_strerror(err)));
        }
        DataPtr plain(rawPlain);

        err = gpgme_op_decrypt(ctx.get(), cipher.get(), plain.get());
        if (failed(err)) {
            return std::unexpected(std::format("File: {} was not decrypted correctly: {}", path, gpgme_strerror(err)));
        }

        auto decrypted = readData(plain.get());
        if (!decrypted) {
            return std::unexpected(std::format("File: {}: {}", path, decrypted.error()));
        }
        results.push_back(std::move(*decrypted));
    }
    return results;
}

std::expected<std::vector<std::string>, std::string> PGPTransform::importKeys(const std::vector<std::string>& paths) {
    auto ctx = newContext(gpgBinary, gpgHome);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }

    std::vector<std::string> fingerprints;
    for (const auto& path : paths) {
        gpgme_data_t rawKeyData = nullptr;
        gpgme_error_t err = gpgme_data_new_from_file(&rawKeyData, path.c_str(), 1);
        if (failed(err)) {
            return std::unexpected(std::format("Key file {} could not be read: {}", path, gpgme_strerror(err)));
        }
        DataPtr keyData(rawKeyData);

        err = gpgme_op_import(ctx->get(), keyData.get());
        if (failed(err)) {
            return std::unexpected(std::format("Key file {} was not imported: {}", path, gpgme_strerror(err)));
        }
        gpgme_import_result_t result = gpgme_op_import_result(ctx->get());
        for (gpgme_import_status_t status = result ? result->imports : nullptr; status; status = status->next) {
            if (!failed(status->result) && status->fpr) {
                fingerprints.emplace_back(status->fpr);
            }
        }
    }
    return fingerprints;
}

bool PGPTransform::isPGPMessage(const std::string& content) {
    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line == kMessageBegin) {
            return true;
        }
    }
    return false;
}

std::string PGPTransform::addComment(const std::string& content, const std::vector<std::string>& comments) {
    auto begin = content.find(kMessageBegin);
    if (begin == std::string::npos || comments.empty()) {
        return content;
    }
    auto lineEnd = content.find('\n', begin);
    if (lineEnd == std::string::npos) {
        lineEnd = content.size();
    }

    std::string inserted;
    for (const auto& comment : comments) {
        inserted += "\nComment: " + comment;
    }

    std::string result = content;
    result.insert(lineEnd, inserted);
    return result;
}
