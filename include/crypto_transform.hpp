/**
 * @file crypto_transform.hpp
 * @brief Defines cryptographic transforms applied to queued files.
 *
 * Provides the encrypt/decrypt interface the transfer queue applies to outgoing and
 * incoming files, and a PGP implementation built on GPGME.
 *
 * @note Requires GPGME and a GnuPG installation. Install via vcpkg on Windows, Homebrew on
 * macOS, or apt on Linux (libgpgme-dev).
 */

#ifndef CRYPTO_TRANSFORM_HPP
#define CRYPTO_TRANSFORM_HPP

#include <string>
#include <vector>
#include <expected>
#include <json/json.h>

/**
 * @brief Transform applied to file content on its way through the queue.
 */
enum class CryptoMode {
    None, ///< Files are moved unchanged.
    PGP   ///< Outgoing files are encrypted, incoming files decrypted.
};

/**
 * @brief Returns "none" or "pgp".
 */
std::string cryptoModeName(CryptoMode mode);

/**
 * @brief Interface for cryptographic transforms.
 *
 * Both operations read each file and return its transformed content, in input order.
 * The files themselves are not modified.
 */
class CryptoTransform {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~CryptoTransform() = default;

    /**
     * @brief Encrypts the given files.
     *
     * @param paths Files to encrypt.
     * @return std::expected<std::vector<std::string>, std::string> Ciphertext per path or an error message.
     */
    virtual std::expected<std::vector<std::string>, std::string> encrypt(const std::vector<std::string>& paths) = 0;

    /**
     * @brief Decrypts the given files.
     *
     * @param paths Files to decrypt.
     * @return std::expected<std::vector<std::string>, std::string> Plaintext per path or an error message.
     */
    virtual std::expected<std::vector<std::string>, std::string> decrypt(const std::vector<std::string>& paths) = 0;
};

/**
 * @brief OpenPGP transform using GPGME.
 *
 * Encrypts to a single recipient key, optionally signing with a second key, and produces
 * ASCII-armoured output. Files that do not contain a PGP message block are passed through
 * unchanged by decrypt().
 */
class PGPTransform : public CryptoTransform {
public:
    /**
     * @brief Line that opens an armoured PGP message.
     */
    static constexpr const char* kMessageBegin = "-----BEGIN PGP MESSAGE-----";

    /**
     * @brief Constructs a PGP transform.
     *
     * @param config JSON configuration with recipient_fp (required), sign_fp, gpg_home,
     * gpg_binary, always_trust and default_comment (string or array).
     * @throws std::runtime_error If recipient_fp is missing or GPGME cannot be initialised.
     */
    explicit PGPTransform(const Json::Value& config);

    /**
     * @brief Encrypts each file to the recipient key, signing when sign_fp is set.
     *
     * Output is always ASCII-armoured, with carriage returns stripped and the default
     * comments inserted.
     *
     * @param paths Files to encrypt.
     * @return std::expected<std::vector<std::string>, std::string> Armoured message per path or an error message.
     */
    std::expected<std::vector<std::string>, std::string> encrypt(const std::vector<std::string>& paths) override;

    /**
     * @brief Decrypts each armoured file; files without a message block are returned as read.
     *
     * @param paths Files to decrypt.
     * @return std::expected<std::vector<std::string>, std::string> Plaintext per path or an error message.
     */
    std::expected<std::vector<std::string>, std::string> decrypt(const std::vector<std::string>& paths) override;

    /**
     * @brief Imports public or secret keys into the configured keyring.
     *
     * @param paths Key files (armoured or binary).
     * @return std::expected<std::vector<std::string>, std::string> Fingerprints of the imported keys.
     */
    std::expected<std::vector<std::string>, std::string> importKeys(const std::vector<std::string>& paths);

    /**
     * @brief Inserts "Comment: <text>" lines after the message begin line.
     *
     * Comments keep the given order: the first one directly follows the begin line, so
     * {"a", "b"} yields "Comment: a" then "Comment: b". Content without a begin line is
     * returned unchanged.
     *
     * @param content Armoured message, lines separated by '\n'.
     * @param comments Comments to insert.
     * @return std::string Content with the comments added.
     */
    static std::string addComment(const std::string& content, const std::vector<std::string>& comments);

    /**
     * @brief Reports whether content contains an armoured PGP message line.
     */
    static bool isPGPMessage(const std::string& content);

    const std::vector<std::string>& defaultComments() const { return comments; }

private:
    std::string recipientFp; ///< Fingerprint of the recipient's public key.
    std::string signFp; ///< Fingerprint of the signing key, empty for unsigned output.
    std::string gpgHome; ///< GnuPG home directory.
    std::string gpgBinary; ///< gpg executable, empty for the GPGME default.
    bool alwaysTrust; ///< Skip the web-of-trust check for the recipient key.
    std::vector<std::string> comments; ///< Comments added to every encrypted message.
};

#endif // CRYPTO_TRANSFORM_HPP
