/**
 * @file test_pgp_transform.cpp
 * @brief PGPTransform against a real GnuPG engine.
 *
 * Each test works in a fresh keyring under the temp directory holding one generated,
 * passphrase-less key. Tests are skipped when no GnuPG engine can create that key.
 */

#include <gtest/gtest.h>
#include <gpgme.h>
#include "crypto_transform.hpp"
#include "fake_remote_store.hpp"

namespace {

fs::path makeGpgHome(const std::string& prefix) {
    fs::path home = makeTempDir(prefix);
    fs::permissions(home, fs::perms::owner_all, fs::perm_options::replace);
    return home;
}

gpgme_ctx_t newTestContext(const fs::path& home) {
    gpgme_check_version(nullptr);
    gpgme_ctx_t ctx = nullptr;
    if (gpgme_err_code(gpgme_new(&ctx)) != GPG_ERR_NO_ERROR) {
        return nullptr;
    }
    gpgme_ctx_set_engine_info(ctx, GPGME_PROTOCOL_OpenPGP, nullptr, home.c_str());
    return ctx;
}

// Generates a key with an encryption subkey and returns its fingerprint, empty on failure.
std::string createKey(const fs::path& home, const std::string& userId) {
    gpgme_ctx_t ctx = newTestContext(home);
    if (!ctx) {
        return {};
    }
    std::string fingerprint;
    gpgme_error_t err = gpgme_op_createkey(ctx, userId.c_str(), "default", 0, 0, nullptr,
                                           GPGME_CREATE_NOPASSWD | GPGME_CREATE_FORCE);
    if (gpgme_err_code(err) == GPG_ERR_NO_ERROR) {
        gpgme_genkey_result_t result = gpgme_op_genkey_result(ctx);
        if (result && result->fpr) {
            fingerprint = result->fpr;
        }
    }
    gpgme_release(ctx);
    return fingerprint;
}

std::string exportPublicKey(const fs::path& home, const std::string& fingerprint) {
    gpgme_ctx_t ctx = newTestContext(home);
    if (!ctx) {
        return {};
    }
    gpgme_set_armor(ctx, 1);
    gpgme_data_t out = nullptr;
    std::string exported;
    if (gpgme_err_code(gpgme_data_new(&out)) == GPG_ERR_NO_ERROR) {
        if (gpgme_err_code(gpgme_op_export(ctx, fingerprint.c_str(), 0, out)) == GPG_ERR_NO_ERROR) {
            size_t size = 0;
            char* buffer = gpgme_data_release_and_get_mem(out, &size);
            exported.assign(buffer, size);
            gpgme_free(buffer);
            out = nullptr;
        }
        if (out) {
            gpgme_data_release(out);
        }
    }
    gpgme_release(ctx);
    return exported;
}

} // namespace

class PGPTransformEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        home = makeGpgHome("sftpmail-gnupg");
        work = makeTempDir("sftpmail-pgp-work");
        fingerprint = createKey(home, "SFTPMail Queue <queue@example.com>");
        if (fingerprint.empty()) {
            GTEST_SKIP() << "GnuPG engine could not create a test key";
        }
    }

    void TearDown() override {
        std::error_code ec;
        for (const auto& dir : {home, otherHome}) {
            if (!dir.empty()) {
                fs::remove_all(dir, ec);
            }
        }
        fs::remove_all(work, ec);
    }

    Json::Value pgpConfig(const fs::path& gpgHome) const {
        Json::Value config;
        config["recipient_fp"] = fingerprint;
        config["gpg_home"] = gpgHome.string();
        return config;
    }

    fs::path home;
    fs::path otherHome;
    fs::path work;
    std::string fingerprint;
};

TEST_F(PGPTransformEngineTest, BinaryContentSurvivesEncryptAndDecrypt) {
    std::string payload;
    for (int i = 0; i < 4096; ++i) {
        payload.push_back(static_cast<char>(i % 256));
    }
    writeText(work / "payload.bin", payload);
    PGPTransform transform(pgpConfig(home));

    auto encrypted = transform.encrypt({(work / "payload.bin").string()});

    ASSERT_TRUE(encrypted.has_value()) << encrypted.error();
    ASSERT_EQ(encrypted->size(), 1u);
    const std::string& armoured = encrypted->front();
    EXPECT_TRUE(armoured.starts_with(PGPTransform::kMessageBegin));
    EXPECT_EQ(armoured.find('\r'), std::string::npos);

    writeText(work / "payload.bin.pgp", armoured);
    auto decrypted = transform.decrypt({(work / "payload.bin.pgp").string()});

    ASSERT_TRUE(decrypted.has_value()) << decrypted.error();
    ASSERT_EQ(decrypted->size(), 1u);
    EXPECT_EQ(decrypted->front(), payload);
}

TEST_F(PGPTransformEngineTest, OutputIsArmouredEvenWhenArmorIsDisabled) {
    writeText(work / "plain.txt", "id,amount\r\n1,2\r\n");
    Json::Value config = pgpConfig(home);
    config["armor"] = false;
    PGPTransform transform(config);

    auto encrypted = transform.encrypt({(work / "plain.txt").string()});

    ASSERT_TRUE(encrypted.has_value()) << encrypted.error();
    EXPECT_TRUE(PGPTransform::isPGPMessage(encrypted->front()));

    writeText(work / "plain.txt.pgp", encrypted->front());
    auto decrypted = transform.decrypt({(work / "plain.txt.pgp").string()});
    ASSERT_TRUE(decrypted.has_value()) << decrypted.error();
    EXPECT_EQ(decrypted->front(), "id,amount\r\n1,2\r\n");
}

TEST_F(PGPTransformEngineTest, CommentsAreAddedToRealArmourAndStillDecrypt) {
    writeText(work / "note.txt", "hello");
    Json::Value config = pgpConfig(home);
    config["default_comment"].append("first");
    config["default_comment"].append("second");
    PGPTransform transform(config);

    auto encrypted = transform.encrypt({(work / "note.txt").string()});

    ASSERT_TRUE(encrypted.has_value()) << encrypted.error();
    const std::string expectedHead = std::string(PGPTransform::kMessageBegin) + "\nComment: first\nComment: second\n";
    EXPECT_TRUE(encrypted->front().starts_with(expectedHead));

    writeText(work / "note.txt.pgp", encrypted->front());
    auto decrypted = transform.decrypt({(work / "note.txt.pgp").string()});
    ASSERT_TRUE(decrypted.has_value()) << decrypted.error();
    EXPECT_EQ(decrypted->front(), "hello");
}

TEST_F(PGPTransformEngineTest, SignedMessagesDecrypt) {
    writeText(work / "signed.txt", "signed content");
    Json::Value config = pgpConfig(home);
    config["sign_fp"] = fingerprint;
    PGPTransform transform(config);

    auto encrypted = transform.encrypt({(work / "signed.txt").string()});

    ASSERT_TRUE(encrypted.has_value()) << encrypted.error();
    writeText(work / "signed.txt.pgp", encrypted->front());
    auto decrypted = transform.decrypt({(work / "signed.txt.pgp").string()});
    ASSERT_TRUE(decrypted.has_value()) << decrypted.error();
    EXPECT_EQ(decrypted->front(), "signed content");
}

TEST_F(PGPTransformEngineTest, UnknownRecipientFailsEncryption) {
    writeText(work / "plain.txt", "data");
    Json::Value config = pgpConfig(home);
    config["recipient_fp"] = "0000000000000000000000000000000000000000";
    PGPTransform transform(config);

    auto encrypted = transform.encrypt({(work / "plain.txt").string()});

    ASSERT_FALSE(encrypted.has_value());
    EXPECT_NE(encrypted.error().find("not found"), std::string::npos);
}

TEST_F(PGPTransformEngineTest, ImportedKeyIsUsableWithAlwaysTrust) {
    std::string exported = exportPublicKey(home, fingerprint);
    ASSERT_FALSE(exported.empty());
    writeText(work / "queue.asc", exported);

    otherHome = makeGpgHome("sftpmail-gnupg-import");
    PGPTransform importer(pgpConfig(otherHome));
    auto imported = importer.importKeys({(work / "queue.asc").string()});

    ASSERT_TRUE(imported.has_value()) << imported.error();
    ASSERT_FALSE(imported->empty());
    EXPECT_EQ(imported->front(), fingerprint);

    // The imported key carries no owner trust in the new keyring.
    writeText(work / "plain.txt", "for the queue");
    auto encrypted = importer.encrypt({(work / "plain.txt").string()});
    ASSERT_TRUE(encrypted.has_value()) << encrypted.error();

    writeText(work / "plain.txt.pgp", encrypted->front());
    PGPTransform owner(pgpConfig(home));
    auto decrypted = owner.decrypt({(work / "plain.txt.pgp").string()});
    ASSERT_TRUE(decrypted.has_value()) << decrypted.error();
    EXPECT_EQ(decrypted->front(), "for the queue");
}

TEST_F(PGPTransformEngineTest, MissingKeyFileFailsImport) {
    PGPTransform transform(pgpConfig(home));

    auto imported = transform.importKeys({(work / "absent.asc").string()});

    EXPECT_FALSE(imported.has_value());
}
