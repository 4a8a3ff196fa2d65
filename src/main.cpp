#include "queue_api.hpp"
#include <print>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitSetupRequired = 2;
constexpr int kExitPartialFailure = 3;

void printUsage(const char* program) {
    std::println(stderr, "Usage: {} [--config <path>] [--setup] <command>", program);
    std::println(stderr, "Commands:");
    std::println(stderr, "  setup                             create the Inbox, Outbox, Sent and Awaiting folders");
    std::println(stderr, "  send <remote_dir> [--encrypt]     send every Outbox file");
    std::println(stderr, "  receive <remote_dir> [--decrypt]  fetch every remote file into Inbox");
    std::println(stderr, "  import-keys <key_file>...         import keys into the configured keyring");
    std::println(stderr, "  test-alert                        send a test email alert");
}

int exitCodeFor(const QueueError& error) {
    std::println(stderr, "Error: {}", error.describe());
    if (error.kind == ErrorKind::Setup) {
        std::println(stderr, "Run with --setup or the 'setup' command to create the queue folders.");
        return kExitSetupRequired;
    }
    return kExitError;
}

int finishBatch(const std::expected<TransferReport, QueueError>& result) {
    if (!result) {
        return exitCodeFor(result.error());
    }
    for (const auto& path : result->completed) {
        std::println("{}", path.string());
    }
    return result->ok() ? kExitOk : kExitPartialFailure;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile = "sftpmail.json";
    bool allowSetup = false;
    bool pgp = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--setup") {
            allowSetup = true;
        } else if (arg == "--encrypt" || arg == "--decrypt") {
            pgp = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return kExitOk;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return kExitError;
    }

    const std::string& command = positional[0];
    CryptoMode mode = pgp ? CryptoMode::PGP : CryptoMode::None;

    if (command == "setup") {
        auto created = QueueAPI::setup(configFile);
        if (!created) {
            return exitCodeFor(created.error());
        }
        std::println("Setup finished: {} folder(s) created.", created->size());
        return kExitOk;
    }
    if (command == "send" && positional.size() == 2) {
        return finishBatch(QueueAPI::send(configFile, positional[1], mode, allowSetup));
    }
    if (command == "receive" && positional.size() == 2) {
        return finishBatch(QueueAPI::receive(configFile, positional[1], mode, allowSetup));
    }
    if (command == "import-keys" && positional.size() > 1) {
        std::vector<std::string> keyFiles(positional.begin() + 1, positional.end());
        auto imported = QueueAPI::importKeys(configFile, keyFiles);
        if (!imported) {
            return exitCodeFor(imported.error());
        }
        for (const auto& fingerprint : *imported) {
            std::println("{}", fingerprint);
        }
        return kExitOk;
    }
    if (command == "test-alert") {
        auto sent = QueueAPI::testAlert(configFile);
        if (!sent) {
            return exitCodeFor(sent.error());
        }
        std::println("Test alert sent.");
        return kExitOk;
    }

    printUsage(argv[0]);
    return kExitError;
}
