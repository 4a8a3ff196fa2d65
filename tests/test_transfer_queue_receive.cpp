#include "queue_fixture.hpp"
#include <algorithm>

class ReceiveTest : public QueueTest {
protected:
    void SetUp() override {
        QueueTest::SetUp();
        fs::create_directories(remote / "incoming");
    }

    fs::path remoteFile(const std::string& name) const { return remote / "incoming" / name; }
};

TEST_F(ReceiveTest, DownloadsIntoInboxAndRemovesRemoteCopies) {
    writeText(remoteFile("a.txt"), "alpha");
    writeText(remoteFile("b.txt"), "bravo");
    auto queue = makeQueue();

    auto report = queue->receiveFrom("incoming");

    ASSERT_TRUE(report.has_value()) << report.error().describe();
    EXPECT_TRUE(report->ok());
    EXPECT_EQ(entryNames(dir(QueueDirectory::Inbox)), (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(readText(dir(QueueDirectory::Inbox) / "a.txt"), "alpha");
    EXPECT_TRUE(entryNames(dir(QueueDirectory::Awaiting)).empty());
    EXPECT_TRUE(entryNames(remote / "incoming").empty());
}

TEST_F(ReceiveTest, ExistingInboxNameGetsSuffix) {
    writeText(dir(QueueDirectory::Inbox) / "report.csv", "yesterday");
    writeText(remoteFile("report.csv"), "today");
    auto queue = makeQueue();

    auto report = queue->receiveFrom("incoming");

    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->completed.size(), 1u);
    EXPECT_EQ(report->completed[0].filename(), "report_1.csv");
    EXPECT_EQ(readText(dir(QueueDirectory::Inbox) / "report.csv"), "yesterday");
    EXPECT_EQ(readText(dir(QueueDirectory::Inbox) / "report_1.csv"), "today");
    EXPECT_FALSE(fs::exists(remoteFile("report.csv")));
}

TEST_F(ReceiveTest, RemoteCopyIsRemovedOnlyAfterDownload) {
    writeText(remoteFile("a.txt"), "alpha");
    writeText(remoteFile("b.txt"), "bravo");
    auto queue = makeQueue();

    ASSERT_TRUE(queue->receiveFrom("incoming").has_value());

    EXPECT_EQ(store->events, (std::vector<std::string>{"download:incoming/a.txt", "remove:incoming/a.txt",
                                                       "download:incoming/b.txt", "remove:incoming/b.txt"}));
}

TEST_F(ReceiveTest, FailedDownloadKeepsRemoteAndDropsPartialFile) {
    writeText(remoteFile("a.txt"), "alpha");
    writeText(remoteFile("b.txt"), "bravo");
    auto queue = makeQueue();
    store->failDownloads.insert("a.txt");

    auto report = queue->receiveFrom("incoming");

    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->failures.size(), 1u);
    EXPECT_EQ(report->failures[0].kind, ErrorKind::Transfer);
    EXPECT_NE(report->failures[0].message.find("connection reset"), std::string::npos);
    EXPECT_TRUE(fs::exists(remoteFile("a.txt")));
    EXPECT_FALSE(fs::exists(remoteFile("b.txt")));
    EXPECT_TRUE(entryNames(dir(QueueDirectory::Awaiting)).empty());
    EXPECT_EQ(entryNames(dir(QueueDirectory::Inbox)), std::vector<std::string>{"b.txt"});
    EXPECT_EQ(std::ranges::count(store->events, std::string("remove:incoming/a.txt")), 0);
}

TEST_F(ReceiveTest, DownloadThatWritesNothingIsAFailure) {
    writeText(remoteFile("a.txt"), "alpha");
    auto queue = makeQueue();
    store->skipWrites.insert("a.txt");

    auto report = queue->receiveFrom("incoming");

    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->failures.size(), 1u);
    EXPECT_NE(report->failures[0].message.find("was not written"), std::string::npos);
    EXPECT_TRUE(fs::exists(remoteFile("a.txt")));
    EXPECT_TRUE(entryNames(dir(QueueDirectory::Inbox)).empty());
}

TEST_F(ReceiveTest, RemoteRemovalFailureIsReportedButFileIsDelivered) {
    writeText(remoteFile("a.txt"), "alpha");
    auto queue = makeQueue();
    store->failRemovals.insert("a.txt");

    auto report = queue->receiveFrom("incoming");

    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->failures.size(), 1u);
    EXPECT_NE(report->failures[0].message.find("read-only file system"), std::string::npos);
    EXPECT_EQ(report->completed.size(), 1u);
    EXPECT_EQ(entryNames(dir(QueueDirectory::Inbox)), std::vector<std::string>{"a.txt"});
    EXPECT_TRUE(fs::exists(remoteFile("a.txt")));
}

TEST_F(ReceiveTest, MissingRemoteDirectoryIsFatal) {
    auto queue = makeQueue();

    auto report = queue->receiveFrom("does-not-exist");

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Transfer);
    EXPECT_EQ(store->disconnectCalls, 1);
}

TEST_F(ReceiveTest, AuthenticationFailureIsFatal) {
    writeText(remoteFile("a.txt"), "alpha");
    auto queue = makeQueue();
    store->connectError = QueueError{ErrorKind::Authentication, "sftp.example.com", "host key rejected"};

    auto report = queue->receiveFrom("incoming");

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Authentication);
    EXPECT_TRUE(fs::exists(remoteFile("a.txt")));
    EXPECT_TRUE(entryNames(dir(QueueDirectory::Inbox)).empty());
}

TEST_F(ReceiveTest, DecryptsIntoInbox) {
    writeText(remoteFile("a.txt"), std::string(ReversibleTransform::kMarker) + ReversibleTransform::scramble("alpha"));
    auto queue = makeQueue(true);

    auto report = queue->receiveFrom("incoming", CryptoMode::PGP);

    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->ok());
    EXPECT_EQ(readText(dir(QueueDirectory::Inbox) / "a.txt"), "alpha");
    EXPECT_TRUE(entryNames(dir(QueueDirectory::Awaiting)).empty());
}

TEST_F(ReceiveTest, DecryptionFailureLeavesFileInAwaiting) {
    writeText(remoteFile("a.txt"), std::string(ReversibleTransform::kMarker) + ReversibleTransform::scramble("alpha"));
    auto queue = makeQueue(true);
    transform->failDecrypt = true;

    auto report = queue->receiveFrom("incoming", CryptoMode::PGP);

    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->failures.size(), 1u);
    EXPECT_NE(report->failures[0].message.find("no secret key"), std::string::npos);
    EXPECT_EQ(entryNames(dir(QueueDirectory::Awaiting)), std::vector<std::string>{"a.txt"});
    EXPECT_TRUE(entryNames(dir(QueueDirectory::Inbox)).empty());
}

TEST_F(ReceiveTest, PgpWithoutTransformIsConfigurationError) {
    auto queue = makeQueue();

    auto report = queue->receiveFrom("incoming", CryptoMode::PGP);

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Configuration);
    EXPECT_EQ(store->connectCalls, 0);
}

TEST_F(ReceiveTest, EncryptedSendThenDecryptedReceiveKeepsBytes) {
    const std::string payload = std::string("line one\r\nline two\n\0binary\xff", 27);
    writeText(dir(QueueDirectory::Outbox) / "payload.bin", payload);
    auto queue = makeQueue(true);

    auto sent = queue->sendTo("incoming", CryptoMode::PGP);
    ASSERT_TRUE(sent.has_value());
    ASSERT_TRUE(sent->ok());

    auto received = queue->receiveFrom("incoming", CryptoMode::PGP);
    ASSERT_TRUE(received.has_value());
    ASSERT_TRUE(received->ok());
    EXPECT_EQ(readText(dir(QueueDirectory::Inbox) / "payload.bin"), payload);
}

TEST_F(ReceiveTest, FailuresRaiseOneAlert) {
    writeText(remoteFile("a.txt"), "alpha");
    writeText(remoteFile("b.txt"), "bravo");
    auto queue = makeQueue(false, true);
    store->failDownloads = {"a.txt", "b.txt"};

    auto report = queue->receiveFrom("incoming");

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->failures.size(), 2u);
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].recipients, std::vector<std::string>{"ops@example.com"});
    EXPECT_NE(alerts[0].body.find("receive"), std::string::npos);
}

TEST_F(ReceiveTest, ThrownRemovalIsRecordedAndBatchContinues) {
    writeText(remoteFile("a.txt"), "alpha");
    writeText(remoteFile("b.txt"), "bravo");
    auto queue = makeQueue();
    store->throwOnRemove.insert("a.txt");

    auto report = queue->receiveFrom("incoming");

    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->failures.size(), 1u);
    EXPECT_EQ(report->failures[0].kind, ErrorKind::Transfer);
    EXPECT_NE(report->failures[0].message.find("operation cancelled"), std::string::npos);
    EXPECT_EQ(entryNames(dir(QueueDirectory::Inbox)), (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_TRUE(entryNames(dir(QueueDirectory::Awaiting)).empty());
    EXPECT_FALSE(fs::exists(remoteFile("b.txt")));
    EXPECT_EQ(store->disconnectCalls, 1);
}

TEST_F(ReceiveTest, ThrownListingIsFatalTransferError) {
    writeText(remoteFile("a.txt"), "alpha");
    auto queue = makeQueue();
    store->throwOnList = true;

    auto report = queue->receiveFrom("incoming");

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Transfer);
    EXPECT_NE(report.error().message.find("operation cancelled"), std::string::npos);
    EXPECT_TRUE(fs::exists(remoteFile("a.txt")));
    EXPECT_EQ(store->disconnectCalls, 1);
}

TEST_F(ReceiveTest, RemoteNamesThatLeaveTheQueueAreRejected) {
    writeText(remoteFile("a.txt"), "alpha");
    auto queue = makeQueue();
    store->extraNames = {"../escape.txt", "nested/inner.txt", ".."};

    auto report = queue->receiveFrom("incoming");

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->failures.size(), 3u);
    EXPECT_EQ(report->completed.size(), 1u);
    EXPECT_EQ(entryNames(dir(QueueDirectory::Inbox)), std::vector<std::string>{"a.txt"});
    EXPECT_FALSE(fs::exists(root / "escape.txt"));
    EXPECT_FALSE(fs::exists(dir(QueueDirectory::Awaiting) / "nested"));
    EXPECT_EQ(store->events, (std::vector<std::string>{"download:incoming/a.txt", "remove:incoming/a.txt"}));
}
