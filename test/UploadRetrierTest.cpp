#include "BaseTestFixture.h"
#include "FakeDocumentStore.h"
#include "UploadRetrier.h"

class UploadRetrierTest : public BaseTestFixture {
protected:
    FakeDocumentStore store;
    std::vector<std::string> logs;
    UploadRetrier retrier{store, [this](const std::string& msg) { logs.push_back(msg); }};

    LocalFile localFile(const std::string& name, std::size_t size = 16) {
        return LocalFile::snapshot(writeFile(tempDir / name, size));
    }

    bool logged(const std::string& line) const {
        return std::find(logs.begin(), logs.end(), line) != logs.end();
    }
};

TEST_F(UploadRetrierTest, FirstAttemptSucceeds) {
    ASSERT_EQ(retrier.attemptUpload(localFile("notes.txt"), std::nullopt, 3), UploadOutcome::Uploaded);
    ASSERT_EQ(store.countCalls("upload:"), 1);
    ASSERT_EQ(store.live("notes", DocumentKind::Document).size(), 1u);
}

TEST_F(UploadRetrierTest, TransientFailuresAreRetried) {
    store.uploadFailures = {RemoteErrorKind::Transient, RemoteErrorKind::Transient, RemoteErrorKind::None};

    ASSERT_EQ(retrier.attemptUpload(localFile("notes.txt"), std::nullopt, 3), UploadOutcome::Uploaded);
    ASSERT_EQ(store.countCalls("upload:"), 3);
    ASSERT_EQ(std::count(logs.begin(), logs.end(), " - Another try..."), 2);
}

TEST_F(UploadRetrierTest, SingleAttemptGivesUpAfterOneCall) {
    store.uploadFailures = {RemoteErrorKind::Transient};

    ASSERT_EQ(retrier.attemptUpload(localFile("notes.txt"), std::nullopt, 1),
              UploadOutcome::SkippedAfterRetriesExhausted);
    ASSERT_EQ(store.countCalls("upload:"), 1);
    ASSERT_FALSE(logged(" - Another try..."));
    ASSERT_TRUE(logged(" - Skipped"));
}

TEST_F(UploadRetrierTest, AttemptsAreBounded) {
    store.uploadFailures = {RemoteErrorKind::Transient, RemoteErrorKind::AuthFailure,
                            RemoteErrorKind::Transient, RemoteErrorKind::None};

    ASSERT_EQ(retrier.attemptUpload(localFile("notes.txt"), std::nullopt, 3),
              UploadOutcome::SkippedAfterRetriesExhausted);
    ASSERT_EQ(store.countCalls("upload:"), 3);
}

TEST_F(UploadRetrierTest, NonPositiveAttemptCountStillTriesOnce) {
    ASSERT_EQ(retrier.attemptUpload(localFile("notes.txt"), std::nullopt, 0), UploadOutcome::Uploaded);
    ASSERT_EQ(store.countCalls("upload:"), 1);
}

TEST_F(UploadRetrierTest, PermanentFailureStopsImmediately) {
    store.uploadFailures = {RemoteErrorKind::Permanent, RemoteErrorKind::None};

    ASSERT_EQ(retrier.attemptUpload(localFile("notes.txt"), std::nullopt, 3),
              UploadOutcome::SkippedPermanentError);
    ASSERT_EQ(store.countCalls("upload:"), 1);
    ASSERT_TRUE(logged(" - Skipped: scripted failure"));
}

TEST_F(UploadRetrierTest, UnsupportedFormatMakesNoCall) {
    ASSERT_EQ(retrier.attemptUpload(localFile("photo.jpg"), std::nullopt, 3),
              UploadOutcome::SkippedUnsupportedFormat);
    ASSERT_EQ(store.countCalls("upload:"), 0);
}

TEST_F(UploadRetrierTest, OversizeDocumentMakesNoCall) {
    ASSERT_EQ(retrier.attemptUpload(localFile("big.txt", 500001), std::nullopt, 3),
              UploadOutcome::SkippedOversize);
    ASSERT_EQ(store.countCalls("upload:"), 0);
}

TEST_F(UploadRetrierTest, SizeLimitIsInclusive) {
    ASSERT_EQ(retrier.attemptUpload(localFile("edge.txt", 500000), std::nullopt, 3), UploadOutcome::Uploaded);
}

TEST_F(UploadRetrierTest, UploadsIntoTargetFolder) {
    std::string id = store.addFolder("Reports");
    FolderHandle target = RemoteFolder{id, "Reports", DocumentKind::Folder};

    ASSERT_EQ(retrier.attemptUpload(localFile("q1.xls"), target, 3), UploadOutcome::Uploaded);
    ASSERT_EQ(store.calls.back(), "upload:q1@Reports");
    auto uploaded = store.live("q1", DocumentKind::Spreadsheet);
    ASSERT_EQ(uploaded.size(), 1u);
    ASSERT_EQ(uploaded[0].parentId, id);
}

TEST_F(UploadRetrierTest, EligibilityCheck) {
    ASSERT_FALSE(UploadRetrier::checkEligibility(localFile("ok.pdf")).has_value());
    auto rejected = UploadRetrier::checkEligibility(localFile("bad.exe"));
    ASSERT_TRUE(rejected.has_value());
    ASSERT_EQ(*rejected, UploadOutcome::SkippedUnsupportedFormat);
}
