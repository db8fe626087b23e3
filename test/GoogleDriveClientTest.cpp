#include "gtest/gtest.h"
#include "BaseTestFixture.h"
#include "GoogleDriveClient.h"
#include "Definitions.h"
#include "LocalFile.h"
#include "UploadRetrier.h"

using namespace DocsUpload;

TEST(GoogleDriveClientTest, KindFromMimeType) {
    ASSERT_EQ(GoogleDriveClient::kindFromMimeType(Definitions::FOLDER_MIME_TYPE), DocumentKind::Folder);
    ASSERT_EQ(GoogleDriveClient::kindFromMimeType(Definitions::DOCUMENT_MIME_TYPE), DocumentKind::Document);
    ASSERT_EQ(GoogleDriveClient::kindFromMimeType(Definitions::SPREADSHEET_MIME_TYPE), DocumentKind::Spreadsheet);
    ASSERT_EQ(GoogleDriveClient::kindFromMimeType(Definitions::PRESENTATION_MIME_TYPE), DocumentKind::Presentation);
    ASSERT_EQ(GoogleDriveClient::kindFromMimeType("application/pdf"), DocumentKind::Pdf);
    ASSERT_EQ(GoogleDriveClient::kindFromMimeType("image/png"), DocumentKind::Other);
}

TEST(GoogleDriveClientTest, ConversionMimeType) {
    ASSERT_EQ(GoogleDriveClient::conversionMimeType(DocumentKind::Document), Definitions::DOCUMENT_MIME_TYPE);
    ASSERT_EQ(GoogleDriveClient::conversionMimeType(DocumentKind::Spreadsheet), Definitions::SPREADSHEET_MIME_TYPE);
    ASSERT_EQ(GoogleDriveClient::conversionMimeType(DocumentKind::Presentation), Definitions::PRESENTATION_MIME_TYPE);
    ASSERT_TRUE(GoogleDriveClient::conversionMimeType(DocumentKind::Pdf).empty());
}

TEST(GoogleDriveClientTest, ClassifyStatus) {
    ASSERT_EQ(GoogleDriveClient::classifyStatus(200, true), RemoteErrorKind::None);
    ASSERT_EQ(GoogleDriveClient::classifyStatus(204, false), RemoteErrorKind::None);
    ASSERT_EQ(GoogleDriveClient::classifyStatus(0, true), RemoteErrorKind::Transient);
    ASSERT_EQ(GoogleDriveClient::classifyStatus(429, true), RemoteErrorKind::Transient);
    ASSERT_EQ(GoogleDriveClient::classifyStatus(503, false), RemoteErrorKind::Transient);
    ASSERT_EQ(GoogleDriveClient::classifyStatus(401, false), RemoteErrorKind::AuthFailure);
    ASSERT_EQ(GoogleDriveClient::classifyStatus(403, true), RemoteErrorKind::AuthFailure);
}

TEST(GoogleDriveClientTest, RejectedUploadsArePermanent) {
    ASSERT_EQ(GoogleDriveClient::classifyStatus(400, true), RemoteErrorKind::Permanent);
    ASSERT_EQ(GoogleDriveClient::classifyStatus(413, true), RemoteErrorKind::Permanent);
    ASSERT_EQ(GoogleDriveClient::classifyStatus(415, true), RemoteErrorKind::Permanent);
    ASSERT_EQ(GoogleDriveClient::classifyStatus(400, false), RemoteErrorKind::Transient);
}

TEST(GoogleDriveClientTest, EscapeQueryValue) {
    ASSERT_EQ(GoogleDriveClient::escapeQueryValue("plain"), "plain");
    ASSERT_EQ(GoogleDriveClient::escapeQueryValue("it's"), "it\\'s");
    ASSERT_EQ(GoogleDriveClient::escapeQueryValue("a\\b"), "a\\\\b");
}

TEST(GoogleDriveClientTest, ChildrenQuery) {
    ASSERT_EQ(GoogleDriveClient::childrenQuery(std::nullopt, true),
              "'root' in parents and trashed = false and mimeType = 'application/vnd.google-apps.folder'");

    FolderHandle parent = RemoteFolder{"abc123", "Docs", DocumentKind::Folder};
    ASSERT_EQ(GoogleDriveClient::childrenQuery(parent, false),
              "'abc123' in parents and trashed = false and mimeType != 'application/vnd.google-apps.folder'");
}

TEST(GoogleDriveClientTest, ErrorMessage) {
    ASSERT_EQ(GoogleDriveClient::errorMessage(404, R"({"error": {"code": 404, "message": "File not found"}})"),
              "File not found");
    ASSERT_EQ(GoogleDriveClient::errorMessage(400, R"({"error": "invalid_grant", "error_description": "Bad password"})"),
              "invalid_grant: Bad password");
    ASSERT_EQ(GoogleDriveClient::errorMessage(502, "<html>Bad Gateway</html>"), "HTTP 502");
    ASSERT_EQ(GoogleDriveClient::errorMessage(500, ""), "HTTP 500");
}

class GoogleDriveClientFileTest : public BaseTestFixture {
protected:
    // unreachable port; the cases below must fail before any request is sent
    DriveEndpoints endpoints{"http", "127.0.0.1:1", "http", "127.0.0.1:1", "", ""};
};

TEST_F(GoogleDriveClientFileTest, UploadOfNonUtf8NameIsPermanentFailure) {
    fs::path file = writeFile(tempDir / "caf\xe9.txt");
    GoogleDriveClient client(endpoints);

    auto result = client.uploadFile(file.string(), "caf\xe9", std::nullopt);
    ASSERT_FALSE(result.ok());
    ASSERT_EQ(result.error.kind, RemoteErrorKind::Permanent);
}

TEST_F(GoogleDriveClientFileTest, FolderWithNonUtf8NameIsCreationFailure) {
    GoogleDriveClient client(endpoints);

    auto result = client.createFolder("bad\xff", std::nullopt);
    ASSERT_FALSE(result.ok());
    ASSERT_EQ(result.error.kind, RemoteErrorKind::CreationFailure);
}

TEST_F(GoogleDriveClientFileTest, NonUtf8FileIsSkippedNotFatal) {
    fs::path file = writeFile(tempDir / "caf\xe9.txt");
    GoogleDriveClient client(endpoints);
    std::vector<std::string> logs;
    UploadRetrier retrier(client, [&logs](const std::string& msg) { logs.push_back(msg); });

    ASSERT_EQ(retrier.attemptUpload(LocalFile::snapshot(file), std::nullopt, 3),
              UploadOutcome::SkippedPermanentError);
}
