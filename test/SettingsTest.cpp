#include "BaseTestFixture.h"
#include "Settings.h"
#include "Definitions.h"

class SettingsTest : public BaseTestFixture {
protected:
    fs::path writeSettings(const std::string& text) {
        fs::path file = tempDir / "settings.json";
        std::ofstream out(file);
        out << text;
        return file;
    }
};

TEST_F(SettingsTest, Defaults) {
    Settings settings = Settings::defaults();
    ASSERT_EQ(settings.protocol, "https");
    ASSERT_EQ(settings.host, Definitions::DEFAULT_HOST);
    ASSERT_EQ(settings.authHost, Definitions::DEFAULT_AUTH_HOST);
    ASSERT_EQ(settings.uploadAttempts, 3);
    ASSERT_TRUE(settings.username.empty());
    ASSERT_TRUE(settings.remoteFolder.empty());
}

TEST_F(SettingsTest, LoadFromFile) {
    fs::path file = writeSettings(R"({
        "username": "me@example.com",
        "remote_folder": "Backup/Docs",
        "host": "localhost:8080",
        "protocol": "http",
        "client_id": "id-123",
        "client_secret": "s3cret",
        "upload_attempts": 5,
        "unknown_key": [1, 2, 3]
    })");

    Settings settings = Settings::loadFromFile(file);
    ASSERT_EQ(settings.username, "me@example.com");
    ASSERT_EQ(settings.remoteFolder, "Backup/Docs");
    ASSERT_EQ(settings.host, "localhost:8080");
    ASSERT_EQ(settings.protocol, "http");
    ASSERT_EQ(settings.uploadAttempts, 5);
    ASSERT_EQ(settings.authHost, Definitions::DEFAULT_AUTH_HOST);

    DriveEndpoints endpoints = settings.endpoints();
    ASSERT_EQ(endpoints.clientId, "id-123");
    ASSERT_EQ(endpoints.clientSecret, "s3cret");
    ASSERT_EQ(endpoints.host, "localhost:8080");
}

TEST_F(SettingsTest, ArgumentsOverrideFile) {
    fs::path file = writeSettings(R"({"username": "file-user", "remote_folder": "FromFile", "host": "file-host"})");
    Settings settings = Settings::loadFromFile(file);

    ArgParser::Arguments args;
    args.stringArgs["username"] = "cli-user";
    args.stringArgs["password"] = "pw";
    args.stringArgs["remote-folder"] = "FromCli";
    settings.applyArguments(args);

    ASSERT_EQ(settings.username, "cli-user");
    ASSERT_EQ(settings.password, "pw");
    ASSERT_EQ(settings.remoteFolder, "FromCli");
    ASSERT_EQ(settings.host, "file-host");
}

TEST_F(SettingsTest, MissingFileThrows) {
    ASSERT_THROW(Settings::loadFromFile(tempDir / "absent.json"), DocsUploadException);
}

TEST_F(SettingsTest, MalformedJsonThrows) {
    ASSERT_THROW(Settings::loadFromFile(writeSettings("{ \"username\": ")), DocsUploadException);
}

TEST_F(SettingsTest, NonObjectThrows) {
    ASSERT_THROW(Settings::loadFromFile(writeSettings("[\"username\"]")), DocsUploadException);
}

TEST_F(SettingsTest, WrongValueTypeThrows) {
    ASSERT_THROW(Settings::loadFromFile(writeSettings(R"({"host": 8080})")), DocsUploadException);
}

TEST_F(SettingsTest, UploadAttemptsMustBePositive) {
    ASSERT_THROW(Settings::loadFromFile(writeSettings(R"({"upload_attempts": 0})")), DocsUploadException);
    ASSERT_THROW(Settings::loadFromFile(writeSettings(R"({"upload_attempts": "3"})")), DocsUploadException);
}
